#pragma once

#include <cstdint>
#include <string>

struct ProcessInfo {
    std::string exe;       // executable name
    std::string exe_path;  // full executable path
};

class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;
    // Empty fields when the process is gone or not readable.
    virtual ProcessInfo inspect(uint32_t pid) const = 0;
};
