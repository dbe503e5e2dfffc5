#pragma once

#include "platform/process_inspector.hpp"

#include <string>

class ProcfsInspector : public ProcessInspector {
public:
    ProcessInfo inspect(uint32_t pid) const override;

private:
    static std::string read_comm(uint32_t pid);
    static std::string read_exe(uint32_t pid);
};
