#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Opaque window reference. The zero handle refers to no window and never
// compares equal, not even to itself.
struct WindowHandle {
    uint64_t value = 0;

    bool is_zero() const { return value == 0; }
    bool is_valid() const { return value != 0; }

    friend bool operator==(WindowHandle a, WindowHandle b) { return a.value == b.value && a.value != 0; }
};

struct WindowSnapshot {
    std::optional<WindowHandle> handle;
    std::string title;         // window title
    std::string window_class;  // Wayland app_id or X11 class (e.g. "firefox")
    std::string exe;           // executable name (e.g. "firefox")
    std::string exe_path;      // full executable path
    uint32_t pid = 0;          // owning process id
    std::string desktop;       // workspace / virtual desktop name

    bool empty() const {
        return !handle && title.empty() && window_class.empty() && exe.empty() && pid == 0;
    }
};
