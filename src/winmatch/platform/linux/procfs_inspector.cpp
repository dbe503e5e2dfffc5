#include "platform/linux/procfs_inspector.hpp"

#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

ProcessInfo ProcfsInspector::inspect(uint32_t pid) const {
    if (pid == 0) return {};

    ProcessInfo info;
    info.exe_path = read_exe(pid);
    if (!info.exe_path.empty()) {
        info.exe = fs::path(info.exe_path).filename().string();
    } else {
        // /proc/<pid>/exe is unreadable for other users' processes; comm is not.
        info.exe = read_comm(pid);
    }
    return info;
}

std::string ProcfsInspector::read_comm(uint32_t pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string ProcfsInspector::read_exe(uint32_t pid) {
    std::error_code ec;
    auto path = fs::read_symlink(std::format("/proc/{}/exe", pid), ec);
    if (ec) return {};
    return path.string();
}
