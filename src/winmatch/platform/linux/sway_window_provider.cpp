#include "platform/linux/sway_window_provider.hpp"

#include "predicate.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

SwayWindowProvider::SwayWindowProvider(std::string socket_path, const ProcessInspector& inspector)
    : sway_sock_(std::move(socket_path)), inspector_(inspector) {}

SwayWindowProvider::~SwayWindowProvider() {
    disconnect();
}

bool SwayWindowProvider::connect() {
    if (query_fd_ >= 0) return true;
    if (sway_sock_.empty()) {
        std::println(stderr, "sway: no IPC socket ($SWAYSOCK not set)");
        return false;
    }

    query_fd_ = connect_socket(sway_sock_);
    return query_fd_ >= 0;
}

std::expected<WindowSnapshot, MatchError> SwayWindowProvider::snapshot(WindowHandle window) {
    auto windows = list_windows();
    if (!windows) return std::unexpected(windows.error());

    auto it = std::ranges::find_if(*windows, [&](const TreeWindow& w) {
        return w.snapshot.handle && *w.snapshot.handle == window;
    });
    if (it == windows->end()) {
        return std::unexpected(MatchError{MatchErrorKind::Discovery,
                                          std::format("no window with id {}", window.value)});
    }
    return it->snapshot;
}

std::expected<std::vector<WindowHandle>, MatchError>
SwayWindowProvider::discover(const Predicate& predicate, FindMode mode) {
    auto windows = list_windows();
    if (!windows) return std::unexpected(windows.error());

    std::vector<WindowHandle> found;
    for (const auto& w : *windows) {
        if (w.hidden && mode != FindMode::IncludeHidden) continue;
        if (!predicate.match(w.snapshot)) continue;
        found.push_back(*w.snapshot.handle);
    }
    return found;
}

std::expected<WindowSnapshot, MatchError> SwayWindowProvider::active_window() {
    auto windows = list_windows();
    if (!windows) return std::unexpected(windows.error());

    auto it = std::ranges::find_if(*windows, &TreeWindow::focused);
    if (it == windows->end()) return WindowSnapshot{};
    return it->snapshot;
}

std::vector<SwayWindowProvider::TreeWindow> SwayWindowProvider::parse_tree(const json& tree) {
    std::vector<TreeWindow> windows;
    collect(tree, "", windows);
    return windows;
}

std::expected<std::vector<SwayWindowProvider::TreeWindow>, MatchError>
SwayWindowProvider::list_windows() {
    if (!connect()) {
        return std::unexpected(MatchError{MatchErrorKind::Discovery, "sway: not connected"});
    }

    uint32_t type;
    std::string payload;
    if (!send_message(query_fd_, MSG_GET_TREE) || !recv_message(query_fd_, type, payload)) {
        // Stale connection; the next query reconnects.
        disconnect();
        return std::unexpected(MatchError{MatchErrorKind::Discovery, "sway: GET_TREE failed"});
    }
    if (type != MSG_GET_TREE) {
        return std::unexpected(MatchError{MatchErrorKind::Discovery,
                                          std::format("sway: unexpected reply type {}", type)});
    }

    std::vector<TreeWindow> windows;
    try {
        windows = parse_tree(json::parse(payload));
    } catch (const json::exception& e) {
        return std::unexpected(MatchError{MatchErrorKind::Discovery,
                                          std::format("sway: bad tree reply: {}", e.what())});
    }

    for (auto& w : windows) {
        auto info = inspector_.inspect(w.snapshot.pid);
        w.snapshot.exe = std::move(info.exe);
        w.snapshot.exe_path = std::move(info.exe_path);
    }
    return windows;
}

void SwayWindowProvider::collect(const json& node, const std::string& workspace,
                                 std::vector<TreeWindow>& out) {
    auto type = string_field(node, "type");
    std::string current = type == "workspace" ? string_field(node, "name") : workspace;

    bool has_children = (node.contains("nodes") && !node["nodes"].empty()) ||
                        (node.contains("floating_nodes") && !node["floating_nodes"].empty());

    if ((type == "con" || type == "floating_con") && !has_children &&
        node.contains("pid") && node["pid"].is_number_integer()) {
        TreeWindow w;
        w.snapshot.handle = WindowHandle{node.value("id", uint64_t{0})};
        w.snapshot.title = string_field(node, "name");
        w.snapshot.window_class = string_field(node, "app_id");
        if (w.snapshot.window_class.empty() && node.contains("window_properties")) {
            w.snapshot.window_class = string_field(node["window_properties"], "class");
        }
        w.snapshot.pid = node.value("pid", uint32_t{0});
        w.snapshot.desktop = current;
        w.hidden = current == SCRATCHPAD;
        w.focused = node.value("focused", false);
        out.push_back(std::move(w));
        return;
    }

    if (node.contains("nodes")) {
        for (auto& child : node["nodes"]) collect(child, current, out);
    }
    if (node.contains("floating_nodes")) {
        for (auto& child : node["floating_nodes"]) collect(child, current, out);
    }
}

std::string SwayWindowProvider::string_field(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

int SwayWindowProvider::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

void SwayWindowProvider::disconnect() {
    if (query_fd_ >= 0) ::close(query_fd_);
    query_fd_ = -1;
}

bool SwayWindowProvider::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayWindowProvider::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}
