#pragma once

#include "platform/process_inspector.hpp"
#include "platform/window_provider.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class SwayWindowProvider : public WindowProvider {
public:
    struct TreeWindow {
        WindowSnapshot snapshot;
        bool hidden = false;   // lives on the scratchpad
        bool focused = false;
    };

    SwayWindowProvider(std::string socket_path, const ProcessInspector& inspector);
    ~SwayWindowProvider() override;

    SwayWindowProvider(const SwayWindowProvider&) = delete;
    SwayWindowProvider& operator=(const SwayWindowProvider&) = delete;

    // Connect to the Sway IPC socket. Called lazily by the queries below.
    bool connect();

    std::expected<WindowSnapshot, MatchError> snapshot(WindowHandle window) override;
    std::expected<std::vector<WindowHandle>, MatchError>
        discover(const Predicate& predicate, FindMode mode) override;
    std::expected<WindowSnapshot, MatchError> active_window() override;

    // Every view in a GET_TREE reply, depth-first, tiled children before
    // floating ones. Process fields are left empty.
    static std::vector<TreeWindow> parse_tree(const nlohmann::json& tree);

private:
    // i3-ipc binary protocol
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_GET_TREE = 4;
    static constexpr const char* SCRATCHPAD = "__i3_scratch";

    std::expected<std::vector<TreeWindow>, MatchError> list_windows();

    bool send_message(int fd, uint32_t type, const std::string& payload = "");
    bool recv_message(int fd, uint32_t& type, std::string& payload);
    int connect_socket(const std::string& path);
    void disconnect();

    static void collect(const nlohmann::json& node, const std::string& workspace,
                        std::vector<TreeWindow>& out);
    static std::string string_field(const nlohmann::json& node, const char* key);

    std::string sway_sock_;
    const ProcessInspector& inspector_;
    int query_fd_ = -1;
};
