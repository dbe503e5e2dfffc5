#include "config.hpp"
#include "leaf_match.hpp"
#include "match_error.hpp"
#include "platform/linux/procfs_inspector.hpp"
#include "platform/linux/sway_window_provider.hpp"
#include "platform/platform_paths.hpp"
#include "predicate.hpp"
#include "window_enumerator.hpp"

#include <cstdlib>
#include <optional>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  list                    List windows");
    std::println(stderr, "  find [criteria] [--all] Print the first (or every) matching window");
    std::println(stderr, "  rule <name>             List windows matching a configured rule");
    std::println(stderr, "  active [<name>]         Print the active window, or test it against a rule");
    std::println(stderr, "Criteria:");
    std::println(stderr, "  --title S  --class S  --exe S  --exe-path S  --pid N  --desktop S");
    std::println(stderr, "  --regex | --full | --partial   String comparison (default from config)");
    std::println(stderr, "Options:");
    std::println(stderr, "  --hidden            Include hidden (scratchpad) windows");
    std::println(stderr, "  -v, --verbose       Enable verbose logging");
    std::println(stderr, "  -c, --config PATH   Config file path");
    std::println(stderr, "  -h, --help          Show this help");
}

static void report(const MatchError& error) {
    std::println(stderr, "Error ({}): {}", to_string(error.kind), error.message);
}

static void print_window(const WindowSnapshot& w) {
    std::println("{}\t{}\t{}\t{}\t{}\t{}",
                 w.handle ? w.handle->value : 0, w.pid, w.desktop, w.window_class, w.exe, w.title);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        usage(argv[0]);
        return 0;
    }

    bool verbose = false;
    bool all = false;
    std::optional<bool> hidden;
    std::optional<MatchDiscipline> discipline;
    std::string config_path;
    std::string rule_name;
    LeafCriteria criteria;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--hidden") {
            hidden = true;
        } else if (arg == "--all") {
            all = true;
        } else if (arg == "--regex") {
            discipline = MatchDiscipline::RegEx;
        } else if (arg == "--full") {
            discipline = MatchDiscipline::Full;
        } else if (arg == "--partial") {
            discipline = MatchDiscipline::Partial;
        } else if (arg == "--title" && i + 1 < argc) {
            criteria.title = argv[++i];
        } else if (arg == "--class" && i + 1 < argc) {
            criteria.window_class = argv[++i];
        } else if (arg == "--exe" && i + 1 < argc) {
            criteria.exe = argv[++i];
        } else if (arg == "--exe-path" && i + 1 < argc) {
            criteria.exe_path = argv[++i];
        } else if (arg == "--pid" && i + 1 < argc) {
            criteria.pid = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--desktop" && i + 1 < argc) {
            criteria.desktop = argv[++i];
        } else if (!arg.starts_with("-") && rule_name.empty()) {
            rule_name = arg;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    FindMode mode = hidden.value_or(config.find.hidden) ? FindMode::IncludeHidden : FindMode::TopLevel;

    auto socket_path = config.sway.socket.empty() ? platform::compositor_socket() : config.sway.socket;
    if (verbose) {
        std::println(stderr, "[winmatch] socket: {}, {} rule(s) loaded",
                     socket_path.empty() ? "<none>" : socket_path, config.rules.size());
    }

    ProcfsInspector inspector;
    SwayWindowProvider provider(socket_path, inspector);
    WindowEnumerator enumerator(provider);

    auto lookup_rule = [&](const std::string& name) -> const Predicate* {
        auto it = config.rules.find(name);
        if (it == config.rules.end()) {
            std::println(stderr, "No rule named '{}'", name);
            return nullptr;
        }
        return &it->second;
    };

    auto print_matches = [&](const Predicate& predicate, bool first_only) -> int {
        int printed = 0;
        auto visited = enumerator.for_all(predicate, [&](WindowHandle window) {
            auto snapshot = provider.snapshot(window);
            if (!snapshot) {
                report(snapshot.error());
                return true;
            }
            print_window(*snapshot);
            ++printed;
            return !first_only;
        }, mode);
        if (!visited) {
            report(visited.error());
            return 1;
        }
        if (verbose) std::println(stderr, "[winmatch] {} window(s)", printed);
        return printed > 0 ? 0 : 1;
    };

    if (command == "list") {
        auto everything = LeafMatch::create({});
        if (!everything) {
            report(everything.error());
            return 1;
        }
        return print_matches(*everything, false);
    }

    if (command == "find") {
        criteria.discipline = discipline.value_or(config.match.discipline);
        auto leaf = LeafMatch::create(std::move(criteria));
        if (!leaf) {
            report(leaf.error());
            return 1;
        }
        return print_matches(*leaf, !all);
    }

    if (command == "rule") {
        if (rule_name.empty()) {
            usage(argv[0]);
            return 1;
        }
        auto rule = lookup_rule(rule_name);
        if (!rule) return 1;
        return print_matches(*rule, false);
    }

    if (command == "active") {
        if (rule_name.empty()) {
            auto active = provider.active_window();
            if (!active) {
                report(active.error());
                return 1;
            }
            print_window(*active);
            return 0;
        }

        auto rule = lookup_rule(rule_name);
        if (!rule) return 1;
        auto matched = enumerator.is_active(*rule);
        if (!matched) {
            report(matched.error());
            return 1;
        }
        if (verbose) std::println(stderr, "[winmatch] active window {} '{}'",
                                  *matched ? "matches" : "does not match", rule_name);
        return *matched ? 0 : 1;
    }

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
