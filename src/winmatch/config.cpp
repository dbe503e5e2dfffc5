#include "config.hpp"

#include "platform/platform_paths.hpp"
#include "predicate_json.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("find")) {
            auto& fd = j["find"];
            if (fd.contains("hidden")) cfg.find.hidden = fd["hidden"].get<bool>();
        }

        if (j.contains("match")) {
            auto& m = j["match"];
            if (m.contains("discipline")) {
                auto name = m["discipline"].get<std::string>();
                if (auto discipline = discipline_from_string(name)) {
                    cfg.match.discipline = *discipline;
                } else {
                    std::println(stderr, "config: unknown discipline '{}', using regex", name);
                }
            }
        }

        if (j.contains("sway")) {
            auto& s = j["sway"];
            if (s.contains("socket")) cfg.sway.socket = s["socket"].get<std::string>();
        }

        if (j.contains("rules")) {
            for (auto& [name, value] : j["rules"].items()) {
                auto rule = predicate_from_json(value);
                if (!rule) {
                    std::println(stderr, "config: skipping rule '{}': {}", name, rule.error().message);
                    continue;
                }
                cfg.rules.insert_or_assign(name, std::move(*rule));
            }
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
