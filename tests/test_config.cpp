#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "wm_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(fd >= 0);
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE_FALSE(cfg.find.hidden);
        REQUIRE(cfg.find.mode() == FindMode::TopLevel);
        REQUIRE(cfg.match.discipline == MatchDiscipline::RegEx);
        REQUIRE(cfg.sway.socket.empty());
        REQUIRE(cfg.rules.empty());
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "find": { "hidden": true },
            "match": { "discipline": "partial" },
            "sway": { "socket": "/run/user/1000/sway-ipc.sock" },
            "rules": {
                "terminals": {
                    "type": "any",
                    "whitelist": [
                        { "type": "leaf", "class": "kitty", "discipline": "full" },
                        { "type": "leaf", "class": "foot", "discipline": "full" }
                    ]
                },
                "editor": { "type": "leaf", "exe": "^nvim$" }
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.find.hidden);
        REQUIRE(cfg.find.mode() == FindMode::IncludeHidden);
        REQUIRE(cfg.match.discipline == MatchDiscipline::Partial);
        REQUIRE(cfg.sway.socket == "/run/user/1000/sway-ipc.sock");
        REQUIRE(cfg.rules.size() == 2);

        WindowSnapshot foot;
        foot.window_class = "foot";
        REQUIRE(cfg.rules.at("terminals").match(foot));
        REQUIRE_FALSE(cfg.rules.at("editor").match(foot));
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "match": { "discipline": "full" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.match.discipline == MatchDiscipline::Full);
        // Other fields retain defaults
        REQUIRE_FALSE(cfg.find.hidden);
        REQUIRE(cfg.sway.socket.empty());
        REQUIRE(cfg.rules.empty());
    }

    SECTION("UnknownDisciplineKeepsDefault") {
        TmpFile f(R"({ "match": { "discipline": "fuzzy" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.match.discipline == MatchDiscipline::RegEx);
    }

    SECTION("InvalidRuleSkipped") {
        TmpFile f(R"({
            "rules": {
                "broken": { "type": "leaf", "title": "([" },
                "ok": { "type": "leaf", "title": "x" }
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.rules.size() == 1);
        REQUIRE(cfg.rules.contains("ok"));
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE_FALSE(cfg.find.hidden);
        REQUIRE(cfg.match.discipline == MatchDiscipline::RegEx);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/wm_test_nonexistent_config_file.json");
        REQUIRE_FALSE(cfg.find.hidden);
        REQUIRE(cfg.rules.empty());
    }
}
