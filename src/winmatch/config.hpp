#pragma once

#include "leaf_match.hpp"
#include "platform/window_provider.hpp"
#include "predicate.hpp"

#include <map>
#include <string>

struct Config {
    struct Find {
        bool hidden = false;

        FindMode mode() const { return hidden ? FindMode::IncludeHidden : FindMode::TopLevel; }
    } find;

    struct Match {
        MatchDiscipline discipline = MatchDiscipline::RegEx;
    } match;

    struct Sway {
        std::string socket;  // empty: use $SWAYSOCK
    } sway;

    // Named predicates, e.g. "browsers" -> any-of over several leaves.
    std::map<std::string, Predicate> rules;

    static Config load(const std::string& path);
    static Config load_default();
};
