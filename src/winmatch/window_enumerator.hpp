#pragma once

#include "match_error.hpp"
#include "platform/window_provider.hpp"
#include "predicate.hpp"
#include "window_snapshot.hpp"

#include <expected>
#include <functional>
#include <future>
#include <optional>
#include <vector>

// Drives discovery and visits matching windows one at a time, in the order the
// provider returned them. Owns no threads; a callback that suspends does so
// through the future it hands back.
class WindowEnumerator {
public:
    using Observer = std::function<void(WindowHandle)>;
    // Return false to stop visiting.
    using Gate = std::function<bool(WindowHandle)>;
    using AsyncGate = std::function<std::future<bool>(WindowHandle)>;

    explicit WindowEnumerator(WindowProvider& provider);

    // Visits every matching window.
    std::expected<void, MatchError> for_each(const Predicate& predicate, const Observer& action,
                                             FindMode mode = FindMode::TopLevel);

    // Returns true if every matching window was visited, false if `action`
    // stopped the enumeration.
    std::expected<bool, MatchError> for_all(const Predicate& predicate, const Gate& action,
                                            FindMode mode = FindMode::TopLevel);

    // Like for_all, but awaits each callback's future before moving on. The
    // returned future is deferred: the enumeration runs on the thread that
    // waits for it. A failed callback future fails the whole enumeration.
    std::future<std::expected<bool, MatchError>>
        for_all_async(const Predicate& predicate, AsyncGate action,
                      FindMode mode = FindMode::TopLevel);

    std::expected<std::vector<WindowHandle>, MatchError>
        windows(const Predicate& predicate, FindMode mode = FindMode::TopLevel);

    // First matching window, or nullopt if none matched.
    std::expected<std::optional<WindowHandle>, MatchError>
        find(const Predicate& predicate, FindMode mode = FindMode::TopLevel);

    std::expected<bool, MatchError> match(const Predicate& predicate, WindowHandle window);

    // True if the focused window satisfies `predicate`.
    std::expected<bool, MatchError> is_active(const Predicate& predicate);

private:
    WindowProvider& provider_;
};
