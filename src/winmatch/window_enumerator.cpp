#include "window_enumerator.hpp"

#include <exception>

WindowEnumerator::WindowEnumerator(WindowProvider& provider)
    : provider_(provider) {}

std::expected<void, MatchError> WindowEnumerator::for_each(const Predicate& predicate,
                                                           const Observer& action,
                                                           FindMode mode) {
    if (!action) {
        return std::unexpected(MatchError{MatchErrorKind::Argument, "for_each: action can't be empty"});
    }

    auto found = provider_.discover(predicate, mode);
    if (!found) return std::unexpected(found.error());

    for (auto window : *found) {
        action(window);
    }
    return {};
}

std::expected<bool, MatchError> WindowEnumerator::for_all(const Predicate& predicate,
                                                          const Gate& action,
                                                          FindMode mode) {
    if (!action) {
        return std::unexpected(MatchError{MatchErrorKind::Argument, "for_all: action can't be empty"});
    }

    auto found = provider_.discover(predicate, mode);
    if (!found) return std::unexpected(found.error());

    for (auto window : *found) {
        if (!action(window)) return false;
    }
    return true;
}

std::future<std::expected<bool, MatchError>>
WindowEnumerator::for_all_async(const Predicate& predicate, AsyncGate action, FindMode mode) {
    return std::async(std::launch::deferred,
                      [this, predicate, action = std::move(action), mode]()
                          -> std::expected<bool, MatchError> {
        if (!action) {
            return std::unexpected(MatchError{MatchErrorKind::Argument, "for_all_async: action can't be empty"});
        }

        auto found = provider_.discover(predicate, mode);
        if (!found) return std::unexpected(found.error());

        for (auto window : *found) {
            auto pending = action(window);
            if (!pending.valid()) {
                return std::unexpected(MatchError{MatchErrorKind::Callback,
                                                  "for_all_async: callback returned no future"});
            }

            bool keep_going = false;
            try {
                keep_going = pending.get();
            } catch (const std::exception& e) {
                return std::unexpected(MatchError{MatchErrorKind::Callback, e.what()});
            }
            if (!keep_going) return false;
        }
        return true;
    });
}

std::expected<std::vector<WindowHandle>, MatchError>
WindowEnumerator::windows(const Predicate& predicate, FindMode mode) {
    return provider_.discover(predicate, mode);
}

std::expected<std::optional<WindowHandle>, MatchError>
WindowEnumerator::find(const Predicate& predicate, FindMode mode) {
    auto found = provider_.discover(predicate, mode);
    if (!found) return std::unexpected(found.error());
    if (found->empty()) return std::nullopt;
    return found->front();
}

std::expected<bool, MatchError> WindowEnumerator::match(const Predicate& predicate, WindowHandle window) {
    auto snapshot = provider_.snapshot(window);
    if (!snapshot) return std::unexpected(snapshot.error());
    return predicate.match(*snapshot);
}

std::expected<bool, MatchError> WindowEnumerator::is_active(const Predicate& predicate) {
    auto active = provider_.active_window();
    if (!active) return std::unexpected(active.error());
    return predicate.match(*active);
}
