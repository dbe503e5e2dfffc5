#pragma once

#include "match_error.hpp"
#include "window_snapshot.hpp"

#include <expected>
#include <vector>

class Predicate;

enum class FindMode {
    TopLevel,       // ordinary mapped application windows
    IncludeHidden,  // also hidden windows (e.g. the scratchpad)
};

// Source of live window metadata. Implementations talk to the compositor.
class WindowProvider {
public:
    virtual ~WindowProvider() = default;
    virtual std::expected<WindowSnapshot, MatchError> snapshot(WindowHandle window) = 0;
    // Every window in `mode` whose snapshot satisfies `predicate`, in the
    // compositor's order.
    virtual std::expected<std::vector<WindowHandle>, MatchError>
        discover(const Predicate& predicate, FindMode mode) = 0;
    virtual std::expected<WindowSnapshot, MatchError> active_window() = 0;
};
