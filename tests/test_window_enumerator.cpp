#include <catch2/catch_test_macros.hpp>

#include "platform/window_provider.hpp"
#include "predicate.hpp"
#include "window_enumerator.hpp"

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class MockWindowProvider : public WindowProvider {
public:
    std::vector<WindowSnapshot> windows;
    std::vector<bool> hidden;
    WindowSnapshot active;
    bool fail = false;
    int discover_calls = 0;

    void add(uint64_t id, const std::string& title, bool is_hidden = false) {
        WindowSnapshot s;
        s.handle = WindowHandle{id};
        s.title = title;
        windows.push_back(s);
        hidden.push_back(is_hidden);
    }

    std::expected<WindowSnapshot, MatchError> snapshot(WindowHandle window) override {
        for (const auto& w : windows) {
            if (w.handle && *w.handle == window) return w;
        }
        return std::unexpected(MatchError{MatchErrorKind::Discovery, "gone"});
    }

    std::expected<std::vector<WindowHandle>, MatchError>
    discover(const Predicate& predicate, FindMode mode) override {
        ++discover_calls;
        if (fail) return std::unexpected(MatchError{MatchErrorKind::Discovery, "denied"});

        std::vector<WindowHandle> found;
        for (size_t i = 0; i < windows.size(); ++i) {
            if (hidden[i] && mode != FindMode::IncludeHidden) continue;
            if (predicate.match(windows[i])) found.push_back(*windows[i].handle);
        }
        return found;
    }

    std::expected<WindowSnapshot, MatchError> active_window() override {
        if (fail) return std::unexpected(MatchError{MatchErrorKind::Discovery, "denied"});
        return active;
    }
};

Predicate everything() {
    return *LeafMatch::create({});
}

Predicate title(const std::string& t) {
    return *LeafMatch::create({.title = t, .discipline = MatchDiscipline::Partial});
}

std::future<bool> ready(bool value) {
    std::promise<bool> p;
    p.set_value(value);
    return p.get_future();
}

} // namespace

TEST_CASE("WindowEnumerator visiting", "[enumerator]") {
    MockWindowProvider provider;
    provider.add(1, "w1 term");
    provider.add(2, "w2 term");
    provider.add(3, "w3 term");
    provider.add(4, "other");
    WindowEnumerator enumerator(provider);

    SECTION("ObserverVisitsAllInOrder") {
        std::vector<uint64_t> seen;
        auto res = enumerator.for_each(title("term"), [&](WindowHandle w) { seen.push_back(w.value); });
        REQUIRE(res.has_value());
        REQUIRE(seen == std::vector<uint64_t>{1, 2, 3});
    }

    SECTION("GateStopsAtFirstFalse") {
        std::vector<uint64_t> seen;
        auto res = enumerator.for_all(title("term"), [&](WindowHandle w) {
            seen.push_back(w.value);
            return w.value != 2;
        });
        REQUIRE(res.has_value());
        REQUIRE_FALSE(*res);
        REQUIRE(seen == std::vector<uint64_t>{1, 2});
    }

    SECTION("GateReportsCompleteEnumeration") {
        int visits = 0;
        auto res = enumerator.for_all(title("term"), [&](WindowHandle) { ++visits; return true; });
        REQUIRE(*res);
        REQUIRE(visits == 3);
    }

    SECTION("NoMatchesIsComplete") {
        auto res = enumerator.for_all(title("nothing"), [](WindowHandle) { return false; });
        REQUIRE(*res);
    }

    SECTION("HiddenWindowsNeedIncludeHidden") {
        provider.add(5, "hidden term", true);

        std::vector<uint64_t> top;
        REQUIRE(enumerator.for_each(title("term"), [&](WindowHandle w) { top.push_back(w.value); }));
        REQUIRE(top == std::vector<uint64_t>{1, 2, 3});

        std::vector<uint64_t> all;
        REQUIRE(enumerator.for_each(title("term"), [&](WindowHandle w) { all.push_back(w.value); },
                                    FindMode::IncludeHidden));
        REQUIRE(all == std::vector<uint64_t>{1, 2, 3, 5});
    }

    SECTION("DiscoveryFailurePropagates") {
        provider.fail = true;
        bool called = false;
        auto res = enumerator.for_all(everything(), [&](WindowHandle) { called = true; return true; });
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == MatchErrorKind::Discovery);
        REQUIRE_FALSE(called);

        auto each = enumerator.for_each(everything(), [](WindowHandle) {});
        REQUIRE_FALSE(each.has_value());
    }

    SECTION("EmptyCallbackIsArgumentError") {
        auto res = enumerator.for_all(everything(), WindowEnumerator::Gate{});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == MatchErrorKind::Argument);
        REQUIRE(provider.discover_calls == 0);
    }
}

TEST_CASE("WindowEnumerator async", "[enumerator]") {
    MockWindowProvider provider;
    provider.add(1, "w1 term");
    provider.add(2, "w2 term");
    provider.add(3, "w3 term");
    WindowEnumerator enumerator(provider);

    SECTION("AwaitsEachCallbackInOrder") {
        std::vector<uint64_t> seen;
        auto pending = enumerator.for_all_async(title("term"), [&](WindowHandle w) {
            seen.push_back(w.value);
            return ready(true);
        });
        // Deferred: nothing runs until the result is requested.
        REQUIRE(seen.empty());

        auto res = pending.get();
        REQUIRE(res.has_value());
        REQUIRE(*res);
        REQUIRE(seen == std::vector<uint64_t>{1, 2, 3});
    }

    SECTION("StopsAtFirstFalse") {
        std::vector<uint64_t> seen;
        auto res = enumerator.for_all_async(title("term"), [&](WindowHandle w) {
            seen.push_back(w.value);
            return ready(w.value != 2);
        }).get();
        REQUIRE(res.has_value());
        REQUIRE_FALSE(*res);
        REQUIRE(seen == std::vector<uint64_t>{1, 2});
    }

    SECTION("CallbackRunningElsewhereIsAwaited") {
        std::vector<uint64_t> seen;
        auto res = enumerator.for_all_async(title("term"), [&](WindowHandle w) {
            return std::async(std::launch::async, [&seen, w] {
                seen.push_back(w.value);
                return true;
            });
        }).get();
        REQUIRE(*res);
        REQUIRE(seen == std::vector<uint64_t>{1, 2, 3});
    }

    SECTION("FailedCallbackFailsEnumeration") {
        std::vector<uint64_t> seen;
        auto res = enumerator.for_all_async(title("term"), [&](WindowHandle w) {
            seen.push_back(w.value);
            if (w.value == 2) {
                std::promise<bool> p;
                p.set_exception(std::make_exception_ptr(std::runtime_error("window vanished")));
                return p.get_future();
            }
            return ready(true);
        }).get();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == MatchErrorKind::Callback);
        REQUIRE(res.error().message == "window vanished");
        REQUIRE(seen == std::vector<uint64_t>{1, 2});
    }

    SECTION("DiscoveryFailurePropagates") {
        provider.fail = true;
        auto res = enumerator.for_all_async(everything(), [](WindowHandle) { return ready(true); }).get();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == MatchErrorKind::Discovery);
    }
}

TEST_CASE("WindowEnumerator lookups", "[enumerator]") {
    MockWindowProvider provider;
    provider.add(1, "editor");
    provider.add(2, "terminal");
    provider.add(3, "terminal 2");
    provider.active = provider.windows[1];
    WindowEnumerator enumerator(provider);

    SECTION("FindReturnsFirst") {
        auto found = enumerator.find(title("terminal"));
        REQUIRE(found.has_value());
        REQUIRE(found->has_value());
        REQUIRE((*found)->value == 2);
    }

    SECTION("FindNothing") {
        auto found = enumerator.find(title("browser"));
        REQUIRE(found.has_value());
        REQUIRE_FALSE(found->has_value());
    }

    SECTION("WindowsListsAll") {
        auto all = enumerator.windows(title("terminal"));
        REQUIRE(all->size() == 2);
    }

    SECTION("MatchByHandle") {
        REQUIRE(*enumerator.match(title("editor"), WindowHandle{1}));
        REQUIRE_FALSE(*enumerator.match(title("editor"), WindowHandle{2}));
        REQUIRE_FALSE(enumerator.match(title("editor"), WindowHandle{99}).has_value());
    }

    SECTION("IsActive") {
        REQUIRE(*enumerator.is_active(title("terminal")));
        REQUIRE_FALSE(*enumerator.is_active(title("editor")));
        REQUIRE(*enumerator.is_active(title("editor") | title("terminal")));
    }

    SECTION("IsActiveFailurePropagates") {
        provider.fail = true;
        REQUIRE_FALSE(enumerator.is_active(everything()).has_value());
    }
}
