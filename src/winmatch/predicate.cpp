#include "predicate.hpp"

#include <algorithm>
#include <iterator>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

Composite::Composite(Combinator combinator)
    : combinator_(combinator) {}

Composite::Composite(Combinator combinator, std::vector<Predicate> whitelist)
    : combinator_(combinator), whitelist_(std::move(whitelist)) {}

Composite::Composite(const Composite& other) = default;
Composite::Composite(Composite&& other) noexcept = default;
Composite& Composite::operator=(const Composite& other) = default;
Composite& Composite::operator=(Composite&& other) noexcept = default;
Composite::~Composite() = default;

bool Composite::match(const WindowSnapshot& snapshot) const {
    if (any_matches(blacklist_, snapshot)) {
        return reverse_;
    }
    return reverse_ != whitelist_matches(snapshot);
}

size_t Composite::size() const {
    return whitelist_.size();
}

Composite Composite::as_reverse() const {
    Composite copy = *this;
    copy.reverse_ = !reverse_;
    return copy;
}

void Composite::add(Predicate predicate) {
    whitelist_.push_back(std::move(predicate));
}

void Composite::add(std::vector<Predicate> predicates) {
    std::ranges::move(predicates, std::back_inserter(whitelist_));
}

void Composite::add(WindowHandle window) {
    whitelist_.emplace_back(LeafMatch::for_handle(window));
}

void Composite::add_blacklist(Predicate predicate) {
    blacklist_.push_back(std::move(predicate));
}

void Composite::add_blacklist(std::vector<Predicate> predicates) {
    std::ranges::move(predicates, std::back_inserter(blacklist_));
}

void Composite::add_blacklist(WindowHandle window) {
    blacklist_.emplace_back(LeafMatch::for_handle(window));
}

std::expected<bool, MatchError> Composite::remove(const LeafFilter& filter) {
    if (!filter) {
        return std::unexpected(MatchError{MatchErrorKind::Argument, "remove: filter can't be empty"});
    }
    return remove_from(whitelist_, filter);
}

std::expected<bool, MatchError> Composite::remove_blacklist(const LeafFilter& filter) {
    if (!filter) {
        return std::unexpected(MatchError{MatchErrorKind::Argument, "remove_blacklist: filter can't be empty"});
    }
    return remove_from(blacklist_, filter);
}

std::vector<LeafMatch> Composite::as_list() const {
    std::vector<LeafMatch> leaves;
    for (const auto& child : whitelist_) {
        auto nested = child.as_list();
        std::ranges::move(nested, std::back_inserter(leaves));
    }
    return leaves;
}

bool Composite::whitelist_matches(const WindowSnapshot& snapshot) const {
    switch (combinator_) {
        case Combinator::Any:
            return any_matches(whitelist_, snapshot);
        case Combinator::All:
            // An empty AND-group matches nothing rather than everything.
            if (whitelist_.empty()) return false;
            return std::ranges::all_of(whitelist_, [&](const Predicate& p) { return p.match(snapshot); });
    }
    return false;
}

bool Composite::any_matches(const std::vector<Predicate>& list, const WindowSnapshot& snapshot) {
    return std::ranges::any_of(list, [&](const Predicate& p) { return p.match(snapshot); });
}

bool Composite::remove_from(std::vector<Predicate>& list, const LeafFilter& filter) {
    bool changed = false;

    for (auto& child : list) {
        if (auto* group = child.composite()) {
            if (remove_from(group->whitelist_, filter)) changed = true;
        }
    }

    auto removed = std::erase_if(list, [&](const Predicate& child) {
        if (const auto* leaf = child.leaf()) return filter(*leaf);
        return child.composite()->size() == 0;
    });

    return changed || removed > 0;
}

Predicate::Predicate(LeafMatch leaf)
    : node_(std::move(leaf)) {}

Predicate::Predicate(Composite composite)
    : node_(std::move(composite)) {}

Predicate Predicate::any_of(std::vector<Predicate> children) {
    return Composite(Combinator::Any, std::move(children));
}

Predicate Predicate::all_of(std::vector<Predicate> children) {
    return Composite(Combinator::All, std::move(children));
}

bool Predicate::match(const WindowSnapshot& snapshot) const {
    return std::visit([&](const auto& node) { return node.match(snapshot); }, node_);
}

bool Predicate::reverse() const {
    return std::visit([](const auto& node) { return node.reverse(); }, node_);
}

void Predicate::set_reverse(bool reverse) {
    std::visit([reverse](auto& node) { node.set_reverse(reverse); }, node_);
}

Predicate Predicate::as_reverse() const {
    return std::visit([](const auto& node) -> Predicate { return node.as_reverse(); }, node_);
}

std::vector<LeafMatch> Predicate::as_list() const {
    return std::visit(overloaded{
        [](const LeafMatch& leaf) { return std::vector<LeafMatch>{leaf}; },
        [](const Composite& group) { return group.as_list(); },
    }, node_);
}

Predicate operator|(Predicate lhs, Predicate rhs) {
    std::vector<Predicate> children;
    children.push_back(std::move(lhs));
    children.push_back(std::move(rhs));
    return Predicate::any_of(std::move(children));
}

Predicate operator&(Predicate lhs, Predicate rhs) {
    std::vector<Predicate> children;
    children.push_back(std::move(lhs));
    children.push_back(std::move(rhs));
    return Predicate::all_of(std::move(children));
}
