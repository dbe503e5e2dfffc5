#pragma once

#include "leaf_match.hpp"
#include "match_error.hpp"
#include "window_snapshot.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <utility>
#include <variant>
#include <vector>

enum class Combinator {
    Any,  // whitelist matches if at least one child matches
    All,  // whitelist matches if it is non-empty and every child matches
};

class Predicate;

using LeafFilter = std::function<bool(const LeafMatch&)>;

// A whitelist/blacklist group of child predicates.
//
// Any blacklist hit vetoes the match; otherwise the whitelist is aggregated
// according to the combinator. The reverse flag is applied last.
//
// Children are owned by value, so copies (including as_reverse()) never share
// containers with the original. match() may run concurrently on a group
// nobody is modifying; add/remove/set_reverse need external locking.
class Composite {
public:
    explicit Composite(Combinator combinator = Combinator::Any);
    Composite(Combinator combinator, std::vector<Predicate> whitelist);
    Composite(const Composite& other);
    Composite(Composite&& other) noexcept;
    Composite& operator=(const Composite& other);
    Composite& operator=(Composite&& other) noexcept;
    ~Composite();

    bool match(const WindowSnapshot& snapshot) const;

    Combinator combinator() const { return combinator_; }

    std::vector<Predicate>& whitelist() { return whitelist_; }
    const std::vector<Predicate>& whitelist() const { return whitelist_; }
    std::vector<Predicate>& blacklist() { return blacklist_; }
    const std::vector<Predicate>& blacklist() const { return blacklist_; }

    // Number of whitelist children.
    size_t size() const;

    bool reverse() const { return reverse_; }
    void set_reverse(bool reverse) { reverse_ = reverse; }
    Composite as_reverse() const;

    void add(Predicate predicate);
    void add(std::vector<Predicate> predicates);
    void add(WindowHandle window);
    void add_blacklist(Predicate predicate);
    void add_blacklist(std::vector<Predicate> predicates);
    void add_blacklist(WindowHandle window);

    // Removes every leaf accepted by `filter`, recursing into child groups of
    // the whitelist. Child groups left with an empty whitelist are pruned.
    // Returns true if anything was removed.
    std::expected<bool, MatchError> remove(const LeafFilter& filter);
    std::expected<bool, MatchError> remove_blacklist(const LeafFilter& filter);

    // Leaves reachable through whitelists, depth-first, left to right.
    std::vector<LeafMatch> as_list() const;

private:
    bool whitelist_matches(const WindowSnapshot& snapshot) const;
    static bool any_matches(const std::vector<Predicate>& list, const WindowSnapshot& snapshot);
    static bool remove_from(std::vector<Predicate>& list, const LeafFilter& filter);

    Combinator combinator_;
    std::vector<Predicate> whitelist_;
    std::vector<Predicate> blacklist_;
    bool reverse_ = false;
};

// A node of a predicate tree: either a leaf matcher or a group.
class Predicate {
public:
    Predicate(LeafMatch leaf);
    Predicate(Composite composite);

    static Predicate any_of(std::vector<Predicate> children = {});
    static Predicate all_of(std::vector<Predicate> children = {});

    bool match(const WindowSnapshot& snapshot) const;

    bool reverse() const;
    void set_reverse(bool reverse);
    Predicate as_reverse() const;

    std::vector<LeafMatch> as_list() const;

    bool is_leaf() const { return std::holds_alternative<LeafMatch>(node_); }
    bool is_composite() const { return std::holds_alternative<Composite>(node_); }

    const LeafMatch* leaf() const { return std::get_if<LeafMatch>(&node_); }
    LeafMatch* leaf() { return std::get_if<LeafMatch>(&node_); }
    const Composite* composite() const { return std::get_if<Composite>(&node_); }
    Composite* composite() { return std::get_if<Composite>(&node_); }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const {
        return std::visit(std::forward<Visitor>(visitor), node_);
    }

private:
    std::variant<LeafMatch, Composite> node_;
};

// Either operand matches.
Predicate operator|(Predicate lhs, Predicate rhs);
// Both operands match.
Predicate operator&(Predicate lhs, Predicate rhs);
