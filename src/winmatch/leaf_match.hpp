#pragma once

#include "match_error.hpp"
#include "window_snapshot.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <regex>
#include <string>

// How the string criteria of a leaf compare against snapshot fields.
enum class MatchDiscipline {
    RegEx,    // case-insensitive regex search
    Full,     // exact equality
    Partial,  // substring containment
};

const char* to_string(MatchDiscipline discipline);
std::optional<MatchDiscipline> discipline_from_string(const std::string& name);

// Absent criteria are not checked. A pid of 0 counts as absent.
struct LeafCriteria {
    std::optional<WindowHandle> handle;
    std::optional<std::string> title;
    std::optional<std::string> window_class;
    std::optional<std::string> exe;
    std::optional<std::string> exe_path;
    std::optional<uint32_t> pid;
    std::optional<std::string> desktop;
    MatchDiscipline discipline = MatchDiscipline::RegEx;
};

class LeafMatch {
public:
    // Compiles regex criteria up front; a bad pattern yields MatchErrorKind::Pattern.
    static std::expected<LeafMatch, MatchError> create(LeafCriteria criteria);
    // Matches exactly one window.
    static LeafMatch for_handle(WindowHandle handle);

    // True iff every configured criterion holds, inverted when reversed.
    bool match(const WindowSnapshot& snapshot) const;

    bool match_handle(std::optional<WindowHandle> handle) const;
    bool match_title(const std::string& title) const;
    bool match_class(const std::string& window_class) const;
    bool match_exe(const std::string& exe) const;
    bool match_exe_path(const std::string& exe_path) const;
    bool match_pid(uint32_t pid) const;

    const LeafCriteria& criteria() const { return criteria_; }
    MatchDiscipline discipline() const { return criteria_.discipline; }
    bool has_criteria() const;

    bool reverse() const { return reverse_; }
    void set_reverse(bool reverse) { reverse_ = reverse; }
    LeafMatch as_reverse() const;

private:
    using Pattern = std::shared_ptr<const std::regex>;

    LeafMatch() = default;

    bool handle_holds(std::optional<WindowHandle> handle) const;
    bool pid_holds(uint32_t pid) const;
    bool field_holds(const std::string& value, const std::optional<std::string>& criterion,
                     const Pattern& pattern) const;

    LeafCriteria criteria_;
    bool reverse_ = false;

    // Compiled patterns, only populated under MatchDiscipline::RegEx. Shared
    // between copies; std::regex is never mutated after construction.
    Pattern title_re_;
    Pattern class_re_;
    Pattern exe_re_;
    Pattern exe_path_re_;
};
