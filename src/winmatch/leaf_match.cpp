#include "leaf_match.hpp"

#include <format>

namespace {

std::expected<std::shared_ptr<const std::regex>, MatchError>
compile(const std::optional<std::string>& pattern, const char* field) {
    if (!pattern) return nullptr;
    try {
        return std::make_shared<std::regex>(
            *pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        return std::unexpected(MatchError{
            MatchErrorKind::Pattern,
            std::format("invalid {} pattern '{}': {}", field, *pattern, e.what())});
    }
}

} // namespace

const char* to_string(MatchDiscipline discipline) {
    switch (discipline) {
        case MatchDiscipline::RegEx: return "regex";
        case MatchDiscipline::Full: return "full";
        case MatchDiscipline::Partial: return "partial";
    }
    return "regex";
}

std::optional<MatchDiscipline> discipline_from_string(const std::string& name) {
    if (name == "regex") return MatchDiscipline::RegEx;
    if (name == "full") return MatchDiscipline::Full;
    if (name == "partial") return MatchDiscipline::Partial;
    return std::nullopt;
}

std::expected<LeafMatch, MatchError> LeafMatch::create(LeafCriteria criteria) {
    if (criteria.pid == 0u) criteria.pid.reset();

    LeafMatch leaf;
    if (criteria.discipline == MatchDiscipline::RegEx) {
        auto title = compile(criteria.title, "title");
        if (!title) return std::unexpected(title.error());
        auto window_class = compile(criteria.window_class, "class");
        if (!window_class) return std::unexpected(window_class.error());
        auto exe = compile(criteria.exe, "exe");
        if (!exe) return std::unexpected(exe.error());
        auto exe_path = compile(criteria.exe_path, "exe path");
        if (!exe_path) return std::unexpected(exe_path.error());

        leaf.title_re_ = std::move(*title);
        leaf.class_re_ = std::move(*window_class);
        leaf.exe_re_ = std::move(*exe);
        leaf.exe_path_re_ = std::move(*exe_path);
    }
    leaf.criteria_ = std::move(criteria);
    return leaf;
}

LeafMatch LeafMatch::for_handle(WindowHandle handle) {
    LeafMatch leaf;
    leaf.criteria_.handle = handle;
    return leaf;
}

bool LeafMatch::match(const WindowSnapshot& snapshot) const {
    bool result = handle_holds(snapshot.handle)
               && field_holds(snapshot.window_class, criteria_.window_class, class_re_)
               && pid_holds(snapshot.pid)
               && field_holds(snapshot.exe, criteria_.exe, exe_re_)
               && field_holds(snapshot.exe_path, criteria_.exe_path, exe_path_re_)
               && field_holds(snapshot.title, criteria_.title, title_re_)
               && (!criteria_.desktop || *criteria_.desktop == snapshot.desktop);
    return reverse_ != result;
}

bool LeafMatch::match_handle(std::optional<WindowHandle> handle) const {
    return reverse_ != handle_holds(handle);
}

bool LeafMatch::match_title(const std::string& title) const {
    return reverse_ != field_holds(title, criteria_.title, title_re_);
}

bool LeafMatch::match_class(const std::string& window_class) const {
    return reverse_ != field_holds(window_class, criteria_.window_class, class_re_);
}

bool LeafMatch::match_exe(const std::string& exe) const {
    return reverse_ != field_holds(exe, criteria_.exe, exe_re_);
}

bool LeafMatch::match_exe_path(const std::string& exe_path) const {
    return reverse_ != field_holds(exe_path, criteria_.exe_path, exe_path_re_);
}

bool LeafMatch::match_pid(uint32_t pid) const {
    return reverse_ != pid_holds(pid);
}

bool LeafMatch::has_criteria() const {
    return criteria_.handle || criteria_.title || criteria_.window_class || criteria_.exe ||
           criteria_.exe_path || criteria_.pid || criteria_.desktop;
}

LeafMatch LeafMatch::as_reverse() const {
    LeafMatch copy = *this;
    copy.reverse_ = !reverse_;
    return copy;
}

bool LeafMatch::handle_holds(std::optional<WindowHandle> handle) const {
    if (!criteria_.handle) return true;
    return handle && *criteria_.handle == *handle;
}

bool LeafMatch::pid_holds(uint32_t pid) const {
    return !criteria_.pid || *criteria_.pid == pid;
}

bool LeafMatch::field_holds(const std::string& value, const std::optional<std::string>& criterion,
                            const Pattern& pattern) const {
    if (!criterion) return true;
    switch (criteria_.discipline) {
        case MatchDiscipline::RegEx:
            return std::regex_search(value, *pattern);
        case MatchDiscipline::Full:
            return value == *criterion;
        case MatchDiscipline::Partial:
            return value.find(*criterion) != std::string::npos;
    }
    return false;
}
