#include "predicate_json.hpp"

#include <format>

using json = nlohmann::json;

namespace {

MatchError parse_error(std::string message) {
    return MatchError{MatchErrorKind::Parse, std::move(message)};
}

std::expected<LeafMatch, MatchError> leaf_from_json(const json& j) {
    LeafCriteria criteria;

    auto discipline = j.value("discipline", std::string("regex"));
    auto parsed = discipline_from_string(discipline);
    if (!parsed) return std::unexpected(parse_error("unknown discipline '" + discipline + "'"));
    criteria.discipline = *parsed;

    if (j.contains("handle")) criteria.handle = WindowHandle{j["handle"].get<uint64_t>()};
    if (j.contains("title")) criteria.title = j["title"].get<std::string>();
    if (j.contains("class")) criteria.window_class = j["class"].get<std::string>();
    if (j.contains("exe")) criteria.exe = j["exe"].get<std::string>();
    if (j.contains("exe_path")) criteria.exe_path = j["exe_path"].get<std::string>();
    if (j.contains("pid")) criteria.pid = j["pid"].get<uint32_t>();
    if (j.contains("desktop")) criteria.desktop = j["desktop"].get<std::string>();

    auto leaf = LeafMatch::create(std::move(criteria));
    if (!leaf) return leaf;
    leaf->set_reverse(j.value("reverse", false));
    return leaf;
}

std::expected<std::vector<Predicate>, MatchError> list_from_json(const json& j, const char* key) {
    std::vector<Predicate> list;
    if (!j.contains(key)) return list;

    const auto& items = j[key];
    if (!items.is_array()) return std::unexpected(parse_error(std::format("'{}' must be an array", key)));

    for (const auto& item : items) {
        auto child = predicate_from_json(item);
        if (!child) return std::unexpected(child.error());
        list.push_back(std::move(*child));
    }
    return list;
}

} // namespace

void to_json(json& j, const LeafMatch& leaf) {
    const auto& c = leaf.criteria();
    j = {
        {"type", "leaf"},
        {"discipline", to_string(c.discipline)},
        {"reverse", leaf.reverse()},
    };
    if (c.handle) j["handle"] = c.handle->value;
    if (c.title) j["title"] = *c.title;
    if (c.window_class) j["class"] = *c.window_class;
    if (c.exe) j["exe"] = *c.exe;
    if (c.exe_path) j["exe_path"] = *c.exe_path;
    if (c.pid) j["pid"] = *c.pid;
    if (c.desktop) j["desktop"] = *c.desktop;
}

void to_json(json& j, const Composite& group) {
    j = {
        {"type", group.combinator() == Combinator::All ? "all" : "any"},
        {"reverse", group.reverse()},
        {"whitelist", json::array()},
        {"blacklist", json::array()},
    };
    for (const auto& child : group.whitelist()) j["whitelist"].push_back(child);
    for (const auto& child : group.blacklist()) j["blacklist"].push_back(child);
}

void to_json(json& j, const Predicate& predicate) {
    predicate.visit([&j](const auto& node) { to_json(j, node); });
}

std::expected<Predicate, MatchError> predicate_from_json(const json& j) {
    if (!j.is_object()) return std::unexpected(parse_error("predicate must be an object"));

    try {
        auto type = j.value("type", std::string());

        if (type == "leaf") {
            auto leaf = leaf_from_json(j);
            if (!leaf) return std::unexpected(leaf.error());
            return Predicate(std::move(*leaf));
        }

        Combinator combinator;
        if (type == "any") {
            combinator = Combinator::Any;
        } else if (type == "all") {
            combinator = Combinator::All;
        } else {
            return std::unexpected(parse_error("unknown predicate type '" + type + "'"));
        }

        auto whitelist = list_from_json(j, "whitelist");
        if (!whitelist) return std::unexpected(whitelist.error());
        auto blacklist = list_from_json(j, "blacklist");
        if (!blacklist) return std::unexpected(blacklist.error());

        Composite group(combinator, std::move(*whitelist));
        group.add_blacklist(std::move(*blacklist));
        group.set_reverse(j.value("reverse", false));
        return Predicate(std::move(group));
    } catch (const json::exception& e) {
        return std::unexpected(parse_error(e.what()));
    }
}

std::expected<Predicate, MatchError> parse_predicate(const std::string& text) {
    try {
        return predicate_from_json(json::parse(text));
    } catch (const json::exception& e) {
        return std::unexpected(parse_error(e.what()));
    }
}
