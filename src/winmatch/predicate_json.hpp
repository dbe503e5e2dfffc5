#pragma once

#include "leaf_match.hpp"
#include "match_error.hpp"
#include "predicate.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Leaf:      {"type":"leaf","discipline":"regex","reverse":false,"title":"...",...}
// Composite: {"type":"any"|"all","reverse":false,"whitelist":[...],"blacklist":[...]}
void to_json(nlohmann::json& j, const LeafMatch& leaf);
void to_json(nlohmann::json& j, const Composite& group);
void to_json(nlohmann::json& j, const Predicate& predicate);

std::expected<Predicate, MatchError> predicate_from_json(const nlohmann::json& j);
std::expected<Predicate, MatchError> parse_predicate(const std::string& text);
