#pragma once

#include "geo_resolver/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace geo_resolver {

// Flat-JSON helpers. Documents exchanged by this project are small objects
// with string/number/bool/null members, so fields are located by pattern
// rather than through a full parser.

std::string json_escape(const std::string &s);
std::string json_unescape(const std::string &s);
std::string json_quote(const std::string &s);
std::string json_string_or_null(const Value &v);

std::optional<std::string> json_find_string(const std::string &json,
                                            const std::string &key);
std::optional<std::int64_t> json_find_i64(const std::string &json,
                                          const std::string &key);
std::optional<bool> json_find_bool(const std::string &json,
                                   const std::string &key);
bool json_is_null(const std::string &json, const std::string &key);

// Object-valued members of the top-level object, as "name" -> raw nested
// object text. Scalar members are skipped.
std::vector<std::pair<std::string, std::string>>
json_object_members(const std::string &json);

} // namespace geo_resolver
