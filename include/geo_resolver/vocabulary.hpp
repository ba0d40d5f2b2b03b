#pragma once

#include <optional>
#include <string>
#include <vector>

namespace geo_resolver {

// Fixed country vocabulary accepted by the shared remote cache.

// Exact name, then alias (whitespace, '.' and '-' stripped, upper-cased),
// then case-insensitive name.
std::optional<std::string> canonical_country(const std::string &name);
bool is_known_country(const std::string &name);
const std::vector<std::string> &known_countries();

} // namespace geo_resolver
