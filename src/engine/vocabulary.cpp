#include "geo_resolver/vocabulary.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace geo_resolver {
namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string alias_key(const std::string &s) {
  std::string out;
  for (unsigned char c : s) {
    if (std::isspace(c) || c == '.' || c == '-')
      continue;
    out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}

const std::unordered_map<std::string, std::string> &aliases() {
  static const std::unordered_map<std::string, std::string> table{
      {"US", "United States"},
      {"USA", "United States"},
      {"UNITEDSTATES", "United States"},
      {"UNITEDSTATESOFAMERICA", "United States"},
      {"CA", "Canada"},
      {"CAN", "Canada"},
      {"UK", "United Kingdom"},
      {"GB", "United Kingdom"},
      {"GBR", "United Kingdom"},
      {"UAE", "United Arab Emirates"},
      {"SA", "Saudi Arabia"},
      {"KSA", "Saudi Arabia"},
      {"AU", "Australia"},
      {"AUS", "Australia"},
      {"NZ", "New Zealand"},
      {"EU", "Europe"},
      {"EUROPEANUNION", "Europe"},
  };
  return table;
}
} // namespace

const std::vector<std::string> &known_countries() {
  static const std::vector<std::string> names{
      "Afghanistan",  "Albania",     "Algeria",
      "Argentina",    "Australia",   "Austria",
      "Bangladesh",   "Belgium",     "Brazil",
      "Canada",       "Chile",       "China",
      "Colombia",     "Czech Republic", "Denmark",
      "Egypt",        "Europe",      "Finland",
      "France",       "Germany",     "Greece",
      "Hong Kong",    "Hungary",     "India",
      "Indonesia",    "Iran",        "Iraq",
      "Ireland",      "Israel",      "Italy",
      "Japan",        "Kenya",       "Malaysia",
      "Mexico",       "Netherlands", "New Zealand",
      "Nigeria",      "Norway",      "Pakistan",
      "Philippines",  "Poland",      "Portugal",
      "Romania",      "Russia",      "Saudi Arabia",
      "Singapore",    "South Africa", "Korea",
      "South Korea",  "Spain",       "Sweden",
      "Switzerland",  "Taiwan",      "Thailand",
      "Turkey",       "Ukraine",     "United Arab Emirates",
      "United Kingdom", "United States", "Venezuela",
      "Vietnam"};
  return names;
}

std::optional<std::string> canonical_country(const std::string &name) {
  if (name.empty())
    return std::nullopt;
  const auto &names = known_countries();
  if (std::find(names.begin(), names.end(), name) != names.end())
    return name;

  auto alias = aliases().find(alias_key(name));
  if (alias != aliases().end())
    return alias->second;

  const std::string wanted = lower(trim(name));
  for (const auto &n : names)
    if (lower(n) == wanted)
      return n;
  return std::nullopt;
}

bool is_known_country(const std::string &name) {
  return canonical_country(name).has_value();
}

} // namespace geo_resolver
