#include "zit/config.hpp"

#include "zit/storage.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <string>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

constexpr std::string_view k_blank_lines = "blank-lines:";
constexpr std::string_view k_abbrev = "abbrev:";

} // namespace

namespace zit {

Settings load_settings(const Storage &storage) {
  Settings out{};
  const auto text = storage.read(consts::kConfigFile);
  if (!text)
    return out;

  std::istringstream iss(*text);
  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_blank_lines)) {
      const auto v = trim(sv.substr(k_blank_lines.size()));
      if (v == "show") {
        out.show_blank_lines = true;
      } else if (v == "hide") {
        out.show_blank_lines = false;
      }
    } else if (sv.starts_with(k_abbrev)) {
      const auto v = trim(sv.substr(k_abbrev.size()));
      std::size_t n = 0;
      const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      if (ec == std::errc{} && ptr == v.data() + v.size()) {
        out.abbrev = std::clamp(n, consts::kMinPrefixLen, consts::kOidHexLen);
      }
    }
  }
  return out;
}

void save_settings(Storage &storage, const Settings &settings) {
  std::ostringstream os;
  os << "blank-lines: " << (settings.show_blank_lines ? "show" : "hide") << '\n'
     << "abbrev: " << settings.abbrev << '\n';
  storage.write(consts::kConfigFile, os.str());
}

} // namespace zit
