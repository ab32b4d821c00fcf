#include "shipcoord/util/strings.h"

namespace shipcoord {
namespace {

constexpr const char* kWhitespace = " \t\r\n";

} // namespace

std::string to_lower(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(kWhitespace);
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(kWhitespace);
  return s.substr(first, last - first + 1);
}

std::string csv_escape(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out = "\"";
  std::size_t from = 0;
  for (std::size_t q = s.find('"'); q != std::string::npos; q = s.find('"', from)) {
    out.append(s, from, q + 1 - from);
    out += '"';
    from = q + 1;
  }
  out.append(s, from, std::string::npos);
  out += '"';
  return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (const auto& p : parts) {
    if (&p != &parts.front()) out += sep;
    out += p;
  }
  return out;
}

} // namespace shipcoord
