/* @file TagReport.cpp
 * @brief tokenises reader report lines into tag sets
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

// STL headers
#include <cctype>

// Pantheon headers
#include "protocols/TagReport.hpp"

using namespace pantheon::protocols;

namespace {

  bool isSeparator(char c) {
    return c == ',' || c == ';' || std::isspace(static_cast<unsigned char>(c));
  }

} // namespace

std::optional<TagReport> TagReport::fromWire(const std::string& line) {
  TagReport report;
  std::string token;

  auto flush = [&]() -> bool {
    if (token.empty())
      return true;
    for (char& c : token) {
      if (!std::isxdigit(static_cast<unsigned char>(c)))
        return false;
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    report.tags.insert(token);
    token.clear();
    return true;
  };

  for (char c : line) {
    if (isSeparator(c)) {
      if (!flush())
        return std::nullopt;
    } else {
      token.push_back(c);
    }
  }
  if (!flush())
    return std::nullopt;

  return report;
}

std::string TagReport::toWire() const {
  std::string out;
  for (const auto& tag : tags) {
    if (!out.empty())
      out += ',';
    out += tag;
  }
  return out + "\r\n";
}
