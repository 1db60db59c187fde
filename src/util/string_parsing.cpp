// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>

namespace courier {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  // Reject empty or whitespace-leading strings
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  long value = 0;
  const char* begin = str.data();
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);

  // Check entire string was consumed and no overflow occurred
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }

  if (value < min || value > max) {
    return std::nullopt;
  }

  return static_cast<int>(value);
}

std::optional<size_t> SafeParseSize(const std::string& str, size_t max) {
  if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }

  unsigned long long value = 0;
  const char* end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }

  if (value > max) {
    return std::nullopt;
  }

  return static_cast<size_t>(value);
}

bool IsValidLogLevel(const std::string& level) {
  static const std::array<const char*, 7> kLevels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  return std::any_of(kLevels.begin(), kLevels.end(),
                     [&](const char* l) { return level == l; });
}

std::vector<std::string> SplitList(const std::string& str, char separator) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= str.size()) {
    size_t pos = str.find(separator, start);
    if (pos == std::string::npos) {
      pos = str.size();
    }
    if (pos > start) {
      items.push_back(str.substr(start, pos - start));
    }
    start = pos + 1;
  }
  return items;
}

} // namespace util
} // namespace courier
