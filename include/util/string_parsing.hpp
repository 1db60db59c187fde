// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and configuration values
 - Consistent error handling: std::nullopt / false on any malformed input

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParseSize: Parse non-negative count with an upper bound
 - IsValidLogLevel: Validate an spdlog level name
 - SplitList: Split a comma-separated option value
*/

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace courier {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * - Validates entire string is consumed (no trailing characters)
 * - Checks value is within [min, max] range
 * - Returns std::nullopt on any error (never throws)
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse a non-negative count (thread counts, queue sizes)
 *
 * Rejects signs, whitespace and values above max.
 *
 * Examples:
 *   SafeParseSize("8", 256) -> 8
 *   SafeParseSize("-1", 256) -> std::nullopt
 */
std::optional<size_t> SafeParseSize(const std::string& str, size_t max);

// True for trace, debug, info, warn, error, critical, off
bool IsValidLogLevel(const std::string& level);

// Split "a,b,,c" into {"a", "b", "c"} (empty items dropped)
std::vector<std::string> SplitList(const std::string& str, char separator = ',');

} // namespace util
} // namespace courier
