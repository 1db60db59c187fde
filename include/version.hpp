// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace courier {

// Software version
constexpr int COURIER_VERSION_MAJOR = 1;
constexpr int COURIER_VERSION_MINOR = 0;
constexpr int COURIER_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(COURIER_VERSION_MAJOR) + "." +
         std::to_string(COURIER_VERSION_MINOR) + "." +
         std::to_string(COURIER_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "Courier version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// Startup banner naming the active publish strategy
inline std::string GetStartupBanner(const std::string &publish_strategy) {
  std::string banner;
  banner += "\n";
  banner += "+-------------------------------------------------+\n";
  banner += "|  courier - in-process message dispatch          |\n";
  banner += "+-------------------------------------------------+\n";

  std::string version_line = "|  Version: " + GetVersionString();
  banner += version_line + std::string(50 - version_line.length(), ' ') + "|\n";

  std::string publish_line = "|  Publish: " + publish_strategy;
  banner += publish_line + std::string(50 - publish_line.length(), ' ') + "|\n";

  banner += "+-------------------------------------------------+\n\n";
  return banner;
}

} // namespace courier
