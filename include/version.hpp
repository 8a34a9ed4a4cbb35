// Copyright (c) 2025 The procrouter developers
// Distributed under the MIT software license

#pragma once

#include <string>

#define PROCROUTER_VERSION_MAJOR 0
#define PROCROUTER_VERSION_MINOR 1
#define PROCROUTER_VERSION_PATCH 0

namespace procrouter {

inline std::string GetVersionString() {
  return std::to_string(PROCROUTER_VERSION_MAJOR) + "." + std::to_string(PROCROUTER_VERSION_MINOR) + "." +
         std::to_string(PROCROUTER_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "procrouterd version v" + GetVersionString();
}

}  // namespace procrouter
