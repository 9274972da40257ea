#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for confflags
 */

#include <spdlog/common.h>

#include <cstddef>

namespace confflags {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Logging Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Name of the spdlog logger used by the library
constexpr const char* kLoggerName = "confflags";

/// Level the logger starts at
constexpr spdlog::level::level_enum kDefaultLogLevel = spdlog::level::info;

/// Log line layout
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

// ─────────────────────────────────────────────────────────────────────────────
// Localization Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Locale consulted when the active locale has no entry for a message
constexpr const char* kFallbackLocale = "en";

// ─────────────────────────────────────────────────────────────────────────────
// Family Definition Limits
// ─────────────────────────────────────────────────────────────────────────────

/// Maximum members per family (a settings choice list, not a data table)
constexpr size_t kMaxMembersPerFamily = 64;

/// Maximum length of a member's machine identifier
constexpr size_t kMaxMemberNameLength = 64;

}  // namespace config
}  // namespace confflags
