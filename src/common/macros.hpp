#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for confflags
 */

#include <cstdlib>
#include <iostream>

namespace confflags {

// ─────────────────────────────────────────────────────────────────────────────
// Assertion Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Check that always runs (even in release) and aborts on failure
 */
#define CONFFLAGS_CHECK(condition, message)                                   \
    do {                                                                      \
        if (!(condition)) {                                                   \
            std::cerr << "Check failed: " << #condition << "\n"               \
                      << "Message: " << (message) << "\n"                     \
                      << "File: " << __FILE__ << "\n"                         \
                      << "Line: " << __LINE__ << std::endl;                   \
            std::abort();                                                     \
        }                                                                     \
    } while (false)

}  // namespace confflags
