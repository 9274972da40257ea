#pragma once

/**
 * @file confflags.hpp
 * @brief Main include header for confflags
 *
 * Include this single header to access the public API of confflags.
 */

#include "confflags/enum_traits.hpp"
#include "confflags/family.hpp"
#include "confflags/options.hpp"
#include "confflags/registry.hpp"
#include "confflags/remote.hpp"
#include "confflags/status.hpp"
#include "confflags/storage_value.hpp"
#include "confflags/translator.hpp"

namespace confflags {

/**
 * @brief Get the version string of confflags
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

constexpr int version_major() noexcept {
    return 0;
}

constexpr int version_minor() noexcept {
    return 1;
}

constexpr int version_patch() noexcept {
    return 0;
}

}  // namespace confflags
