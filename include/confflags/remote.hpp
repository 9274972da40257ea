#pragma once

/**
 * @file remote.hpp
 * @brief Values understood by the remote-control subsystem
 */

#include <cstdint>
#include <string_view>

namespace confflags {
namespace remote {

/**
 * @brief Role of this computer in a remote-control session
 */
enum class ConnectionMode : uint8_t {
    kLeader = 0,  // controls the other computer
    kFollower,    // is controlled by the other computer
};

/**
 * @brief Wire name of a connection mode
 */
constexpr std::string_view to_string(ConnectionMode mode) noexcept {
    switch (mode) {
        case ConnectionMode::kLeader:   return "leader";
        case ConnectionMode::kFollower: return "follower";
    }
    return "unknown";
}

}  // namespace remote
}  // namespace confflags
