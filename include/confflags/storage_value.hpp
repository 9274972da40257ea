#pragma once

/**
 * @file storage_value.hpp
 * @brief Raw option values as persisted in the settings store
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace confflags {

/**
 * @brief Structural variant of an option family
 */
enum class StorageKind : uint8_t {
    kInteger = 0,   // small non-negative int
    kString,        // short machine token
    kIntegerFlags,  // power-of-two int, or an OR of such
    kBooleanFlag,   // false/true, OR is any-true
};

/**
 * @brief Name of a storage kind, for diagnostics
 */
constexpr const char* to_string(StorageKind kind) noexcept {
    switch (kind) {
        case StorageKind::kInteger:      return "Integer";
        case StorageKind::kString:       return "String";
        case StorageKind::kIntegerFlags: return "IntegerFlags";
        case StorageKind::kBooleanFlag:  return "BooleanFlag";
    }
    return "Unknown";
}

/**
 * @brief Check if members of this kind compose with bitwise OR
 */
constexpr bool is_flag_kind(StorageKind kind) noexcept {
    return kind == StorageKind::kIntegerFlags || kind == StorageKind::kBooleanFlag;
}

/**
 * @brief Check if members of this kind have an integer ordering
 */
constexpr bool is_ordinal_kind(StorageKind kind) noexcept {
    return kind != StorageKind::kString;
}

/**
 * @brief A raw value read from or written to the settings store
 *
 * Holds exactly one of an integer, a string or a boolean. Integer and
 * IntegerFlags families store integers, String families store strings and
 * BooleanFlag families store booleans.
 */
class StorageValue {
public:
    using ValueType = std::variant<int64_t, std::string, bool>;

    explicit StorageValue(int v) : value_(static_cast<int64_t>(v)) {}
    explicit StorageValue(int64_t v) : value_(v) {}
    explicit StorageValue(bool v) : value_(v) {}
    explicit StorageValue(std::string v) : value_(std::move(v)) {}
    explicit StorageValue(std::string_view v) : value_(std::string(v)) {}
    explicit StorageValue(const char* v) : value_(std::string(v)) {}

    /// Type checking methods
    [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<int64_t>(value_); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }

    /// Value retrieval methods (throw if wrong type)
    [[nodiscard]] int64_t as_integer() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] bool as_bool() const;

    /// Safe value retrieval (returns nullopt if wrong type)
    [[nodiscard]] std::optional<int64_t> try_integer() const noexcept;
    [[nodiscard]] std::optional<std::string_view> try_string() const noexcept;
    [[nodiscard]] std::optional<bool> try_bool() const noexcept;

    /**
     * @brief Integer reading of an ordinal value
     *
     * Booleans read as 0 and 1. Returns nullopt for strings.
     */
    [[nodiscard]] std::optional<int64_t> ordinal() const noexcept;

    /**
     * @brief Check whether this value has the shape a family of @p kind stores
     */
    [[nodiscard]] bool fits(StorageKind kind) const noexcept;

    /// Convert to string representation (strings are quoted)
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const ValueType& raw() const noexcept { return value_; }

    bool operator==(const StorageValue& other) const noexcept {
        return value_ == other.value_;
    }

    bool operator!=(const StorageValue& other) const noexcept {
        return !(*this == other);
    }

private:
    ValueType value_;
};

}  // namespace confflags
