/**
 * @file storage_value.cpp
 * @brief StorageValue implementation
 */

#include "confflags/storage_value.hpp"

#include <stdexcept>
#include <type_traits>

namespace confflags {

int64_t StorageValue::as_integer() const {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    throw std::runtime_error("StorageValue is not an integer");
}

const std::string& StorageValue::as_string() const {
    if (auto* v = std::get_if<std::string>(&value_)) return *v;
    throw std::runtime_error("StorageValue is not a string");
}

bool StorageValue::as_bool() const {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    throw std::runtime_error("StorageValue is not a bool");
}

std::optional<int64_t> StorageValue::try_integer() const noexcept {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    return std::nullopt;
}

std::optional<std::string_view> StorageValue::try_string() const noexcept {
    if (auto* v = std::get_if<std::string>(&value_)) return std::string_view(*v);
    return std::nullopt;
}

std::optional<bool> StorageValue::try_bool() const noexcept {
    if (auto* v = std::get_if<bool>(&value_)) return *v;
    return std::nullopt;
}

std::optional<int64_t> StorageValue::ordinal() const noexcept {
    if (auto* v = std::get_if<int64_t>(&value_)) return *v;
    if (auto* v = std::get_if<bool>(&value_)) return *v ? 1 : 0;
    return std::nullopt;
}

bool StorageValue::fits(StorageKind kind) const noexcept {
    switch (kind) {
        case StorageKind::kInteger:
        case StorageKind::kIntegerFlags:
            return is_integer();
        case StorageKind::kString:
            return is_string();
        case StorageKind::kBooleanFlag:
            return is_bool();
    }
    return false;
}

std::string StorageValue::to_string() const {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                return std::to_string(v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else {
                return "\"" + v + "\"";
            }
        },
        value_);
}

}  // namespace confflags
