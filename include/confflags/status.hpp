#pragma once

/**
 * @file status.hpp
 * @brief Public status and error codes for confflags
 */

#include <string>
#include <string_view>
#include <utility>

namespace confflags {

/**
 * @brief Status codes for family lookups and definition checks
 */
enum class StatusCode {
    kOk = 0,
    kUnknownMember,
    kDuplicateValue,
    kDiscontinuous,
    kMissingLabel,
    kNonExhaustive,
    kInvalidDefinition,
    kNotFound,
};

/**
 * @brief Status class for operation results
 *
 * A failed lookup (kUnknownMember, kNotFound) is recoverable by the caller.
 * The remaining error codes describe a defect in a family definition and
 * are only produced by the validation functions.
 */
class Status {
public:
    /**
     * @brief Create a success status
     */
    Status() noexcept : code_(StatusCode::kOk) {}

    /**
     * @brief Create a status with the given code
     */
    explicit Status(StatusCode code) noexcept : code_(code) {}

    /**
     * @brief Create a status with code and message
     */
    Status(StatusCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    // Factory methods
    [[nodiscard]] static Status Ok() noexcept { return Status(); }
    [[nodiscard]] static Status UnknownMember(std::string msg = "") { return Status(StatusCode::kUnknownMember, std::move(msg)); }
    [[nodiscard]] static Status DuplicateValue(std::string msg = "") { return Status(StatusCode::kDuplicateValue, std::move(msg)); }
    [[nodiscard]] static Status Discontinuous(std::string msg = "") { return Status(StatusCode::kDiscontinuous, std::move(msg)); }
    [[nodiscard]] static Status MissingLabel(std::string msg = "") { return Status(StatusCode::kMissingLabel, std::move(msg)); }
    [[nodiscard]] static Status NonExhaustive(std::string msg = "") { return Status(StatusCode::kNonExhaustive, std::move(msg)); }
    [[nodiscard]] static Status InvalidDefinition(std::string msg = "") { return Status(StatusCode::kInvalidDefinition, std::move(msg)); }
    [[nodiscard]] static Status NotFound(std::string msg = "") { return Status(StatusCode::kNotFound, std::move(msg)); }

    // Query methods
    [[nodiscard]] bool ok() const noexcept { return code_ == StatusCode::kOk; }
    [[nodiscard]] bool is_error() const noexcept { return code_ != StatusCode::kOk; }
    [[nodiscard]] bool is_unknown_member() const noexcept { return code_ == StatusCode::kUnknownMember; }

    /// True for codes that signal a broken family definition
    [[nodiscard]] bool is_definition_error() const noexcept {
        return code_ != StatusCode::kOk && code_ != StatusCode::kUnknownMember &&
               code_ != StatusCode::kNotFound;
    }

    [[nodiscard]] StatusCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /**
     * @brief Get a human-readable string representation
     */
    [[nodiscard]] std::string to_string() const;

    explicit operator bool() const noexcept { return ok(); }

private:
    StatusCode code_;
    std::string message_;
};

}  // namespace confflags
