#pragma once

/**
 * @file registry.hpp
 * @brief Registry of option families
 */

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "confflags/family.hpp"
#include "confflags/status.hpp"

namespace confflags {

/**
 * @brief Owns option families and finds them by name
 *
 * Families are added during start-up and never removed. After that the
 * registry is only read.
 */
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Family Management
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Validate and add a family
     * @return Status::Ok(), the validation error, or kInvalidDefinition if
     *         a family with the same name exists
     */
    [[nodiscard]] Status add_family(FamilySpec spec);

    template <typename E>
    [[nodiscard]] Status add_family() {
        return add_family(describe_family<E>());
    }

    /**
     * @brief Add a family whose definition must be valid
     *
     * Logs the defect at critical level and aborts the process if the
     * family is rejected. Used while building the application's families.
     */
    void add_family_or_die(FamilySpec spec);

    template <typename E>
    void add_family_or_die() {
        add_family_or_die(describe_family<E>());
    }

    [[nodiscard]] const EnumerationFamily* get_family(std::string_view name) const;
    [[nodiscard]] bool family_exists(std::string_view name) const;

    /// Family names in registration order
    [[nodiscard]] std::vector<std::string> get_family_names() const;

    [[nodiscard]] size_t size() const noexcept { return families_.size(); }

    /**
     * @brief Family of a typed option
     * @throws std::out_of_range if the family was never added
     */
    template <typename E>
    [[nodiscard]] const EnumerationFamily& family() const {
        const EnumerationFamily* f = get_family(FamilyTraits<E>::kName);
        if (f == nullptr) {
            throw std::out_of_range("Family not registered: " +
                                    std::string(FamilyTraits<E>::kName));
        }
        return *f;
    }

    /**
     * @brief Runtime member of a typed option
     * @throws std::out_of_range if the family was never added or @p id is
     *         not a declared member
     */
    template <typename E>
    [[nodiscard]] const Member& member(E id) const {
        return family<E>().member(index_of(id));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lookup
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Find the member of a named family stored as @p value
     * @return Status::Ok(), kNotFound for an unknown family, or
     *         kUnknownMember for an unknown value
     */
    [[nodiscard]] Status lookup(std::string_view family, const StorageValue& value,
                                const Member** out) const;

    /**
     * @brief The registry of every option family the application defines
     *
     * Built and validated on first use. A defect in a definition aborts the
     * process, since it can only come from a programming error.
     */
    [[nodiscard]] static const Registry& options();

private:
    std::vector<std::unique_ptr<EnumerationFamily>> families_;
    std::unordered_map<std::string, size_t> family_names_;  ///< Name -> index
};

}  // namespace confflags
