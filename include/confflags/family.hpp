#pragma once

/**
 * @file family.hpp
 * @brief Runtime view of an option family
 *
 * EnumerationFamily works with raw storage values and member names. It is
 * what persistence and settings UI code use; C++ callers that know the
 * option at compile time can use the typed functions in enum_traits.hpp.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "confflags/enum_traits.hpp"
#include "confflags/status.hpp"
#include "confflags/storage_value.hpp"
#include "confflags/translator.hpp"

namespace confflags {

class EnumerationFamily;

/**
 * @brief Display label of a runtime member, owning its message strings
 */
struct MemberLabel {
    std::string msgid;
    std::string context;
};

/**
 * @brief One option value within a family
 *
 * Members are owned by their family and never copied, so a pointer to a
 * member identifies it.
 */
class Member {
public:
    Member(const EnumerationFamily* family, size_t index, std::string name,
           StorageValue value, MemberLabel label);

    Member(const Member&) = delete;
    Member& operator=(const Member&) = delete;
    Member(Member&&) = delete;
    Member& operator=(Member&&) = delete;

    [[nodiscard]] const EnumerationFamily& family() const noexcept { return *family_; }
    [[nodiscard]] size_t index() const noexcept { return index_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const StorageValue& value() const noexcept { return value_; }
    /// Views into strings owned by this member
    [[nodiscard]] LabelKey label() const noexcept { return {label_.msgid, label_.context}; }

    /// True for a flags member whose value is the OR of other members
    [[nodiscard]] bool is_composite() const noexcept;

    /**
     * @brief Localized display string, resolved through the installed translator
     */
    [[nodiscard]] std::string display_label() const;

private:
    const EnumerationFamily* family_;
    size_t index_;
    std::string name_;
    StorageValue value_;
    MemberLabel label_;
};

/**
 * @brief Definition of one member, before validation
 */
struct MemberSpec {
    std::string name;
    StorageValue value;
    MemberLabel label;
};

/**
 * @brief Definition of a family, before validation
 */
struct FamilySpec {
    std::string name;
    StorageKind kind = StorageKind::kInteger;
    bool continuous = false;
    std::vector<MemberSpec> members;
};

/**
 * @brief Check a family definition
 *
 * Reports the first defect found, naming the family and the offending
 * member(s):
 * - kInvalidDefinition: no members, too many members, empty or repeated
 *   member name, a value whose type does not match the kind, a negative
 *   integer value, or a String family marked continuous
 * - kDuplicateValue: two members share a storage value
 * - kMissingLabel: a member has an empty label message
 * - kDiscontinuous: a continuous family's non-composite values have a gap
 */
[[nodiscard]] Status validate_family(const FamilySpec& spec);

/**
 * @brief A closed, named set of members sharing a storage kind
 *
 * Immutable once created; safe for any number of concurrent readers.
 */
class EnumerationFamily {
    struct Token {
        explicit Token() = default;
    };

public:
    /**
     * @brief Validate a definition and build the family
     * @param spec Family definition
     * @param out Receives the family on success
     * @return Status::Ok(), or the validation error
     */
    [[nodiscard]] static Status create(FamilySpec spec,
                                       std::unique_ptr<EnumerationFamily>* out);

    /// Only create() can supply the token
    EnumerationFamily(Token, std::string name, StorageKind kind, bool continuous);

    EnumerationFamily(const EnumerationFamily&) = delete;
    EnumerationFamily& operator=(const EnumerationFamily&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] StorageKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_continuous() const noexcept { return continuous_; }
    [[nodiscard]] size_t size() const noexcept { return members_.size(); }

    /**
     * @brief All members in declaration order
     *
     * The returned vector never changes, so it can be walked any number of
     * times.
     */
    [[nodiscard]] const std::vector<const Member*>& members() const noexcept {
        return members_;
    }

    [[nodiscard]] const Member& member(size_t index) const { return *members_.at(index); }

    /**
     * @brief Find the member stored as @p value
     * @param value Raw value from the settings store
     * @param out Receives the member on success
     * @return Status::Ok(), or kUnknownMember if no member has exactly that
     *         value (including a flags combination that is not declared)
     */
    [[nodiscard]] Status lookup(const StorageValue& value, const Member** out) const;

    /// Like lookup(), returning nullptr instead of a status
    [[nodiscard]] const Member* find(const StorageValue& value) const;

    [[nodiscard]] const Member* find_by_name(std::string_view name) const;

    [[nodiscard]] std::string display_label(const Member& member) const;

    /**
     * @brief Check whether every bit of @p flag is set in @p value
     *
     * Only meaningful for flag families; other kinds compare whole values.
     */
    [[nodiscard]] bool contains(const StorageValue& value, const Member& flag) const;

    /**
     * @brief Split a flags value into the single-bit members it contains
     * @param value Raw value, any combination of declared bits
     * @param out Receives the primitive members in declaration order
     * @return Status::Ok(), or kUnknownMember if @p value has a bit that no
     *         member declares
     */
    [[nodiscard]] Status decompose(const StorageValue& value,
                                   std::vector<const Member*>* out) const;

private:
    /// BooleanFlag families also accept 0 and 1 as stored values
    [[nodiscard]] StorageValue canonical(const StorageValue& value) const;

    std::string name_;
    StorageKind kind_;
    bool continuous_;
    std::vector<std::unique_ptr<Member>> owned_;
    std::vector<const Member*> members_;
    std::unordered_map<std::string, size_t> names_;  ///< Member name -> index
};

/**
 * @brief Build the runtime definition of a typed family
 */
template <typename E>
FamilySpec describe_family() {
    using Traits = FamilyTraits<E>;
    FamilySpec spec;
    spec.name = std::string(Traits::kName);
    spec.kind = Traits::kKind;
    spec.continuous = Traits::kContinuous;
    spec.members.reserve(Traits::kMembers.size());
    for (const auto& m : Traits::kMembers) {
        spec.members.push_back(MemberSpec{
            std::string(m.name), StorageValue(m.value),
            MemberLabel{std::string(m.label.msgid), std::string(m.label.context)}});
    }
    return spec;
}

}  // namespace confflags
