#pragma once

/**
 * @file enum_traits.hpp
 * @brief Compile-time description of option families
 *
 * An option family is an enum class plus a FamilyTraits specialization whose
 * member table pairs every enumerator with its storage value and the label
 * key of its display string. Because the label is a column of the table, a
 * member cannot be declared without one. CONFFLAGS_VERIFY_FAMILY checks the
 * remaining definition rules with static_assert.
 */

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "confflags/status.hpp"
#include "confflags/storage_value.hpp"
#include "confflags/translator.hpp"

namespace confflags {

/**
 * @brief One row of a family's member table
 */
template <typename E, typename Raw>
struct MemberDef {
    E id;
    std::string_view name;  ///< Machine identifier, e.g. "SPEECH_AND_BRAILLE"
    Raw value;              ///< Storage value
    LabelKey label;
};

/**
 * @brief Description of an option family, specialised once per enum
 *
 * A specialization provides:
 * - @c storage_type: int64_t (Integer, IntegerFlags), std::string_view
 *   (String) or bool (BooleanFlag)
 * - @c kName, @c kKind, @c kContinuous
 * - @c kMembers: std::array of MemberDef in declaration order
 */
template <typename E>
struct FamilyTraits;

template <typename E>
using storage_type_t = typename FamilyTraits<E>::storage_type;

/**
 * @brief Opt-in for the bitwise operators of an IntegerFlags family
 */
template <typename E>
struct enable_flag_operators : std::false_type {};

#define CONFFLAGS_FLAG_OPERATORS(E) \
    template <>                     \
    struct enable_flag_operators<E> : std::true_type {}

namespace detail {

constexpr int64_t ordinal(int64_t v) noexcept { return v; }
constexpr int64_t ordinal(bool v) noexcept { return v ? 1 : 0; }

/// A flags value with more than one bit set is the OR of other members
constexpr bool is_composite_value(StorageKind kind, int64_t v) noexcept {
    return kind == StorageKind::kIntegerFlags && v > 0 &&
           std::popcount(static_cast<uint64_t>(v)) > 1;
}

inline std::string describe(int64_t v) { return std::to_string(v); }
inline std::string describe(bool v) { return v ? "true" : "false"; }
inline std::string describe(std::string_view v) { return "\"" + std::string(v) + "\""; }

template <typename Def, size_t N>
constexpr bool has_unique_values(const std::array<Def, N>& members) {
    for (size_t i = 0; i < N; ++i) {
        for (size_t j = i + 1; j < N; ++j) {
            if (members[i].value == members[j].value) return false;
        }
    }
    return true;
}

template <typename Def, size_t N>
constexpr bool has_unique_ids(const std::array<Def, N>& members) {
    for (size_t i = 0; i < N; ++i) {
        for (size_t j = i + 1; j < N; ++j) {
            if (members[i].id == members[j].id || members[i].name == members[j].name) {
                return false;
            }
        }
    }
    return true;
}

template <typename Def, size_t N>
constexpr bool has_labels(const std::array<Def, N>& members) {
    return std::all_of(members.begin(), members.end(),
                       [](const Def& m) { return !m.label.msgid.empty(); });
}

template <typename Def, size_t N>
constexpr bool is_contiguous(StorageKind kind, const std::array<Def, N>& members) {
    std::array<int64_t, N> ordinals{};
    size_t count = 0;
    for (const auto& m : members) {
        const int64_t v = ordinal(m.value);
        if (!is_composite_value(kind, v)) {
            ordinals[count++] = v;
        }
    }
    std::sort(ordinals.begin(), ordinals.begin() + count);
    for (size_t i = 1; i < count; ++i) {
        if (ordinals[i] != ordinals[i - 1] + 1) return false;
    }
    return true;
}

template <typename E>
constexpr bool continuity_holds() {
    using Traits = FamilyTraits<E>;
    if constexpr (!Traits::kContinuous) {
        return true;
    } else {
        static_assert(is_ordinal_kind(Traits::kKind),
                      "String families cannot be marked continuous");
        return is_contiguous(Traits::kKind, Traits::kMembers);
    }
}

/// Integer enumerators must equal their storage value so that casts agree
template <typename E>
constexpr bool values_match_enumerators() {
    using Traits = FamilyTraits<E>;
    if constexpr (std::is_same_v<typename Traits::storage_type, int64_t>) {
        for (const auto& m : Traits::kMembers) {
            if (m.value < 0) return false;
            if (static_cast<int64_t>(static_cast<std::underlying_type_t<E>>(m.id)) != m.value) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace detail

#define CONFFLAGS_VERIFY_FAMILY(E)                                                        \
    static_assert(!::confflags::FamilyTraits<E>::kMembers.empty(),                        \
                  #E ": family has no members");                                          \
    static_assert(::confflags::detail::has_unique_values(                                 \
                      ::confflags::FamilyTraits<E>::kMembers),                            \
                  #E ": two members share a storage value");                              \
    static_assert(::confflags::detail::has_unique_ids(                                    \
                      ::confflags::FamilyTraits<E>::kMembers),                            \
                  #E ": member declared twice");                                          \
    static_assert(::confflags::detail::has_labels(::confflags::FamilyTraits<E>::kMembers), \
                  #E ": member without a display label");                                 \
    static_assert(::confflags::detail::values_match_enumerators<E>(),                     \
                  #E ": enumerator differs from its storage value");                      \
    static_assert(::confflags::detail::continuity_holds<E>(),                             \
                  #E ": member values are not continuous")

// ─────────────────────────────────────────────────────────────────────────────
// Typed access
// ─────────────────────────────────────────────────────────────────────────────

template <typename E>
constexpr const auto& members() noexcept {
    return FamilyTraits<E>::kMembers;
}

/**
 * @brief Position of a declared member in its family
 * @throws std::out_of_range if @p id is not a declared member
 */
template <typename E>
constexpr size_t index_of(E id) {
    const auto& table = FamilyTraits<E>::kMembers;
    for (size_t i = 0; i < table.size(); ++i) {
        if (table[i].id == id) return i;
    }
    throw std::out_of_range("Enumerator is not a declared member of " +
                            std::string(FamilyTraits<E>::kName));
}

/**
 * @brief Value to persist or compare with the settings store
 *
 * For integer families this is the enumerator's own value, so any
 * combination of flags has a storage value even if it is not declared.
 */
template <typename E>
constexpr storage_type_t<E> storage_value(E id) {
    if constexpr (std::is_same_v<storage_type_t<E>, int64_t>) {
        return static_cast<int64_t>(static_cast<std::underlying_type_t<E>>(id));
    } else {
        return FamilyTraits<E>::kMembers[index_of(id)].value;
    }
}

template <typename E>
constexpr std::string_view member_name(E id) {
    return FamilyTraits<E>::kMembers[index_of(id)].name;
}

template <typename E>
constexpr const LabelKey& label_key(E id) {
    return FamilyTraits<E>::kMembers[index_of(id)].label;
}

/**
 * @brief Localized display string of a member
 */
template <typename E>
std::string display_label(E id) {
    return translate(label_key(id));
}

template <typename E>
constexpr bool is_composite(E id) {
    return detail::is_composite_value(FamilyTraits<E>::kKind,
                                      detail::ordinal(storage_value(id)));
}

/**
 * @brief Find the member stored as @p value
 * @param value Raw value from the settings store
 * @param out Receives the member on success
 * @return Status::Ok(), or kUnknownMember if no member has that value
 */
template <typename E>
[[nodiscard]] Status lookup(storage_type_t<E> value, E* out) {
    for (const auto& m : FamilyTraits<E>::kMembers) {
        if (m.value == value) {
            *out = m.id;
            return Status::Ok();
        }
    }
    return Status::UnknownMember(std::string(FamilyTraits<E>::kName) +
                                 " has no member with value " + detail::describe(value));
}

// ─────────────────────────────────────────────────────────────────────────────
// Flag operations
// ─────────────────────────────────────────────────────────────────────────────

template <typename E, typename = std::enable_if_t<enable_flag_operators<E>::value>>
constexpr E operator|(E lhs, E rhs) noexcept {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(lhs) | static_cast<U>(rhs));
}

template <typename E, typename = std::enable_if_t<enable_flag_operators<E>::value>>
constexpr E operator&(E lhs, E rhs) noexcept {
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(lhs) & static_cast<U>(rhs));
}

/**
 * @brief Check whether every bit of @p flag is set in @p value
 *
 * This tests membership of bits, unlike lookup() which matches a whole
 * value. The zero member is contained only in the zero value.
 */
template <typename E>
constexpr bool has_flag(E value, E flag) noexcept {
    static_assert(FamilyTraits<E>::kKind == StorageKind::kIntegerFlags,
                  "has_flag requires an IntegerFlags family");
    using U = std::underlying_type_t<E>;
    const auto bits = static_cast<U>(flag);
    if (bits == 0) return static_cast<U>(value) == 0;
    return (static_cast<U>(value) & bits) == bits;
}

/**
 * @brief OR of BooleanFlag members (true if any is true)
 */
template <typename E>
constexpr bool any_of(std::initializer_list<E> ids) {
    static_assert(FamilyTraits<E>::kKind == StorageKind::kBooleanFlag,
                  "any_of requires a BooleanFlag family");
    for (E id : ids) {
        if (storage_value(id)) return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Cross-domain mappings
// ─────────────────────────────────────────────────────────────────────────────

template <typename E, typename T>
using Mapping = std::pair<E, T>;

/**
 * @brief Check that a mapping lists every declared member exactly once
 */
template <typename E, typename T, size_t N>
constexpr bool covers_all_members(const std::array<Mapping<E, T>, N>& mapping) {
    const auto& table = FamilyTraits<E>::kMembers;
    if (N != table.size()) return false;
    for (const auto& m : table) {
        size_t hits = 0;
        for (const auto& entry : mapping) {
            if (entry.first == m.id) ++hits;
        }
        if (hits != 1) return false;
    }
    return true;
}

/**
 * @brief Runtime form of covers_all_members() naming the first gap
 */
template <typename E, typename T, size_t N>
[[nodiscard]] Status validate_mapping(std::string_view target,
                                      const std::array<Mapping<E, T>, N>& mapping) {
    for (const auto& m : FamilyTraits<E>::kMembers) {
        size_t hits = 0;
        for (const auto& entry : mapping) {
            if (entry.first == m.id) ++hits;
        }
        if (hits == 0) {
            return Status::NonExhaustive(std::string(FamilyTraits<E>::kName) + "." +
                                         std::string(m.name) + " has no " +
                                         std::string(target) + " mapping");
        }
        if (hits > 1) {
            return Status::InvalidDefinition(std::string(FamilyTraits<E>::kName) + "." +
                                             std::string(m.name) + " is mapped to " +
                                             std::string(target) + " more than once");
        }
    }
    if (N != FamilyTraits<E>::kMembers.size()) {
        return Status::InvalidDefinition(std::string(target) +
                                         " mapping lists undeclared members");
    }
    return Status::Ok();
}

template <typename E, typename T, size_t N>
constexpr T map_member(const std::array<Mapping<E, T>, N>& mapping, E id) {
    for (const auto& entry : mapping) {
        if (entry.first == id) return entry.second;
    }
    throw std::out_of_range("Member has no mapping in " + std::string(FamilyTraits<E>::kName));
}

}  // namespace confflags
