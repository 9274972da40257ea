/**
 * @file validation.cpp
 * @brief Definition-time checks for option families
 */

#include <algorithm>
#include <unordered_set>
#include <utility>
#include <vector>

#include "common/config.hpp"
#include "common/status.hpp"
#include "confflags/family.hpp"

namespace confflags {

namespace {

std::string member_ref(const FamilySpec& spec, const MemberSpec& member) {
    return spec.name + "." + member.name;
}

Status check_shape(const FamilySpec& spec) {
    if (spec.name.empty()) {
        return Status::InvalidDefinition("Family has no name");
    }
    if (spec.members.empty()) {
        return Status::InvalidDefinition(spec.name + " has no members");
    }
    if (spec.members.size() > config::kMaxMembersPerFamily) {
        return Status::InvalidDefinition(spec.name + " has " +
                                         std::to_string(spec.members.size()) +
                                         " members, limit is " +
                                         std::to_string(config::kMaxMembersPerFamily));
    }
    if (spec.continuous && !is_ordinal_kind(spec.kind)) {
        return Status::InvalidDefinition(spec.name + " is a " + to_string(spec.kind) +
                                         " family and cannot be continuous");
    }

    std::unordered_set<std::string> names;
    for (const auto& m : spec.members) {
        if (m.name.empty() || m.name.size() > config::kMaxMemberNameLength) {
            return Status::InvalidDefinition(spec.name + " has a member with an invalid name '" +
                                             m.name + "'");
        }
        if (!names.insert(m.name).second) {
            return Status::InvalidDefinition(member_ref(spec, m) + " is declared twice");
        }
        if (!m.value.fits(spec.kind)) {
            return Status::InvalidDefinition(member_ref(spec, m) + " value " +
                                             m.value.to_string() + " does not fit a " +
                                             to_string(spec.kind) + " family");
        }
        auto v = m.value.try_integer();
        if (v.has_value() && *v < 0) {
            return Status::InvalidDefinition(member_ref(spec, m) + " has negative value " +
                                             std::to_string(*v));
        }
    }
    return Status::Ok();
}

Status check_unique(const FamilySpec& spec) {
    for (size_t i = 0; i < spec.members.size(); ++i) {
        for (size_t j = i + 1; j < spec.members.size(); ++j) {
            if (spec.members[i].value == spec.members[j].value) {
                return Status::DuplicateValue(
                    member_ref(spec, spec.members[j]) + " repeats value " +
                    spec.members[j].value.to_string() + " of " + spec.members[i].name);
            }
        }
    }
    return Status::Ok();
}

Status check_labels(const FamilySpec& spec) {
    for (const auto& m : spec.members) {
        if (m.label.msgid.empty()) {
            return Status::MissingLabel(member_ref(spec, m) + " has no display label");
        }
    }
    return Status::Ok();
}

Status check_continuous(const FamilySpec& spec) {
    if (!spec.continuous) {
        return Status::Ok();
    }

    std::vector<std::pair<int64_t, const MemberSpec*>> ordinals;
    ordinals.reserve(spec.members.size());
    for (const auto& m : spec.members) {
        const int64_t v = *m.value.ordinal();
        if (!detail::is_composite_value(spec.kind, v)) {
            ordinals.emplace_back(v, &m);
        }
    }
    std::sort(ordinals.begin(), ordinals.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    for (size_t i = 1; i < ordinals.size(); ++i) {
        if (ordinals[i].first != ordinals[i - 1].first + 1) {
            return Status::Discontinuous(
                member_ref(spec, *ordinals[i].second) + "=" + std::to_string(ordinals[i].first) +
                " does not follow " + member_ref(spec, *ordinals[i - 1].second) + "=" +
                std::to_string(ordinals[i - 1].first));
        }
    }
    return Status::Ok();
}

}  // namespace

Status validate_family(const FamilySpec& spec) {
    CONFFLAGS_RETURN_IF_ERROR(check_shape(spec));
    CONFFLAGS_RETURN_IF_ERROR(check_unique(spec));
    CONFFLAGS_RETURN_IF_ERROR(check_labels(spec));
    CONFFLAGS_RETURN_IF_ERROR(check_continuous(spec));
    return Status::Ok();
}

}  // namespace confflags
