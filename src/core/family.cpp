/**
 * @file family.cpp
 * @brief Member and EnumerationFamily implementation
 */

#include "confflags/family.hpp"

#include "common/logger.hpp"
#include "common/status.hpp"

namespace confflags {

// ─────────────────────────────────────────────────────────────────────────────
// Member
// ─────────────────────────────────────────────────────────────────────────────

Member::Member(const EnumerationFamily* family, size_t index, std::string name,
               StorageValue value, MemberLabel label)
    : family_(family), index_(index), name_(std::move(name)), value_(std::move(value)),
      label_(std::move(label)) {}

bool Member::is_composite() const noexcept {
    auto v = value_.try_integer();
    return v.has_value() && detail::is_composite_value(family_->kind(), *v);
}

std::string Member::display_label() const {
    return translate(label());
}

// ─────────────────────────────────────────────────────────────────────────────
// EnumerationFamily
// ─────────────────────────────────────────────────────────────────────────────

EnumerationFamily::EnumerationFamily(Token, std::string name, StorageKind kind, bool continuous)
    : name_(std::move(name)), kind_(kind), continuous_(continuous) {}

Status EnumerationFamily::create(FamilySpec spec, std::unique_ptr<EnumerationFamily>* out) {
    CONFFLAGS_RETURN_IF_ERROR(validate_family(spec));

    auto family = std::make_unique<EnumerationFamily>(Token{}, std::move(spec.name), spec.kind,
                                                      spec.continuous);

    family->owned_.reserve(spec.members.size());
    family->members_.reserve(spec.members.size());
    for (auto& m : spec.members) {
        const size_t index = family->owned_.size();
        family->names_.emplace(m.name, index);
        family->owned_.push_back(std::make_unique<Member>(
            family.get(), index, std::move(m.name), std::move(m.value), std::move(m.label)));
        family->members_.push_back(family->owned_.back().get());
    }

    LOG_DEBUG("Created family {} ({}, {} members)", family->name_, to_string(family->kind_),
              family->members_.size());
    *out = std::move(family);
    return Status::Ok();
}

StorageValue EnumerationFamily::canonical(const StorageValue& value) const {
    if (kind_ == StorageKind::kBooleanFlag) {
        auto v = value.try_integer();
        if (v.has_value() && (*v == 0 || *v == 1)) {
            return StorageValue(*v == 1);
        }
    }
    return value;
}

const Member* EnumerationFamily::find(const StorageValue& value) const {
    const StorageValue key = canonical(value);
    for (const Member* m : members_) {
        if (m->value() == key) {
            return m;
        }
    }
    return nullptr;
}

Status EnumerationFamily::lookup(const StorageValue& value, const Member** out) const {
    const Member* member = find(value);
    if (member == nullptr) {
        LOG_DEBUG("Family {} has no member with value {}", name_, value.to_string());
        return Status::UnknownMember(name_ + " has no member with value " + value.to_string());
    }
    *out = member;
    return Status::Ok();
}

const Member* EnumerationFamily::find_by_name(std::string_view name) const {
    auto it = names_.find(std::string(name));
    return it != names_.end() ? members_[it->second] : nullptr;
}

std::string EnumerationFamily::display_label(const Member& member) const {
    return member.display_label();
}

bool EnumerationFamily::contains(const StorageValue& value, const Member& flag) const {
    if (kind_ == StorageKind::kIntegerFlags) {
        auto raw = value.try_integer();
        auto bits = flag.value().try_integer();
        if (!raw.has_value() || !bits.has_value() || *raw < 0) {
            return false;
        }
        if (*bits == 0) {
            return *raw == 0;
        }
        return (*raw & *bits) == *bits;
    }
    return canonical(value) == flag.value();
}

Status EnumerationFamily::decompose(const StorageValue& value,
                                    std::vector<const Member*>* out) const {
    if (kind_ != StorageKind::kIntegerFlags) {
        const Member* member = nullptr;
        CONFFLAGS_RETURN_IF_ERROR(lookup(value, &member));
        out->clear();
        out->push_back(member);
        return Status::Ok();
    }

    auto raw = value.try_integer();
    if (!raw.has_value() || *raw < 0) {
        return Status::UnknownMember(name_ + " cannot hold flags value " + value.to_string());
    }

    std::vector<const Member*> flags;
    int64_t covered = 0;
    for (const Member* m : members_) {
        const int64_t bits = m->value().as_integer();
        if (bits == 0 || m->is_composite()) {
            continue;
        }
        if ((*raw & bits) == bits) {
            flags.push_back(m);
            covered |= bits;
        }
    }

    if ((*raw & ~covered) != 0) {
        return Status::UnknownMember(name_ + " value " + value.to_string() +
                                     " has undeclared bits " +
                                     std::to_string(*raw & ~covered));
    }

    *out = std::move(flags);
    return Status::Ok();
}

}  // namespace confflags
