/**
 * @file registry.cpp
 * @brief Registry implementation
 */

#include "confflags/registry.hpp"

#include "common/logger.hpp"
#include "common/macros.hpp"
#include "common/status.hpp"

namespace confflags {

Status Registry::add_family(FamilySpec spec) {
    if (family_exists(spec.name)) {
        return Status::InvalidDefinition("Family already registered: " + spec.name);
    }

    std::unique_ptr<EnumerationFamily> family;
    CONFFLAGS_RETURN_IF_ERROR(EnumerationFamily::create(std::move(spec), &family));

    family_names_[family->name()] = families_.size();
    families_.push_back(std::move(family));
    return Status::Ok();
}

void Registry::add_family_or_die(FamilySpec spec) {
    const std::string name = spec.name;
    Status status = add_family(std::move(spec));
    if (!status.ok()) {
        LOG_CRITICAL("Invalid option family {}: {}", name, status.to_string());
    }
    CONFFLAGS_CHECK(status.ok(), status.to_string());
}

const EnumerationFamily* Registry::get_family(std::string_view name) const {
    auto it = family_names_.find(std::string(name));
    return it != family_names_.end() ? families_[it->second].get() : nullptr;
}

bool Registry::family_exists(std::string_view name) const {
    return family_names_.find(std::string(name)) != family_names_.end();
}

std::vector<std::string> Registry::get_family_names() const {
    std::vector<std::string> names;
    names.reserve(families_.size());
    for (const auto& family : families_) {
        names.push_back(family->name());
    }
    return names;
}

Status Registry::lookup(std::string_view family, const StorageValue& value,
                        const Member** out) const {
    const EnumerationFamily* f = get_family(family);
    if (f == nullptr) {
        return Status::NotFound("Family not found: " + std::string(family));
    }
    return f->lookup(value, out);
}

}  // namespace confflags
