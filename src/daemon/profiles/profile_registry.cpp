#include "profiles/profile_registry.hpp"

#include <format>

std::expected<void, Error> ProfileRegistry::register_profile(ProfileDescriptor descriptor,
                                                             RunnerFactory factory) {
    if (sealed_) {
        return std::unexpected(Error{ErrorCode::InvalidState,
                                     std::format("registry is sealed, cannot add '{}'", descriptor.id)});
    }
    if (descriptor.id.empty() || !factory) {
        return std::unexpected(Error{ErrorCode::InvalidParameter, "profile needs an id and a factory"});
    }
    if (entries_.contains(descriptor.id)) {
        return std::unexpected(Error{ErrorCode::DuplicateProfile,
                                     std::format("profile '{}' already registered", descriptor.id)});
    }

    auto id = descriptor.id;
    entries_.emplace(id, Entry{std::move(descriptor), std::move(factory)});
    order_.push_back(std::move(id));
    return {};
}

std::expected<std::unique_ptr<JobRunner>, Error>
ProfileRegistry::create(const std::string& id, const nlohmann::json& params) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::unexpected(Error{ErrorCode::UnknownProfile, std::format("no profile '{}'", id)});
    }

    auto validated = ProfileParams::validate(it->second.descriptor, params);
    if (!validated) return std::unexpected(validated.error());

    auto runner = it->second.factory(*validated);
    if (!runner) {
        return std::unexpected(Error{ErrorCode::Model, std::format("profile '{}' failed to build a runner", id)});
    }
    return runner;
}

const ProfileDescriptor* ProfileRegistry::find(const std::string& id) const {
    auto it = entries_.find(id);
    return it != entries_.end() ? &it->second.descriptor : nullptr;
}

std::vector<const ProfileDescriptor*> ProfileRegistry::descriptors() const {
    std::vector<const ProfileDescriptor*> out;
    out.reserve(order_.size());
    for (auto& id : order_) {
        out.push_back(&entries_.at(id).descriptor);
    }
    return out;
}
