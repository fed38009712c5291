#pragma once

#include "errors.hpp"
#include "profiles/profile.hpp"
#include "runner/job_runner.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using RunnerFactory = std::function<std::unique_ptr<JobRunner>(const ProfileParams&)>;

// Profile types known to the daemon, keyed by identifier. Populated at
// startup and sealed before the event loop starts; read-only afterwards.
class ProfileRegistry {
public:
    // DuplicateProfileError if the id is taken, InvalidStateError once sealed.
    std::expected<void, Error> register_profile(ProfileDescriptor descriptor, RunnerFactory factory);

    // UnknownProfileError, InvalidParameterError, or ModelError if the factory
    // could not build the runner.
    std::expected<std::unique_ptr<JobRunner>, Error> create(const std::string& id,
                                                            const nlohmann::json& params) const;

    const ProfileDescriptor* find(const std::string& id) const;
    std::vector<const ProfileDescriptor*> descriptors() const;

    void seal() { sealed_ = true; }
    bool sealed() const { return sealed_; }
    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        ProfileDescriptor descriptor;
        RunnerFactory factory;
    };

    std::map<std::string, Entry> entries_;
    std::vector<std::string> order_; // registration order
    bool sealed_ = false;
};
