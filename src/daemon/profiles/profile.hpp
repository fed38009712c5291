#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ParamType { Bool, Int, Float, String, Choice };

using ParamValue = std::variant<bool, int64_t, double, std::string>;

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    ParamValue default_value;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::string> choices; // Choice only
    std::string description;
};

struct ProfileDescriptor {
    std::string id;
    std::string display_name;
    std::vector<ParamSpec> params;

    const ParamSpec* find_param(const std::string& name) const;
};

// Validated parameter snapshot for one runner instance.
class ProfileParams {
public:
    ProfileParams() = default;

    // Rejects unknown names, wrong types and out-of-range values with
    // InvalidParameterError. Missing parameters take their default.
    static std::expected<ProfileParams, Error> validate(const ProfileDescriptor& desc,
                                                        const nlohmann::json& supplied);

    bool contains(const std::string& name) const { return values_.contains(name); }

    bool get_bool(const std::string& name, bool fallback = false) const;
    int64_t get_int(const std::string& name, int64_t fallback = 0) const;
    double get_double(const std::string& name, double fallback = 0.0) const;
    std::string get_string(const std::string& name, const std::string& fallback = {}) const;

    void set(const std::string& name, ParamValue value) { values_[name] = std::move(value); }

    nlohmann::json to_json() const;

private:
    std::map<std::string, ParamValue> values_;
};

std::string_view param_type_name(ParamType type);
nlohmann::json param_value_to_json(const ParamValue& value);
nlohmann::json descriptor_to_json(const ProfileDescriptor& desc);
