#include "profiles/profile.hpp"

#include <algorithm>
#include <format>

using json = nlohmann::json;

namespace {

std::unexpected<Error> invalid(const std::string& param, const std::string& why) {
    return std::unexpected(Error{ErrorCode::InvalidParameter, std::format("'{}': {}", param, why)});
}

std::expected<ParamValue, Error> check_value(const ParamSpec& spec, const json& v) {
    auto check_range = [&spec](double x) -> std::expected<void, Error> {
        if (spec.min && x < *spec.min) {
            return invalid(spec.name, std::format("{} is below minimum {}", x, *spec.min));
        }
        if (spec.max && x > *spec.max) {
            return invalid(spec.name, std::format("{} is above maximum {}", x, *spec.max));
        }
        return {};
    };

    switch (spec.type) {
        case ParamType::Bool:
            if (!v.is_boolean()) return invalid(spec.name, "expected a boolean");
            return ParamValue{v.get<bool>()};

        case ParamType::Int: {
            if (!v.is_number_integer()) return invalid(spec.name, "expected an integer");
            auto x = v.get<int64_t>();
            if (auto r = check_range(static_cast<double>(x)); !r) return std::unexpected(r.error());
            return ParamValue{x};
        }

        case ParamType::Float: {
            if (!v.is_number()) return invalid(spec.name, "expected a number");
            auto x = v.get<double>();
            if (auto r = check_range(x); !r) return std::unexpected(r.error());
            return ParamValue{x};
        }

        case ParamType::String:
            if (!v.is_string()) return invalid(spec.name, "expected a string");
            return ParamValue{v.get<std::string>()};

        case ParamType::Choice: {
            if (!v.is_string()) return invalid(spec.name, "expected a string");
            auto s = v.get<std::string>();
            if (std::ranges::find(spec.choices, s) == spec.choices.end()) {
                std::string allowed;
                for (auto& c : spec.choices) {
                    if (!allowed.empty()) allowed += ", ";
                    allowed += c;
                }
                return invalid(spec.name, std::format("'{}' is not one of [{}]", s, allowed));
            }
            return ParamValue{std::move(s)};
        }
    }
    return invalid(spec.name, "unknown parameter type");
}

} // namespace

const ParamSpec* ProfileDescriptor::find_param(const std::string& name) const {
    auto it = std::ranges::find_if(params, [&name](const ParamSpec& p) { return p.name == name; });
    return it != params.end() ? &*it : nullptr;
}

std::expected<ProfileParams, Error> ProfileParams::validate(const ProfileDescriptor& desc,
                                                            const json& supplied) {
    if (!supplied.is_null() && !supplied.is_object()) {
        return std::unexpected(Error{ErrorCode::InvalidParameter, "parameters must be a JSON object"});
    }

    ProfileParams out;
    for (auto& spec : desc.params) {
        out.values_[spec.name] = spec.default_value;
    }

    if (supplied.is_null()) return out;

    for (auto& [name, value] : supplied.items()) {
        const auto* spec = desc.find_param(name);
        if (!spec) {
            return invalid(name, std::format("unknown parameter for profile '{}'", desc.id));
        }
        auto checked = check_value(*spec, value);
        if (!checked) return std::unexpected(checked.error());
        out.values_[name] = std::move(*checked);
    }

    return out;
}

bool ProfileParams::get_bool(const std::string& name, bool fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    if (auto* b = std::get_if<bool>(&it->second)) return *b;
    return fallback;
}

int64_t ProfileParams::get_int(const std::string& name, int64_t fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    if (auto* i = std::get_if<int64_t>(&it->second)) return *i;
    if (auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
    return fallback;
}

double ProfileParams::get_double(const std::string& name, double fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    if (auto* d = std::get_if<double>(&it->second)) return *d;
    if (auto* i = std::get_if<int64_t>(&it->second)) return static_cast<double>(*i);
    return fallback;
}

std::string ProfileParams::get_string(const std::string& name, const std::string& fallback) const {
    auto it = values_.find(name);
    if (it == values_.end()) return fallback;
    if (auto* s = std::get_if<std::string>(&it->second)) return *s;
    return fallback;
}

json ProfileParams::to_json() const {
    json j = json::object();
    for (auto& [name, value] : values_) {
        j[name] = param_value_to_json(value);
    }
    return j;
}

std::string_view param_type_name(ParamType type) {
    switch (type) {
        case ParamType::Bool: return "bool";
        case ParamType::Int: return "int";
        case ParamType::Float: return "float";
        case ParamType::String: return "string";
        case ParamType::Choice: return "choice";
    }
    return "unknown";
}

json param_value_to_json(const ParamValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

json descriptor_to_json(const ProfileDescriptor& desc) {
    json params = json::array();
    for (auto& p : desc.params) {
        json entry = {
            {"name", p.name},
            {"type", param_type_name(p.type)},
            {"default", param_value_to_json(p.default_value)},
        };
        if (p.min) entry["min"] = *p.min;
        if (p.max) entry["max"] = *p.max;
        if (!p.choices.empty()) entry["choices"] = p.choices;
        if (!p.description.empty()) entry["description"] = p.description;
        params.push_back(std::move(entry));
    }
    return {{"id", desc.id}, {"name", desc.display_name}, {"params", std::move(params)}};
}
