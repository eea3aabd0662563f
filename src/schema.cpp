#include "taskmcp/schema.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>

namespace taskmcp {

std::string_view param_kind_to_string(ParamKind kind) {
    switch (kind) {
        case ParamKind::String:  return "string";
        case ParamKind::Number:  return "number";
        case ParamKind::Boolean: return "boolean";
        case ParamKind::Array:   return "array";
        case ParamKind::Object:  return "object";
        case ParamKind::Enum:    return "enum";
    }
    return "unknown";
}

ParamSpec string_param(std::string name, std::string description, bool required) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::String;
    p.required = required;
    p.description = std::move(description);
    return p;
}

ParamSpec number_param(std::string name, std::string description, bool required) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::Number;
    p.required = required;
    p.description = std::move(description);
    return p;
}

ParamSpec boolean_param(std::string name, std::string description, bool required) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::Boolean;
    p.required = required;
    p.description = std::move(description);
    return p;
}

ParamSpec enum_param(std::string name, std::vector<std::string> values,
                     std::string description, bool required) {
    ParamSpec p;
    p.name = std::move(name);
    p.kind = ParamKind::Enum;
    p.required = required;
    p.enum_values = std::move(values);
    p.description = std::move(description);
    return p;
}

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (const auto& v : values) {
        if (!out.empty()) out += ", ";
        out += v;
    }
    return out;
}

std::optional<std::string> check_value(const ParamSpec& spec, const nlohmann::json& value) {
    const std::string& name = spec.name;
    switch (spec.kind) {
        case ParamKind::String:
            if (!value.is_string()) return "'" + name + "' must be a string";
            if (spec.min_length && value.get_ref<const std::string&>().size() < *spec.min_length) {
                return "'" + name + "' must be at least " + std::to_string(*spec.min_length)
                       + " characters";
            }
            return std::nullopt;
        case ParamKind::Number: {
            if (!value.is_number()) return "'" + name + "' must be a number";
            if (spec.integer) {
                // Floating-point values never count, even integral ones like 1e30.
                if (!value.is_number_integer()) return "'" + name + "' must be an integer";
                if (value.is_number_unsigned()
                    && value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                    return "'" + name + "' is out of range";
                }
            }
            double d = value.get<double>();
            if (spec.minimum && d < *spec.minimum) {
                return "'" + name + "' must be at least " + nlohmann::json(*spec.minimum).dump();
            }
            return std::nullopt;
        }
        case ParamKind::Boolean:
            if (!value.is_boolean()) return "'" + name + "' must be a boolean";
            return std::nullopt;
        case ParamKind::Array:
            if (!value.is_array()) return "'" + name + "' must be an array";
            return std::nullopt;
        case ParamKind::Object:
            if (!value.is_object()) return "'" + name + "' must be an object";
            return std::nullopt;
        case ParamKind::Enum: {
            if (!value.is_string()) return "'" + name + "' must be one of: " + join(spec.enum_values);
            const auto& s = value.get_ref<const std::string&>();
            if (std::find(spec.enum_values.begin(), spec.enum_values.end(), s)
                == spec.enum_values.end()) {
                return "'" + name + "' must be one of: " + join(spec.enum_values);
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<std::string> validate_parameters(const Schema& schema,
                                               const nlohmann::json& params) {
    if (!params.is_object()) {
        return std::string("parameters must be an object");
    }
    for (const auto& spec : schema) {
        auto it = params.find(spec.name);
        if (it == params.end() || it->is_null()) {
            if (spec.required) return "'" + spec.name + "' is required";
            continue;
        }
        if (auto err = check_value(spec, *it)) return err;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const ParamSpec& p) {
    j = {
        {"name", p.name},
        {"description", p.description.empty() ? p.name : p.description},
        {"type", std::string(param_kind_to_string(p.kind))},
        {"required", p.required}
    };
    if (p.kind == ParamKind::Enum) j["enum"] = p.enum_values;
}

} // namespace taskmcp
