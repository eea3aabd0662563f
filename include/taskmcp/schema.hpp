#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace taskmcp {

enum class ParamKind {
    String,
    Number,
    Boolean,
    Array,
    Object,
    Enum
};

std::string_view param_kind_to_string(ParamKind kind);

/// Declared shape of one capability parameter.
struct ParamSpec {
    std::string name;
    ParamKind kind = ParamKind::String;
    bool required = false;
    std::vector<std::string> enum_values;   // only meaningful for ParamKind::Enum
    std::string description;

    // Optional constraints, checked by validate_parameters() only.
    std::optional<std::size_t> min_length;
    bool integer = false;
    std::optional<double> minimum;

    bool operator==(const ParamSpec& o) const {
        return name == o.name && kind == o.kind && required == o.required
               && enum_values == o.enum_values && description == o.description
               && min_length == o.min_length && integer == o.integer
               && minimum == o.minimum;
    }
};

/// Ordered parameter list; order is the declaration order.
using Schema = std::vector<ParamSpec>;

// ---- Builders ----

ParamSpec string_param(std::string name, std::string description, bool required = false);
ParamSpec number_param(std::string name, std::string description, bool required = false);
ParamSpec boolean_param(std::string name, std::string description, bool required = false);
ParamSpec enum_param(std::string name, std::vector<std::string> values,
                     std::string description, bool required = false);

/// Check params against schema. Returns a human-readable reason on the first
/// violation, std::nullopt when params conform. Unknown keys are ignored.
[[nodiscard]] std::optional<std::string> validate_parameters(const Schema& schema,
                                                             const nlohmann::json& params);

/// Discovery form: {name, description, type, required[, enum]}.
void to_json(nlohmann::json& j, const ParamSpec& p);

} // namespace taskmcp
