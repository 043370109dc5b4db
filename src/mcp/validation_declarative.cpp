#include <govcat/core/format.h>
#include <govcat/mcp/validation.h>

#include <cmath>
#include <map>
#include <optional>

namespace govcat::mcp {

namespace {

// Compiled form of one schema node
struct Shape {
    std::vector<std::string> types;
    std::vector<json> enumValues;
    std::vector<std::string> required;
    std::map<std::string, std::unique_ptr<Shape>> properties;
    bool additionalAllowed = true;
    std::unique_ptr<Shape> items;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<std::size_t> minItems;
    std::optional<std::size_t> maxItems;
    std::optional<std::size_t> maxLength;
};

std::unique_ptr<Shape> compile(const json& schema) {
    auto shape = std::make_unique<Shape>();
    if (!schema.is_object()) {
        return shape;
    }
    if (auto it = schema.find("type"); it != schema.end()) {
        if (it->is_string()) {
            shape->types.push_back(it->get<std::string>());
        } else if (it->is_array()) {
            for (const auto& t : *it) {
                if (t.is_string()) {
                    shape->types.push_back(t.get<std::string>());
                }
            }
        }
    }
    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        shape->enumValues.assign(it->begin(), it->end());
    }
    if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
        for (const auto& r : *it) {
            if (r.is_string()) {
                shape->required.push_back(r.get<std::string>());
            }
        }
    }
    if (auto it = schema.find("properties"); it != schema.end() && it->is_object()) {
        for (const auto& [key, sub] : it->items()) {
            shape->properties.emplace(key, compile(sub));
        }
    }
    if (auto it = schema.find("additionalProperties"); it != schema.end() && it->is_boolean()) {
        shape->additionalAllowed = it->get<bool>();
    }
    if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
        shape->items = compile(*it);
    }
    auto number = [&](const char* key) -> std::optional<double> {
        if (auto it = schema.find(key); it != schema.end() && it->is_number()) {
            return it->get<double>();
        }
        return std::nullopt;
    };
    auto count = [&](const char* key) -> std::optional<std::size_t> {
        if (auto it = schema.find(key); it != schema.end() && it->is_number_integer()) {
            const auto n = it->get<int64_t>();
            if (n >= 0) {
                return static_cast<std::size_t>(n);
            }
        }
        return std::nullopt;
    };
    shape->minimum = number("minimum");
    shape->maximum = number("maximum");
    shape->minItems = count("minItems");
    shape->maxItems = count("maxItems");
    shape->maxLength = count("maxLength");
    return shape;
}

std::string joinTypes(const std::vector<std::string>& types) {
    std::string out;
    for (const auto& t : types) {
        if (!out.empty()) {
            out += "|";
        }
        out += t;
    }
    return out;
}

void check(const Shape& shape, const json& value, const std::string& path,
           std::vector<ValidationIssue>& errors) {
    if (!shape.types.empty()) {
        bool matched = false;
        for (const auto& t : shape.types) {
            if (jsonMatchesType(value, t)) {
                matched = true;
                break;
            }
        }
        if (!matched) {
            errors.push_back({path, "type", "must be " + joinTypes(shape.types)});
            return;
        }
    }

    if (!shape.enumValues.empty()) {
        bool found = false;
        for (const auto& allowed : shape.enumValues) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            errors.push_back({path, "enum", "must be equal to one of the allowed values"});
        }
    }

    if (value.is_number()) {
        const double v = value.get<double>();
        if (shape.minimum && v < *shape.minimum) {
            errors.push_back({path, "minimum", govcat::format("must be >= {}", *shape.minimum)});
        }
        if (shape.maximum && v > *shape.maximum) {
            errors.push_back({path, "maximum", govcat::format("must be <= {}", *shape.maximum)});
        }
    }

    if (value.is_string() && shape.maxLength) {
        if (value.get_ref<const std::string&>().size() > *shape.maxLength) {
            errors.push_back({path, "maxLength",
                              govcat::format("must NOT have more than {} characters",
                                             *shape.maxLength)});
        }
    }

    if (value.is_array()) {
        if (shape.minItems && value.size() < *shape.minItems) {
            errors.push_back({path, "minItems",
                              govcat::format("must NOT have fewer than {} items", *shape.minItems)});
        }
        if (shape.maxItems && value.size() > *shape.maxItems) {
            errors.push_back({path, "maxItems",
                              govcat::format("must NOT have more than {} items", *shape.maxItems)});
        }
        if (shape.items) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                check(*shape.items, value[i], path + "/" + std::to_string(i), errors);
            }
        }
    }

    if (value.is_object()) {
        for (const auto& r : shape.required) {
            if (!value.contains(r)) {
                errors.push_back(
                    {path, "required", govcat::format("must have required property '{}'", r)});
            }
        }
        for (const auto& [key, sub] : value.items()) {
            auto it = shape.properties.find(key);
            if (it != shape.properties.end()) {
                check(*it->second, sub, path + "/" + key, errors);
            } else if (!shape.additionalAllowed) {
                errors.push_back({path + "/" + key, "additionalProperties",
                                  "must NOT have additional properties"});
            }
        }
    }
}

class DeclarativeValidator final : public IValidator {
public:
    explicit DeclarativeValidator(const json& schema) : root_(compile(schema)) {}

    const char* name() const noexcept override { return "declarative"; }

    ValidationOutcome validate(const json& params) const override {
        ValidationOutcome out;
        out.backend = name();
        check(*root_, params, "", out.errors);
        out.ok = out.errors.empty();
        return out;
    }

private:
    std::unique_ptr<Shape> root_;
};

} // namespace

bool jsonMatchesType(const json& value, std::string_view type) {
    if (type == "object")
        return value.is_object();
    if (type == "array")
        return value.is_array();
    if (type == "string")
        return value.is_string();
    if (type == "boolean")
        return value.is_boolean();
    if (type == "null")
        return value.is_null();
    if (type == "number")
        return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer())
            return true;
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    // Unknown type names do not constrain
    return true;
}

std::unique_ptr<IValidator> makeDeclarativeValidator(const json& schema) {
    return std::make_unique<DeclarativeValidator>(schema);
}

} // namespace govcat::mcp
