#include <govcat/mcp/validation.h>

#include <optional>

namespace govcat::mcp {

namespace {

std::optional<std::size_t> countKeyword(const json& schema, const char* key) {
    if (auto it = schema.find(key); it != schema.end() && it->is_number_integer()) {
        const auto n = it->get<int64_t>();
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
    }
    return std::nullopt;
}

// Interprets one schema node against one value; the first violation wins
std::optional<ValidationIssue> walk(const json& schema, const json& value,
                                    const std::string& path) {
    if (!schema.is_object()) {
        return std::nullopt;
    }

    if (auto it = schema.find("type"); it != schema.end()) {
        bool matched = true;
        if (it->is_string()) {
            matched = jsonMatchesType(value, it->get<std::string>());
        } else if (it->is_array()) {
            matched = false;
            for (const auto& t : *it) {
                if (t.is_string() && jsonMatchesType(value, t.get<std::string>())) {
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) {
            return ValidationIssue{path, "type", "type mismatch"};
        }
    }

    if (auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
        bool found = false;
        for (const auto& allowed : *it) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return ValidationIssue{path, "enum", "value not in enum"};
        }
    }

    if (value.is_number()) {
        const double v = value.get<double>();
        if (auto it = schema.find("minimum"); it != schema.end() && it->is_number() &&
                                              v < it->get<double>()) {
            return ValidationIssue{path, "minimum", "below minimum"};
        }
        if (auto it = schema.find("maximum"); it != schema.end() && it->is_number() &&
                                              v > it->get<double>()) {
            return ValidationIssue{path, "maximum", "above maximum"};
        }
    }

    if (value.is_string()) {
        if (auto max = countKeyword(schema, "maxLength");
            max && value.get_ref<const std::string&>().size() > *max) {
            return ValidationIssue{path, "maxLength", "string too long"};
        }
    }

    if (value.is_array()) {
        if (auto min = countKeyword(schema, "minItems"); min && value.size() < *min) {
            return ValidationIssue{path, "minItems", "too few items"};
        }
        if (auto max = countKeyword(schema, "maxItems"); max && value.size() > *max) {
            return ValidationIssue{path, "maxItems", "too many items"};
        }
        if (auto it = schema.find("items"); it != schema.end() && it->is_object()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (auto issue = walk(*it, value[i], path + "/" + std::to_string(i))) {
                    return issue;
                }
            }
        }
    }

    if (value.is_object()) {
        if (auto it = schema.find("required"); it != schema.end() && it->is_array()) {
            for (const auto& r : *it) {
                if (r.is_string() && !value.contains(r.get<std::string>())) {
                    return ValidationIssue{path, "required",
                                           "missing property '" + r.get<std::string>() + "'"};
                }
            }
        }
        const json* props = nullptr;
        if (auto it = schema.find("properties"); it != schema.end() && it->is_object()) {
            props = &*it;
        }
        bool closed = false;
        if (auto it = schema.find("additionalProperties"); it != schema.end() && it->is_boolean()) {
            closed = !it->get<bool>();
        }
        for (const auto& [key, sub] : value.items()) {
            if (props && props->contains(key)) {
                if (auto issue = walk((*props)[key], sub, path + "/" + key)) {
                    return issue;
                }
            } else if (closed) {
                return ValidationIssue{path + "/" + key, "additionalProperties",
                                       "unexpected property"};
            }
        }
    }

    return std::nullopt;
}

class SchemaRuleValidator final : public IValidator {
public:
    explicit SchemaRuleValidator(json schema) : schema_(std::move(schema)) {}

    const char* name() const noexcept override { return "schema"; }

    ValidationOutcome validate(const json& params) const override {
        ValidationOutcome out;
        out.backend = name();
        if (auto issue = walk(schema_, params, "")) {
            out.ok = false;
            out.errors.push_back(std::move(*issue));
        }
        return out;
    }

private:
    json schema_;
};

} // namespace

std::unique_ptr<IValidator> makeSchemaRuleValidator(const json& schema) {
    return std::make_unique<SchemaRuleValidator>(schema);
}

} // namespace govcat::mcp
