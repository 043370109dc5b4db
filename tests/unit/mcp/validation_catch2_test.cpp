// Parameter validation backends

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <nlohmann/json.hpp>

#include <govcat/mcp/tool_registry.h>
#include <govcat/mcp/validation.h>

using govcat::config::ValidationBackend;
using namespace govcat::mcp;

namespace {

const json& sampleSchema() {
    static const json schema = json::parse(R"({
        "type": "object",
        "additionalProperties": false,
        "required": ["id"],
        "properties": {
            "id": {"type": "string", "maxLength": 8},
            "limit": {"type": "number", "minimum": 1, "maximum": 10},
            "tags": {"type": "array", "items": {"type": "string"}, "maxItems": 2},
            "mode": {"enum": ["skip", "overwrite"]},
            "count": {"type": "integer"}
        }
    })");
    return schema;
}

} // namespace

TEST_CASE("Validation - both backends agree on acceptance", "[mcp][validation][catch2]") {
    auto declarative = makeDeclarativeValidator(sampleSchema());
    auto schemaRule = makeSchemaRuleValidator(sampleSchema());

    auto [params, expected] = GENERATE(table<const char*, bool>({
        {R"({"id":"a"})", true},
        {R"({"id":"a","limit":5,"tags":["x"],"mode":"skip","count":3})", true},
        {R"({"id":"a","count":3.0})", true},
        {R"({})", false},
        {R"([])", false},
        {R"({"id":7})", false},
        {R"({"id":"way-too-long"})", false},
        {R"({"id":"a","limit":0})", false},
        {R"({"id":"a","limit":11})", false},
        {R"({"id":"a","tags":["x","y","z"]})", false},
        {R"({"id":"a","tags":[1]})", false},
        {R"({"id":"a","mode":"merge"})", false},
        {R"({"id":"a","count":1.5})", false},
        {R"({"id":"a","extra":true})", false},
    }));

    CAPTURE(params);
    const auto value = json::parse(params);
    const auto d = declarative->validate(value);
    const auto s = schemaRule->validate(value);
    CHECK(d.ok == expected);
    CHECK(s.ok == expected);
    CHECK(std::string(d.backend) == "declarative");
    CHECK(std::string(s.backend) == "schema");
}

TEST_CASE("Validation - declarative reports every violation, schema rule the first",
          "[mcp][validation][catch2]") {
    const auto bad = json::parse(R"({"limit":0,"extra":1})");

    auto d = makeDeclarativeValidator(sampleSchema())->validate(bad);
    REQUIRE_FALSE(d.ok);
    CHECK(d.errors.size() == 3);

    auto s = makeSchemaRuleValidator(sampleSchema())->validate(bad);
    REQUIRE_FALSE(s.ok);
    REQUIRE(s.errors.size() == 1);
    CHECK(s.errors[0].rule == "required");
}

TEST_CASE("Validation - issues carry a pointer to the failing value",
          "[mcp][validation][catch2]") {
    auto d = makeDeclarativeValidator(sampleSchema())
                 ->validate(json::parse(R"({"id":"a","tags":["ok",5]})"));
    REQUIRE(d.errors.size() == 1);
    CHECK(d.errors[0].path == "/tags/1");
    CHECK(d.errors[0].rule == "type");
    CHECK(d.errors[0].toJson()["path"] == "/tags/1");
}

TEST_CASE("ValidationService - registry schemas drive per-method checks",
          "[mcp][validation][service][catch2]") {
    auto backend = GENERATE(ValidationBackend::Declarative, ValidationBackend::SchemaRule);
    ValidationService service(backend);

    CHECK(service.validate("instructions/get", json{{"id", "a"}}).ok);
    CHECK_FALSE(service.validate("instructions/get", json::object()).ok);
    CHECK(service.validate("instructions/list", json()).ok);
    CHECK_FALSE(service.validate("instructions/remove", json{{"ids", json::array()}}).ok);
    CHECK_FALSE(service.validate("usage/hotset", json{{"limit", 500}}).ok);

    // Unknown methods have no schema and pass
    auto none = service.validate("not/a/tool", json{{"anything", 1}});
    CHECK(none.ok);
    CHECK(std::string(none.backend) == "none");

    const auto m = service.metrics();
    CHECK(m.backend == govcat::config::to_string(backend));
    CHECK(m.unvalidated == 1);
    CHECK(m.cachedValidators == 5);
    if (backend == ValidationBackend::Declarative) {
        CHECK(m.declarativeCalls == 5);
        CHECK(m.declarativeFailures == 3);
        CHECK(m.schemaCalls == 0);
    } else {
        CHECK(m.schemaCalls == 5);
        CHECK(m.schemaFailures == 3);
    }

    service.clearCache();
    CHECK(service.metrics().cachedValidators == 0);
}

TEST_CASE("ValidationService - entry priority stays within 1..100",
          "[mcp][validation][service][catch2]") {
    auto backend = GENERATE(ValidationBackend::Declarative, ValidationBackend::SchemaRule);
    ValidationService service(backend);

    auto add = [&](json priority) {
        return service.validate(
            "instructions/add",
            json{{"entry", {{"id", "a"}, {"body", "b"}, {"priority", std::move(priority)}}}});
    };
    CHECK(add(1).ok);
    CHECK(add(100).ok);
    CHECK_FALSE(add(0).ok);
    CHECK_FALSE(add(1e20).ok);
    CHECK_FALSE(add(-1e20).ok);
}
