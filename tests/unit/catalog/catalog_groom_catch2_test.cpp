// Groom passes over the stored documents

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <govcat/catalog/catalog_engine.h>

#include "../../common/catalog_fixture.h"

using namespace govcat;
using namespace govcat::catalog;
using nlohmann::json;

namespace {

struct GroomFixture : test::CatalogFixture {
    GroomFixture() {
        writeDoc("a", "Same body", {{"createdAt", "2025-01-01T00:00:00.000Z"}});
        writeDoc("b", "Same body", {{"createdAt", "2025-02-01T00:00:00.000Z"}});
        writeDoc("c", "Mixed categories",
                 {{"categories", json::array({"Beta", "alpha", "scope:team:core"})},
                  {"sourceHash", computeSourceHash("Mixed categories")}});
        writeDoc("d", "Drifted", {{"sourceHash", "bogus"}});
        writeDoc("old", "Superseded text",
                 {{"requirement", "deprecated"},
                  {"deprecatedBy", "c"},
                  {"sourceHash", computeSourceHash("Superseded text")}});
    }
};

void checkSameCounts(const GroomReport& dry, const GroomReport& applied) {
    CHECK(dry.repairedHashes == applied.repairedHashes);
    CHECK(dry.normalizedCategories == applied.normalizedCategories);
    CHECK(dry.deprecatedRemoved == applied.deprecatedRemoved);
    CHECK(dry.duplicatesMerged == applied.duplicatesMerged);
    CHECK(dry.filesRewritten == applied.filesRewritten);
    CHECK(dry.purgedScopes == applied.purgedScopes);
}

} // namespace

TEST_CASE_METHOD(GroomFixture, "Groom - dry run predicts the applied counts and writes nothing",
                 "[catalog][groom][catch2]") {
    GroomOptions opts;
    opts.mergeDuplicates = true;
    opts.removeDeprecated = true;
    opts.purgeLegacyScopes = true;

    opts.dryRun = true;
    auto dry = engine->groom(opts);
    REQUIRE(dry);
    CHECK(dry.value().dryRun);
    CHECK(store->stats().writes == 0);
    CHECK(store->stats().removes == 0);
    CHECK(dry.value().hash == dry.value().previousHash);
    CHECK(dry.value().scanned == 5);
    CHECK(dry.value().duplicatesMerged == 1);
    CHECK(dry.value().deprecatedRemoved == 2);
    CHECK(dry.value().purgedScopes == 1);
    CHECK(dry.value().normalizedCategories == 1);
    CHECK(dry.value().notes.front() ==
          "would-rewrite:" + std::to_string(dry.value().filesRewritten));

    opts.dryRun = false;
    auto applied = engine->groom(opts);
    REQUIRE(applied);
    checkSameCounts(dry.value(), applied.value());
    CHECK(applied.value().hash != applied.value().previousHash);

    auto remaining = engine->list();
    REQUIRE(remaining);
    REQUIRE(remaining.value().size() == 3);
    CHECK_FALSE(engine->get("b").value());
    CHECK_FALSE(engine->get("old").value());
    CHECK(engine->get("c").value()->categories == std::vector<std::string>{"alpha", "beta"});
    CHECK(engine->verify().value().issues.empty());
}

TEST_CASE_METHOD(GroomFixture, "Groom - merging without removal deprecates the later duplicate",
                 "[catalog][groom][catch2]") {
    GroomOptions opts;
    opts.mergeDuplicates = true;
    REQUIRE(engine->groom(opts));

    auto b = engine->get("b");
    REQUIRE(b);
    REQUIRE(b.value());
    CHECK(b.value()->requirement == Requirement::Deprecated);
    CHECK(b.value()->deprecatedBy == "a");
    CHECK(engine->get("old").value());
}

TEST_CASE_METHOD(GroomFixture, "Groom - a second pass finds nothing to rewrite",
                 "[catalog][groom][catch2]") {
    GroomOptions opts;
    opts.mergeDuplicates = true;
    REQUIRE(engine->groom(opts));

    const auto writes = store->stats().writes;
    opts.dryRun = true;
    auto again = engine->groom(opts);
    REQUIRE(again);
    CHECK(again.value().repairedHashes == 0);
    CHECK(again.value().filesRewritten == 0);

    opts.dryRun = false;
    auto applied = engine->groom(opts);
    REQUIRE(applied);
    CHECK(applied.value().hash == applied.value().previousHash);
    CHECK(store->stats().writes == writes);
}
