// Entry decoding, derived fields and version arithmetic

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

#include <nlohmann/json.hpp>

#include <govcat/catalog/entry.h>
#include <govcat/catalog/merge_policy.h>

using namespace govcat;
using namespace govcat::catalog;
using nlohmann::json;

TEST_CASE("Entry - decode requires string id, title and body", "[catalog][entry][catch2]") {
    CHECK_FALSE(entryFromJson(json::array()));
    CHECK_FALSE(entryFromJson(json{{"id", "a"}, {"title", "t"}}));
    CHECK_FALSE(entryFromJson(json{{"id", 5}, {"title", "t"}, {"body", "b"}}));

    auto ok = entryFromJson(json{{"id", "a"}, {"title", "t"}, {"body", "b"}});
    REQUIRE(ok);
    CHECK(ok.value().priority == 50);
    CHECK(ok.value().audience == Audience::All);
    CHECK(ok.value().requirement == Requirement::Optional);
}

TEST_CASE("Entry - unknown enum values are corrupt documents", "[catalog][entry][catch2]") {
    auto r = entryFromJson(
        json{{"id", "a"}, {"title", "t"}, {"body", "b"}, {"requirement", "sometimes"}});
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::CorruptedData);
}

TEST_CASE("Entry - unknown fields survive a rewrite", "[catalog][entry][catch2]") {
    auto r = entryFromJson(json{{"id", "a"}, {"title", "t"}, {"body", "b"}, {"x-team", "infra"}});
    REQUIRE(r);
    auto back = toJson(r.value());
    CHECK(back["x-team"] == "infra");
}

TEST_CASE("Entry - stored entries must satisfy admission rules", "[catalog][entry][catch2]") {
    Entry e;
    e.id = "style.tabs";
    e.title = "Tabs";
    e.body = "Use tabs";
    CHECK(validateStoredEntry(e));

    e.requirement = Requirement::Deprecated;
    CHECK_FALSE(validateStoredEntry(e));
    e.deprecatedBy = "style.spaces";
    CHECK(validateStoredEntry(e));

    e.body.clear();
    CHECK_FALSE(validateStoredEntry(e));
}

TEST_CASE("Entry - ids are filename safe", "[catalog][entry][catch2]") {
    CHECK(isValidEntryId("abc"));
    CHECK(isValidEntryId("team_a.rule-1"));
    CHECK_FALSE(isValidEntryId(""));
    CHECK_FALSE(isValidEntryId(".hidden"));
    CHECK_FALSE(isValidEntryId("a/b"));
    CHECK_FALSE(isValidEntryId("../x"));
    CHECK_FALSE(isValidEntryId(std::string(201, 'a')));
}

TEST_CASE("Entry - categories are trimmed, lowered and deduplicated",
          "[catalog][entry][catch2]") {
    CHECK(normalizeCategories({" Style ", "style", "", "Build"}) ==
          std::vector<std::string>{"build", "style"});
}

TEST_CASE("Entry - risk and tier derive from priority and requirement",
          "[catalog][entry][governance][catch2]") {
    CHECK(computeRiskScore(10, Requirement::Mandatory) == 140);
    CHECK(computeRiskScore(100, Requirement::Deprecated) == -30);
    CHECK(derivePriorityTier(15, Requirement::Optional) == PriorityTier::P1);
    CHECK(derivePriorityTier(90, Requirement::Critical) == PriorityTier::P1);
    CHECK(derivePriorityTier(35, Requirement::Optional) == PriorityTier::P2);
    CHECK(derivePriorityTier(60, Requirement::Optional) == PriorityTier::P3);
    CHECK(derivePriorityTier(90, Requirement::Optional) == PriorityTier::P4);
    CHECK(reviewIntervalDays(PriorityTier::P4, Requirement::Optional) == 120);
    CHECK(reviewIntervalDays(PriorityTier::P4, Requirement::Mandatory) == 30);
}

TEST_CASE("Entry - status accepts active as approved", "[catalog][entry][catch2]") {
    CHECK(parseStatus("active") == GovernanceStatus::Approved);
    CHECK(parseStatus("review") == GovernanceStatus::Review);
    CHECK_FALSE(parseStatus("retired"));
}

TEST_CASE("SemVer - parse, compare and bump", "[catalog][semver][catch2]") {
    auto v = SemVer::parse("1.2.3");
    REQUIRE(v);
    CHECK(v->str() == "1.2.3");
    CHECK(SemVer::parse("2.0.0-rc.1"));
    CHECK_FALSE(SemVer::parse("1.2"));
    CHECK_FALSE(SemVer::parse("v1.2.3"));

    CHECK(v->bumped("patch").str() == "1.2.4");
    CHECK(v->bumped("minor").str() == "1.3.0");
    CHECK(v->bumped("major").str() == "2.0.0");
    CHECK(v->bumped("none") == *v);
    CHECK(SemVer{1, 10, 0} > SemVer{1, 9, 9});
}

TEST_CASE("MergePolicy - earliest entry is primary and metadata folds into it",
          "[catalog][merge][catch2]") {
    Entry a;
    a.id = "b-later";
    a.createdAt = "2025-01-02T00:00:00.000Z";
    a.priority = 40;
    a.categories = {"style"};
    Entry b;
    b.id = "a-earlier";
    b.createdAt = "2025-01-01T00:00:00.000Z";
    b.priority = 60;
    b.riskScore = 10;

    CHECK(merge::pickPrimary({&a, &b}) == &b);

    CHECK(merge::foldDuplicate(b, a));
    CHECK(b.priority == 40);
    CHECK(b.riskScore == 10);
    CHECK(b.categories == std::vector<std::string>{"style"});
    CHECK_FALSE(merge::foldDuplicate(b, a));
}

TEST_CASE("Entry - numbers outside int range saturate", "[catalog][entry][catch2]") {
    CHECK(clampedInt(1e20, 1, 100) == 100);
    CHECK(clampedInt(-1e20, 1, 100) == 1);
    CHECK(clampedInt(41.6, 1, 100) == 42);

    auto r = entryFromJson(json{{"id", "a"},
                                {"title", "t"},
                                {"body", "b"},
                                {"priority", 1e20},
                                {"riskScore", -1e300},
                                {"usageCount", 1e30}});
    REQUIRE(r);
    CHECK(r.value().priority == std::numeric_limits<int>::max());
    CHECK(r.value().riskScore == std::numeric_limits<int>::min());
    CHECK(r.value().usageCount == (uint64_t{1} << 53));
}
