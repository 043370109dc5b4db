#pragma once

#include <nlohmann/json.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <govcat/core/types.h>

namespace govcat::catalog {

using json = nlohmann::json;

enum class Audience { Individual, Group, All };
enum class Requirement { Mandatory, Critical, Recommended, Optional, Deprecated };
enum class GovernanceStatus { Draft, Review, Approved, Deprecated, Superseded };
enum class Classification { Public, Internal, Restricted };
enum class PriorityTier { P1, P2, P3, P4 };

const char* to_string(Audience v) noexcept;
const char* to_string(Requirement v) noexcept;
const char* to_string(GovernanceStatus v) noexcept;
const char* to_string(Classification v) noexcept;
const char* to_string(PriorityTier v) noexcept;

std::optional<Audience> parseAudience(std::string_view s);
std::optional<Requirement> parseRequirement(std::string_view s);
// "active" is accepted as an alias of approved
std::optional<GovernanceStatus> parseStatus(std::string_view s);
std::optional<Classification> parseClassification(std::string_view s);
std::optional<PriorityTier> parsePriorityTier(std::string_view s);

struct ChangeLogEntry {
    std::string version;
    std::string changedAt;
    std::string summary;

    bool operator==(const ChangeLogEntry&) const = default;
};

/**
 * One catalog document. Governance fields are optional on disk; unknown
 * fields are carried in `extra` so a rewrite never drops hand-added data.
 */
struct Entry {
    std::string id;
    std::string title;
    std::string body;
    std::optional<std::string> rationale;
    int priority = 50;
    Audience audience = Audience::All;
    Requirement requirement = Requirement::Optional;
    std::vector<std::string> categories;
    std::string sourceHash;
    std::string schemaVersion;
    std::optional<std::string> deprecatedBy;
    std::string createdAt;
    std::string updatedAt;

    std::optional<uint64_t> usageCount;
    std::optional<std::string> firstSeenTs;
    std::optional<std::string> lastUsedAt;
    std::optional<int> riskScore;

    // governance block
    std::optional<std::string> version;
    std::optional<GovernanceStatus> status;
    std::optional<std::string> owner;
    std::optional<PriorityTier> priorityTier;
    std::optional<Classification> classification;
    std::optional<std::string> lastReviewedAt;
    std::optional<std::string> nextReviewDue;
    std::vector<ChangeLogEntry> changeLog;
    std::optional<std::string> supersedes;
    std::optional<std::string> semanticSummary;

    json extra = json::object();
};

json toJson(const Entry& e);

// Strict decode: id/title/body must be strings, enum fields must be known values
Result<Entry> entryFromJson(const json& j);

// Rules a stored document must satisfy to be admitted into the catalog
Result<void> validateStoredEntry(const Entry& e);

bool isValidEntryId(std::string_view id);

std::vector<std::string> normalizeCategories(const std::vector<std::string>& raw);

int computeRiskScore(int priority, Requirement requirement);
PriorityTier derivePriorityTier(int priority, Requirement requirement);
int reviewIntervalDays(PriorityTier tier, Requirement requirement);

std::string computeSourceHash(std::string_view body);

// Rounds a JSON number after clamping it to [lo, hi]
int clampedInt(double v, int lo, int hi);

struct SemVer {
    int major = 1;
    int minor = 0;
    int patch = 0;

    static std::optional<SemVer> parse(std::string_view text);
    std::string str() const;
    SemVer bumped(std::string_view kind) const;

    auto operator<=>(const SemVer&) const = default;
};

} // namespace govcat::catalog
