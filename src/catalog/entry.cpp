#include <govcat/catalog/entry.h>
#include <govcat/config/config_helpers.h>
#include <govcat/core/format.h>
#include <govcat/crypto/hasher.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <regex>
#include <set>

namespace govcat::catalog {

namespace {

constexpr std::array<std::string_view, 29> kKnownKeys = {
    "id",          "title",          "body",       "rationale",      "priority",
    "audience",    "requirement",    "categories", "sourceHash",     "schemaVersion",
    "deprecatedBy", "createdAt",     "updatedAt",  "usageCount",     "firstSeenTs",
    "lastUsedAt",  "riskScore",      "version",    "status",         "owner",
    "priorityTier", "classification", "lastReviewedAt", "nextReviewDue", "changeLog",
    "supersedes",  "semanticSummary", "primaryCategory", "reviewIntervalDays"};

bool isKnownKey(const std::string& key) {
    return std::find(kKnownKeys.begin(), kKnownKeys.end(), key) != kKnownKeys.end();
}

std::optional<std::string> optString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    auto s = it->get<std::string>();
    if (s.empty()) {
        return std::nullopt;
    }
    return s;
}

template <typename Enum, typename Parser>
Result<std::optional<Enum>> optEnum(const json& j, const char* key, Parser parse) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null() || (it->is_string() && it->get<std::string>().empty())) {
        return std::optional<Enum>{};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::CorruptedData, govcat::format("field '{}' must be a string", key)};
    }
    auto parsed = parse(it->template get<std::string>());
    if (!parsed) {
        return Error{ErrorCode::CorruptedData,
                     govcat::format("field '{}' has unknown value '{}'", key,
                                    it->template get<std::string>())};
    }
    return std::optional<Enum>{*parsed};
}

void putOpt(json& j, const char* key, const std::optional<std::string>& v) {
    if (v) {
        j[key] = *v;
    } else {
        j.erase(key);
    }
}

} // namespace

const char* to_string(Audience v) noexcept {
    switch (v) {
        case Audience::Individual: return "individual";
        case Audience::Group: return "group";
        case Audience::All: return "all";
    }
    return "all";
}

const char* to_string(Requirement v) noexcept {
    switch (v) {
        case Requirement::Mandatory: return "mandatory";
        case Requirement::Critical: return "critical";
        case Requirement::Recommended: return "recommended";
        case Requirement::Optional: return "optional";
        case Requirement::Deprecated: return "deprecated";
    }
    return "optional";
}

const char* to_string(GovernanceStatus v) noexcept {
    switch (v) {
        case GovernanceStatus::Draft: return "draft";
        case GovernanceStatus::Review: return "review";
        case GovernanceStatus::Approved: return "approved";
        case GovernanceStatus::Deprecated: return "deprecated";
        case GovernanceStatus::Superseded: return "superseded";
    }
    return "draft";
}

const char* to_string(Classification v) noexcept {
    switch (v) {
        case Classification::Public: return "public";
        case Classification::Internal: return "internal";
        case Classification::Restricted: return "restricted";
    }
    return "internal";
}

const char* to_string(PriorityTier v) noexcept {
    switch (v) {
        case PriorityTier::P1: return "P1";
        case PriorityTier::P2: return "P2";
        case PriorityTier::P3: return "P3";
        case PriorityTier::P4: return "P4";
    }
    return "P4";
}

std::optional<Audience> parseAudience(std::string_view s) {
    if (s == "individual") return Audience::Individual;
    if (s == "group") return Audience::Group;
    if (s == "all") return Audience::All;
    return std::nullopt;
}

std::optional<Requirement> parseRequirement(std::string_view s) {
    if (s == "mandatory") return Requirement::Mandatory;
    if (s == "critical") return Requirement::Critical;
    if (s == "recommended") return Requirement::Recommended;
    if (s == "optional") return Requirement::Optional;
    if (s == "deprecated") return Requirement::Deprecated;
    return std::nullopt;
}

std::optional<GovernanceStatus> parseStatus(std::string_view s) {
    if (s == "draft") return GovernanceStatus::Draft;
    if (s == "review") return GovernanceStatus::Review;
    if (s == "approved" || s == "active") return GovernanceStatus::Approved;
    if (s == "deprecated") return GovernanceStatus::Deprecated;
    if (s == "superseded") return GovernanceStatus::Superseded;
    return std::nullopt;
}

std::optional<Classification> parseClassification(std::string_view s) {
    if (s == "public") return Classification::Public;
    if (s == "internal") return Classification::Internal;
    if (s == "restricted") return Classification::Restricted;
    return std::nullopt;
}

std::optional<PriorityTier> parsePriorityTier(std::string_view s) {
    if (s == "P1" || s == "p1") return PriorityTier::P1;
    if (s == "P2" || s == "p2") return PriorityTier::P2;
    if (s == "P3" || s == "p3") return PriorityTier::P3;
    if (s == "P4" || s == "p4") return PriorityTier::P4;
    return std::nullopt;
}

json toJson(const Entry& e) {
    json j = e.extra.is_object() ? e.extra : json::object();
    j["id"] = e.id;
    j["title"] = e.title;
    j["body"] = e.body;
    putOpt(j, "rationale", e.rationale);
    j["priority"] = e.priority;
    j["audience"] = to_string(e.audience);
    j["requirement"] = to_string(e.requirement);
    j["categories"] = e.categories;
    j["sourceHash"] = e.sourceHash;
    j["schemaVersion"] = e.schemaVersion;
    putOpt(j, "deprecatedBy", e.deprecatedBy);
    j["createdAt"] = e.createdAt;
    j["updatedAt"] = e.updatedAt;
    if (e.usageCount) {
        j["usageCount"] = *e.usageCount;
    }
    putOpt(j, "firstSeenTs", e.firstSeenTs);
    putOpt(j, "lastUsedAt", e.lastUsedAt);
    if (e.riskScore) {
        j["riskScore"] = *e.riskScore;
    }
    putOpt(j, "version", e.version);
    if (e.status) {
        j["status"] = to_string(*e.status);
    }
    putOpt(j, "owner", e.owner);
    if (e.priorityTier) {
        j["priorityTier"] = to_string(*e.priorityTier);
    }
    if (e.classification) {
        j["classification"] = to_string(*e.classification);
    }
    putOpt(j, "lastReviewedAt", e.lastReviewedAt);
    putOpt(j, "nextReviewDue", e.nextReviewDue);
    if (!e.changeLog.empty()) {
        json cl = json::array();
        for (const auto& c : e.changeLog) {
            cl.push_back({{"version", c.version}, {"changedAt", c.changedAt}, {"summary", c.summary}});
        }
        j["changeLog"] = std::move(cl);
    }
    putOpt(j, "supersedes", e.supersedes);
    putOpt(j, "semanticSummary", e.semanticSummary);
    return j;
}

Result<Entry> entryFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::CorruptedData, "entry document must be a JSON object"};
    }
    for (const char* key : {"id", "title", "body"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return Error{ErrorCode::CorruptedData, govcat::format("missing string field '{}'", key)};
        }
    }

    Entry e;
    e.id = j.at("id").get<std::string>();
    e.title = j.at("title").get<std::string>();
    e.body = j.at("body").get<std::string>();
    e.rationale = optString(j, "rationale");

    if (auto it = j.find("priority"); it != j.end() && it->is_number()) {
        e.priority = clampedInt(it->get<double>(), std::numeric_limits<int>::min(),
                                std::numeric_limits<int>::max());
    }

    auto audience = optEnum<Audience>(j, "audience", parseAudience);
    if (!audience) return audience.error();
    e.audience = audience.value().value_or(Audience::All);

    auto requirement = optEnum<Requirement>(j, "requirement", parseRequirement);
    if (!requirement) return requirement.error();
    e.requirement = requirement.value().value_or(Requirement::Optional);

    if (auto it = j.find("categories"); it != j.end() && it->is_array()) {
        for (const auto& c : *it) {
            if (c.is_string()) {
                e.categories.push_back(c.get<std::string>());
            }
        }
    }
    e.sourceHash = optString(j, "sourceHash").value_or("");
    e.schemaVersion = optString(j, "schemaVersion").value_or("");
    e.deprecatedBy = optString(j, "deprecatedBy");
    e.createdAt = optString(j, "createdAt").value_or("");
    e.updatedAt = optString(j, "updatedAt").value_or("");

    if (auto it = j.find("usageCount"); it != j.end() && it->is_number()) {
        e.usageCount = static_cast<uint64_t>(
            std::clamp(it->get<double>(), 0.0, static_cast<double>(uint64_t{1} << 53)));
    }
    e.firstSeenTs = optString(j, "firstSeenTs");
    e.lastUsedAt = optString(j, "lastUsedAt");
    if (auto it = j.find("riskScore"); it != j.end() && it->is_number()) {
        e.riskScore = clampedInt(it->get<double>(), std::numeric_limits<int>::min(),
                                 std::numeric_limits<int>::max());
    }

    e.version = optString(j, "version");
    auto status = optEnum<GovernanceStatus>(j, "status", parseStatus);
    if (!status) return status.error();
    e.status = status.value();
    e.owner = optString(j, "owner");
    auto tier = optEnum<PriorityTier>(j, "priorityTier", parsePriorityTier);
    if (!tier) return tier.error();
    e.priorityTier = tier.value();
    auto cls = optEnum<Classification>(j, "classification", parseClassification);
    if (!cls) return cls.error();
    e.classification = cls.value();
    e.lastReviewedAt = optString(j, "lastReviewedAt");
    e.nextReviewDue = optString(j, "nextReviewDue");
    if (auto it = j.find("changeLog"); it != j.end() && it->is_array()) {
        for (const auto& c : *it) {
            if (!c.is_object()) {
                continue;
            }
            auto v = optString(c, "version");
            auto s = optString(c, "summary");
            if (v && s) {
                e.changeLog.push_back({*v, optString(c, "changedAt").value_or(""), *s});
            }
        }
    }
    e.supersedes = optString(j, "supersedes");
    e.semanticSummary = optString(j, "semanticSummary");

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!isKnownKey(it.key())) {
            e.extra[it.key()] = it.value();
        }
    }
    return e;
}

Result<void> validateStoredEntry(const Entry& e) {
    if (e.id.empty() || e.title.empty() || e.body.empty()) {
        return Error{ErrorCode::ValidationError, "id, title and body must be non-empty"};
    }
    if (!isValidEntryId(e.id)) {
        return Error{ErrorCode::ValidationError, "id is not filename safe: " + e.id};
    }
    if (e.requirement == Requirement::Deprecated && !e.deprecatedBy) {
        return Error{ErrorCode::ValidationError, "deprecated entry requires deprecatedBy"};
    }
    return {};
}

bool isValidEntryId(std::string_view id) {
    static const std::regex kIdPattern{"^[A-Za-z0-9_][A-Za-z0-9._-]{0,199}$"};
    return std::regex_match(id.begin(), id.end(), kIdPattern);
}

std::vector<std::string> normalizeCategories(const std::vector<std::string>& raw) {
    std::set<std::string> out;
    for (auto c : raw) {
        config::trim(c);
        if (c.empty()) {
            continue;
        }
        std::transform(c.begin(), c.end(), c.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        out.insert(std::move(c));
    }
    return {out.begin(), out.end()};
}

int clampedInt(double v, int lo, int hi) {
    return static_cast<int>(
        std::lround(std::clamp(v, static_cast<double>(lo), static_cast<double>(hi))));
}

int computeRiskScore(int priority, Requirement requirement) {
    const int p = std::clamp(priority, 1, 100);
    int weight = 0;
    switch (requirement) {
        case Requirement::Mandatory: weight = 50; break;
        case Requirement::Critical: weight = 60; break;
        case Requirement::Recommended: weight = 20; break;
        case Requirement::Optional: weight = 5; break;
        case Requirement::Deprecated: weight = -30; break;
    }
    return (100 - p) + weight;
}

PriorityTier derivePriorityTier(int priority, Requirement requirement) {
    if (priority <= 20 || requirement == Requirement::Mandatory ||
        requirement == Requirement::Critical) {
        return PriorityTier::P1;
    }
    if (priority <= 40) return PriorityTier::P2;
    if (priority <= 70) return PriorityTier::P3;
    return PriorityTier::P4;
}

int reviewIntervalDays(PriorityTier tier, Requirement requirement) {
    if (tier == PriorityTier::P1 || requirement == Requirement::Mandatory ||
        requirement == Requirement::Critical) {
        return 30;
    }
    if (tier == PriorityTier::P2) return 60;
    if (tier == PriorityTier::P3) return 90;
    return 120;
}

std::string computeSourceHash(std::string_view body) {
    return crypto::sha256Hex(body);
}

std::optional<SemVer> SemVer::parse(std::string_view text) {
    static const std::regex kSemver{R"(^([0-9]+)\.([0-9]+)\.([0-9]+)(?:[-+].*)?$)"};
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(text.begin(), text.end(), m, kSemver)) {
        return std::nullopt;
    }
    try {
        return SemVer{std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str())};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string SemVer::str() const {
    return govcat::format("{}.{}.{}", major, minor, patch);
}

SemVer SemVer::bumped(std::string_view kind) const {
    if (kind == "major") return SemVer{major + 1, 0, 0};
    if (kind == "minor") return SemVer{major, minor + 1, 0};
    if (kind == "patch") return SemVer{major, minor, patch + 1};
    return *this;
}

} // namespace govcat::catalog
