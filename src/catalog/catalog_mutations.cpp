#include <govcat/catalog/catalog_engine.h>
#include <govcat/config/config_helpers.h>
#include <govcat/core/format.h>
#include <govcat/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <limits>
#include <set>

namespace govcat::catalog {

namespace {

// Records the stages one mutation passes through and hands the trace to the engine when done
class MutationRun {
public:
    using Sink = std::function<void(MutationTrace)>;

    MutationRun(std::string operation, std::string id, Sink sink) : sink_(std::move(sink)) {
        trace_.operation = std::move(operation);
        trace_.id = std::move(id);
        trace_.stages.push_back(MutationStage::Idle);
    }

    ~MutationRun() {
        if (sink_) {
            sink_(std::move(trace_));
        }
    }

    MutationRun(const MutationRun&) = delete;
    MutationRun& operator=(const MutationRun&) = delete;

    void advance(MutationStage stage) {
        trace_.stages.push_back(stage);
        spdlog::trace("{} {}: {}", trace_.operation, trace_.id, to_string(stage));
    }

    Error reject(std::string message) {
        advance(MutationStage::Invalid);
        spdlog::debug("{} {} rejected: {}", trace_.operation, trace_.id, message);
        return Error{ErrorCode::ValidationError, std::move(message)};
    }

    Error fail(Error error) {
        advance(MutationStage::Failed);
        spdlog::error("{} {} failed: {}", trace_.operation, trace_.id, error.message);
        return error;
    }

private:
    MutationTrace trace_;
    Sink sink_;
};

bool blank(const std::optional<std::string>& s) {
    if (!s) {
        return true;
    }
    return std::all_of(s->begin(), s->end(), [](unsigned char c) { return std::isspace(c); });
}

std::string trimmed(std::string s) {
    config::trim(s);
    return s;
}

std::optional<std::string> reviewDueFrom(const std::string& anchorIso, PriorityTier tier,
                                         Requirement requirement) {
    auto anchor = parseIso8601(anchorIso);
    if (!anchor) {
        return std::nullopt;
    }
    return toIso8601(*anchor + std::chrono::days{reviewIntervalDays(tier, requirement)});
}

template <typename T, typename Parser>
Result<std::optional<T>> draftEnum(const json& j, const char* key, Parser parse) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<T>{};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::ValidationError, govcat::format("{} must be a string", key)};
    }
    auto parsed = parse(it->template get<std::string>());
    if (!parsed) {
        return Error{ErrorCode::ValidationError,
                     govcat::format("{} has unsupported value '{}'", key,
                                    it->template get<std::string>())};
    }
    return std::optional<T>{*parsed};
}

Result<std::optional<std::string>> draftString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::ValidationError, govcat::format("{} must be a string", key)};
    }
    return std::optional<std::string>{it->get<std::string>()};
}

// Governance prerequisites shared by add and import
std::optional<std::string> governanceViolation(const EntryDraft& d,
                                               const std::vector<std::string>& categories,
                                               const std::optional<std::string>& owner) {
    if (d.priorityTier == PriorityTier::P1 && (categories.empty() || blank(owner))) {
        return "P1 requires category & owner";
    }
    if ((d.requirement == Requirement::Mandatory || d.requirement == Requirement::Critical) &&
        blank(owner)) {
        return "mandatory/critical require owner";
    }
    return std::nullopt;
}

void applyGovernanceFields(const EntryDraft& d, Entry& rec) {
    if (d.owner) rec.owner = d.owner;
    if (d.status) rec.status = d.status;
    if (d.priorityTier) rec.priorityTier = d.priorityTier;
    if (d.classification) rec.classification = d.classification;
    if (d.lastReviewedAt) rec.lastReviewedAt = d.lastReviewedAt;
    if (d.nextReviewDue) rec.nextReviewDue = d.nextReviewDue;
    if (d.semanticSummary) rec.semanticSummary = d.semanticSummary;
    if (d.supersedes) rec.supersedes = d.supersedes;
    if (d.deprecatedBy) rec.deprecatedBy = d.deprecatedBy;
    if (d.riskScore) rec.riskScore = d.riskScore;
}

void fillDerived(Entry& rec) {
    rec.sourceHash = computeSourceHash(rec.body);
    rec.schemaVersion = kSchemaVersion;
    if (!rec.priorityTier) {
        rec.priorityTier = derivePriorityTier(rec.priority, rec.requirement);
    }
    if (!rec.riskScore) {
        rec.riskScore = computeRiskScore(rec.priority, rec.requirement);
    }
    if (!rec.nextReviewDue) {
        rec.nextReviewDue =
            reviewDueFrom(rec.lastReviewedAt.value_or(rec.createdAt), *rec.priorityTier,
                          rec.requirement);
    }
}

} // namespace

Result<EntryDraft> draftFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "entry must be an object"};
    }
    EntryDraft d;
    auto id = draftString(j, "id");
    if (!id) {
        return id.error();
    }
    d.id = trimmed(id.value().value_or(""));

    struct StringField {
        const char* key;
        std::optional<std::string>* target;
    };
    const StringField strings[] = {
        {"title", &d.title},
        {"body", &d.body},
        {"rationale", &d.rationale},
        {"deprecatedBy", &d.deprecatedBy},
        {"version", &d.version},
        {"owner", &d.owner},
        {"lastReviewedAt", &d.lastReviewedAt},
        {"nextReviewDue", &d.nextReviewDue},
        {"supersedes", &d.supersedes},
        {"semanticSummary", &d.semanticSummary},
    };
    for (const auto& f : strings) {
        auto v = draftString(j, f.key);
        if (!v) {
            return v.error();
        }
        *f.target = std::move(v).value();
    }

    for (const char* key : {"priority", "riskScore"}) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            continue;
        }
        if (!it->is_number()) {
            return Error{ErrorCode::ValidationError, govcat::format("{} must be a number", key)};
        }
        const double raw = it->get<double>();
        if (std::string_view{key} == "priority") {
            d.priority = clampedInt(raw, 1, 100);
        } else {
            d.riskScore = clampedInt(raw, 0, std::numeric_limits<int>::max());
        }
    }

    auto audience = draftEnum<Audience>(j, "audience", parseAudience);
    if (!audience) return audience.error();
    d.audience = audience.value();
    auto requirement = draftEnum<Requirement>(j, "requirement", parseRequirement);
    if (!requirement) return requirement.error();
    d.requirement = requirement.value();
    auto status = draftEnum<GovernanceStatus>(j, "status", parseStatus);
    if (!status) return status.error();
    d.status = status.value();
    auto tier = draftEnum<PriorityTier>(j, "priorityTier", parsePriorityTier);
    if (!tier) return tier.error();
    d.priorityTier = tier.value();
    auto classification = draftEnum<Classification>(j, "classification", parseClassification);
    if (!classification) return classification.error();
    d.classification = classification.value();

    if (auto it = j.find("categories"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            return Error{ErrorCode::ValidationError, "categories must be an array"};
        }
        std::vector<std::string> cats;
        for (const auto& c : *it) {
            if (c.is_string()) {
                cats.push_back(c.get<std::string>());
            }
        }
        d.categories = std::move(cats);
    }

    // Malformed change log items are dropped rather than rejected
    if (auto it = j.find("changeLog"); it != j.end() && it->is_array()) {
        std::vector<ChangeLogEntry> log;
        for (const auto& item : *it) {
            if (!item.is_object()) continue;
            auto version = trimmed(item.value("version", std::string{}));
            auto summary = trimmed(item.value("summary", std::string{}));
            if (version.empty() || summary.empty()) continue;
            log.push_back({version, item.value("changedAt", std::string{}), summary});
        }
        d.changeLog = std::move(log);
    }
    return d;
}

Result<AddOutcome> CatalogEngine::add(const EntryDraft& input, const AddOptions& options) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    MutationRun run("add", input.id, [this](MutationTrace t) { recordTrace(std::move(t)); });
    run.advance(MutationStage::Validating);

    EntryDraft d = input;
    if (d.id.empty()) {
        return run.reject("missing id");
    }
    if (!isValidEntryId(d.id)) {
        return run.reject("invalid id: " + d.id);
    }
    if (options.lax) {
        if (blank(d.title)) d.title = d.id;
        if (!d.priority) d.priority = 50;
        if (!d.audience) d.audience = Audience::All;
        if (!d.requirement) d.requirement = Requirement::Optional;
    }

    auto& store = *config_.store;
    const bool exists = store.exists(d.id);
    std::optional<Entry> existing;
    if (exists) {
        if (auto raw = store.readRaw(d.id); raw) {
            if (auto decoded = entryFromJson(raw.value()); decoded) {
                existing = std::move(decoded).value();
            } else {
                spdlog::warn("Existing document {} is unreadable; treating as new: {}", d.id,
                             decoded.error().message);
            }
        }
    }

    // An overwrite may omit body/title and keep the stored ones
    if (options.overwrite && existing) {
        if (blank(d.body)) d.body = existing->body;
        if (blank(d.title)) d.title = existing->title;
    }
    if (blank(d.title) || blank(d.body)) {
        return run.reject("missing required fields");
    }

    if (exists && !options.overwrite) {
        auto st = ensureLoaded();
        if (!st) {
            return run.fail(st.error());
        }
        AddOutcome out;
        out.id = d.id;
        out.skipped = true;
        out.hash = st.value()->hash;
        out.verified = st.value()->find(d.id) != nullptr;
        run.advance(MutationStage::Success);
        audit_->record("add", {d.id}, json{{"skipped", true}, {"visible", out.verified}});
        return out;
    }

    const std::string body = trimmed(*d.body);
    std::vector<std::string> categories;
    if (d.categories) {
        categories = normalizeCategories(*d.categories);
    } else if (existing) {
        categories = normalizeCategories(existing->categories);
    }
    if (categories.empty()) {
        categories = {"uncategorized"};
    }

    const auto owner = d.owner ? d.owner : (existing ? existing->owner : std::nullopt);
    if (auto violation = governanceViolation(d, categories, owner)) {
        return run.reject(*violation);
    }

    std::optional<SemVer> incoming;
    if (d.version) {
        incoming = SemVer::parse(*d.version);
        if (!incoming) {
            return run.reject("invalid_semver");
        }
    }

    const auto now = nowIso();
    Entry rec;
    if (existing) {
        rec = *existing;
        const std::string prevVersionText = existing->version.value_or("1.0.0");
        const SemVer prevVersion = SemVer::parse(prevVersionText).value_or(SemVer{});
        const bool bodyChanged = body != existing->body;

        rec.title = trimmed(*d.title);
        rec.body = body;
        if (d.rationale) rec.rationale = d.rationale;
        if (d.priority) rec.priority = std::clamp(*d.priority, 1, 100);
        if (d.audience) rec.audience = *d.audience;
        if (d.requirement) rec.requirement = *d.requirement;
        rec.categories = categories;
        rec.updatedAt = now;
        if (d.changeLog) rec.changeLog = *d.changeLog;

        if (incoming && !(*incoming > prevVersion)) {
            return run.reject("version_not_bumped");
        }
        if (incoming) {
            rec.version = *d.version;
        } else if (bodyChanged) {
            rec.version = prevVersion.bumped("patch").str();
        } else {
            rec.version = prevVersionText;
        }

        if (rec.changeLog.empty()) {
            rec.changeLog.push_back(
                {prevVersionText, existing->createdAt.empty() ? now : existing->createdAt,
                 "initial import"});
        }
        if (rec.changeLog.back().version != *rec.version) {
            std::string summary = bodyChanged
                                      ? (incoming ? "body update" : "auto bump (body change)")
                                      : "metadata update";
            rec.changeLog.push_back({*rec.version, now, std::move(summary)});
        }
    } else {
        rec.id = d.id;
        rec.title = trimmed(*d.title);
        rec.body = body;
        rec.rationale = d.rationale;
        rec.priority = std::clamp(d.priority.value_or(50), 1, 100);
        rec.audience = d.audience.value_or(Audience::All);
        rec.requirement = d.requirement.value_or(Requirement::Optional);
        rec.categories = categories;
        rec.createdAt = now;
        rec.updatedAt = now;
        rec.version = incoming ? *d.version : std::string{"1.0.0"};
        if (d.changeLog && !d.changeLog->empty()) {
            rec.changeLog = *d.changeLog;
        } else {
            rec.changeLog.push_back({*rec.version, now, "initial import"});
        }
    }
    applyGovernanceFields(d, rec);
    fillDerived(rec);

    if (auto valid = validateStoredEntry(rec); !valid) {
        return run.reject(valid.error().message);
    }

    run.advance(MutationStage::Writing);
    if (auto written = store.save(rec); !written) {
        return run.fail(written.error());
    }
    run.advance(MutationStage::Persisted);

    run.advance(MutationStage::Reloading);
    auto st = reloadLocked();
    if (!st) {
        return run.fail(st.error());
    }
    const auto* visible = st.value()->find(rec.id);
    if (!visible || visible->sourceHash != rec.sourceHash) {
        audit_->record("add", {rec.id},
                       json{{"created", false}, {"overwritten", false},
                            {"atomic_readback_failed", true}});
        return run.fail(Error{ErrorCode::WriteError, "atomic_readback_failed"});
    }
    run.advance(MutationStage::VerifiedVisible);

    AddOutcome out;
    out.id = rec.id;
    out.created = !exists;
    out.overwritten = exists;
    out.hash = st.value()->hash;
    out.verified = true;
    run.advance(MutationStage::Success);
    audit_->record("add", {rec.id},
                   json{{"created", out.created}, {"overwritten", out.overwritten},
                        {"verified", true}});
    spdlog::info("Entry {} {} (version {})", rec.id, exists ? "overwritten" : "created",
                 rec.version.value_or("1.0.0"));
    return out;
}

Result<ImportOutcome> CatalogEngine::importEntries(const std::vector<EntryDraft>& drafts,
                                                   ImportMode mode) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    ImportOutcome out;
    out.total = drafts.size();
    auto& store = *config_.store;
    const auto now = nowIso();
    bool wrote = false;

    for (const auto& d : drafts) {
        if (d.id.empty() || blank(d.title) || blank(d.body)) {
            out.errors.push_back({d.id.empty() ? "unknown" : d.id, "missing required fields"});
            continue;
        }
        if (!isValidEntryId(d.id)) {
            out.errors.push_back({d.id, "invalid id"});
            continue;
        }
        auto categories = normalizeCategories(d.categories.value_or(std::vector<std::string>{}));
        if (categories.empty()) {
            categories = {"uncategorized"};
        }
        if (auto violation = governanceViolation(d, categories, d.owner)) {
            out.errors.push_back({d.id, *violation});
            continue;
        }

        const bool exists = store.exists(d.id);
        if (exists && mode == ImportMode::Skip) {
            ++out.skipped;
            continue;
        }

        std::optional<Entry> existing;
        if (exists) {
            if (auto raw = store.readRaw(d.id); raw) {
                if (auto decoded = entryFromJson(raw.value()); decoded) {
                    existing = std::move(decoded).value();
                }
            }
        }

        Entry rec = existing ? *existing : Entry{};
        if (!existing) {
            rec.id = d.id;
            rec.createdAt = now;
        }
        rec.title = trimmed(*d.title);
        rec.body = trimmed(*d.body);
        if (d.rationale) rec.rationale = d.rationale;
        rec.priority = std::clamp(d.priority.value_or(rec.priority), 1, 100);
        rec.audience = d.audience.value_or(rec.audience);
        rec.requirement = d.requirement.value_or(rec.requirement);
        rec.categories = categories;
        rec.updatedAt = now;
        applyGovernanceFields(d, rec);
        if (d.version) {
            if (!SemVer::parse(*d.version)) {
                out.errors.push_back({d.id, "invalid_semver"});
                continue;
            }
            rec.version = d.version;
        }
        if (!rec.version) {
            rec.version = "1.0.0";
        }
        if (d.changeLog) {
            rec.changeLog = *d.changeLog;
        }
        if (rec.changeLog.empty()) {
            rec.changeLog.push_back({*rec.version, rec.createdAt, "initial import"});
        }
        fillDerived(rec);

        if (auto valid = validateStoredEntry(rec); !valid) {
            out.errors.push_back({d.id, valid.error().message});
            continue;
        }
        if (auto written = store.save(rec); !written) {
            out.errors.push_back({d.id, "write-failed"});
            continue;
        }
        wrote = true;
        if (exists) {
            ++out.overwritten;
        } else {
            ++out.imported;
        }
    }

    auto st = wrote ? reloadLocked() : ensureLoaded();
    if (!st) {
        return st.error();
    }
    out.hash = st.value()->hash;
    std::vector<std::string> ids;
    ids.reserve(drafts.size());
    for (const auto& d : drafts) {
        if (!d.id.empty()) {
            ids.push_back(d.id);
        }
    }
    audit_->record("import", ids,
                   json{{"imported", out.imported}, {"skipped", out.skipped},
                        {"overwritten", out.overwritten}, {"errors", out.errors.size()}});
    spdlog::info("Import finished: {} imported, {} overwritten, {} skipped, {} errors",
                 out.imported, out.overwritten, out.skipped, out.errors.size());
    return out;
}

Result<RemoveOutcome> CatalogEngine::remove(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (auto id : ids) {
        config::trim(id);
        if (!id.empty() && seen.insert(id).second) {
            unique.push_back(std::move(id));
        }
    }
    if (unique.empty()) {
        return Error{ErrorCode::ValidationError, "no ids supplied"};
    }

    RemoveOutcome out;
    for (const auto& id : unique) {
        auto removed = config_.store->remove(id);
        if (!removed) {
            out.errors.push_back({id, removed.error().message});
        } else if (removed.value()) {
            out.removedIds.push_back(id);
            usage_->forget(id);
        } else {
            out.missing.push_back(id);
        }
    }
    if (!out.removedIds.empty()) {
        if (auto st = reloadLocked(); !st) {
            return st.error();
        }
        spdlog::info("Removed {} entries", out.removedIds.size());
    }
    audit_->record("remove", unique,
                   json{{"removed", out.removedIds.size()}, {"missing", out.missing.size()},
                        {"errors", out.errors.size()}});
    return out;
}

Result<RepairOutcome> CatalogEngine::repair(bool allowWrite) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto loaded = config_.store->load();
    if (!loaded) {
        return loaded.error();
    }

    std::vector<Entry> drifted;
    for (auto& e : loaded.value().entries) {
        if (computeSourceHash(e.body) != e.sourceHash) {
            drifted.push_back(std::move(e));
        }
    }
    RepairOutcome out;
    if (drifted.empty()) {
        return out;
    }
    if (!allowWrite) {
        return Error{ErrorCode::MutationDisabled,
                     govcat::format("{} entries need repair but mutation is disabled",
                                    drifted.size())};
    }

    const auto now = nowIso();
    for (auto& e : drifted) {
        e.sourceHash = computeSourceHash(e.body);
        e.updatedAt = now;
        if (auto written = config_.store->save(e); !written) {
            out.errors.push_back({e.id, written.error().message});
            continue;
        }
        out.updated.push_back(e.id);
    }
    if (!out.updated.empty()) {
        if (auto st = reloadLocked(); !st) {
            return st.error();
        }
        spdlog::info("Repaired source hashes for {} entries", out.updated.size());
        audit_->record("repair", out.updated, json{{"repaired", out.updated.size()}});
    }
    return out;
}

Result<ReloadOutcome> CatalogEngine::reload() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto st = reloadLocked();
    if (!st) {
        return st.error();
    }
    audit_->record("reload", {}, json{{"count", st.value()->entries.size()}});
    return ReloadOutcome{st.value()->hash, st.value()->entries.size()};
}

Result<EnrichOutcome> CatalogEngine::enrich() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto snap = st.value();
    auto& store = *config_.store;

    // A field counts as missing when absent, null or an empty string
    auto missing = [](const json& doc, const char* key) {
        auto it = doc.find(key);
        return it == doc.end() || it->is_null() ||
               (it->is_string() && it->get_ref<const std::string&>().empty());
    };

    EnrichOutcome out;
    for (const auto& view : snap->entries) {
        auto raw = store.readRaw(view.id);
        if (!raw) {
            out.errors.push_back({view.id, raw.error().message});
            continue;
        }
        auto decoded = entryFromJson(raw.value());
        if (!decoded) {
            out.errors.push_back({view.id, decoded.error().message});
            continue;
        }
        Entry rec = std::move(decoded).value();
        const json& doc = raw.value();

        bool needs = false;
        if (missing(doc, "sourceHash")) {
            rec.sourceHash = view.sourceHash;
            needs = true;
        }
        if (missing(doc, "createdAt")) {
            rec.createdAt = view.createdAt;
            needs = true;
        }
        if (missing(doc, "updatedAt")) {
            rec.updatedAt = view.updatedAt;
            needs = true;
        }
        if (missing(doc, "priorityTier") && view.priorityTier) {
            rec.priorityTier = view.priorityTier;
            needs = true;
        }
        if (!needs) {
            out.skipped.push_back(view.id);
            continue;
        }
        if (auto written = store.save(rec); !written) {
            out.errors.push_back({view.id, written.error().message});
            continue;
        }
        out.updated.push_back(view.id);
    }

    out.hash = snap->hash;
    if (!out.updated.empty()) {
        auto after = reloadLocked();
        if (!after) {
            return after.error();
        }
        out.hash = after.value()->hash;
        audit_->record("enrich", out.updated,
                       json{{"rewritten", out.updated.size()}, {"skipped", out.skipped.size()}});
        spdlog::info("Enriched {} documents", out.updated.size());
    }
    return out;
}

Result<GovernanceUpdateOutcome> CatalogEngine::governanceUpdate(const GovernanceUpdate& update) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    MutationRun run("governanceUpdate", update.id,
                    [this](MutationTrace t) { recordTrace(std::move(t)); });
    run.advance(MutationStage::Validating);

    if (update.bump != "none" && update.bump != "patch" && update.bump != "minor" &&
        update.bump != "major") {
        return run.reject("invalid bump: " + update.bump);
    }
    auto st = ensureLoaded();
    if (!st) {
        return run.fail(st.error());
    }
    if (!st.value()->find(update.id) || !config_.store->exists(update.id)) {
        run.advance(MutationStage::Invalid);
        return Error{ErrorCode::NotFound, "entry not found: " + update.id};
    }
    auto raw = config_.store->readRaw(update.id);
    if (!raw) {
        return run.fail(raw.error());
    }
    auto decoded = entryFromJson(raw.value());
    if (!decoded) {
        return run.fail(decoded.error());
    }
    Entry rec = std::move(decoded).value();

    bool changed = false;
    const auto now = nowIso();
    if (update.owner && !update.owner->empty() && update.owner != rec.owner) {
        rec.owner = update.owner;
        changed = true;
    }
    if (update.status && update.status != rec.status) {
        rec.status = update.status;
        changed = true;
    }
    if (update.lastReviewedAt && update.lastReviewedAt != rec.lastReviewedAt) {
        rec.lastReviewedAt = update.lastReviewedAt;
        changed = true;
    }
    if (update.nextReviewDue && update.nextReviewDue != rec.nextReviewDue) {
        rec.nextReviewDue = update.nextReviewDue;
        changed = true;
    }
    if (update.bump != "none") {
        const auto current = SemVer::parse(rec.version.value_or("1.0.0")).value_or(SemVer{});
        const auto next = current.bumped(update.bump).str();
        if (next != rec.version) {
            rec.version = next;
            rec.changeLog.push_back(
                {next, now, govcat::format("manual {} bump via governanceUpdate", update.bump)});
            changed = true;
        }
    }

    GovernanceUpdateOutcome out;
    out.id = rec.id;
    out.changed = changed;
    if (changed) {
        rec.updatedAt = now;
        run.advance(MutationStage::Writing);
        if (auto written = config_.store->save(rec); !written) {
            return run.fail(written.error());
        }
        run.advance(MutationStage::Persisted);
        run.advance(MutationStage::Reloading);
        auto after = reloadLocked();
        if (!after) {
            return run.fail(after.error());
        }
        if (!after.value()->find(rec.id)) {
            return run.fail(Error{ErrorCode::WriteError, "atomic_readback_failed"});
        }
        run.advance(MutationStage::VerifiedVisible);
        audit_->record("governanceUpdate", {rec.id},
                       json{{"changed", true}, {"version", rec.version.value_or("1.0.0")}});
    }
    out.version = rec.version;
    out.owner = rec.owner;
    out.status = rec.status;
    out.lastReviewedAt = rec.lastReviewedAt;
    out.nextReviewDue = rec.nextReviewDue;
    run.advance(MutationStage::Success);
    return out;
}

} // namespace govcat::catalog
