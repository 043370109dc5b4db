#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <govcat/catalog/audit_log.h>
#include <govcat/catalog/entry.h>
#include <govcat/catalog/usage_tracker.h>
#include <govcat/core/clock.h>
#include <govcat/core/types.h>
#include <govcat/storage/content_store.h>

namespace govcat::catalog {

using json = nlohmann::json;

struct CatalogSnapshot {
    std::vector<Entry> entries; // sorted by id
    std::unordered_map<std::string, std::size_t> byId;
    Hash hash;
    std::string loadedAt;
    std::size_t skipped = 0;

    const Entry* find(std::string_view id) const;
};

using SnapshotPtr = std::shared_ptr<const CatalogSnapshot>;

// ---- reads ----------------------------------------------------------------

struct QueryFilter {
    std::vector<std::string> categoriesAll;
    std::vector<std::string> categoriesAny;
    std::vector<std::string> excludeCategories;
    std::optional<int> priorityMin;
    std::optional<int> priorityMax;
    std::vector<PriorityTier> priorityTiers;
    std::vector<Requirement> requirements;
    std::string text;
    std::size_t limit = 100;
    std::size_t offset = 0;
};

struct QueryResult {
    Hash hash;
    std::size_t total = 0;
    std::size_t offset = 0;
    std::size_t limit = 0;
    std::vector<Entry> items;
};

struct KnownEntry {
    std::string id;
    std::string sourceHash;
};

struct DiffRequest {
    std::optional<std::string> clientHash;
    std::optional<std::vector<KnownEntry>> known;
};

struct DiffResult {
    Hash hash;
    bool upToDate = false;
    // Set when no inventory was supplied and the client hash is stale
    bool fullResync = false;
    std::vector<Entry> added;
    std::vector<Entry> updated;
    std::vector<std::string> removed;
    std::vector<Entry> changed;
};

struct CategoryCount {
    std::string name;
    std::size_t count = 0;
};

struct HealthReport {
    std::string snapshot; // missing | present | error
    Hash hash;
    std::size_t count = 0;
    std::string loadedAt;
    // Documents the last load could not decode
    std::size_t skipped = 0;
    std::vector<std::string> missing;
    std::vector<std::string> changed;
    std::vector<std::string> extra;
    std::string governanceHash;
    std::string error;
};

struct IntegrityIssue {
    std::string id;
    std::string expected;
    std::string actual;
};

struct IntegrityReport {
    Hash hash;
    std::size_t count = 0;
    std::vector<IntegrityIssue> issues;
};

// ---- mutations --------------------------------------------------------------

// An entry as submitted by a client; only id is guaranteed
struct EntryDraft {
    std::string id;
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<std::string> rationale;
    std::optional<int> priority;
    std::optional<Audience> audience;
    std::optional<Requirement> requirement;
    std::optional<std::vector<std::string>> categories;
    std::optional<std::string> deprecatedBy;
    std::optional<int> riskScore;
    std::optional<std::string> version;
    std::optional<std::string> owner;
    std::optional<GovernanceStatus> status;
    std::optional<PriorityTier> priorityTier;
    std::optional<Classification> classification;
    std::optional<std::string> lastReviewedAt;
    std::optional<std::string> nextReviewDue;
    std::optional<std::vector<ChangeLogEntry>> changeLog;
    std::optional<std::string> supersedes;
    std::optional<std::string> semanticSummary;
};

// ValidationError when a field has the wrong type or an unknown enum value
Result<EntryDraft> draftFromJson(const json& j);

struct AddOptions {
    bool overwrite = false;
    bool lax = false;
};

struct AddOutcome {
    std::string id;
    bool created = false;
    bool overwritten = false;
    bool skipped = false;
    Hash hash;
    bool verified = false;
};

enum class ImportMode { Skip, Overwrite };

struct ItemError {
    std::string id;
    std::string error;
};

struct ImportOutcome {
    Hash hash;
    std::size_t imported = 0;
    std::size_t skipped = 0;
    std::size_t overwritten = 0;
    std::size_t total = 0;
    std::vector<ItemError> errors;
};

struct RemoveOutcome {
    std::vector<std::string> removedIds;
    std::vector<std::string> missing;
    std::vector<ItemError> errors;
};

struct RepairOutcome {
    std::vector<std::string> updated;
    std::vector<ItemError> errors;
};

struct EnrichOutcome {
    Hash hash;
    std::vector<std::string> updated;
    std::vector<std::string> skipped;
    std::vector<ItemError> errors;
};

struct ReloadOutcome {
    Hash hash;
    std::size_t count = 0;
};

struct GroomOptions {
    bool dryRun = false;
    bool removeDeprecated = false;
    bool mergeDuplicates = false;
    bool purgeLegacyScopes = false;
};

struct GroomReport {
    Hash previousHash;
    Hash hash;
    std::size_t scanned = 0;
    std::size_t repairedHashes = 0;
    std::size_t normalizedCategories = 0;
    std::size_t deprecatedRemoved = 0;
    std::size_t duplicatesMerged = 0;
    std::size_t filesRewritten = 0;
    std::size_t purgedScopes = 0;
    bool dryRun = false;
    std::vector<std::string> notes;
};

struct GovernanceUpdate {
    std::string id;
    std::optional<std::string> owner;
    std::optional<GovernanceStatus> status;
    std::optional<std::string> lastReviewedAt;
    std::optional<std::string> nextReviewDue;
    std::string bump = "none";
};

struct GovernanceUpdateOutcome {
    std::string id;
    bool changed = false;
    std::optional<std::string> version;
    std::optional<std::string> owner;
    std::optional<GovernanceStatus> status;
    std::optional<std::string> lastReviewedAt;
    std::optional<std::string> nextReviewDue;
};

// Stages a single-entry mutation passes through; failures are tagged with the stage reached
enum class MutationStage {
    Idle,
    Validating,
    Invalid,
    Writing,
    Persisted,
    Reloading,
    VerifiedVisible,
    Success,
    Failed
};

const char* to_string(MutationStage stage) noexcept;

struct MutationTrace {
    std::string operation;
    std::string id;
    std::vector<MutationStage> stages;
};

struct CatalogEngineConfig {
    std::shared_ptr<storage::IContentStore> store;
    std::shared_ptr<IClock> clock;
    // Optional canonical snapshot compared by health()
    std::filesystem::path catalogSnapshotPath;
    // JSONL mutation log; empty disables it
    std::filesystem::path auditLogPath;
    UsageTrackerConfig usage;
};

/**
 * Lazily materialized view over the content store.
 *
 * Readers take an immutable snapshot without locking the writer path; every
 * mutation is serialized behind one writer lock, persists through the store,
 * invalidates the view and reloads before it reports success.
 */
class CatalogEngine {
public:
    explicit CatalogEngine(CatalogEngineConfig config,
                           std::optional<boost::asio::any_io_executor> executor = std::nullopt);
    ~CatalogEngine();

    CatalogEngine(const CatalogEngine&) = delete;
    CatalogEngine& operator=(const CatalogEngine&) = delete;

    Result<SnapshotPtr> ensureLoaded() const;
    void invalidate() const;

    // Reads
    Result<std::vector<Entry>> list(std::string_view category = {}) const;
    Result<std::optional<Entry>> get(std::string_view id) const;
    Result<std::vector<Entry>> search(std::string_view q) const;
    Result<QueryResult> query(const QueryFilter& filter) const;
    Result<std::vector<CategoryCount>> categories() const;
    Result<DiffResult> diff(const DiffRequest& request) const;
    Result<std::vector<Entry>> exportEntries(const std::vector<std::string>& ids,
                                             bool metaOnly) const;
    Result<std::string> governanceHash() const;
    Result<HealthReport> health() const;
    Result<IntegrityReport> verify() const;
    Result<Hash> currentHash() const;

    // Mutations
    Result<AddOutcome> add(const EntryDraft& draft, const AddOptions& options);
    Result<ImportOutcome> importEntries(const std::vector<EntryDraft>& drafts, ImportMode mode);
    Result<RemoveOutcome> remove(const std::vector<std::string>& ids);
    // With allowWrite false a drifted catalog fails with MutationDisabled and nothing is written
    Result<RepairOutcome> repair(bool allowWrite);
    Result<ReloadOutcome> reload();
    // Persist derived fields (sourceHash, timestamps, priorityTier) that documents omit
    Result<EnrichOutcome> enrich();
    Result<GroomReport> groom(const GroomOptions& options);
    Result<GovernanceUpdateOutcome> governanceUpdate(const GovernanceUpdate& update);

    // Usage
    Result<std::optional<TrackOutcome>> incrementUsage(std::string_view id);
    Result<std::vector<std::pair<std::string, UsageRecord>>> hotset(std::size_t limit) const;
    Result<void> flushUsage();

    std::optional<MutationTrace> lastMutation() const;
    storage::IContentStore& store() const { return *config_.store; }
    UsageTracker& usage() { return *usage_; }
    const AuditLog& auditLog() const { return *audit_; }

private:
    Result<SnapshotPtr> loadSnapshot() const;
    Result<SnapshotPtr> reloadLocked();
    std::string nowIso() const;
    void recordTrace(MutationTrace trace);

    CatalogEngineConfig config_;
    std::unique_ptr<UsageTracker> usage_;
    std::unique_ptr<AuditLog> audit_;

    mutable std::shared_ptr<const CatalogSnapshot> snapshot_;
    mutable std::mutex loadMutex_;
    std::mutex writeMutex_;

    mutable std::mutex traceMutex_;
    std::optional<MutationTrace> lastTrace_;
};

// sha256 over the sorted governance projections joined by '\n'
std::string computeGovernanceHash(const std::vector<Entry>& entries);
json projectGovernance(const Entry& e);

} // namespace govcat::catalog
