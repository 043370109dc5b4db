#include <govcat/catalog/catalog_engine.h>
#include <govcat/config/config_helpers.h>
#include <govcat/crypto/hasher.h>
#include <govcat/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <map>
#include <set>
#include <unordered_set>

namespace govcat::catalog {

namespace {

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

bool containsCi(std::string_view haystack, const std::string& loweredNeedle) {
    return toLower(haystack).find(loweredNeedle) != std::string::npos;
}

// Derived fields the view carries even when the document omits them
void normalizeForView(Entry& e) {
    e.categories = normalizeCategories(e.categories);
    if (!e.riskScore) {
        e.riskScore = computeRiskScore(e.priority, e.requirement);
    }
    if (!e.priorityTier) {
        e.priorityTier = derivePriorityTier(e.priority, e.requirement);
    }
    if (e.schemaVersion.empty()) {
        e.schemaVersion = kSchemaVersion;
    }
}

bool hasCategory(const Entry& e, const std::string& c) {
    return std::binary_search(e.categories.begin(), e.categories.end(), c);
}

} // namespace

const Entry* CatalogSnapshot::find(std::string_view id) const {
    auto it = byId.find(std::string(id));
    return it == byId.end() ? nullptr : &entries[it->second];
}

const char* to_string(MutationStage stage) noexcept {
    switch (stage) {
        case MutationStage::Idle: return "idle";
        case MutationStage::Validating: return "validating";
        case MutationStage::Invalid: return "invalid";
        case MutationStage::Writing: return "writing";
        case MutationStage::Persisted: return "persisted";
        case MutationStage::Reloading: return "reloading";
        case MutationStage::VerifiedVisible: return "verified-visible";
        case MutationStage::Success: return "success";
        case MutationStage::Failed: return "failed";
    }
    return "unknown";
}

CatalogEngine::CatalogEngine(CatalogEngineConfig config,
                             std::optional<boost::asio::any_io_executor> executor)
    : config_(std::move(config)) {
    if (!config_.clock) {
        config_.clock = systemClock();
    }
    if (!config_.usage.clock) {
        config_.usage.clock = config_.clock;
    }
    usage_ = std::make_unique<UsageTracker>(config_.usage, std::move(executor));
    audit_ = std::make_unique<AuditLog>(config_.auditLogPath, config_.clock);
    if (auto r = usage_->loadSnapshot(); !r) {
        spdlog::warn("Usage snapshot not loaded: {}", r.error().message);
    }
}

CatalogEngine::~CatalogEngine() = default;

std::string CatalogEngine::nowIso() const {
    return toIso8601(config_.clock->now());
}

Result<SnapshotPtr> CatalogEngine::loadSnapshot() const {
    auto loaded = config_.store->load();
    if (!loaded) {
        return loaded.error();
    }
    auto& catalog = loaded.value();

    auto snap = std::make_shared<CatalogSnapshot>();
    snap->entries = std::move(catalog.entries);
    std::sort(snap->entries.begin(), snap->entries.end(),
              [](const Entry& a, const Entry& b) { return a.id < b.id; });
    snap->byId.reserve(snap->entries.size());
    for (std::size_t i = 0; i < snap->entries.size(); ++i) {
        normalizeForView(snap->entries[i]);
        snap->byId.emplace(snap->entries[i].id, i);
    }
    snap->hash = catalog.aggregateHash;
    snap->loadedAt = nowIso();
    snap->skipped = catalog.issues.size();
    return SnapshotPtr{std::move(snap)};
}

Result<SnapshotPtr> CatalogEngine::ensureLoaded() const {
    if (auto current = std::atomic_load(&snapshot_)) {
        return current;
    }
    std::lock_guard<std::mutex> lock(loadMutex_);
    if (auto current = std::atomic_load(&snapshot_)) {
        return current;
    }
    auto fresh = loadSnapshot();
    if (!fresh) {
        spdlog::error("Catalog load failed: {}", fresh.error().message);
        return fresh.error();
    }
    std::atomic_store(&snapshot_, fresh.value());
    spdlog::debug("Catalog materialized: {} entries, hash {}", fresh.value()->entries.size(),
                  fresh.value()->hash);
    return fresh.value();
}

// Waits out a load in flight so a view read before the write cannot be published after it
void CatalogEngine::invalidate() const {
    std::lock_guard<std::mutex> lock(loadMutex_);
    std::atomic_store(&snapshot_, std::shared_ptr<const CatalogSnapshot>{});
}

Result<SnapshotPtr> CatalogEngine::reloadLocked() {
    std::lock_guard<std::mutex> lock(loadMutex_);
    std::atomic_store(&snapshot_, std::shared_ptr<const CatalogSnapshot>{});
    auto fresh = loadSnapshot();
    if (!fresh) {
        spdlog::error("Catalog reload failed: {}", fresh.error().message);
        return fresh.error();
    }
    std::atomic_store(&snapshot_, fresh.value());
    spdlog::debug("Catalog reloaded: {} entries, hash {}", fresh.value()->entries.size(),
                  fresh.value()->hash);
    return fresh.value();
}

Result<Hash> CatalogEngine::currentHash() const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    return st.value()->hash;
}

Result<std::vector<Entry>> CatalogEngine::list(std::string_view category) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto& snap = *st.value();
    if (category.empty()) {
        return snap.entries;
    }
    const auto wanted = toLower(category);
    std::vector<Entry> out;
    for (const auto& e : snap.entries) {
        if (hasCategory(e, wanted)) {
            out.push_back(e);
        }
    }
    return out;
}

Result<std::optional<Entry>> CatalogEngine::get(std::string_view id) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    if (const auto* e = st.value()->find(id)) {
        return std::optional<Entry>{*e};
    }
    return std::optional<Entry>{};
}

Result<std::vector<Entry>> CatalogEngine::search(std::string_view q) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto needle = toLower(q);
    std::vector<Entry> out;
    for (const auto& e : st.value()->entries) {
        if (containsCi(e.title, needle) || containsCi(e.body, needle)) {
            out.push_back(e);
        }
    }
    return out;
}

Result<QueryResult> CatalogEngine::query(const QueryFilter& filter) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto& snap = *st.value();

    const auto all = normalizeCategories(filter.categoriesAll);
    const auto any = normalizeCategories(filter.categoriesAny);
    const auto excluded = normalizeCategories(filter.excludeCategories);
    const std::set<PriorityTier> tiers(filter.priorityTiers.begin(), filter.priorityTiers.end());
    const std::set<Requirement> reqs(filter.requirements.begin(), filter.requirements.end());
    std::string text = toLower(filter.text);
    config::trim(text);

    QueryResult out;
    out.hash = snap.hash;
    out.limit = std::clamp<std::size_t>(filter.limit, 1, 1000);
    out.offset = filter.offset;

    std::vector<const Entry*> matched;
    for (const auto& e : snap.entries) {
        if (!std::all_of(all.begin(), all.end(), [&](const auto& c) { return hasCategory(e, c); })) {
            continue;
        }
        if (!any.empty() &&
            std::none_of(any.begin(), any.end(), [&](const auto& c) { return hasCategory(e, c); })) {
            continue;
        }
        if (std::any_of(excluded.begin(), excluded.end(),
                        [&](const auto& c) { return hasCategory(e, c); })) {
            continue;
        }
        if (filter.priorityMin && e.priority < *filter.priorityMin) continue;
        if (filter.priorityMax && e.priority > *filter.priorityMax) continue;
        if (!tiers.empty() && (!e.priorityTier || !tiers.contains(*e.priorityTier))) continue;
        if (!reqs.empty() && !reqs.contains(e.requirement)) continue;
        if (!text.empty() && !containsCi(e.title, text) && !containsCi(e.body, text) &&
            !containsCi(e.semanticSummary.value_or(""), text)) {
            continue;
        }
        matched.push_back(&e);
    }

    out.total = matched.size();
    for (std::size_t i = out.offset; i < matched.size() && out.items.size() < out.limit; ++i) {
        out.items.push_back(*matched[i]);
    }
    return out;
}

Result<std::vector<CategoryCount>> CatalogEngine::categories() const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    std::map<std::string, std::size_t> counts;
    for (const auto& e : st.value()->entries) {
        for (const auto& c : e.categories) {
            ++counts[c];
        }
    }
    std::vector<CategoryCount> out;
    out.reserve(counts.size());
    for (auto& [name, count] : counts) {
        out.push_back({name, count});
    }
    return out;
}

Result<DiffResult> CatalogEngine::diff(const DiffRequest& request) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto& snap = *st.value();
    DiffResult out;
    out.hash = snap.hash;

    if (!request.known) {
        if (request.clientHash && *request.clientHash == snap.hash) {
            out.upToDate = true;
        } else {
            out.fullResync = true;
            out.changed = snap.entries;
        }
        return out;
    }

    std::unordered_map<std::string, std::string> known;
    known.reserve(request.known->size());
    for (const auto& k : *request.known) {
        if (!k.id.empty()) {
            known.emplace(k.id, k.sourceHash);
        }
    }
    for (const auto& e : snap.entries) {
        auto it = known.find(e.id);
        if (it == known.end()) {
            out.added.push_back(e);
        } else if (it->second != e.sourceHash) {
            out.updated.push_back(e);
        }
    }
    for (const auto& [id, _] : known) {
        if (!snap.find(id)) {
            out.removed.push_back(id);
        }
    }
    std::sort(out.removed.begin(), out.removed.end());

    if (out.added.empty() && out.updated.empty() && out.removed.empty() && request.clientHash &&
        *request.clientHash == snap.hash) {
        out.upToDate = true;
    }
    return out;
}

Result<std::vector<Entry>> CatalogEngine::exportEntries(const std::vector<std::string>& ids,
                                                        bool metaOnly) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const std::unordered_set<std::string> wanted(ids.begin(), ids.end());
    std::vector<Entry> out;
    for (const auto& e : st.value()->entries) {
        if (!wanted.empty() && !wanted.contains(e.id)) {
            continue;
        }
        out.push_back(e);
        if (metaOnly) {
            out.back().body.clear();
        }
    }
    return out;
}

json projectGovernance(const Entry& e) {
    return json{
        {"id", e.id},
        {"title", e.title},
        {"version", e.version.value_or("1.0.0")},
        {"owner", e.owner.value_or("unowned")},
        {"status", e.status ? to_string(*e.status) : ""},
        {"priorityTier", e.priorityTier ? to_string(*e.priorityTier) : "P4"},
        {"nextReviewDue", e.nextReviewDue.value_or("")},
        {"semanticSummarySha256", crypto::sha256Hex(e.semanticSummary.value_or(""))},
        {"changeLogLength", e.changeLog.size()},
    };
}

std::string computeGovernanceHash(const std::vector<Entry>& entries) {
    std::vector<const Entry*> sorted;
    sorted.reserve(entries.size());
    for (const auto& e : entries) {
        sorted.push_back(&e);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Entry* a, const Entry* b) { return a->id < b->id; });

    crypto::SHA256Hasher hasher;
    bool first = true;
    for (const auto* e : sorted) {
        if (!first) {
            hasher.update(std::string_view{"\n"});
        }
        first = false;
        hasher.update(projectGovernance(*e).dump());
    }
    return hasher.finalize();
}

Result<std::string> CatalogEngine::governanceHash() const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    return computeGovernanceHash(st.value()->entries);
}

Result<HealthReport> CatalogEngine::health() const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto& snap = *st.value();
    HealthReport out;
    out.hash = snap.hash;
    out.count = snap.entries.size();
    out.loadedAt = snap.loadedAt;
    out.skipped = snap.skipped;
    out.governanceHash = computeGovernanceHash(snap.entries);

    std::error_code ec;
    if (config_.catalogSnapshotPath.empty() ||
        !std::filesystem::exists(config_.catalogSnapshotPath, ec)) {
        out.snapshot = "missing";
        return out;
    }

    json doc;
    try {
        std::ifstream in(config_.catalogSnapshotPath);
        doc = json::parse(in);
    } catch (const json::exception& e) {
        out.snapshot = "error";
        out.error = e.what();
        return out;
    }

    out.snapshot = "present";
    std::unordered_map<std::string, std::string> recorded;
    if (auto it = doc.find("items"); it != doc.end() && it->is_array()) {
        for (const auto& item : *it) {
            if (item.is_object() && item.contains("id") && item["id"].is_string()) {
                recorded.emplace(item["id"].get<std::string>(),
                                 item.value("sourceHash", std::string{}));
            }
        }
    }
    for (const auto& e : snap.entries) {
        auto it = recorded.find(e.id);
        if (it == recorded.end()) {
            out.missing.push_back(e.id);
        } else if (it->second != e.sourceHash) {
            out.changed.push_back(e.id);
        }
    }
    for (const auto& [id, _] : recorded) {
        if (!snap.find(id)) {
            out.extra.push_back(id);
        }
    }
    std::sort(out.extra.begin(), out.extra.end());
    return out;
}

Result<IntegrityReport> CatalogEngine::verify() const {
    // Read straight from the store so a stale cached view cannot mask drift
    auto loaded = config_.store->load();
    if (!loaded) {
        return loaded.error();
    }
    IntegrityReport out;
    out.hash = loaded.value().aggregateHash;
    out.count = loaded.value().entries.size();
    for (const auto& e : loaded.value().entries) {
        auto actual = computeSourceHash(e.body);
        if (actual != e.sourceHash) {
            out.issues.push_back({e.id, e.sourceHash, std::move(actual)});
        }
    }
    if (!out.issues.empty()) {
        spdlog::warn("Integrity check found {} drifted entries", out.issues.size());
    }
    return out;
}

Result<std::optional<TrackOutcome>> CatalogEngine::incrementUsage(std::string_view id) {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    if (!st.value()->find(id)) {
        return std::optional<TrackOutcome>{};
    }
    return std::optional<TrackOutcome>{usage_->increment(id)};
}

Result<std::vector<std::pair<std::string, UsageRecord>>>
CatalogEngine::hotset(std::size_t limit) const {
    auto st = ensureLoaded();
    if (!st) {
        return st.error();
    }
    const auto& snap = *st.value();
    auto items = usage_->hotset(std::numeric_limits<std::size_t>::max());
    std::erase_if(items, [&](const auto& item) { return snap.find(item.first) == nullptr; });
    if (items.size() > limit) {
        items.resize(limit);
    }
    return items;
}

Result<void> CatalogEngine::flushUsage() {
    return usage_->flush();
}

std::optional<MutationTrace> CatalogEngine::lastMutation() const {
    std::lock_guard<std::mutex> lock(traceMutex_);
    return lastTrace_;
}

void CatalogEngine::recordTrace(MutationTrace trace) {
    std::lock_guard<std::mutex> lock(traceMutex_);
    lastTrace_ = std::move(trace);
}

} // namespace govcat::catalog
