#include <govcat/catalog/catalog_engine.h>
#include <govcat/catalog/merge_policy.h>
#include <govcat/core/format.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <regex>
#include <set>

namespace govcat::catalog {

namespace {

const std::regex& legacyScopePattern() {
    static const std::regex kPattern{"^scope:(workspace|user|team):"};
    return kPattern;
}

} // namespace

Result<GroomReport> CatalogEngine::groom(const GroomOptions& options) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto before = ensureLoaded();
    if (!before) {
        return before.error();
    }
    const auto& snap = *before.value();
    auto& store = *config_.store;

    GroomReport report;
    report.previousHash = snap.hash;
    report.scanned = snap.entries.size();
    report.dryRun = options.dryRun;

    // Work on the stored documents, not the normalized view, so counts reflect what is on disk
    std::map<std::string, Entry> byId;
    std::map<std::string, std::string> storedHash;
    for (const auto& e : snap.entries) {
        Entry working = e;
        std::string stored = e.sourceHash;
        if (auto raw = store.readRaw(e.id); raw) {
            if (auto decoded = entryFromJson(raw.value()); decoded) {
                working = std::move(decoded).value();
                stored = raw.value().value("sourceHash", std::string{});
            }
        } else {
            spdlog::warn("groom: using cached view for {}: {}", e.id, raw.error().message);
        }
        storedHash.emplace(e.id, std::move(stored));
        byId.emplace(e.id, std::move(working));
    }

    std::set<std::string> updated;

    // 1. category casing and order
    for (auto& [id, e] : byId) {
        auto norm = normalizeCategories(e.categories);
        if (norm != e.categories) {
            e.categories = std::move(norm);
            ++report.normalizedCategories;
            updated.insert(id);
        }
    }

    // 2. duplicate bodies fold into the earliest entry
    std::set<std::string> duplicateIds;
    if (options.mergeDuplicates) {
        std::map<std::string, std::vector<const Entry*>> groups;
        for (const auto& [id, e] : byId) {
            groups[computeSourceHash(e.body)].push_back(&e);
        }
        for (auto& [hash, group] : groups) {
            if (group.size() < 2) {
                continue;
            }
            const std::string primaryId = merge::pickPrimary(group)->id;
            for (const auto* member : group) {
                if (member->id == primaryId) {
                    continue;
                }
                Entry& dup = byId.at(member->id);
                if (merge::foldDuplicate(byId.at(primaryId), dup)) {
                    updated.insert(primaryId);
                }
                if (options.removeDeprecated) {
                    duplicateIds.insert(dup.id);
                } else if (dup.deprecatedBy != primaryId ||
                           dup.requirement != Requirement::Deprecated) {
                    dup.deprecatedBy = primaryId;
                    dup.requirement = Requirement::Deprecated;
                    updated.insert(dup.id);
                }
                ++report.duplicatesMerged;
            }
        }
    }

    // 3. deprecated entries whose replacement exists
    std::vector<std::string> toRemove;
    if (options.removeDeprecated) {
        for (const auto& [id, e] : byId) {
            if (e.deprecatedBy && *e.deprecatedBy != id && byId.contains(*e.deprecatedBy)) {
                toRemove.push_back(id);
            }
        }
        for (const auto& id : duplicateIds) {
            if (std::find(toRemove.begin(), toRemove.end(), id) == toRemove.end()) {
                toRemove.push_back(id);
            }
        }
    }
    report.deprecatedRemoved = toRemove.size();
    const std::set<std::string> removing(toRemove.begin(), toRemove.end());

    // 4. legacy scope tokens
    if (options.purgeLegacyScopes) {
        for (auto& [id, e] : byId) {
            const auto n = std::erase_if(e.categories, [](const std::string& c) {
                return std::regex_search(c, legacyScopePattern());
            });
            if (n > 0) {
                report.purgedScopes += n;
                updated.insert(id);
            }
        }
    }

    // 5. stored hash against the body actually on disk
    for (auto& [id, e] : byId) {
        auto actual = computeSourceHash(e.body);
        if (storedHash[id] != actual) {
            e.sourceHash = std::move(actual);
            ++report.repairedHashes;
            updated.insert(id);
        }
    }

    report.filesRewritten = static_cast<std::size_t>(std::count_if(
        updated.begin(), updated.end(), [&](const auto& id) { return !removing.contains(id); }));

    if (options.dryRun) {
        report.hash = report.previousHash;
        report.notes.push_back(govcat::format("would-rewrite:{}", report.filesRewritten));
        report.notes.push_back(govcat::format("would-remove:{}", report.deprecatedRemoved));
        return report;
    }

    bool wrote = false;
    for (const auto& id : toRemove) {
        auto removed = store.remove(id);
        if (!removed) {
            report.notes.push_back("remove-failed:" + id);
            continue;
        }
        usage_->forget(id);
        wrote = true;
    }
    const auto now = nowIso();
    for (const auto& id : updated) {
        if (removing.contains(id)) {
            continue;
        }
        auto& e = byId.at(id);
        e.updatedAt = now;
        if (auto written = store.save(e); !written) {
            report.notes.push_back("write-failed:" + id);
            continue;
        }
        wrote = true;
    }

    if (wrote) {
        auto after = reloadLocked();
        if (!after) {
            return after.error();
        }
        report.hash = after.value()->hash;
        audit_->record("groom", {},
                       json{{"repairedHashes", report.repairedHashes},
                            {"normalizedCategories", report.normalizedCategories},
                            {"deprecatedRemoved", report.deprecatedRemoved},
                            {"duplicatesMerged", report.duplicatesMerged},
                            {"filesRewritten", report.filesRewritten},
                            {"purgedScopes", report.purgedScopes}});
        spdlog::info("Groom rewrote {} and removed {} entries", report.filesRewritten,
                     report.deprecatedRemoved);
    } else {
        report.hash = report.previousHash;
    }
    return report;
}

} // namespace govcat::catalog
