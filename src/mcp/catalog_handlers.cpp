#include <govcat/config/config_helpers.h>
#include <govcat/mcp/handlers.h>
#include <govcat/version.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace govcat::mcp {

using catalog::CatalogEngine;
using catalog::Entry;

namespace {

template <typename T> T take(Result<T> result, const std::string& id = {}) {
    if (!result) {
        json data = json::object();
        if (!id.empty()) {
            data["id"] = id;
        }
        throwRpcError(result.error(), std::move(data));
    }
    return std::move(result).value();
}

void take(Result<void> result) {
    if (!result) {
        throwRpcError(result.error());
    }
}

json entriesToJson(const std::vector<Entry>& entries) {
    json items = json::array();
    for (const auto& e : entries) {
        items.push_back(catalog::toJson(e));
    }
    return items;
}

std::vector<std::string> stringList(const json& params, const char* key) {
    std::vector<std::string> out;
    if (auto it = params.find(key); it != params.end() && it->is_array()) {
        for (const auto& v : *it) {
            if (v.is_string()) {
                out.push_back(v.get<std::string>());
            }
        }
    }
    return out;
}

std::optional<std::string> optionalString(const json& params, const char* key) {
    if (auto it = params.find(key); it != params.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

std::optional<double> optionalNumber(const json& params, const char* key) {
    if (auto it = params.find(key); it != params.end() && it->is_number()) {
        return it->get<double>();
    }
    return std::nullopt;
}

std::string requireId(const json& params, const char* key = "id") {
    auto id = optionalString(params, key);
    if (id) {
        config::trim(*id);
    }
    if (!id || id->empty()) {
        throw RpcError(protocol::INVALID_PARAMS, std::string("Missing '") + key + "'",
                       json{{"reason", "missing_id"}});
    }
    return *id;
}

catalog::QueryFilter parseQuery(const json& p) {
    catalog::QueryFilter f;
    f.categoriesAll = stringList(p, "categoriesAll");
    f.categoriesAny = stringList(p, "categoriesAny");
    f.excludeCategories = stringList(p, "excludeCategories");
    if (auto v = optionalNumber(p, "priorityMin")) {
        f.priorityMin = catalog::clampedInt(std::ceil(*v), 0, 101);
    }
    if (auto v = optionalNumber(p, "priorityMax")) {
        f.priorityMax = catalog::clampedInt(std::floor(*v), 0, 101);
    }
    for (const auto& t : stringList(p, "priorityTiers")) {
        if (auto tier = catalog::parsePriorityTier(t)) {
            f.priorityTiers.push_back(*tier);
        }
    }
    for (const auto& r : stringList(p, "requirements")) {
        if (auto req = catalog::parseRequirement(r)) {
            f.requirements.push_back(*req);
        }
    }
    f.text = p.value("text", std::string{});
    if (auto v = optionalNumber(p, "limit")) {
        f.limit = static_cast<std::size_t>(std::clamp(*v, 1.0, 1000.0));
    }
    if (auto v = optionalNumber(p, "offset")) {
        f.offset = static_cast<std::size_t>(std::max(*v, 0.0));
    }
    return f;
}

json diffToJson(const catalog::DiffResult& d) {
    if (d.upToDate) {
        return json{{"upToDate", true}, {"hash", d.hash}};
    }
    if (d.fullResync) {
        return json{{"hash", d.hash}, {"changed", entriesToJson(d.changed)}};
    }
    return json{{"hash", d.hash},
                {"added", entriesToJson(d.added)},
                {"updated", entriesToJson(d.updated)},
                {"removed", d.removed}};
}

json itemErrorsToJson(const std::vector<catalog::ItemError>& errors) {
    json out = json::array();
    for (const auto& e : errors) {
        out.push_back({{"id", e.id}, {"error", e.error}});
    }
    return out;
}

json groomToJson(const catalog::GroomReport& r) {
    return json{{"previousHash", r.previousHash},
                {"hash", r.hash},
                {"scanned", r.scanned},
                {"repairedHashes", r.repairedHashes},
                {"normalizedCategories", r.normalizedCategories},
                {"deprecatedRemoved", r.deprecatedRemoved},
                {"duplicatesMerged", r.duplicatesMerged},
                {"filesRewritten", r.filesRewritten},
                {"purgedScopes", r.purgedScopes},
                {"dryRun", r.dryRun},
                {"notes", r.notes}};
}

json usageRecordJson(const std::string& id, const catalog::UsageRecord& r) {
    return json{{"id", id},
                {"usageCount", r.usageCount},
                {"firstSeenTs", r.firstSeenTs},
                {"lastUsedAt", r.lastUsedAt}};
}

const std::set<std::string>& forwardedActions() {
    static const std::set<std::string> kActions = {
        "list",   "get",    "search", "query",  "categories", "diff",
        "export", "governanceHash", "health", "add", "import", "remove",
        "repair", "reload", "groom",  "governanceUpdate", "enrich"};
    return kActions;
}

json routeAction(Dispatcher& dispatcher, const json& params, const CallContext& ctx) {
    std::string action = params.is_object() ? params.value("action", std::string{}) : "";
    config::trim(action);
    if (action.empty()) {
        throw RpcError(protocol::INVALID_PARAMS, "Missing action",
                       json{{"method", "instructions/dispatch"}, {"reason", "missing_action"}});
    }

    if (action == "capabilities") {
        return json{{"version", kVersion},
                    {"supportedActions", dispatchActions()},
                    {"mutationEnabled", ctx.mutationAllowed}};
    }

    if (action == "batch") {
        const json* ops = nullptr;
        if (params.contains("operations") && params["operations"].is_array()) {
            ops = &params["operations"];
        } else if (params.contains("ops") && params["ops"].is_array()) {
            ops = &params["ops"];
        }
        json results = json::array();
        if (ops) {
            for (const auto& op : *ops) {
                if (!op.is_object()) {
                    continue;
                }
                try {
                    results.push_back(routeAction(dispatcher, op, ctx));
                } catch (...) {
                    auto normalized =
                        deepUnwrap(std::current_exception(), "instructions/dispatch");
                    results.push_back(json{{"error", normalized.toJson()}});
                }
            }
        }
        return json{{"results", std::move(results)}};
    }

    if (!forwardedActions().contains(action)) {
        throw RpcError(protocol::METHOD_NOT_FOUND, "Unknown action: " + action,
                       json{{"action", action}, {"reason", "unknown_action"}});
    }

    json rest = params;
    rest.erase("action");
    // A single id is accepted for remove
    if (action == "remove" && rest.contains("id") && rest["id"].is_string() &&
        !rest.contains("ids")) {
        rest["ids"] = json::array({rest["id"]});
        rest.erase("id");
    }
    return dispatcher.invoke("instructions/" + action, rest);
}

} // namespace

const std::vector<std::string>& dispatchActions() {
    static const std::vector<std::string> kAll = [] {
        std::vector<std::string> v(forwardedActions().begin(), forwardedActions().end());
        v.push_back("capabilities");
        v.push_back("batch");
        return v;
    }();
    return kAll;
}

void registerCatalogHandlers(Dispatcher& dispatcher, CatalogEngine& engine) {
    // ---- reads ----

    dispatcher.registerHandler("instructions/list", [&engine](const json& p, const CallContext&) {
        const auto category = p.value("category", std::string{});
        auto hash = take(engine.currentHash());
        auto items = take(engine.list(category));
        return json{{"hash", hash}, {"count", items.size()}, {"items", entriesToJson(items)}};
    });

    dispatcher.registerHandler("instructions/get", [&engine](const json& p, const CallContext&) {
        const auto id = requireId(p);
        auto found = take(engine.get(id), id);
        if (!found) {
            return json{{"id", id}, {"notFound", true}};
        }
        return json{{"hash", take(engine.currentHash())}, {"item", catalog::toJson(*found)}};
    });

    dispatcher.registerHandler("instructions/search",
                               [&engine](const json& p, const CallContext&) {
                                   const auto q = p.value("q", std::string{});
                                   auto hash = take(engine.currentHash());
                                   auto items = take(engine.search(q));
                                   return json{{"hash", hash},
                                               {"count", items.size()},
                                               {"items", entriesToJson(items)}};
                               });

    dispatcher.registerHandler("instructions/query", [&engine](const json& p, const CallContext&) {
        auto r = take(engine.query(parseQuery(p)));
        return json{{"hash", r.hash},       {"total", r.total},
                    {"count", r.items.size()}, {"offset", r.offset},
                    {"limit", r.limit},     {"items", entriesToJson(r.items)}};
    });

    dispatcher.registerHandler("instructions/categories",
                               [&engine](const json&, const CallContext&) {
                                   auto cats = take(engine.categories());
                                   json out = json::array();
                                   for (const auto& c : cats) {
                                       out.push_back({{"name", c.name}, {"count", c.count}});
                                   }
                                   return json{{"count", cats.size()},
                                               {"categories", std::move(out)}};
                               });

    dispatcher.registerHandler("instructions/diff", [&engine](const json& p, const CallContext&) {
        catalog::DiffRequest req;
        req.clientHash = optionalString(p, "clientHash");
        if (auto it = p.find("known"); it != p.end() && it->is_array()) {
            std::vector<catalog::KnownEntry> known;
            for (const auto& k : *it) {
                if (k.is_object() && k.contains("id") && k["id"].is_string()) {
                    known.push_back({k["id"].get<std::string>(),
                                     k.value("sourceHash", std::string{})});
                }
            }
            req.known = std::move(known);
        }
        return diffToJson(take(engine.diff(req)));
    });

    dispatcher.registerHandler("instructions/export", [&engine](const json& p, const CallContext&) {
        auto hash = take(engine.currentHash());
        auto items = take(engine.exportEntries(stringList(p, "ids"), p.value("metaOnly", false)));
        json out = entriesToJson(items);
        if (p.value("metaOnly", false)) {
            for (auto& item : out) {
                item.erase("body");
            }
        }
        return json{{"hash", hash}, {"count", items.size()}, {"items", std::move(out)}};
    });

    dispatcher.registerHandler("instructions/governanceHash",
                               [&engine](const json&, const CallContext&) {
                                   auto entries = take(engine.list());
                                   json items = json::array();
                                   for (const auto& e : entries) {
                                       items.push_back(catalog::projectGovernance(e));
                                   }
                                   return json{{"count", entries.size()},
                                               {"governanceHash", take(engine.governanceHash())},
                                               {"items", std::move(items)}};
                               });

    dispatcher.registerHandler("instructions/health", [&engine](const json&, const CallContext&) {
        auto h = take(engine.health());
        json out{{"snapshot", h.snapshot},
                 {"hash", h.hash},
                 {"count", h.count},
                 {"loadedAt", h.loadedAt},
                 {"skipped", h.skipped},
                 {"governanceHash", h.governanceHash}};
        if (h.snapshot == "present") {
            out["missing"] = h.missing;
            out["changed"] = h.changed;
            out["extra"] = h.extra;
            out["drift"] = h.missing.size() + h.changed.size() + h.extra.size();
        } else if (h.snapshot == "error") {
            out["error"] = h.error;
        }
        return out;
    });

    dispatcher.registerHandler("integrity/verify", [&engine](const json&, const CallContext&) {
        auto r = take(engine.verify());
        json issues = json::array();
        for (const auto& i : r.issues) {
            issues.push_back({{"id", i.id}, {"expected", i.expected}, {"actual", i.actual}});
        }
        return json{{"hash", r.hash},
                    {"count", r.count},
                    {"issues", std::move(issues)},
                    {"issueCount", r.issues.size()}};
    });

    // ---- mutations ----

    dispatcher.registerHandler("instructions/add", [&engine](const json& p, const CallContext&) {
        const json& entry = p.contains("entry") ? p["entry"] : json::object();
        auto draft = take(catalog::draftFromJson(entry), entry.value("id", std::string{}));
        catalog::AddOptions options;
        options.overwrite = p.value("overwrite", false);
        options.lax = p.value("lax", false);
        auto r = take(engine.add(draft, options), draft.id);
        return json{{"id", r.id},           {"created", r.created}, {"overwritten", r.overwritten},
                    {"skipped", r.skipped}, {"hash", r.hash},       {"verified", r.verified}};
    });

    dispatcher.registerHandler("instructions/import", [&engine](const json& p, const CallContext&) {
        std::vector<catalog::EntryDraft> drafts;
        std::vector<catalog::ItemError> parseErrors;
        std::size_t total = 0;
        if (auto it = p.find("entries"); it != p.end() && it->is_array()) {
            total = it->size();
            for (const auto& raw : *it) {
                auto draft = catalog::draftFromJson(raw);
                if (!draft) {
                    parseErrors.push_back({raw.is_object() ? raw.value("id", std::string{}) : "",
                                           draft.error().message});
                    continue;
                }
                drafts.push_back(std::move(draft).value());
            }
        }
        const auto mode = p.value("mode", std::string{"skip"}) == "overwrite"
                              ? catalog::ImportMode::Overwrite
                              : catalog::ImportMode::Skip;
        auto r = take(engine.importEntries(drafts, mode));
        auto errors = parseErrors;
        errors.insert(errors.end(), r.errors.begin(), r.errors.end());
        return json{{"hash", r.hash},
                    {"imported", r.imported},
                    {"skipped", r.skipped},
                    {"overwritten", r.overwritten},
                    {"total", total},
                    {"errors", itemErrorsToJson(errors)}};
    });

    dispatcher.registerHandler("instructions/remove", [&engine](const json& p, const CallContext&) {
        // missingOk is accepted; missing ids are always reported rather than failing
        auto r = take(engine.remove(stringList(p, "ids")));
        return json{{"removed", r.removedIds.size()},
                    {"removedIds", r.removedIds},
                    {"missing", r.missing},
                    {"errorCount", r.errors.size()},
                    {"errors", itemErrorsToJson(r.errors)}};
    });

    dispatcher.registerHandler(
        "instructions/repair",
        [&engine](const json&, const CallContext& ctx) {
            auto r = take(engine.repair(ctx.mutationAllowed));
            json out{{"repaired", r.updated.size()}, {"updated", r.updated}};
            if (!r.errors.empty()) {
                out["errors"] = itemErrorsToJson(r.errors);
            }
            return out;
        },
        HandlerOptions{.noopWhenDisabled = true});

    dispatcher.registerHandler("instructions/reload", [&engine](const json&, const CallContext&) {
        auto r = take(engine.reload());
        return json{{"reloaded", true}, {"hash", r.hash}, {"count", r.count}};
    });

    dispatcher.registerHandler("instructions/enrich", [&engine](const json&, const CallContext&) {
        auto r = take(engine.enrich());
        json out{{"rewritten", r.updated.size()},
                 {"updated", r.updated},
                 {"skipped", r.skipped},
                 {"hash", r.hash}};
        if (!r.errors.empty()) {
            out["errors"] = itemErrorsToJson(r.errors);
        }
        return out;
    });

    dispatcher.registerHandler("instructions/groom", [&engine](const json& p, const CallContext&) {
        catalog::GroomOptions options;
        if (auto it = p.find("mode"); it != p.end() && it->is_object()) {
            options.dryRun = it->value("dryRun", false);
            options.removeDeprecated = it->value("removeDeprecated", false);
            options.mergeDuplicates = it->value("mergeDuplicates", false);
            options.purgeLegacyScopes = it->value("purgeLegacyScopes", false);
        }
        return groomToJson(take(engine.groom(options)));
    });

    dispatcher.registerHandler(
        "instructions/governanceUpdate", [&engine](const json& p, const CallContext&) {
            catalog::GovernanceUpdate update;
            update.id = requireId(p);
            update.owner = optionalString(p, "owner");
            if (auto status = optionalString(p, "status")) {
                update.status = catalog::parseStatus(*status);
                if (!update.status) {
                    throw RpcError(protocol::INVALID_PARAMS, "invalid status",
                                   json{{"id", update.id}, {"provided", *status}});
                }
            }
            update.lastReviewedAt = optionalString(p, "lastReviewedAt");
            update.nextReviewDue = optionalString(p, "nextReviewDue");
            update.bump = p.value("bump", std::string{"none"});
            auto r = take(engine.governanceUpdate(update), update.id);
            json out{{"id", r.id}, {"changed", r.changed}};
            if (r.version) out["version"] = *r.version;
            if (r.owner) out["owner"] = *r.owner;
            if (r.status) out["status"] = catalog::to_string(*r.status);
            if (r.lastReviewedAt) out["lastReviewedAt"] = *r.lastReviewedAt;
            if (r.nextReviewDue) out["nextReviewDue"] = *r.nextReviewDue;
            return out;
        });

    // ---- usage ----

    dispatcher.registerHandler("usage/track", [&engine](const json& p, const CallContext&) {
        const auto id = requireId(p);
        auto outcome = take(engine.incrementUsage(id), id);
        if (!outcome) {
            return json{{"id", id}, {"notFound", true}};
        }
        if (outcome->rateLimited) {
            return json{{"id", id}, {"rateLimited", true}};
        }
        return usageRecordJson(outcome->id, outcome->record);
    });

    dispatcher.registerHandler("usage/hotset", [&engine](const json& p, const CallContext&) {
        std::size_t limit = 10;
        if (auto v = optionalNumber(p, "limit")) {
            limit = static_cast<std::size_t>(std::clamp(*v, 1.0, 100.0));
        }
        auto items = take(engine.hotset(limit));
        json out = json::array();
        for (const auto& [id, rec] : items) {
            out.push_back(
                {{"id", id}, {"usageCount", rec.usageCount}, {"lastUsedAt", rec.lastUsedAt}});
        }
        return json{{"count", items.size()}, {"limit", limit}, {"items", std::move(out)}};
    });

    dispatcher.registerHandler("usage/flush", [&engine](const json&, const CallContext&) {
        take(engine.flushUsage());
        return json{{"flushed", true}};
    });

    // ---- action router ----

    dispatcher.registerHandler("instructions/dispatch",
                               [&dispatcher](const json& p, const CallContext& ctx) {
                                   return routeAction(dispatcher, p, ctx);
                               });

    spdlog::debug("Registered catalog handlers");
}

} // namespace govcat::mcp
