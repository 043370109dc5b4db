#include <govcat/mcp/tool_registry.h>
#include <govcat/version.hpp>

#include <algorithm>
#include <set>
#include <unordered_map>

namespace govcat::mcp {

namespace {

json makeProp(const char* type) {
    return json{{"type", type}};
}

json makeEnum(const char* type, std::initializer_list<const char*> values) {
    json prop = makeProp(type);
    prop["enum"] = json::array();
    for (const char* v : values) {
        prop["enum"].push_back(v);
    }
    return prop;
}

json arrayOf(json items) {
    return json{{"type", "array"}, {"items", std::move(items)}};
}

json objectSchema(json props = json::object(), std::initializer_list<const char*> required = {},
                  bool additional = true) {
    json schema;
    schema["type"] = "object";
    schema["additionalProperties"] = additional;
    if (!props.empty()) {
        schema["properties"] = std::move(props);
    }
    if (required.size() > 0) {
        schema["required"] = json::array();
        for (const char* r : required) {
            schema["required"].push_back(r);
        }
    }
    return schema;
}

json entryItemProps() {
    json props = json::object();
    props["id"] = makeProp("string");
    props["title"] = makeProp("string");
    props["body"] = makeProp("string");
    props["rationale"] = makeProp("string");
    props["priority"] = json{{"type", "number"}, {"minimum", 1}, {"maximum", 100}};
    props["audience"] = makeProp("string");
    props["requirement"] = makeProp("string");
    props["categories"] = arrayOf(makeProp("string"));
    return props;
}

std::unordered_map<std::string, json> buildInputSchemas() {
    std::unordered_map<std::string, json> s;

    s["health/check"] = objectSchema();
    s["meta/tools"] = objectSchema();
    s["metrics/snapshot"] = objectSchema();
    s["usage/flush"] = objectSchema();
    s["integrity/verify"] = objectSchema();
    s["instructions/governanceHash"] = objectSchema();
    s["instructions/categories"] = objectSchema();
    s["instructions/health"] = objectSchema();
    s["instructions/repair"] = objectSchema();
    s["instructions/reload"] = objectSchema();
    s["instructions/enrich"] = objectSchema();
    s["diagnostics/handshake"] = objectSchema();

    s["instructions/dispatch"] =
        objectSchema(json{{"action", makeProp("string")}}, {"action"}, true);

    s["instructions/list"] = objectSchema(json{{"category", makeProp("string")}});
    s["instructions/get"] = objectSchema(json{{"id", makeProp("string")}}, {"id"});
    s["instructions/search"] = objectSchema(json{{"q", makeProp("string")}}, {"q"});
    {
        json known = objectSchema(
            json{{"id", makeProp("string")}, {"sourceHash", makeProp("string")}}, {"id"});
        s["instructions/diff"] =
            objectSchema(json{{"clientHash", makeProp("string")}, {"known", arrayOf(known)}});
    }
    s["instructions/export"] = objectSchema(
        json{{"ids", arrayOf(makeProp("string"))}, {"metaOnly", makeProp("boolean")}});

    {
        json props = json::object();
        props["categoriesAll"] = arrayOf(makeProp("string"));
        props["categoriesAny"] = arrayOf(makeProp("string"));
        props["excludeCategories"] = arrayOf(makeProp("string"));
        props["priorityMin"] = makeProp("number");
        props["priorityMax"] = makeProp("number");
        props["priorityTiers"] = arrayOf(makeEnum("string", {"P1", "P2", "P3", "P4"}));
        props["requirements"] = arrayOf(makeEnum(
            "string", {"mandatory", "critical", "recommended", "optional", "deprecated"}));
        props["text"] = makeProp("string");
        props["limit"] = json{{"type", "number"}, {"minimum", 1}, {"maximum", 1000}};
        props["offset"] = json{{"type", "number"}, {"minimum", 0}};
        s["instructions/query"] = objectSchema(std::move(props));
    }

    {
        json item = objectSchema(entryItemProps(),
                                 {"id", "title", "body", "priority", "audience", "requirement"});
        item["properties"]["mode"] = makeProp("string");
        json entries = arrayOf(std::move(item));
        entries["minItems"] = 1;
        s["instructions/import"] = objectSchema(
            json{{"entries", std::move(entries)},
                 {"mode", json{{"enum", json::array({"skip", "overwrite"})}}}},
            {"entries"}, false);
    }

    {
        json props = entryItemProps();
        props["deprecatedBy"] = makeProp("string");
        props["riskScore"] = makeProp("number");
        json entry = objectSchema(std::move(props), {"id", "body"});
        s["instructions/add"] = objectSchema(json{{"entry", std::move(entry)},
                                                  {"overwrite", makeProp("boolean")},
                                                  {"lax", makeProp("boolean")}},
                                             {"entry"}, false);
    }

    {
        json ids = arrayOf(makeProp("string"));
        ids["minItems"] = 1;
        s["instructions/remove"] = objectSchema(
            json{{"ids", std::move(ids)}, {"missingOk", makeProp("boolean")}}, {"ids"}, false);
    }

    {
        json mode = objectSchema(json{{"dryRun", makeProp("boolean")},
                                      {"removeDeprecated", makeProp("boolean")},
                                      {"mergeDuplicates", makeProp("boolean")},
                                      {"purgeLegacyScopes", makeProp("boolean")}},
                                 {}, false);
        s["instructions/groom"] = objectSchema(json{{"mode", std::move(mode)}}, {}, false);
    }

    {
        json props = json::object();
        props["id"] = makeProp("string");
        props["owner"] = makeProp("string");
        props["status"] = makeEnum(
            "string", {"approved", "active", "draft", "review", "deprecated", "superseded"});
        props["lastReviewedAt"] = makeProp("string");
        props["nextReviewDue"] = makeProp("string");
        props["bump"] = makeEnum("string", {"patch", "minor", "major", "none"});
        s["instructions/governanceUpdate"] = objectSchema(std::move(props), {"id"}, false);
    }

    s["usage/track"] = objectSchema(json{{"id", makeProp("string")}}, {"id"}, false);
    s["usage/hotset"] = objectSchema(
        json{{"limit", json{{"type", "number"}, {"minimum", 1}, {"maximum", 100}}}}, {}, false);

    {
        json op = objectSchema(json{{"method", makeProp("string")}, {"params", makeProp("object")}},
                               {"method"});
        json ops = arrayOf(std::move(op));
        ops["maxItems"] = 100;
        s["batch"] = objectSchema(json{{"ops", std::move(ops)}}, {"ops"}, false);
    }

    return s;
}

std::unordered_map<std::string, json> buildOutputSchemas() {
    std::unordered_map<std::string, json> s;
    s["health/check"] = objectSchema(json{{"status", makeProp("string")},
                                          {"timestamp", makeProp("string")},
                                          {"version", makeProp("string")}},
                                     {"status", "timestamp", "version"});
    s["usage/track"] = objectSchema(json{{"id", makeProp("string")},
                                         {"usageCount", makeProp("number")},
                                         {"firstSeenTs", makeProp("string")},
                                         {"lastUsedAt", makeProp("string")},
                                         {"rateLimited", makeProp("boolean")},
                                         {"notFound", makeProp("boolean")}});
    s["usage/hotset"] = objectSchema(json{{"count", makeProp("number")},
                                          {"limit", makeProp("number")},
                                          {"items", makeProp("array")}},
                                     {"count", "limit", "items"});
    s["instructions/governanceHash"] = objectSchema(json{{"count", makeProp("number")},
                                                         {"governanceHash", makeProp("string")},
                                                         {"items", makeProp("array")}},
                                                    {"count", "governanceHash", "items"});
    s["integrity/verify"] = objectSchema(json{{"hash", makeProp("string")},
                                              {"count", makeProp("number")},
                                              {"issues", makeProp("array")},
                                              {"issueCount", makeProp("number")}},
                                         {"hash", "count", "issues", "issueCount"});
    s["meta/tools"] =
        objectSchema(json{{"version", makeProp("string")}, {"tools", makeProp("array")}},
                     {"version", "tools"});
    return s;
}

const char* describeTool(std::string_view name) {
    static const std::unordered_map<std::string_view, const char*> kDescriptions = {
        {"health/check", "Returns server health status & version."},
        {"instructions/dispatch",
         "Unified dispatcher for catalog actions (list, get, search, diff, export, query, "
         "categories and mutations)."},
        {"instructions/governanceHash",
         "Return governance projection & deterministic governance hash."},
        {"instructions/query",
         "Filter the catalog by categories, priorities, tiers, requirements, and text."},
        {"instructions/categories", "Return category taxonomy with occurrence counts."},
        {"instructions/list", "List entries, optionally restricted to one category."},
        {"instructions/get", "Fetch a single entry by id."},
        {"instructions/search", "Case-insensitive substring search over title and body."},
        {"instructions/diff", "Incremental sync against a client hash or inventory."},
        {"instructions/export", "Export entries (optionally by id, optionally without bodies)."},
        {"instructions/health", "Compare live catalog to canonical snapshot for drift."},
        {"instructions/import", "Import (create/overwrite) entries from provided objects."},
        {"instructions/add", "Add a single entry (lax mode fills defaults; overwrite optional)."},
        {"instructions/repair", "Repair out-of-sync sourceHash fields (noop if none drifted)."},
        {"instructions/reload", "Force reload of the catalog from disk."},
        {"instructions/enrich",
         "Persist normalized fields (sourceHash, timestamps, priorityTier) missing on disk."},
        {"instructions/remove", "Delete one or more entries by id."},
        {"instructions/groom",
         "Groom catalog: normalize, repair hashes, merge duplicates, remove deprecated."},
        {"instructions/governanceUpdate",
         "Patch limited governance fields (owner/status/review dates + optional version bump)."},
        {"integrity/verify", "Verify each entry body hash against stored sourceHash."},
        {"usage/track", "Increment usage counters & timestamps for an entry id."},
        {"usage/hotset", "Return the most-used entries (hot set)."},
        {"usage/flush", "Flush usage snapshot to persistent storage."},
        {"metrics/snapshot", "Performance metrics summary for handled methods."},
        {"meta/tools", "Enumerate available tools & their metadata."},
        {"diagnostics/handshake",
         "Return recent handshake events (ordering/ready/list_changed trace)."},
        {"batch", "Run an ordered list of method calls, isolating each failure to its slot."},
    };
    if (auto it = kDescriptions.find(name); it != kDescriptions.end()) {
        return it->second;
    }
    return "Tool description pending.";
}

const std::set<std::string>& stableMethods() {
    static const std::set<std::string> kStable = {
        "health/check",     "instructions/dispatch", "instructions/governanceHash",
        "instructions/query", "instructions/categories", "integrity/verify",
        "usage/track",      "usage/hotset",          "metrics/snapshot",
        "meta/tools"};
    return kStable;
}

const std::set<std::string>& mutationMethods() {
    static const std::set<std::string> kMutation = {
        "instructions/add",    "instructions/import", "instructions/repair",
        "instructions/reload", "instructions/remove", "instructions/groom",
        "instructions/governanceUpdate", "instructions/enrich", "usage/flush"};
    return kMutation;
}

std::vector<ToolRegistryEntry> buildRegistry() {
    auto inputs = buildInputSchemas();
    auto outputs = buildOutputSchemas();

    std::set<std::string> names(stableMethods().begin(), stableMethods().end());
    names.insert(mutationMethods().begin(), mutationMethods().end());
    for (const auto& [name, _] : inputs) {
        names.insert(name);
    }

    std::vector<ToolRegistryEntry> entries;
    entries.reserve(names.size());
    for (const auto& name : names) {
        ToolRegistryEntry e;
        e.name = name;
        e.description = describeTool(name);
        e.stable = stableMethods().contains(name);
        e.mutation = mutationMethods().contains(name);
        if (auto it = inputs.find(name); it != inputs.end()) {
            e.inputSchema = it->second;
        } else {
            e.inputSchema = json{{"type", "object"}};
        }
        if (auto it = outputs.find(name); it != outputs.end()) {
            e.outputSchema = it->second;
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace

json ToolRegistryEntry::toJson() const {
    json j{{"name", name},
           {"description", description},
           {"stable", stable},
           {"mutation", mutation},
           {"inputSchema", inputSchema}};
    if (outputSchema) {
        j["outputSchema"] = *outputSchema;
    }
    return j;
}

const std::vector<ToolRegistryEntry>& getRegistry() {
    static const std::vector<ToolRegistryEntry> kRegistry = buildRegistry();
    return kRegistry;
}

const ToolRegistryEntry* findTool(std::string_view name) {
    const auto& reg = getRegistry();
    auto it = std::lower_bound(reg.begin(), reg.end(), name,
                               [](const ToolRegistryEntry& e, std::string_view n) {
                                   return std::string_view(e.name) < n;
                               });
    if (it != reg.end() && it->name == name) {
        return &*it;
    }
    return nullptr;
}

bool isMutationMethod(std::string_view name) {
    const auto* tool = findTool(name);
    return tool && tool->mutation;
}

json registryToJson() {
    json tools = json::array();
    for (const auto& e : getRegistry()) {
        tools.push_back(e.toJson());
    }
    return json{{"version", kRegistryVersion}, {"tools", std::move(tools)}};
}

json listToolsResult() {
    json tools = json::array();
    for (const auto& e : getRegistry()) {
        json tool;
        tool["name"] = e.name;
        tool["description"] = e.description;
        tool["inputSchema"] = e.inputSchema;
        tools.push_back(std::move(tool));
    }
    return json{{"tools", std::move(tools)}};
}

} // namespace govcat::mcp
