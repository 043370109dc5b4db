// Tool registry shape

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>

#include <govcat/mcp/handlers.h>
#include <govcat/mcp/tool_registry.h>
#include <govcat/version.hpp>

using namespace govcat::mcp;

TEST_CASE("ToolRegistry - sorted, unique and fully described", "[mcp][registry][catch2]") {
    const auto& reg = getRegistry();
    REQUIRE_FALSE(reg.empty());
    CHECK(std::is_sorted(reg.begin(), reg.end(),
                         [](const auto& a, const auto& b) { return a.name < b.name; }));

    std::set<std::string> names;
    for (const auto& e : reg) {
        CAPTURE(e.name);
        CHECK(names.insert(e.name).second);
        CHECK(e.description != "Tool description pending.");
        CHECK(e.inputSchema.is_object());
        CHECK(e.inputSchema.value("type", "") == "object");
    }
}

TEST_CASE("ToolRegistry - mutation flags", "[mcp][registry][catch2]") {
    for (const char* name : {"instructions/add", "instructions/import", "instructions/remove",
                             "instructions/groom", "instructions/repair", "instructions/reload",
                             "instructions/governanceUpdate", "instructions/enrich",
                             "usage/flush"}) {
        CAPTURE(name);
        CHECK(isMutationMethod(name));
    }
    for (const char* name : {"instructions/list", "instructions/dispatch", "health/check",
                             "usage/track", "batch"}) {
        CAPTURE(name);
        CHECK_FALSE(isMutationMethod(name));
    }
    CHECK_FALSE(isMutationMethod("unknown/tool"));
    CHECK(findTool("unknown/tool") == nullptr);
}

TEST_CASE("ToolRegistry - stable tools carry output schemas where declared",
          "[mcp][registry][catch2]") {
    const auto* health = findTool("health/check");
    REQUIRE(health);
    CHECK(health->stable);
    REQUIRE(health->outputSchema);
    CHECK(health->toJson().contains("outputSchema"));

    const auto* list = findTool("instructions/list");
    REQUIRE(list);
    CHECK_FALSE(list->stable);
    CHECK_FALSE(list->toJson().contains("outputSchema"));
}

TEST_CASE("ToolRegistry - list views", "[mcp][registry][catch2]") {
    const auto meta = registryToJson();
    CHECK(meta["version"] == govcat::kRegistryVersion);
    CHECK(meta["tools"].size() == getRegistry().size());

    const auto listed = listToolsResult();
    REQUIRE(listed["tools"].size() == getRegistry().size());
    for (const auto& tool : listed["tools"]) {
        CHECK(tool.contains("name"));
        CHECK(tool.contains("inputSchema"));
        CHECK_FALSE(tool.contains("mutation"));
    }
}

TEST_CASE("ToolRegistry - every dispatch action has a tool", "[mcp][registry][catch2]") {
    for (const auto& action : dispatchActions()) {
        if (action == "capabilities" || action == "batch") {
            continue;
        }
        CAPTURE(action);
        CHECK(findTool("instructions/" + action) != nullptr);
    }
}

TEST_CASE("ToolRegistry - wrapped tool results are text content", "[mcp][registry][catch2]") {
    auto wrapped = wrapToolResult(json{{"ok", true}});
    REQUIRE(wrapped["content"].size() == 1);
    CHECK(wrapped["content"][0]["type"] == "text");
    CHECK(json::parse(wrapped["content"][0]["text"].get<std::string>())["ok"] == true);
    CHECK_FALSE(wrapped.contains("isError"));
    CHECK(wrapToolResult(json::object(), true)["isError"] == true);
}
