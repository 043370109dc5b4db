// Catalog tools through the dispatcher

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <govcat/mcp/dispatcher.h>
#include <govcat/mcp/handlers.h>

#include "../../common/catalog_fixture.h"

using namespace govcat;
using namespace govcat::mcp;

namespace {

struct HandlerFixture : test::CatalogFixture {
    Dispatcher readOnly;
    Dispatcher writable{DispatcherOptions{.mutationEnabled = true}};

    HandlerFixture() {
        registerCatalogHandlers(readOnly, *engine);
        registerCatalogHandlers(writable, *engine);
        writeDoc("alpha", "Prefer composition.", {{"categories", json::array({"design"})}});
        writeDoc("beta", "Keep functions short.", {{"categories", json::array({"style"})}});
    }

    json call(Dispatcher& d, const std::string& method, const json& params) {
        auto r = d.dispatch(method, params);
        if (!r.ok()) {
            FAIL("unexpected error: " << r.error->dump());
        }
        return r.result;
    }

    int errorCode(Dispatcher& d, const std::string& method, const json& params) {
        auto r = d.dispatch(method, params);
        REQUIRE_FALSE(r.ok());
        return (*r.error)["code"].get<int>();
    }
};

} // namespace

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - reads", "[mcp][handlers][catch2]") {
    auto list = call(readOnly, "instructions/list", json::object());
    CHECK(list["count"] == 2);
    CHECK(list["hash"].get<std::string>().size() == 64);

    auto filtered = call(readOnly, "instructions/list", json{{"category", "STYLE"}});
    CHECK(filtered["count"] == 1);

    auto got = call(readOnly, "instructions/get", json{{"id", "alpha"}});
    CHECK(got["item"]["body"] == "Prefer composition.");

    auto missing = call(readOnly, "instructions/get", json{{"id", "nope"}});
    CHECK(missing["notFound"] == true);

    auto found = call(readOnly, "instructions/search", json{{"q", "short"}});
    CHECK(found["count"] == 1);

    auto query = call(readOnly, "instructions/query",
                      json{{"categoriesAny", json::array({"design", "style"})}, {"limit", 1}});
    CHECK(query["total"] == 2);
    CHECK(query["count"] == 1);

    auto wide = call(readOnly, "instructions/query",
                     json{{"priorityMin", -1e20}, {"priorityMax", 1e20}});
    CHECK(wide["total"] == 2);
    auto none = call(readOnly, "instructions/query", json{{"priorityMin", 1e20}});
    CHECK(none["total"] == 0);

    auto cats = call(readOnly, "instructions/categories", json::object());
    CHECK(cats["count"] == 2);

    auto exported = call(readOnly, "instructions/export", json{{"metaOnly", true}});
    CHECK_FALSE(exported["items"][0].contains("body"));

    CHECK(errorCode(readOnly, "instructions/get", json{{"id", "  "}}) == protocol::INVALID_PARAMS);
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - diff shapes", "[mcp][handlers][diff][catch2]") {
    const auto hash = call(readOnly, "instructions/list", json::object())["hash"];

    auto upToDate = call(readOnly, "instructions/diff", json{{"clientHash", hash}});
    CHECK(upToDate["upToDate"] == true);

    auto resync = call(readOnly, "instructions/diff", json{{"clientHash", "stale"}});
    CHECK(resync["changed"].size() == 2);

    auto incremental = call(readOnly, "instructions/diff",
                            json{{"known", json::array({json{{"id", "alpha"}, {"sourceHash", "x"}},
                                                        json{{"id", "zeta"}}})}});
    CHECK(incremental["added"].size() == 1);
    CHECK(incremental["updated"].size() == 1);
    CHECK(incremental["removed"] == json::array({"zeta"}));
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - disabled mutation writes nothing",
                 "[mcp][handlers][mutation][catch2]") {
    const auto writes = store->stats().writes;
    const json entry{{"id", "gamma"}, {"title", "G"}, {"body", "b"}};

    CHECK(errorCode(readOnly, "instructions/add", json{{"entry", entry}}) ==
          protocol::MUTATION_DISABLED);
    CHECK(errorCode(readOnly, "instructions/remove", json{{"ids", json::array({"alpha"})}}) ==
          protocol::MUTATION_DISABLED);
    CHECK(errorCode(readOnly, "instructions/groom", json::object()) ==
          protocol::MUTATION_DISABLED);
    CHECK(errorCode(readOnly, "instructions/dispatch",
                    json{{"action", "add"}, {"entry", entry}}) == protocol::MUTATION_DISABLED);

    // Repair runs but refuses to write while a hash is stale
    writeDoc("beta", "Keep functions short.", {{"sourceHash", "stale"}});
    CHECK(errorCode(readOnly, "instructions/repair", json::object()) ==
          protocol::MUTATION_DISABLED);

    CHECK(store->stats().writes == writes);
    CHECK(store->stats().removes == 0);
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - mutations when enabled",
                 "[mcp][handlers][mutation][catch2]") {
    auto added = call(writable, "instructions/add",
                      json{{"entry", {{"id", "gamma"}, {"title", "G"}, {"body", "b"}}}});
    CHECK(added["created"] == true);
    CHECK(added["verified"] == true);

    auto skipped = call(writable, "instructions/add",
                        json{{"entry", {{"id", "gamma"}, {"title", "G"}, {"body", "other"}}}});
    CHECK(skipped["skipped"] == true);

    CHECK(errorCode(writable, "instructions/add",
                    json{{"entry", {{"id", "bad id!"}, {"title", "t"}, {"body", "b"}}}}) ==
          protocol::INVALID_PARAMS);

    auto imported = call(writable, "instructions/import",
                         json{{"entries", json::array({json{{"id", "delta"},
                                                            {"title", "D"},
                                                            {"body", "d"},
                                                            {"priority", 30},
                                                            {"audience", "all"},
                                                            {"requirement", "optional"}}})},
                              {"mode", "skip"}});
    CHECK(imported["imported"] == 1);

    auto removed = call(writable, "instructions/dispatch",
                        json{{"action", "remove"}, {"id", "delta"}});
    CHECK(removed["removedIds"] == json::array({"delta"}));

    auto update = call(writable, "instructions/governanceUpdate",
                       json{{"id", "gamma"}, {"owner", "team-a"}, {"bump", "patch"}});
    CHECK(update["changed"] == true);
    CHECK(update["version"] == "1.0.1");

    CHECK(errorCode(writable, "instructions/governanceUpdate", json{{"id", "missing"}}) ==
          protocol::NOT_FOUND);

    auto repaired = call(writable, "instructions/repair", json::object());
    CHECK(repaired["repaired"] == 0);

    auto verify = call(writable, "integrity/verify", json::object());
    CHECK(verify["issueCount"] == 0);
    CHECK(verify["count"] == 3);
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - dispatch batch isolates failures",
                 "[mcp][handlers][dispatch][catch2]") {
    json ops = json::array({json{{"action", "get"}, {"id", "alpha"}},
                            json{{"action", "get"}, {"id", "missing"}},
                            json{{"action", "list"}},
                            json{{"action", "badAction"}},
                            json{{"action", "search"}, {"q", "functions"}}});
    auto r = call(readOnly, "instructions/dispatch", json{{"action", "batch"}, {"operations", ops}});
    const auto& results = r["results"];
    REQUIRE(results.size() == 5);
    CHECK(results[0]["item"]["id"] == "alpha");
    CHECK(results[1]["notFound"] == true);
    CHECK(results[2]["count"] == 2);
    CHECK(results[3]["error"]["code"] == protocol::METHOD_NOT_FOUND);
    CHECK(results[3]["error"]["data"]["action"] == "badAction");
    CHECK(results[4]["count"] == 1);
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - dispatch capabilities and errors",
                 "[mcp][handlers][dispatch][catch2]") {
    auto caps = call(readOnly, "instructions/dispatch", json{{"action", "capabilities"}});
    CHECK(caps["mutationEnabled"] == false);
    CHECK(caps["supportedActions"].size() == dispatchActions().size());

    CHECK(errorCode(readOnly, "instructions/dispatch", json{{"action", " "}}) ==
          protocol::INVALID_PARAMS);
    CHECK(errorCode(readOnly, "instructions/dispatch", json{{"action", "get"}}) ==
          protocol::INVALID_PARAMS);
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - usage tracking",
                 "[mcp][handlers][usage][catch2]") {
    auto first = call(readOnly, "usage/track", json{{"id", "alpha"}});
    CHECK(first["usageCount"] == 1);
    CHECK(first["firstSeenTs"] == first["lastUsedAt"]);

    auto unknown = call(readOnly, "usage/track", json{{"id", "ghost"}});
    CHECK(unknown["notFound"] == true);

    for (int i = 0; i < 9; ++i) {
        REQUIRE(readOnly.dispatch("usage/track", json{{"id", "alpha"}}).ok());
    }
    auto limited = call(readOnly, "usage/track", json{{"id", "alpha"}});
    CHECK(limited["rateLimited"] == true);

    auto hot = call(readOnly, "usage/hotset", json{{"limit", 5}});
    REQUIRE(hot["count"] == 1);
    CHECK(hot["items"][0]["usageCount"] == 10);

    CHECK(errorCode(readOnly, "usage/flush", json::object()) == protocol::MUTATION_DISABLED);
    CHECK(call(writable, "usage/flush", json::object())["flushed"] == true);
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - governance hash and health",
                 "[mcp][handlers][governance][catch2]") {
    auto gov = call(readOnly, "instructions/governanceHash", json::object());
    CHECK(gov["count"] == 2);
    CHECK(gov["items"][0]["owner"] == "unowned");
    CHECK(gov["governanceHash"].get<std::string>().size() == 64);

    auto health = call(readOnly, "instructions/health", json::object());
    CHECK(health["snapshot"] == "missing");
    CHECK(health["governanceHash"] == gov["governanceHash"]);
    CHECK(health["skipped"] == 0);
    CHECK_FALSE(health["loadedAt"].get<std::string>().empty());
}

TEST_CASE_METHOD(HandlerFixture, "CatalogHandlers - enrich fills missing fields",
                 "[mcp][handlers][mutation][enrich][catch2]") {
    const auto writes = store->stats().writes;
    CHECK(errorCode(readOnly, "instructions/enrich", json::object()) ==
          protocol::MUTATION_DISABLED);
    CHECK(store->stats().writes == writes);

    auto first = call(writable, "instructions/enrich", json::object());
    CHECK(first["rewritten"] == 2);
    CHECK(first["updated"] == json::array({"alpha", "beta"}));
    CHECK_FALSE(first.contains("errors"));
    CHECK(store->readRaw("alpha").value().contains("sourceHash"));

    auto again = call(writable, "instructions/dispatch", json{{"action", "enrich"}});
    CHECK(again["rewritten"] == 0);
    CHECK(again["skipped"].size() == 2);
    CHECK(again["hash"] == first["hash"]);
}
