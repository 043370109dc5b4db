// Configuration precedence: overrides > environment > config file > defaults

#include <catch2/catch_test_macros.hpp>

#include <vector>

#include <govcat/config/config_helpers.h>
#include <govcat/config/server_config.h>

#include "../../common/test_helpers_catch2.h"

using namespace govcat;
using namespace govcat::config;
using govcat::test::ScopedEnvVar;

namespace {

// Clears every variable the loader reads so the host environment cannot leak in
std::vector<ScopedEnvVar> cleanEnvironment(const std::filesystem::path& home) {
    std::vector<ScopedEnvVar> vars;
    for (const char* name :
         {"GOVCAT_CONFIG", "GOVCAT_DATA_DIR", "GOVCAT_INSTRUCTIONS_DIR", "GOVCAT_USAGE_SNAPSHOT",
          "GOVCAT_ENABLE_MUTATION", "GOVCAT_VALIDATION_BACKEND", "GOVCAT_WORKER_THREADS",
          "GOVCAT_HANDSHAKE_TRACE", "GOVCAT_STRICT_PROTOCOL", "GOVCAT_READY_RETRY_MS",
          "GOVCAT_USAGE_FLUSH_MS", "GOVCAT_USAGE_RATE_LIMIT", "GOVCAT_USAGE_RATE_WINDOW_MS",
          "GOVCAT_AUDIT_LOG", "GOVCAT_LOG_LEVEL", "XDG_CONFIG_HOME", "XDG_DATA_HOME"}) {
        vars.emplace_back(name, std::nullopt);
    }
    vars.emplace_back("HOME", home.string());
    return vars;
}

} // namespace

TEST_CASE("ServerConfig - defaults resolve under the data directory", "[config][catch2]") {
    test::TempDir home;
    auto env = cleanEnvironment(home.path());

    auto cfg = loadServerConfig();
    REQUIRE(cfg);
    const auto& c = cfg.value();
    CHECK_FALSE(c.mutationEnabled);
    CHECK(c.validationBackend == ValidationBackend::Declarative);
    CHECK(c.dataDir == home.path() / ".local" / "share" / "govcat");
    CHECK(c.instructionsDir == c.dataDir / "instructions");
    CHECK(c.usageSnapshotPath == c.dataDir / "usage-snapshot.json");
    CHECK(c.readyRetry.count() == 0);
    CHECK(c.rateLimitPerWindow == 10);
    CHECK(c.rateLimitWindow.count() == 1000);
    CHECK(c.auditLogPath == c.dataDir / "logs" / "instruction-transactions.log.jsonl");
    CHECK(c.effectiveWorkerThreads() >= 2);
}

TEST_CASE("ServerConfig - audit log can be moved or switched off", "[config][audit][catch2]") {
    test::TempDir home;
    auto env = cleanEnvironment(home.path());

    SECTION("a path relocates it") {
        ScopedEnvVar audit("GOVCAT_AUDIT_LOG", (home.path() / "audit.jsonl").string());
        auto cfg = loadServerConfig();
        REQUIRE(cfg);
        CHECK(cfg.value().auditLogEnabled);
        CHECK(cfg.value().auditLogPath == home.path() / "audit.jsonl");
    }
    SECTION("a false switch disables it") {
        ScopedEnvVar audit("GOVCAT_AUDIT_LOG", std::string("off"));
        auto cfg = loadServerConfig();
        REQUIRE(cfg);
        CHECK_FALSE(cfg.value().auditLogEnabled);
        CHECK(cfg.value().auditLogPath.empty());
    }
    SECTION("none disables it too") {
        ScopedEnvVar audit("GOVCAT_AUDIT_LOG", std::string("none"));
        auto cfg = loadServerConfig();
        REQUIRE(cfg);
        CHECK(cfg.value().auditLogPath.empty());
    }
}

TEST_CASE("ServerConfig - file, environment and overrides stack", "[config][catch2]") {
    test::TempDir home;
    auto env = cleanEnvironment(home.path());
    const auto file = test::write_file(home.path() / "govcat.toml", R"(
[server]
# catalog root
data_dir = "/srv/govcat"
enable_mutation = true
validation_backend = "schema"
ready_retry_ms = 250 # diagnostic only
usage_rate_limit = 3
log_level = "debug"

[other]
data_dir = "/ignored"
)");

    ConfigOverrides overrides;
    overrides.configPath = file.string();

    SECTION("file values apply") {
        auto cfg = loadServerConfig(overrides);
        REQUIRE(cfg);
        CHECK(cfg.value().dataDir == "/srv/govcat");
        CHECK(cfg.value().mutationEnabled);
        CHECK(cfg.value().validationBackend == ValidationBackend::SchemaRule);
        CHECK(cfg.value().readyRetry.count() == 250);
        CHECK(cfg.value().rateLimitPerWindow == 3);
        CHECK(cfg.value().logLevel == "debug");
    }
    SECTION("environment beats the file") {
        ScopedEnvVar mutation("GOVCAT_ENABLE_MUTATION", std::string("0"));
        ScopedEnvVar dataDir("GOVCAT_DATA_DIR", std::string("/env/govcat"));
        auto cfg = loadServerConfig(overrides);
        REQUIRE(cfg);
        CHECK_FALSE(cfg.value().mutationEnabled);
        CHECK(cfg.value().dataDir == "/env/govcat");
    }
    SECTION("command line beats the environment") {
        ScopedEnvVar mutation("GOVCAT_ENABLE_MUTATION", std::string("0"));
        overrides.mutationEnabled = true;
        overrides.validationBackend = "declarative";
        overrides.dataDir = (home.path() / "cli").string();
        auto cfg = loadServerConfig(overrides);
        REQUIRE(cfg);
        CHECK(cfg.value().mutationEnabled);
        CHECK(cfg.value().validationBackend == ValidationBackend::Declarative);
        CHECK(cfg.value().instructionsDir == home.path() / "cli" / "instructions");
    }
}

TEST_CASE("ServerConfig - bad values are reported or ignored", "[config][catch2]") {
    test::TempDir home;
    auto env = cleanEnvironment(home.path());

    SECTION("unknown validation backend fails") {
        ScopedEnvVar backend("GOVCAT_VALIDATION_BACKEND", std::string("xml"));
        auto cfg = loadServerConfig();
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
    }
    SECTION("a missing explicit config file fails") {
        ConfigOverrides overrides;
        overrides.configPath = (home.path() / "absent.toml").string();
        auto cfg = loadServerConfig(overrides);
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::NotFound);
    }
    SECTION("a non-boolean switch keeps the default") {
        ScopedEnvVar mutation("GOVCAT_ENABLE_MUTATION", std::string("maybe"));
        auto cfg = loadServerConfig();
        REQUIRE(cfg);
        CHECK_FALSE(cfg.value().mutationEnabled);
    }
}

TEST_CASE("ConfigHelpers - boolean spellings", "[config][catch2]") {
    CHECK(parse_bool(" Yes ") == true);
    CHECK(parse_bool("off") == false);
    CHECK_FALSE(parse_bool("2"));
    CHECK(parse_validation_backend("Schema-Rule").value() == ValidationBackend::SchemaRule);
    CHECK(parse_validation_backend("typed").value() == ValidationBackend::Declarative);
}
