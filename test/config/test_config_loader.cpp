#include <catch2/catch_test_macros.hpp>

#include <catalog_graph/config/config_loader.hpp>

#include "../mocks/catalog_fixture.hpp"

#include <map>
#include <optional>
#include <string>

using namespace catalog_graph;
using catalog_graph::testing::TestDataPath;

namespace {

// Environment backed by a map instead of the process environment.
EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // anonymous namespace

// ===========================================================================
// YAML
// ===========================================================================

TEST_CASE("LoadFromYaml: every setting", "[config]") {
    auto result = LoadFromYaml(TestDataPath("config_full.yaml"));
    REQUIRE(result.IsOk());
    const auto& c = result.Value();
    CHECK(c.catalog.path == "/var/lib/catalog/manufacturing.db");
    CHECK(c.store.url == "https://arango.plant.local:8530");
    CHECK(c.store.database == "plant_semantics");
    CHECK(c.store.user == "graph_writer");
    CHECK(c.store.password.empty());
    CHECK(c.store.password_env == std::optional<std::string>("PLANT_ARANGO_PASSWORD"));
    CHECK(c.store.batch_size == 250);
    CHECK(c.store.connect_timeout_seconds == 5);
    CHECK(c.store.read_timeout_seconds == 30);
    CHECK(c.store.disable_tls_verify);
    CHECK(c.graphs.schema == "plant_schema");
    CHECK(c.graphs.semantic == "plant_semantics");
    CHECK(c.log_file == std::optional<std::string>("/tmp/catalog-graph.log"));
    CHECK(c.json_output);
    CHECK(c.verbose);
    CHECK(c.timeout_seconds == 45);
}

TEST_CASE("LoadFromYaml: unset keys keep defaults", "[config]") {
    auto result = LoadFromYaml(TestDataPath("config_minimal.yaml"));
    REQUIRE(result.IsOk());
    const auto& c = result.Value();
    CHECK(c.catalog.path == "catalog.db");
    CHECK(c.store.url == "http://localhost:8529");
    CHECK(c.store.database == "manufacturing_semantics");
    CHECK(c.store.user == "root");
    CHECK(c.store.batch_size == 1000);
    CHECK(c.graphs.schema == "manufacturing_schema");
    CHECK(c.graphs.semantic == "manufacturing_semantic_layer");
    CHECK_FALSE(c.log_file.has_value());
    CHECK(c.timeout_seconds == 120);
}

TEST_CASE("LoadFromYaml: type mismatch", "[config]") {
    auto result = LoadFromYaml(TestDataPath("config_invalid.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: missing file", "[config]") {
    auto result = LoadFromYaml(TestDataPath("no_such_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    REQUIRE(result.Error().details.size() == 1);
    CHECK(result.Error().details[0].find("no_such_config.yaml") != std::string::npos);
}

TEST_CASE("LoadFromYamlString: empty document", "[config]") {
    auto result = LoadFromYamlString("");
    REQUIRE(result.IsOk());
    CHECK(result.Value().store.url == "http://localhost:8529");

    auto broken = LoadFromYamlString("store: [unclosed");
    REQUIRE(broken.IsErr());
    CHECK(broken.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// Environment
// ===========================================================================

TEST_CASE("ApplyEnvironment: first set variable wins", "[config]") {
    auto c = ApplyEnvironment(AppConfig{}, FakeEnv({
        {"ARANGO_HOST", "http://second:8529"},
        {"DATABASE_HOST", "http://third:8529"},
        {"ARANGO_USERNAME", "svc"},
        {"DATABASE_PASSWORD", "s3cret"},
        {"ARANGO_DB", "plant"},
        {"CATALOG_DB", "/data/catalog.db"},
    }));
    CHECK(c.store.url == "http://second:8529");
    CHECK(c.store.user == "svc");
    CHECK(c.store.password == "s3cret");
    CHECK(c.store.database == "plant");
    CHECK(c.catalog.path == "/data/catalog.db");
}

TEST_CASE("ApplyEnvironment: empty variables are ignored", "[config]") {
    AppConfig base;
    base.store.url = "http://from-file:8529";
    auto c = ApplyEnvironment(base, FakeEnv({{"ARANGO_URL", ""}}));
    CHECK(c.store.url == "http://from-file:8529");
}

TEST_CASE("ResolvePasswordEnv: reads the named variable", "[config]") {
    AppConfig base;
    base.store.password_env = "PLANT_ARANGO_PASSWORD";
    auto resolved = ResolvePasswordEnv(base, FakeEnv({{"PLANT_ARANGO_PASSWORD", "pw"}}));
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value().store.password == "pw");

    auto missing = ResolvePasswordEnv(base, FakeEnv({}));
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().message.find("PLANT_ARANGO_PASSWORD") != std::string::npos);

    base.store.password = "explicit";
    auto explicit_wins = ResolvePasswordEnv(base, FakeEnv({}));
    REQUIRE(explicit_wins.IsOk());
    CHECK(explicit_wins.Value().store.password == "explicit");
}

// ===========================================================================
// Flags
// ===========================================================================

TEST_CASE("ApplyFlagOverrides: flags win", "[config]") {
    AppConfig base;
    base.store.url = "http://from-env:8529";
    auto c = ApplyFlagOverrides(base, {
        {"catalog", "flag.db"},
        {"store-url", "http://from-flag:8529"},
        {"database", "flagdb"},
        {"batch-size", "50"},
        {"timeout", "0"},
        {"insecure", "true"},
        {"json", "true"},
        {"verbose", "true"},
        {"log-file", "run.log"},
    });
    REQUIRE(c.IsOk());
    CHECK(c.Value().catalog.path == "flag.db");
    CHECK(c.Value().store.url == "http://from-flag:8529");
    CHECK(c.Value().store.database == "flagdb");
    CHECK(c.Value().store.batch_size == 50);
    CHECK(c.Value().timeout_seconds == 0);
    CHECK(c.Value().store.disable_tls_verify);
    CHECK(c.Value().json_output);
    CHECK(c.Value().verbose);
    CHECK(c.Value().log_file == std::optional<std::string>("run.log"));
}

TEST_CASE("ApplyFlagOverrides: password-env clears an inherited password", "[config]") {
    AppConfig base;
    base.store.password = "from-env";
    auto c = ApplyFlagOverrides(base, {{"password-env", "MY_PW"}});
    REQUIRE(c.IsOk());
    CHECK(c.Value().store.password.empty());
    CHECK(c.Value().store.password_env == std::optional<std::string>("MY_PW"));
}

TEST_CASE("ApplyFlagOverrides: malformed numbers", "[config]") {
    auto bad_timeout = ApplyFlagOverrides(AppConfig{}, {{"timeout", "ten"}});
    REQUIRE(bad_timeout.IsErr());
    CHECK(bad_timeout.Error().message == "Invalid value for --timeout: 'ten'");

    auto zero_batch = ApplyFlagOverrides(AppConfig{}, {{"batch-size", "0"}});
    REQUIRE(zero_batch.IsErr());
    CHECK(zero_batch.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// Validation
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());
}

TEST_CASE("ValidateConfig: rejects malformed values", "[config]") {
    AppConfig c;
    c.store.url = "arango:8529";
    CHECK(ValidateConfig(c).IsErr());

    c = AppConfig{};
    c.store.database = "bad name";
    auto db = ValidateConfig(c);
    REQUIRE(db.IsErr());
    CHECK(db.Error().details == std::vector<std::string>{"bad name"});

    c = AppConfig{};
    c.graphs.semantic = "1st";
    CHECK(ValidateConfig(c).IsErr());

    c = AppConfig{};
    c.store.read_timeout_seconds = 0;
    CHECK(ValidateConfig(c).IsErr());

    c = AppConfig{};
    c.timeout_seconds = -1;
    CHECK(ValidateConfig(c).IsErr());
}
