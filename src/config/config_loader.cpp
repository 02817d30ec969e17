#include <catalog_graph/config/config_loader.hpp>

#include <catalog_graph/core/types.hpp>

#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cstdlib>
#include <initializer_list>

namespace catalog_graph {

namespace {

Error MakeConfigError(const std::string& message,
                      std::vector<std::string> details = {}) {
    return MakeError(ErrorCategory::Config, "ConfigLoader", "", message,
                     std::move(details));
}

std::optional<std::string> FirstSet(const EnvLookup& env,
                                    std::initializer_list<const char*> names) {
    for (const char* name : names) {
        auto value = env(name);
        if (value && !value->empty()) return value;
    }
    return std::nullopt;
}

// Throws YAML::Exception on type mismatches; the caller converts.
AppConfig ParseConfig(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return config;
    }

    // -- Catalog --
    if (root["catalog"] && root["catalog"]["path"]) {
        config.catalog.path = root["catalog"]["path"].as<std::string>();
    }

    // -- Store --
    if (root["store"]) {
        const auto& store = root["store"];
        if (store["url"]) {
            config.store.url = store["url"].as<std::string>();
        }
        if (store["database"]) {
            config.store.database = store["database"].as<std::string>();
        }
        if (store["user"]) {
            config.store.user = store["user"].as<std::string>();
        }
        if (store["password"]) {
            config.store.password = store["password"].as<std::string>();
        }
        if (store["password_env"]) {
            config.store.password_env = store["password_env"].as<std::string>();
        }
        if (store["batch_size"]) {
            config.store.batch_size = store["batch_size"].as<size_t>();
        }
        if (store["connect_timeout"]) {
            config.store.connect_timeout_seconds = store["connect_timeout"].as<int>();
        }
        if (store["read_timeout"]) {
            config.store.read_timeout_seconds = store["read_timeout"].as<int>();
        }
        if (store["disable_tls_verify"]) {
            config.store.disable_tls_verify = store["disable_tls_verify"].as<bool>();
        }
    }

    // -- Graph names --
    if (root["graphs"]) {
        const auto& graphs = root["graphs"];
        if (graphs["schema"]) {
            config.graphs.schema = graphs["schema"].as<std::string>();
        }
        if (graphs["semantic"]) {
            config.graphs.semantic = graphs["semantic"].as<std::string>();
        }
    }

    // -- Options --
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    if (root["json_output"]) {
        config.json_output = root["json_output"].as<bool>();
    }
    if (root["verbose"]) {
        config.verbose = root["verbose"].as<bool>();
    }
    if (root["timeout"]) {
        config.timeout_seconds = root["timeout"].as<int>();
    }
    return config;
}

Result<long, Error> ParseNumberFlag(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    errno = 0;
    long n = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || end == nullptr || *end != '\0' || errno == ERANGE) {
        return Result<long, Error>::Err(
            MakeConfigError("Invalid value for --" + flag + ": '" + value + "'"));
    }
    return Result<long, Error>::Ok(n);
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) return std::nullopt;
        return std::string(value);
    };
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        auto root = YAML::LoadFile(std::string(file_path));
        return Result<AppConfig, Error>::Ok(ParseConfig(root));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                            {std::string(file_path)}));
    }
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view text) {
    try {
        auto root = YAML::Load(std::string(text));
        return Result<AppConfig, Error>::Ok(ParseConfig(root));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config, const EnvLookup& env) {
    if (auto v = FirstSet(env, {"ARANGO_URL", "ARANGO_HOST", "DATABASE_HOST"})) {
        config.store.url = *v;
    }
    if (auto v = FirstSet(env, {"ARANGO_USER", "ARANGO_USERNAME", "DATABASE_USERNAME"})) {
        config.store.user = *v;
    }
    if (auto v = FirstSet(env, {"ARANGO_PASSWORD", "ARANGO_ROOT_PASSWORD",
                                "DATABASE_PASSWORD"})) {
        config.store.password = *v;
    }
    if (auto v = FirstSet(env, {"ARANGO_DB", "ARANGO_DATABASE", "DATABASE_NAME"})) {
        config.store.database = *v;
    }
    if (auto v = FirstSet(env, {"CATALOG_DB"})) {
        config.catalog.path = *v;
    }
    return config;
}

// ---------------------------------------------------------------------------
// ApplyFlagOverrides
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyFlagOverrides(
    AppConfig config, const std::map<std::string, std::string>& flags) {
    using R = Result<AppConfig, Error>;
    auto flag = [&](const char* name) -> std::optional<std::string> {
        auto it = flags.find(name);
        if (it == flags.end()) return std::nullopt;
        return it->second;
    };

    if (auto v = flag("catalog")) config.catalog.path = *v;
    if (auto v = flag("store-url")) config.store.url = *v;
    if (auto v = flag("database")) config.store.database = *v;
    if (auto v = flag("user")) config.store.user = *v;
    if (auto v = flag("password")) config.store.password = *v;
    if (auto v = flag("password-env")) {
        config.store.password_env = *v;
        if (!flag("password")) config.store.password.clear();
    }
    if (auto v = flag("log-file")) config.log_file = *v;
    if (flag("insecure")) config.store.disable_tls_verify = true;
    if (flag("json")) config.json_output = true;
    if (flag("verbose")) config.verbose = true;

    if (auto v = flag("timeout")) {
        auto n = ParseNumberFlag("timeout", *v);
        if (n.IsErr()) return R::Err(n.Error());
        config.timeout_seconds = static_cast<int>(n.Value());
    }
    if (auto v = flag("batch-size")) {
        auto n = ParseNumberFlag("batch-size", *v);
        if (n.IsErr()) return R::Err(n.Error());
        if (n.Value() <= 0) {
            return R::Err(MakeConfigError("--batch-size must be positive"));
        }
        config.store.batch_size = static_cast<size_t>(n.Value());
    }
    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config, const EnvLookup& env) {
    if (config.store.password.empty() && config.store.password_env.has_value()) {
        const auto& env_var = *config.store.password_env;
        auto value = env(env_var);
        if (!value) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.store.password = *value;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    using R = Result<void, Error>;
    if (auto url = StoreUrl::Create(config.store.url); url.IsErr()) {
        return R::Err(MakeConfigError("Invalid store URL: " + url.Error(),
                                      {config.store.url}));
    }
    if (auto db = DatabaseName::Create(config.store.database); db.IsErr()) {
        return R::Err(MakeConfigError("Invalid database name: " + db.Error(),
                                      {config.store.database}));
    }
    for (const auto& name : {config.graphs.schema, config.graphs.semantic}) {
        if (auto g = GraphName::Create(name); g.IsErr()) {
            return R::Err(MakeConfigError("Invalid graph name: " + g.Error(), {name}));
        }
    }
    if (config.store.batch_size == 0) {
        return R::Err(MakeConfigError("batch_size must be positive"));
    }
    if (config.store.connect_timeout_seconds <= 0 || config.store.read_timeout_seconds <= 0) {
        return R::Err(MakeConfigError("Store timeouts must be positive"));
    }
    if (config.timeout_seconds < 0) {
        return R::Err(MakeConfigError("timeout must not be negative"));
    }
    return R::Ok();
}

} // namespace catalog_graph
