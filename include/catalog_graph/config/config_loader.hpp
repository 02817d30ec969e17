#pragma once

#include <catalog_graph/config/app_config.hpp>
#include <catalog_graph/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace catalog_graph {

// Environment lookup; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Lookup through std::getenv.
EnvLookup ProcessEnvironment();

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text into an AppConfig.
Result<AppConfig, Error> LoadFromYamlString(std::string_view text);

// Overlay connection settings from the environment. For each setting the
// first variable that is set wins:
//   url       ARANGO_URL, ARANGO_HOST, DATABASE_HOST
//   user      ARANGO_USER, ARANGO_USERNAME, DATABASE_USERNAME
//   password  ARANGO_PASSWORD, ARANGO_ROOT_PASSWORD, DATABASE_PASSWORD
//   database  ARANGO_DB, ARANGO_DATABASE, DATABASE_NAME
//   catalog   CATALOG_DB
AppConfig ApplyEnvironment(AppConfig config, const EnvLookup& env = ProcessEnvironment());

// Overlay command-line flags (`--store-url`, `--batch-size`, ...); flags win
// over file and environment. Malformed numbers are a Config error.
Result<AppConfig, Error> ApplyFlagOverrides(AppConfig config,
                                            const std::map<std::string, std::string>& flags);

// Resolve password_env: if password is empty and password_env is set,
// read the environment variable and populate password.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config,
                                            const EnvLookup& env = ProcessEnvironment());

// Validate that values are well-formed and in range.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace catalog_graph
