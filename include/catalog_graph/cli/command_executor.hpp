#pragma once

#include <catalog_graph/catalog/i_catalog_reader.hpp>
#include <catalog_graph/cli/command_router.hpp>
#include <catalog_graph/config/app_config.hpp>
#include <catalog_graph/config/config_loader.hpp>
#include <catalog_graph/core/deadline.hpp>
#include <catalog_graph/store/i_graph_store.hpp>

#include <functional>
#include <iostream>
#include <memory>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// CommandEnvironment: what command handlers reach out to. main() uses
// DefaultEnvironment(); tests substitute in-memory readers and stores.
// ---------------------------------------------------------------------------
struct CommandEnvironment {
    using CatalogFactory =
        std::function<Result<std::unique_ptr<ICatalogReader>, Error>(const AppConfig&)>;
    using StoreFactory =
        std::function<Result<std::unique_ptr<IGraphStore>, Error>(const AppConfig&)>;

    CatalogFactory open_catalog;
    StoreFactory open_store;
    EnvLookup env;
    CancellationToken cancel;
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
};

// SQLite catalog at config.catalog.path; ArangoDB over HTTP.
CommandEnvironment DefaultEnvironment();

// File, environment and flags merged in that order, then validated.
Result<AppConfig, Error> ResolveConfig(const CommandArgs& args, const EnvLookup& env);

// Register path, concept and graph commands.
void RegisterAllCommands(CommandRouter& router, const CommandEnvironment& environment);

} // namespace catalog_graph
