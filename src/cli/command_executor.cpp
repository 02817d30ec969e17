#include <catalog_graph/cli/command_executor.hpp>
#include <catalog_graph/cli/output_formatter.hpp>

#include <catalog_graph/catalog/catalog_loader.hpp>
#include <catalog_graph/catalog/sqlite_catalog_reader.hpp>
#include <catalog_graph/core/log.hpp>
#include <catalog_graph/core/terminal.hpp>
#include <catalog_graph/core/types.hpp>
#include <catalog_graph/graph/graph_stats.hpp>
#include <catalog_graph/graph/graphml_writer.hpp>
#include <catalog_graph/resolve/concept_resolver.hpp>
#include <catalog_graph/resolve/join_path_resolver.hpp>
#include <catalog_graph/store/arango_graph_store.hpp>
#include <catalog_graph/store/graph_persistence.hpp>
#include <catalog_graph/store/http_store_session.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace catalog_graph {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Error UsageError(const std::string& message) {
    return MakeError(ErrorCategory::Config, "cli", "", message);
}

std::string FormatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string Join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

bool ColorMode(const CommandArgs& args, const AppConfig& config) {
    if (config.json_output) return false;
    int choice = -1;
    if (args.HasFlag("color")) choice = 1;
    if (args.HasFlag("no-color")) choice = 0;
    return ShouldUseColor(choice, IsStdoutTty());
}

Deadline MakeDeadline(const AppConfig& config, const CommandEnvironment& env) {
    Deadline deadline;
    if (config.timeout_seconds > 0) {
        deadline = Deadline::After(std::chrono::milliseconds(
            static_cast<long long>(config.timeout_seconds) * 1000));
    }
    return deadline.WithToken(env.cancel);
}

nlohmann::json ExtraJson(const Attributes& extra) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [k, v] : extra) j[k] = v;
    return j;
}

// Per-invocation state shared by every handler: merged configuration,
// formatter bound to the environment's streams, and the deadline.
struct Invocation {
    AppConfig config;
    OutputFormatter fmt;
    Deadline deadline;
};

// Resolve config and set up output. On failure the error has already been
// printed and the exit code is returned in the Err.
Result<std::unique_ptr<Invocation>, int> Begin(const CommandArgs& args,
                                               const CommandEnvironment& env) {
    using R = Result<std::unique_ptr<Invocation>, int>;
    auto config = ResolveConfig(args, env.env);
    if (config.IsErr()) {
        OutputFormatter fmt(args.HasFlag("json"), false, *env.out, *env.err);
        fmt.PrintError(config.Error());
        return R::Err(config.Error().ExitCode());
    }
    auto cfg = std::move(config).Value();
    const bool color = ColorMode(args, cfg);
    auto deadline = MakeDeadline(cfg, env);
    const bool json = cfg.json_output;
    return R::Ok(std::unique_ptr<Invocation>(new Invocation{
        std::move(cfg), OutputFormatter(json, color, *env.out, *env.err),
        std::move(deadline)}));
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

Result<std::unique_ptr<ICatalogReader>, Error> OpenCatalog(const CommandEnvironment& env,
                                                           const AppConfig& config) {
    if (!env.open_catalog) {
        return Result<std::unique_ptr<ICatalogReader>, Error>::Err(
            MakeError(ErrorCategory::Internal, "cli", "", "No catalog reader configured"));
    }
    return env.open_catalog(config);
}

// Schema graph by default; the semantic layer with --semantic.
Result<Graph, Error> BuildRequestedGraph(const CommandArgs& args,
                                         const CommandEnvironment& env,
                                         const Invocation& inv) {
    auto reader = OpenCatalog(env, inv.config);
    if (reader.IsErr()) return Result<Graph, Error>::Err(std::move(reader).Error());
    auto& r = *reader.Value();
    return args.HasFlag("semantic") ? BuildSemanticGraph(r, inv.deadline)
                                    : BuildSchemaGraph(r, inv.deadline);
}

std::optional<std::string> TableScope(const CommandArgs& args) {
    return args.Flag("table");
}

// ---------------------------------------------------------------------------
// JSON views
// ---------------------------------------------------------------------------

nlohmann::json StepsJson(const std::vector<JoinStep>& steps) {
    auto j = nlohmann::json::array();
    for (const auto& s : steps) {
        j.push_back({{"from", s.from},
                     {"to", s.to},
                     {"relationship_kind", s.relationship_kind},
                     {"join_column", s.join_column},
                     {"weight", s.weight},
                     {"forward", s.forward},
                     {"extra", ExtraJson(s.extra)}});
    }
    return j;
}

nlohmann::json CandidateJson(const ScoredConcept& c) {
    auto fields = nlohmann::json::array();
    for (const auto& f : c.fields) {
        fields.push_back({{"table", f.table},
                          {"column", f.column},
                          {"table_alias", f.table_alias},
                          {"is_primary", f.is_primary}});
    }
    nlohmann::json j = {{"concept", c.concept_name},
                        {"score", c.score},
                        {"perspective_elevation", c.perspective_elevation},
                        {"intent_weight", c.intent_weight},
                        {"fields", std::move(fields)}};
    j["deciding_perspective"] = c.deciding_perspective
                                    ? nlohmann::json(*c.deciding_perspective)
                                    : nlohmann::json(nullptr);
    return j;
}

nlohmann::json ResolutionJson(const ConceptResolution& r) {
    auto candidates = nlohmann::json::array();
    for (const auto& c : r.candidates) candidates.push_back(CandidateJson(c));
    nlohmann::json j = {{"intent", r.intent},
                        {"field", r.field},
                        {"concept", r.concept_name},
                        {"table", r.table},
                        {"column", r.column},
                        {"table_alias", r.table_alias},
                        {"score", r.score},
                        {"intent_weight", r.deciding_intent_weight},
                        {"rationale", r.rationale},
                        {"tie_broken", r.tie_broken},
                        {"elevated", r.elevated},
                        {"suppressed", r.suppressed},
                        {"suggested_joins", r.suggested_joins},
                        {"candidates", std::move(candidates)}};
    j["table_scope"] = r.table_scope ? nlohmann::json(*r.table_scope) : nlohmann::json(nullptr);
    j["deciding_perspective"] = r.deciding_perspective
                                    ? nlohmann::json(*r.deciding_perspective)
                                    : nlohmann::json(nullptr);
    return j;
}

nlohmann::json StatsJson(const GraphStats& stats) {
    return {{"nodes", stats.node_count},
            {"edges", stats.edge_count},
            {"directed", stats.directed},
            {"nodes_by_kind", stats.nodes_by_kind},
            {"edges_by_label", stats.edges_by_label},
            {"joins_by_relationship", stats.joins_by_relationship}};
}

void PrintStats(const OutputFormatter& fmt, const std::string& title,
                const GraphStats& stats) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(StatsJson(stats));
        return;
    }
    auto counts = [](const std::map<std::string, size_t>& m) {
        std::vector<std::pair<std::string, std::string>> entries;
        for (const auto& [k, v] : m) entries.emplace_back(k, std::to_string(v));
        return entries;
    };
    fmt.PrintDetail(title, {
        {"", {{"nodes", std::to_string(stats.node_count)},
              {"edges", std::to_string(stats.edge_count)},
              {"directed", stats.directed ? "yes" : "no"}}},
        {"Nodes by kind", counts(stats.nodes_by_kind)},
        {"Edges by label", counts(stats.edges_by_label)},
        {"Joins by relationship", counts(stats.joins_by_relationship)},
    });
}

// ---------------------------------------------------------------------------
// path resolve
// ---------------------------------------------------------------------------
int HandlePathResolve(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    if (args.positional.size() != 2) {
        return Fail(fmt, UsageError("Usage: catalog-graph path resolve <source> <target>"));
    }
    const auto& source = args.positional[0];
    const auto& target = args.positional[1];

    auto reader = OpenCatalog(env, inv->config);
    if (reader.IsErr()) return Fail(fmt, reader.Error());
    auto schema = BuildSchemaGraph(*reader.Value(), inv->deadline);
    if (schema.IsErr()) return Fail(fmt, schema.Error());

    JoinPathResolver resolver(std::make_shared<const Graph>(std::move(schema).Value()));
    auto path = resolver.Resolve(source, target, inv->deadline);
    if (path.IsErr()) return Fail(fmt, path.Error());
    const auto& steps = path.Value();
    const double cost = JoinPathResolver::PathCost(steps);

    if (fmt.IsJsonMode()) {
        fmt.PrintJson({{"source", source},
                       {"target", target},
                       {"cost", cost},
                       {"steps", StepsJson(steps)}});
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& s = steps[i];
        rows.push_back({std::to_string(i + 1), s.from, s.to, s.relationship_kind,
                        s.join_column, FormatNumber(s.weight),
                        s.forward ? "forward" : "reverse"});
    }
    if (!rows.empty()) {
        fmt.PrintTable({"#", "From", "To", "Relationship", "Join column", "Weight",
                        "Direction"},
                       rows);
    }
    fmt.PrintSuccess(source + " -> " + target + ": " + std::to_string(steps.size()) +
                     " step(s), cost " + FormatNumber(cost));
    return 0;
}

// ---------------------------------------------------------------------------
// concept resolve / compare / rank
// ---------------------------------------------------------------------------
Result<std::shared_ptr<const Graph>, Error> LoadSemantic(const CommandEnvironment& env,
                                                         const Invocation& inv) {
    using R = Result<std::shared_ptr<const Graph>, Error>;
    auto reader = OpenCatalog(env, inv.config);
    if (reader.IsErr()) return R::Err(std::move(reader).Error());
    auto semantic = BuildSemanticGraph(*reader.Value(), inv.deadline);
    if (semantic.IsErr()) return R::Err(std::move(semantic).Error());
    return R::Ok(std::make_shared<const Graph>(std::move(semantic).Value()));
}

int HandleConceptResolve(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    if (args.positional.size() != 2) {
        return Fail(fmt, UsageError(
            "Usage: catalog-graph concept resolve <intent> <field> [--table=<t>]"));
    }

    auto graph = LoadSemantic(env, *inv);
    if (graph.IsErr()) return Fail(fmt, graph.Error());
    ConceptResolver resolver(graph.Value());
    auto result = resolver.Resolve(args.positional[0], args.positional[1],
                                   TableScope(args), inv->deadline);
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& r = result.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(ResolutionJson(r));
        return 0;
    }

    std::vector<std::pair<std::string, std::string>> summary = {
        {"concept", r.concept_name},
        {"column", r.table + "." + r.column},
        {"score", FormatNumber(r.score)},
        {"perspective", r.deciding_perspective.value_or("-")},
        {"intent weight", FormatNumber(r.deciding_intent_weight)},
    };
    if (!r.table_alias.empty()) summary.insert(summary.begin() + 2, {"alias", r.table_alias});
    if (r.tie_broken) summary.emplace_back("tie broken", "yes");

    fmt.PrintDetail(r.intent + " / " + r.field, {
        {"", summary},
        {"Query plan", {{"elevated", r.elevated.empty() ? "-" : Join(r.elevated, ", ")},
                        {"suppressed", r.suppressed.empty() ? "-" : Join(r.suppressed, ", ")},
                        {"suggested joins",
                         r.suggested_joins.empty() ? "-" : Join(r.suggested_joins, ", ")}}},
        {"Rationale", {{"why", r.rationale}}},
    });

    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < r.candidates.size(); ++i) {
        const auto& c = r.candidates[i];
        std::vector<std::string> fields;
        for (const auto& f : c.fields) {
            fields.push_back(f.table + "." + f.column + (f.is_primary ? "*" : ""));
        }
        rows.push_back({std::to_string(i + 1), c.concept_name, FormatNumber(c.score),
                        c.deciding_perspective.value_or("-"),
                        FormatNumber(c.intent_weight), Join(fields, ", ")});
    }
    fmt.PrintTable({"Rank", "Concept", "Score", "Perspective", "Intent", "Fields"}, rows);
    return 0;
}

int HandleConceptCompare(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    if (args.positional.size() != 1) {
        return Fail(fmt, UsageError(
            "Usage: catalog-graph concept compare <field> [--table=<t>]"));
    }

    auto graph = LoadSemantic(env, *inv);
    if (graph.IsErr()) return Fail(fmt, graph.Error());
    ConceptResolver resolver(graph.Value());
    auto result = resolver.Compare(args.positional[0], TableScope(args), inv->deadline);
    if (result.IsErr()) return Fail(fmt, result.Error());

    if (fmt.IsJsonMode()) {
        auto j = nlohmann::json::array();
        for (const auto& c : result.Value()) {
            nlohmann::json entry = {{"intent", c.intent}};
            if (c.resolution) entry["resolution"] = ResolutionJson(*c.resolution);
            if (c.error) entry["error"] = nlohmann::json::parse(c.error->ToJson())["error"];
            j.push_back(std::move(entry));
        }
        fmt.PrintJson(j);
        return 0;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& c : result.Value()) {
        if (c.resolution) {
            const auto& r = *c.resolution;
            rows.push_back({c.intent, r.concept_name, r.table + "." + r.column,
                            FormatNumber(r.score), r.deciding_perspective.value_or("-")});
        } else {
            rows.push_back({c.intent, "-", "-", "-", c.error->CategoryName() + ": " +
                                                         c.error->message});
        }
    }
    fmt.PrintTable({"Intent", "Concept", "Column", "Score", "Perspective"}, rows);
    return 0;
}

int HandleConceptRank(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    const std::string usage = "Usage: catalog-graph concept rank <table.column>...";
    if (args.positional.empty()) {
        return Fail(fmt, UsageError(usage));
    }
    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& arg : args.positional) {
        auto dot = arg.find('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 == arg.size()) {
            return Fail(fmt, UsageError("Expected <table.column>, got '" + arg + "'. " + usage));
        }
        fields.emplace_back(arg.substr(0, dot), arg.substr(dot + 1));
    }

    auto graph = LoadSemantic(env, *inv);
    if (graph.IsErr()) return Fail(fmt, graph.Error());
    ConceptResolver resolver(graph.Value());
    auto result = resolver.RankIntents(fields, inv->deadline);
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& scores = result.Value();

    if (fmt.IsJsonMode()) {
        auto j = nlohmann::json::array();
        for (const auto& s : scores) {
            j.push_back({{"intent", s.intent},
                         {"confidence", s.confidence},
                         {"matched_fields", s.matched_fields},
                         {"matched_concepts", s.matched_concepts},
                         {"explanation", s.explanation}});
        }
        fmt.PrintJson(j);
        return 0;
    }

    if (scores.empty()) {
        fmt.PrintSuccess("No intent elevates any of the " + std::to_string(fields.size()) +
                         " field(s)");
        return 0;
    }
    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < scores.size(); ++i) {
        const auto& s = scores[i];
        rows.push_back({std::to_string(i + 1), s.intent, FormatNumber(s.confidence),
                        Join(s.matched_fields, ", "), Join(s.matched_concepts, ", ")});
    }
    fmt.PrintTable({"Rank", "Intent", "Confidence", "Fields", "Concepts"}, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// graph stats / export
// ---------------------------------------------------------------------------
int HandleGraphStats(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();

    auto graph = BuildRequestedGraph(args, env, *inv);
    if (graph.IsErr()) return Fail(inv->fmt, graph.Error());
    PrintStats(inv->fmt, args.HasFlag("semantic") ? "Semantic graph" : "Schema graph",
               ComputeStats(graph.Value()));
    return 0;
}

int HandleGraphExport(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    auto out_path = args.Flag("out");
    if (!out_path || out_path->empty() || *out_path == "true") {
        return Fail(fmt, UsageError("Usage: catalog-graph graph export --out=<file> [--semantic]"));
    }

    auto graph = BuildRequestedGraph(args, env, *inv);
    if (graph.IsErr()) return Fail(fmt, graph.Error());
    const auto& g = graph.Value();
    auto written = WriteGraphMlFile(g, *out_path);
    if (written.IsErr()) return Fail(fmt, written.Error());

    fmt.PrintSuccess("Wrote " + std::to_string(g.NodeCount()) + " node(s) and " +
                     std::to_string(g.EdgeCount()) + " edge(s) to " + *out_path);
    return 0;
}

// ---------------------------------------------------------------------------
// graph persist / load
// ---------------------------------------------------------------------------
Result<std::unique_ptr<IGraphStore>, Error> OpenStore(const CommandEnvironment& env,
                                                      const AppConfig& config) {
    if (!env.open_store) {
        return Result<std::unique_ptr<IGraphStore>, Error>::Err(
            MakeError(ErrorCategory::Internal, "cli", "", "No graph store configured"));
    }
    return env.open_store(config);
}

int HandleGraphPersist(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    const bool semantic = args.HasFlag("semantic");
    PersistOptions options;
    options.store_name = args.Flag("name").value_or(
        semantic ? inv->config.graphs.semantic : inv->config.graphs.schema);
    options.batch_size = inv->config.store.batch_size;
    options.overwrite = args.HasFlag("overwrite");
    options.deadline = inv->deadline;

    auto graph = BuildRequestedGraph(args, env, *inv);
    if (graph.IsErr()) return Fail(fmt, graph.Error());
    auto store = OpenStore(env, inv->config);
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto report = PersistGraph(*store.Value(), graph.Value(), options);
    if (report.IsErr()) return Fail(fmt, report.Error());
    const auto& r = report.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson({{"graph", r.definition.name},
                       {"node_collection", r.definition.node_collection},
                       {"edge_collection", r.definition.edge_collection},
                       {"generation", r.generation},
                       {"nodes", r.nodes_written},
                       {"edges", r.edges_written},
                       {"batches", r.batches},
                       {"replaced", r.replaced_existing}});
        return 0;
    }
    fmt.PrintSuccess((r.replaced_existing ? "Replaced " : "Created ") + r.definition.name +
                     ": " + std::to_string(r.nodes_written) + " node(s), " +
                     std::to_string(r.edges_written) + " edge(s) in " +
                     std::to_string(r.batches) + " batch(es)");
    return 0;
}

int HandleGraphLoad(const CommandArgs& args, const CommandEnvironment& env) {
    auto begun = Begin(args, env);
    if (begun.IsErr()) return begun.Error();
    auto inv = std::move(begun).Value();
    const auto& fmt = inv->fmt;

    auto name = args.Flag("name");
    if (!name || name->empty() || *name == "true") {
        return Fail(fmt, UsageError("Usage: catalog-graph graph load --name=<n> [--undirected]"));
    }

    LoadOptions options;
    options.store_name = *name;
    options.directed = !args.HasFlag("undirected");
    options.batch_size = inv->config.store.batch_size;
    options.deadline = inv->deadline;

    auto store = OpenStore(env, inv->config);
    if (store.IsErr()) return Fail(fmt, store.Error());
    auto graph = LoadGraph(*store.Value(), options);
    if (graph.IsErr()) return Fail(fmt, graph.Error());

    PrintStats(fmt, "Stored graph " + *name, ComputeStats(graph.Value()));
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DefaultEnvironment
// ---------------------------------------------------------------------------
CommandEnvironment DefaultEnvironment() {
    CommandEnvironment env;
    env.env = ProcessEnvironment();
    env.open_catalog = [](const AppConfig& config)
        -> Result<std::unique_ptr<ICatalogReader>, Error> {
        using R = Result<std::unique_ptr<ICatalogReader>, Error>;
        if (config.catalog.path.empty()) {
            return R::Err(MakeError(
                ErrorCategory::Config, "OpenCatalog", "",
                "No catalog database configured (--catalog, CATALOG_DB or catalog.path)"));
        }
        auto reader = SqliteCatalogReader::Open(config.catalog.path);
        if (reader.IsErr()) return R::Err(std::move(reader).Error());
        return R::Ok(std::unique_ptr<ICatalogReader>(std::move(reader).Value()));
    };
    env.open_store = [](const AppConfig& config)
        -> Result<std::unique_ptr<IGraphStore>, Error> {
        using R = Result<std::unique_ptr<IGraphStore>, Error>;
        auto url = StoreUrl::Create(config.store.url);
        if (url.IsErr()) {
            return R::Err(MakeError(ErrorCategory::Config, "OpenStore", config.store.url,
                                    "Invalid store URL: " + url.Error()));
        }
        auto db = DatabaseName::Create(config.store.database);
        if (db.IsErr()) {
            return R::Err(MakeError(ErrorCategory::Config, "OpenStore", config.store.database,
                                    "Invalid database name: " + db.Error()));
        }
        StoreSessionOptions opts;
        opts.connect_timeout = std::chrono::seconds(config.store.connect_timeout_seconds);
        opts.read_timeout = std::chrono::seconds(config.store.read_timeout_seconds);
        opts.disable_tls_verify = config.store.disable_tls_verify;
        auto session = std::make_unique<HttpStoreSession>(url.Value(), config.store.user,
                                                          config.store.password, db.Value(),
                                                          opts);
        return R::Ok(std::unique_ptr<IGraphStore>(
            std::make_unique<ArangoGraphStore>(std::move(session))));
    };
    return env;
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CommandArgs& args, const EnvLookup& env) {
    using R = Result<AppConfig, Error>;
    AppConfig config;
    if (auto path = args.Flag("config")) {
        auto loaded = LoadFromYaml(*path);
        if (loaded.IsErr()) return loaded;
        config = std::move(loaded).Value();
    }
    config = ApplyEnvironment(std::move(config), env);

    auto flagged = ApplyFlagOverrides(std::move(config), args.flags);
    if (flagged.IsErr()) return flagged;
    auto resolved = ResolvePasswordEnv(std::move(flagged).Value(), env);
    if (resolved.IsErr()) return resolved;

    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) return R::Err(valid.Error());
    return resolved;
}

// ---------------------------------------------------------------------------
// RegisterAllCommands
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router, const CommandEnvironment& environment) {
    auto bind = [environment](int (*handler)(const CommandArgs&, const CommandEnvironment&)) {
        return [environment, handler](const CommandArgs& args) {
            return handler(args, environment);
        };
    };

    router.SetGroupDescription("path", "Join paths between catalog tables");
    router.SetGroupDescription("concept", "Intent-aware concept disambiguation");
    router.SetGroupDescription("graph", "Graph statistics, export and persistence");

    router.Register("path", "resolve", "Cheapest join path between two tables",
                    bind(HandlePathResolve),
                    CommandHelp{
                        "catalog-graph path resolve <source> <target>",
                        "<source> <target>    Table names from schema_nodes",
                        "Ties between equal-cost paths go to the lexicographically "
                        "smallest table sequence.",
                        {},
                        {"$ catalog-graph --catalog=manufacturing.db path resolve "
                         "production_runs suppliers"}});

    router.Register("concept", "resolve", "Concept a field means under an intent",
                    bind(HandleConceptResolve),
                    CommandHelp{
                        "catalog-graph concept resolve <intent> <field> [--table=<t>]",
                        "<intent> <field>    Intent name and column name",
                        "",
                        {{"table", "<name>", "Only consider this table's column", false}},
                        {"$ catalog-graph concept resolve supplier_performance_analysis "
                         "ncm_count"}});

    router.Register("concept", "compare", "Resolve a field under every intent",
                    bind(HandleConceptCompare),
                    CommandHelp{
                        "catalog-graph concept compare <field> [--table=<t>]",
                        "<field>    Column name",
                        "",
                        {{"table", "<name>", "Only consider this table's column", false}},
                        {"$ catalog-graph --json concept compare ncm_count"}});

    router.Register("concept", "rank", "Rank intents by the fields they elevate",
                    bind(HandleConceptRank),
                    CommandHelp{
                        "catalog-graph concept rank <table.column>...",
                        "<table.column>    One or more qualified columns",
                        "Confidence is the share of fields an intent elevates times "
                        "the average weight of those matches.",
                        {},
                        {"$ catalog-graph concept rank non_conformant_materials.cost_impact "
                         "product_defects.severity"}});

    const FlagHelp semantic_flag{"semantic", "", "Use the semantic layer instead of the schema",
                                 false};

    router.Register("graph", "stats", "Node and edge counts",
                    bind(HandleGraphStats),
                    CommandHelp{"catalog-graph graph stats [--semantic]", "", "",
                                {semantic_flag}, {}});

    router.Register("graph", "export", "Write the graph as GraphML",
                    bind(HandleGraphExport),
                    CommandHelp{"catalog-graph graph export --out=<file> [--semantic]", "", "",
                                {{"out", "<file>", "GraphML output path", true},
                                 semantic_flag},
                                {"$ catalog-graph graph export --out=schema.graphml"}});

    router.Register("graph", "persist", "Write the graph to the graph store",
                    bind(HandleGraphPersist),
                    CommandHelp{
                        "catalog-graph graph persist [--name=<n>] [--semantic] [--overwrite]",
                        "",
                        "An existing graph is replaced only with --overwrite; the previous "
                        "version stays readable until the new one is complete.",
                        {{"name", "<graph>", "Store graph name (default from config)", false},
                         semantic_flag,
                         {"overwrite", "", "Replace an existing graph", false},
                         {"batch-size", "<n>", "Documents per insert request", false}},
                        {"$ catalog-graph graph persist --semantic --overwrite"}});

    router.Register("graph", "load", "Read a stored graph and report its size",
                    bind(HandleGraphLoad),
                    CommandHelp{"catalog-graph graph load --name=<n> [--undirected]", "", "",
                                {{"name", "<graph>", "Store graph name", true},
                                 {"undirected", "", "Rebuild as an undirected graph", false}},
                                {}});

    LogDebug("cli", "registered " + std::to_string(router.Groups().size()) + " command groups");
}

} // namespace catalog_graph
