#pragma once

#include <catalog_graph/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace catalog_graph {

// ---------------------------------------------------------------------------
// CommandArgs: one parsed command line.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                         // "path", "concept", "graph"
    std::string action;                        // "resolve", "compare", ...
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;  // --key=value; bare flags hold "true"

    [[nodiscard]] bool HasFlag(const std::string& name) const {
        return flags.count(name) > 0;
    }
    [[nodiscard]] std::optional<std::string> Flag(const std::string& name) const {
        auto it = flags.find(name);
        if (it == flags.end()) return std::nullopt;
        return it->second;
    }
};

// Returns the process exit code.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "table"
    std::string placeholder; // e.g. "<name>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;
    std::string args_description;
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter: two-level dispatch: `catalog-graph <group> <action> ...`.
//
//   CommandRouter router;
//   router.Register("path", "resolve", "Cheapest join path", handler);
//   return router.Dispatch(argc, argv);
//
// Flags may appear before the group or anywhere after the action, as
// `--key=value`, `--key value`, or bare boolean `--key`.
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& group,
                  const std::string& action,
                  const std::string& description,
                  CommandHandler handler,
                  std::optional<CommandHelp> help = std::nullopt);

    void SetGroupDescription(const std::string& group,
                             const std::string& description);

    // Parse argv and dispatch. Returns the handler's exit code, 0 after
    // printing help, or 2 on a usage error.
    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out, std::ostream& err) const;

    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // True for flags that never take a value (--json, --semantic, ...).
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] bool HasCommand(const std::string& group, const std::string& action) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group, const std::string& action,
                          std::ostream& out) const;

private:
    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
};

} // namespace catalog_graph
