#include <catalog_graph/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>

namespace catalog_graph {

namespace {

constexpr int kUsageExitCode = 2;
constexpr const char* kProgram = "catalog-graph";

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void PrintUsageError(const std::string& message, bool json_mode, std::ostream& err) {
    if (json_mode) {
        nlohmann::json j = {{"error", {{"category", "usage"}, {"message", message}}}};
        err << j.dump() << "\n";
    } else {
        err << "Error: " << message << "\n";
    }
}

// Consume the flag at argv[i] into `flags`; returns the index after it.
int ConsumeFlag(int argc, const char* const* argv, int i,
                std::map<std::string, std::string>& flags) {
    std::string_view arg{argv[i]};
    auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        return i + 1;
    }
    auto key = std::string(arg.substr(2));
    if (!CommandRouter::IsBooleanFlag(arg) && i + 1 < argc &&
        std::string_view{argv[i + 1]}.substr(0, 2) != "--") {
        flags[key] = argv[i + 1];
        return i + 2;
    }
    flags[key] = "true";
    return i + 1;
}

bool IsFlag(std::string_view arg) { return arg.size() > 2 && arg.substr(0, 2) == "--"; }

} // anonymous namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--color" || arg == "--no-color" || arg == "--json" ||
           arg == "--help" || arg == "--version" || arg == "--verbose" ||
           arg == "--semantic" || arg == "--overwrite" || arg == "--undirected" ||
           arg == "--insecure";
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             std::optional<CommandHelp> help) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    bool json_mode = HasJsonFlag(argc, argv);
    auto parsed = Parse(argc, argv);
    if (parsed.IsErr()) {
        PrintUsageError(parsed.Error(), json_mode, err);
        if (!json_mode) PrintHelp(err);
        return kUsageExitCode;
    }
    auto args = std::move(parsed).Value();

    if (args.group.empty() || args.group == "help") {
        PrintHelp(out);
        return 0;
    }
    if (!HasGroup(args.group)) {
        PrintUsageError("Unknown command group '" + args.group + "'", json_mode, err);
        if (!json_mode) PrintHelp(err);
        return kUsageExitCode;
    }
    if (args.action.empty() || args.action == "help") {
        if (args.HasFlag("help") || args.action == "help") {
            PrintGroupHelp(args.group, out);
            return 0;
        }
        PrintUsageError("Missing action for group '" + args.group + "'", json_mode, err);
        if (!json_mode) PrintGroupHelp(args.group, err);
        return kUsageExitCode;
    }

    auto it = commands_.find(args.group + ":" + args.action);
    if (it == commands_.end()) {
        PrintUsageError("Unknown command '" + args.group + " " + args.action + "'",
                        json_mode, err);
        if (!json_mode) PrintGroupHelp(args.group, err);
        return kUsageExitCode;
    }
    if (args.HasFlag("help")) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }
    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(int argc,
                                                      const char* const* argv) {
    CommandArgs args;
    int i = 1;

    // Global flags before the group.
    while (i < argc && IsFlag(argv[i])) {
        i = ConsumeFlag(argc, argv, i, args.flags);
    }
    if (i >= argc) {
        if (args.HasFlag("help") || args.HasFlag("version")) {
            return Result<CommandArgs, std::string>::Ok(std::move(args));
        }
        return Result<CommandArgs, std::string>::Err(
            std::string("Missing command group. Usage: ") + kProgram +
            " <group> <action> [args]");
    }
    args.group = argv[i++];

    if (i < argc && !IsFlag(argv[i])) {
        args.action = argv[i++];
    }

    while (i < argc) {
        if (IsFlag(argv[i])) {
            i = ConsumeFlag(argc, argv, i, args.flags);
        } else {
            args.positional.emplace_back(argv[i++]);
        }
    }
    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& [key, info] : commands_) {
        groups.insert(info.group);
    }
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&](const auto& kv) { return kv.second.group == group; });
}

bool CommandRouter::HasCommand(const std::string& group,
                               const std::string& action) const {
    return commands_.count(group + ":" + action) > 0;
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    // Map order is "group:action", so actions are already sorted.
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return it != group_descriptions_.end() ? it->second : "";
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: " << kProgram << " <group> <action> [args] [options]\n\n";
    out << "Commands:\n";
    for (const auto& group : Groups()) {
        out << "\n  " << group;
        auto desc = GroupDescription(group);
        if (!desc.empty()) out << " - " << desc;
        out << "\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\nGlobal options:\n"
        << "  --config <file>        YAML configuration file\n"
        << "  --catalog <path>       SQLite catalog database\n"
        << "  --store-url <url>      Graph store URL\n"
        << "  --database <name>      Graph store database\n"
        << "  --user <name>          Graph store user\n"
        << "  --password <secret>    Graph store password\n"
        << "  --password-env <var>   Read the password from this variable\n"
        << "  --timeout <seconds>    Operation deadline (0 disables)\n"
        << "  --json                 JSON output\n"
        << "  --color, --no-color    Force or disable colored output\n"
        << "  --verbose              Debug logging\n"
        << "  --version              Print version\n\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc = GroupDescription(group);
    out << kProgram << " " << group << " - " << (desc.empty() ? group : desc) << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action << std::string(max_len - cmd.action.size() + 4, ' ')
            << cmd.description << "\n";
    }
    out << "\nUse \"" << kProgram << " " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << kProgram << " " << group << " " << action << " - " << cmd.description << "\n";
    if (!cmd.help) {
        return;
    }
    const auto& help = *cmd.help;

    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> displays;
        size_t max_len = 0;
        for (const auto& f : help.flags) {
            auto display = "--" + f.name + (f.placeholder.empty() ? "" : " " + f.placeholder);
            max_len = std::max(max_len, display.size());
            displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << displays[i] << std::string(max_len - displays[i].size() + 4, ' ')
                << help.flags[i].description
                << (help.flags[i].required ? " (required)" : "") << "\n";
        }
    }
    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace catalog_graph
