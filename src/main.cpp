#include <catalog_graph/cli/command_executor.hpp>
#include <catalog_graph/cli/command_router.hpp>
#include <catalog_graph/config/config_loader.hpp>
#include <catalog_graph/core/log.hpp>
#include <catalog_graph/core/terminal.hpp>
#include <catalog_graph/core/version.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

// Cancelled from the SIGINT handler. Handler copies of the environment
// share the flag, so running operations stop at their next Deadline check.
catalog_graph::CancellationToken* g_cancel = nullptr;

extern "C" void HandleInterrupt(int /*signal*/) {
    if (g_cancel != nullptr) {
        g_cancel->Cancel();
    }
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "catalog-graph " << catalog_graph::kVersion << "\n";
            return true;
        }
    }
    return false;
}

// Console sink (JSON lines under --json) plus an optional log file. The
// config is resolved once here only to pick sinks and level; command
// handlers resolve it again and report any error themselves.
void InitLogging(int argc, const char* const* argv,
                 const catalog_graph::EnvLookup& env) {
    using namespace catalog_graph;

    bool json = false;
    bool verbose = false;
    bool force_color = false;
    bool force_no_color = false;
    std::optional<std::string> log_file;

    auto parsed = CommandRouter::Parse(argc, argv);
    if (parsed.IsOk()) {
        const auto& args = parsed.Value();
        force_color = args.HasFlag("color");
        force_no_color = args.HasFlag("no-color");
        auto config = ResolveConfig(args, env);
        if (config.IsOk()) {
            json = config.Value().json_output;
            verbose = config.Value().verbose;
            log_file = config.Value().log_file;
        } else {
            json = args.HasFlag("json");
            verbose = args.HasFlag("verbose");
        }
    }

    std::unique_ptr<ILogSink> console;
    if (json) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        int choice = force_no_color ? 0 : (force_color ? 1 : -1);
        console = std::make_unique<ColorConsoleSink>(ShouldUseColor(choice, IsStderrTty()));
    }

    const auto level = verbose ? LogLevel::Debug : LogLevel::Warn;
    if (!log_file) {
        InitGlobalLogger(std::move(console), level);
        return;
    }

    auto tee = std::make_unique<TeeSink>();
    tee->Add(std::move(console));
    auto file = std::make_unique<FileSink>(*log_file);
    const bool file_open = file->IsOpen();
    if (file_open) {
        tee->Add(std::move(file));
    }
    InitGlobalLogger(std::move(tee), level);
    if (!file_open) {
        LogWarn("main", "cannot open log file " + *log_file);
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace catalog_graph;

    auto environment = DefaultEnvironment();

    CommandRouter router;
    RegisterAllCommands(router, environment);

    // No arguments: print top-level help.
    if (argc == 1) {
        router.PrintHelp(std::cout);
        return kExitSuccess;
    }

    // --version: print and exit before any parsing.
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    InitLogging(argc, argv, environment.env);

    g_cancel = &environment.cancel;
    std::signal(SIGINT, HandleInterrupt);

    int rc = router.Dispatch(argc, argv, std::cout, std::cerr);
    g_cancel = nullptr;
    return rc;
}
