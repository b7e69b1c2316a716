#include <aasx_kg/cli/command_executor.hpp>
#include <aasx_kg/cli/command_router.hpp>
#include <aasx_kg/config/config_loader.hpp>
#include <aasx_kg/core/log.hpp>
#include <aasx_kg/core/terminal.hpp>
#include <aasx_kg/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

// Resolve color mode for help output (stdout-based, before config parsing).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    auto choice = aasx_kg::ColorChoice::Auto;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--no-color") {
            choice = aasx_kg::ColorChoice::Never;
        } else if (arg == "--color" && choice == aasx_kg::ColorChoice::Auto) {
            choice = aasx_kg::ColorChoice::Always;
        }
    }
    return aasx_kg::ResolveColor(choice, aasx_kg::IsStdoutTty());
}

// Flags that take no value; everything else starting with "--" before the
// group is assumed to consume the next token.
bool IsGlobalSwitch(std::string_view arg) {
    return arg == "-v" || arg == "-vv" || arg == "-q" || arg == "--quiet" ||
           arg == "--json" || arg == "--color" || arg == "--no-color" ||
           arg == "--log-json";
}

// Check for --version before the first positional (group) argument, so
// command flags further right never collide with it.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "aasx-kg " << aasx_kg::kVersion << "\n";
            return true;
        }
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

// --help/-h before the first positional prints top-level help. After a group
// the router handles it (group or command help).
bool HandleHelpFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--help" || arg == "-h") {
            return true;
        }
        if (IsGlobalSwitch(arg)) continue;
        if (arg.substr(0, 2) == "--" || arg == "-c") {
            if (arg.find('=') == std::string_view::npos) {
                ++i; // skip flag value
            }
            continue;
        }
        break;
    }
    return false;
}

aasx_kg::LogLevel LogLevelFor(const aasx_kg::AppConfig& config) {
    if (config.quiet) return aasx_kg::LogLevel::Error;
    if (config.verbosity >= 2) return aasx_kg::LogLevel::Debug;
    if (config.verbosity == 1) return aasx_kg::LogLevel::Info;
    return aasx_kg::LogLevel::Warn;
}

void InitLogging(const aasx_kg::AppConfig& config) {
    using namespace aasx_kg;
    const bool use_color = ResolveColor(config.color, IsStderrTty());

    std::unique_ptr<ILogSink> sink;
    if (config.log_json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(use_color);
    }
    if (config.log_file.has_value()) {
        auto file_sink = std::make_unique<FileSink>(*config.log_file, std::move(sink));
        if (!file_sink->IsOpen()) {
            std::cerr << "Warning: cannot open log file " << *config.log_file << "\n";
        }
        sink = std::move(file_sink);
    }
    InitGlobalLogger(std::move(sink), LogLevelFor(config));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace aasx_kg;

    // No arguments: print top-level help.
    if (argc == 1) {
        CommandRouter router;
        AppConfig defaults;
        RegisterAllCommands(router, CommandContext{defaults});
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    if (HandleHelpFlag(argc, argv)) {
        CommandRouter router;
        AppConfig defaults;
        RegisterAllCommands(router, CommandContext{defaults});
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    // Step 1: global flags; the rest is the routed command.
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        std::cerr << "Error: " << cli_result.Error().ToString() << "\n";
        return cli_result.Error().ExitCode();
    }
    auto cli = std::move(cli_result).Value();
    const bool json_errors = cli.config.json_output;

    auto print_error = [json_errors](const Error& error) {
        if (json_errors) {
            std::cerr << error.ToJson() << "\n";
        } else {
            std::cerr << "Error: " << error.ToString() << "\n";
        }
        return error.ExitCode();
    };

    // Step 2: YAML config, overridden by CLI flags.
    AppConfig config;
    if (cli.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*cli.config_file);
        if (yaml_result.IsErr()) {
            return print_error(yaml_result.Error());
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli.config);
    } else {
        config = cli.config;
    }

    InitLogging(config);

    // Step 3: password from the environment.
    auto resolved = ResolvePasswordEnv(std::move(config));
    if (resolved.IsErr()) {
        return print_error(resolved.Error());
    }
    config = std::move(resolved).Value();

    // Step 4: validate.
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return print_error(valid.Error());
    }

    // Step 5: dispatch.
    CommandRouter router;
    CommandContext context{config, std::cout, std::cerr,
                           ResolveColor(config.color, IsStdoutTty()),
                           DefaultGraphStoreFactory()};
    RegisterAllCommands(router, context);
    return router.Dispatch(cli.command_args, std::cout, std::cerr);
}
