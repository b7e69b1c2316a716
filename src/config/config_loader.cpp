#include <aasx_kg/config/config_loader.hpp>

#include <aasx_kg/core/types.hpp>
#include <aasx_kg/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace aasx_kg {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

void ReadStoreSection(const YAML::Node& node, StoreConfig& store) {
    if (node["uri"]) {
        store.uri = node["uri"].as<std::string>();
    }
    if (node["database"]) {
        store.database = node["database"].as<std::string>();
    }
    if (node["user"]) {
        store.user = node["user"].as<std::string>();
    }
    if (node["password"]) {
        store.password = node["password"].as<std::string>();
    }
    if (node["password_env"]) {
        store.password_env = node["password_env"].as<std::string>();
    }
    if (node["connect_timeout"]) {
        store.connect_timeout_seconds = node["connect_timeout"].as<int>();
    }
    if (node["read_timeout"]) {
        store.read_timeout_seconds = node["read_timeout"].as<int>();
    }
    if (node["ready_timeout"]) {
        store.ready_timeout_seconds = node["ready_timeout"].as<int>();
    }
    if (node["initial_backoff_ms"]) {
        store.initial_backoff_ms = node["initial_backoff_ms"].as<int>();
    }
    if (node["max_backoff_ms"]) {
        store.max_backoff_ms = node["max_backoff_ms"].as<int>();
    }
}

void ReadEtlSection(const YAML::Node& node, EtlConfig& etl) {
    if (node["output_directory"]) {
        etl.output_directory = node["output_directory"].as<std::string>();
    }
    if (node["max_workers"]) {
        etl.max_workers = node["max_workers"].as<int>();
    }
    if (node["file_pattern"]) {
        etl.file_pattern = node["file_pattern"].as<std::string>();
    }
    if (node["recursive"]) {
        etl.recursive = node["recursive"].as<bool>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (root["store"]) {
            ReadStoreSection(root["store"], config.store);
        }
        if (root["etl"]) {
            ReadEtlSection(root["etl"], config.etl);
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbosity"]) {
            config.verbosity = root["verbosity"].as<int>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliParseResult, Error> LoadFromCli(int argc, const char* const* argv) {
    // --help and --version are routed, not handled by argparse.
    argparse::ArgumentParser program("aasx-kg", kVersion,
                                     argparse::default_arguments::none);

    // Store flags
    program.add_argument("--uri")
        .help("Graph store HTTP endpoint");
    program.add_argument("--database")
        .help("Graph store database name");
    program.add_argument("--user")
        .help("Graph store user");
    program.add_argument("--password")
        .help("Graph store password");
    program.add_argument("--password-env")
        .help("Environment variable containing the store password");

    // Options
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    int verbosity = 0;
    program.add_argument("-v")
        .help("Verbose output (-vv for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    std::vector<std::string> unknown;
    try {
        unknown = program.parse_known_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<CliParseResult, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliParseResult parsed;
    auto& config = parsed.config;

    // Store
    if (auto val = program.present("--uri")) {
        config.store.uri = *val;
    }
    if (auto val = program.present("--database")) {
        config.store.database = *val;
    }
    if (auto val = program.present("--user")) {
        config.store.user = *val;
    }
    if (auto val = program.present("--password")) {
        config.store.password = *val;
    }
    if (auto val = program.present("--password-env")) {
        config.store.password_env = *val;
    }

    // Options
    if (auto val = program.present("--config")) {
        parsed.config_file = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = ColorChoice::Never;
    } else if (program.get<bool>("--color")) {
        config.color = ColorChoice::Always;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.log_json = true;
    }
    config.verbosity = verbosity;
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    parsed.command_args.reserve(unknown.size() + 1);
    parsed.command_args.emplace_back(argc > 0 ? argv[0] : "aasx-kg");
    for (auto& arg : unknown) {
        parsed.command_args.push_back(std::move(arg));
    }

    return Result<CliParseResult, Error>::Ok(std::move(parsed));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const StoreConfig store_defaults;
    AppConfig merged = yaml_base;

    // Store overrides
    const auto& cli_store = cli_overrides.store;
    if (cli_store.uri != store_defaults.uri) {
        merged.store.uri = cli_store.uri;
    }
    if (cli_store.database != store_defaults.database) {
        merged.store.database = cli_store.database;
    }
    if (cli_store.user != store_defaults.user) {
        merged.store.user = cli_store.user;
    }
    if (!cli_store.password.empty()) {
        merged.store.password = cli_store.password;
    }
    if (cli_store.password_env.has_value()) {
        merged.store.password_env = cli_store.password_env;
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color != ColorChoice::Auto) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    if (!config.store.password.empty()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (config.store.password_env.has_value()) {
        const auto& env_var = *config.store.password_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by password_env)"));
        }
        config.store.password = env_val;
    } else if (const char* env_val = std::getenv(kDefaultPasswordEnv)) {
        config.store.password = env_val;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& store = config.store;
    if (store.uri.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: store.uri"));
    }
    auto uri = StoreUri::Create(store.uri);
    if (uri.IsErr()) {
        return Result<void, Error>::Err(MakeConfigError("Invalid store URI: " + uri.Error()));
    }
    if (store.database.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: store.database"));
    }
    auto database = DatabaseName::Create(store.database);
    if (database.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid database name: " + database.Error()));
    }
    if (store.user.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: store.user"));
    }
    if (store.connect_timeout_seconds <= 0 || store.read_timeout_seconds <= 0 ||
        store.ready_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError("Store timeouts must be positive"));
    }
    if (store.initial_backoff_ms <= 0 || store.max_backoff_ms < store.initial_backoff_ms) {
        return Result<void, Error>::Err(MakeConfigError(
            "Backoff must satisfy 0 < initial_backoff_ms <= max_backoff_ms"));
    }
    if (config.etl.max_workers <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_workers must be positive, got " +
                            std::to_string(config.etl.max_workers)));
    }
    if (config.etl.file_pattern.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: etl.file_pattern"));
    }
    if (config.verbosity > 0 && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

Neo4jStoreOptions MakeStoreOptions(const StoreConfig& store) {
    Neo4jStoreOptions options;
    options.connect_timeout = std::chrono::seconds(store.connect_timeout_seconds);
    options.read_timeout = std::chrono::seconds(store.read_timeout_seconds);
    return options;
}

ImporterOptions MakeImporterOptions(const StoreConfig& store) {
    ImporterOptions options;
    options.ready_timeout = std::chrono::seconds(store.ready_timeout_seconds);
    options.initial_backoff = std::chrono::milliseconds(store.initial_backoff_ms);
    options.max_backoff = std::chrono::milliseconds(store.max_backoff_ms);
    return options;
}

Result<std::unique_ptr<Neo4jHttpStore>, Error> MakeGraphStore(const StoreConfig& store) {
    using R = Result<std::unique_ptr<Neo4jHttpStore>, Error>;
    auto uri = StoreUri::Create(store.uri);
    if (uri.IsErr()) {
        return R::Err(MakeConfigError("Invalid store URI: " + uri.Error()));
    }
    auto database = DatabaseName::Create(store.database);
    if (database.IsErr()) {
        return R::Err(MakeConfigError("Invalid database name: " + database.Error()));
    }
    return R::Ok(std::make_unique<Neo4jHttpStore>(uri.Value(), database.Value(),
                                                  store.user, store.password,
                                                  MakeStoreOptions(store)));
}

} // namespace aasx_kg
