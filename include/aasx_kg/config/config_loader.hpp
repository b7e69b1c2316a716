#pragma once

#include <aasx_kg/config/app_config.hpp>
#include <aasx_kg/core/result.hpp>
#include <aasx_kg/store/graph_importer.hpp>
#include <aasx_kg/store/neo4j_store.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aasx_kg {

// Name of the environment variable consulted when no password is configured.
constexpr const char* kDefaultPasswordEnv = "AASX_KG_STORE_PASSWORD";

// ---------------------------------------------------------------------------
// CliParseResult — global flags parsed out of argv. Everything argparse did
// not recognise (the command group, action, its positionals and flags) is
// left in command_args, in order, with argv[0] in front.
// ---------------------------------------------------------------------------
struct CliParseResult {
    AppConfig config;
    std::optional<std::string> config_file;
    std::vector<std::string> command_args;
};

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse global CLI flags into an AppConfig.
Result<CliParseResult, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Only fields the CLI moved off their defaults replace YAML values.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Fill an empty password from password_env, or from AASX_KG_STORE_PASSWORD
// when no variable was named. A named variable that is unset is an error.
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

Neo4jStoreOptions MakeStoreOptions(const StoreConfig& store);
ImporterOptions MakeImporterOptions(const StoreConfig& store);

// Build the HTTP store from a validated StoreConfig.
Result<std::unique_ptr<Neo4jHttpStore>, Error> MakeGraphStore(const StoreConfig& store);

} // namespace aasx_kg
