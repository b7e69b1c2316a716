#pragma once

#include <aasx_kg/cli/command_router.hpp>
#include <aasx_kg/config/app_config.hpp>
#include <aasx_kg/core/result.hpp>
#include <aasx_kg/store/i_graph_store.hpp>

#include <functional>
#include <iostream>
#include <memory>

namespace aasx_kg {

using GraphStoreFactory =
    std::function<Result<std::unique_ptr<IGraphStore>, Error>(const StoreConfig&)>;

// ---------------------------------------------------------------------------
// CommandContext — shared state for all command handlers.
//
// References must outlive the router the handlers are registered with.
// `make_store` defaults to the HTTP store; tests substitute a mock.
// ---------------------------------------------------------------------------
struct CommandContext {
    const AppConfig& config;
    std::ostream& out = std::cout;
    std::ostream& err = std::cerr;
    bool color = false;
    GraphStoreFactory make_store;
};

// Store factory used by main: a Neo4jHttpStore built from the StoreConfig.
GraphStoreFactory DefaultGraphStoreFactory();

// Register the extract, etl, graph and analyze commands.
void RegisterAllCommands(CommandRouter& router, const CommandContext& context);

// Print top-level help (all groups, global flags, quick-start examples).
// When color=true, uses ANSI escape codes for bold/dim/yellow formatting.
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

} // namespace aasx_kg
