#pragma once

#include <aasx_kg/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// CommandArgs — parsed command-line arguments for a specific command.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string group;                        // e.g. "extract", "graph"
    std::string action;                       // e.g. "container", "import-dir"
    std::vector<std::string> positional;      // remaining positional arguments
    std::map<std::string, std::string> flags; // --key value / --key=value pairs

    [[nodiscard]] bool HasFlag(const std::string& name) const {
        return flags.count(name) > 0;
    }
    [[nodiscard]] std::optional<std::string> Flag(const std::string& name) const {
        auto it = flags.find(name);
        if (it == flags.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

// Returns the process exit code: 0 on success.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;        // e.g. "out"
    std::string placeholder; // e.g. "<file>"
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;            // e.g. "aasx-kg extract container <file.aasx> [flags]"
    std::string args_description; // e.g. "<file.aasx>    Container to read"
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
// CommandRouter — two-level dispatch for CLI commands.
//
// Commands are registered as group/action pairs. The router parses the
// command tokens left over after global flag parsing, extracts the group
// and action, and dispatches to the registered handler.
//
// Usage:
//   CommandRouter router;
//   router.Register("graph", "info", "Show database statistics", handler);
//   return router.Dispatch(args);
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

    void SetGroupExamples(const std::string& group,
                          std::vector<std::string> examples);

    // Parse and dispatch. `argv[0]` is the program name.
    // Returns the handler's exit code, or 1 on a routing error.
    // Intercepts --help/-h at group and command levels.
    int Dispatch(const std::vector<std::string>& argv,
                 std::ostream& out, std::ostream& err) const;

    // Parse into CommandArgs without dispatching.
    static Result<CommandArgs, std::string> Parse(const std::vector<std::string>& argv);

    // True if arg is a flag that never consumes the next token as its value
    // (--json, --dry-run, --yes, ...).
    static bool IsBooleanFlag(std::string_view arg);

    // Sorted group names.
    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;
    [[nodiscard]] std::vector<std::string> GroupExamples(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group,
                          const std::string& action,
                          std::ostream& out) const;

private:
    // Key: "group:action"
    std::map<std::string, CommandInfo> commands_;
    std::map<std::string, std::string> group_descriptions_;
    std::map<std::string, std::vector<std::string>> group_examples_;
};

} // namespace aasx_kg
