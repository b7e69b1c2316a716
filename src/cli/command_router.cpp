#include <aasx_kg/cli/command_router.hpp>

#include <algorithm>
#include <set>

namespace aasx_kg {

namespace {

bool IsLongFlag(std::string_view arg) {
    return arg.size() > 2 && arg.substr(0, 2) == "--";
}

} // namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--json" || arg == "--help" || arg == "--dry-run" ||
           arg == "--recursive" || arg == "--yes" ||
           arg == "--color" || arg == "--no-color";
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

void CommandRouter::SetGroupExamples(const std::string& group,
                                     std::vector<std::string> examples) {
    group_examples_[group] = std::move(examples);
}

Result<CommandArgs, std::string> CommandRouter::Parse(const std::vector<std::string>& argv) {
    CommandArgs args;
    size_t i = 1;

    auto consume_flag = [&](std::string_view arg) {
        if (arg == "-h") {
            args.flags["help"] = "true";
            ++i;
            return;
        }
        auto eq = arg.find('=');
        if (eq != std::string_view::npos) {
            args.flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
            ++i;
            return;
        }
        auto key = std::string(arg.substr(2));
        if (IsBooleanFlag(arg)) {
            args.flags[key] = "true";
            ++i;
        } else if (i + 1 < argv.size() && !IsLongFlag(argv[i + 1])) {
            args.flags[key] = argv[i + 1];
            i += 2;
        } else {
            args.flags[key] = "true";
            ++i;
        }
    };

    // Flags in front of the group (e.g. "aasx-kg --help graph").
    while (i < argv.size() && (IsLongFlag(argv[i]) || argv[i] == "-h")) {
        consume_flag(argv[i]);
    }

    if (i >= argv.size()) {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: aasx-kg <group> <action> [args]");
    }
    args.group = argv[i++];

    if (i < argv.size() && !IsLongFlag(argv[i]) && argv[i] != "-h") {
        args.action = argv[i++];
    }

    while (i < argv.size()) {
        const std::string& arg = argv[i];
        if (IsLongFlag(arg) || arg == "-h") {
            consume_flag(arg);
        } else {
            args.positional.push_back(arg);
            ++i;
        }
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

int CommandRouter::Dispatch(const std::vector<std::string>& argv,
                            std::ostream& out, std::ostream& err) const {
    auto parse_result = Parse(argv);
    if (parse_result.IsErr()) {
        err << "Error: " << parse_result.Error() << "\n";
        PrintHelp(err);
        return 1;
    }
    auto args = std::move(parse_result).Value();
    const bool wants_help = args.HasFlag("help");

    if (args.group == "help") {
        PrintHelp(out);
        return 0;
    }
    if (!HasGroup(args.group)) {
        err << "Error: unknown command group '" << args.group << "'\n";
        PrintHelp(err);
        return 1;
    }

    // "aasx-kg graph", "aasx-kg graph help", "aasx-kg graph --help"
    if (args.action.empty() || args.action == "help") {
        PrintGroupHelp(args.group, out);
        return 0;
    }

    auto it = commands_.find(args.group + ":" + args.action);
    if (it == commands_.end()) {
        err << "Error: unknown command '" << args.group << " " << args.action << "'\n";
        PrintGroupHelp(args.group, err);
        return 1;
    }

    if (wants_help) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }

    return it->second.handler(args);
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
                       [&](const auto& entry) { return entry.second.group == group; });
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const CommandInfo& a, const CommandInfo& b) { return a.action < b.action; });
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return (it != group_descriptions_.end()) ? it->second : "";
}

std::vector<std::string> CommandRouter::GroupExamples(const std::string& group) const {
    auto it = group_examples_.find(group);
    return (it != group_examples_.end()) ? it->second : std::vector<std::string>{};
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: aasx-kg <group> <action> [options]\n\n";
    out << "Available commands:\n";
    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc = GroupDescription(group);
    out << "aasx-kg " << group << " - " << (desc.empty() ? group : desc) << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action << std::string(max_len - cmd.action.size() + 6, ' ')
            << cmd.description << "\n";
    }

    auto examples = GroupExamples(group);
    if (!examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : examples) {
            out << "  " << ex << "\n";
        }
    }

    out << "\nUse \"aasx-kg " << group
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
    out << "aasx-kg " << group << " " << action << " - " << cmd.description << "\n";

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
            std::string display = "--" + f.name;
            if (!f.placeholder.empty()) {
                display += " " + f.placeholder;
            }
            max_len = std::max(max_len, display.size());
            displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << displays[i] << std::string(max_len - displays[i].size() + 4, ' ')
                << help.flags[i].description;
            if (help.flags[i].required) {
                out << " (required)";
            }
            out << "\n";
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

} // namespace aasx_kg
