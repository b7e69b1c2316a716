#include <aasx_kg/cli/command_executor.hpp>
#include <aasx_kg/cli/output_formatter.hpp>
#include <aasx_kg/core/terminal.hpp>

#include <aasx_kg/analytics/graph_analytics.hpp>
#include <aasx_kg/config/config_loader.hpp>
#include <aasx_kg/extract/extraction.hpp>
#include <aasx_kg/graph/graph_transformer.hpp>
#include <aasx_kg/store/graph_importer.hpp>
#include <aasx_kg/workflow/etl_workflow.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

namespace aasx_kg {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

constexpr int kDefaultHops = 2;

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    return args.Flag(key).value_or(default_val);
}

OutputFormatter MakeFormatter(const CommandContext& ctx, const CommandArgs& args) {
    const bool json_mode = ctx.config.json_output || GetFlag(args, "json") == "true";
    return OutputFormatter(json_mode, ctx.color, ctx.out, ctx.err);
}

Error MakeUsageError(const std::string& message) {
    return Error{"Usage", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

Result<int, Error> ParseIntFlag(const CommandArgs& args, const std::string& key,
                                int default_val) {
    auto raw = args.Flag(key);
    if (!raw) {
        return Result<int, Error>::Ok(default_val);
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(*raw, &consumed);
        if (consumed == raw->size()) {
            return Result<int, Error>::Ok(value);
        }
    } catch (const std::exception&) {
        // Falls through to the usage error below.
    }
    return Result<int, Error>::Err(
        MakeUsageError("--" + key + " expects an integer, got '" + *raw + "'"));
}

Result<void, Error> WriteTextFile(const std::string& path, const std::string& text) {
    std::ofstream ofs(path);
    if (!ofs) {
        return Result<void, Error>::Err(Error{
            "WriteOutput", path, std::nullopt, "Failed to open file for writing",
            std::nullopt, ErrorCategory::Internal});
    }
    ofs << text << '\n';
    return Result<void, Error>::Ok();
}

// Print a document to stdout, or write it to --out.
int EmitDocument(const OutputFormatter& fmt, const CommandArgs& args,
                 const nlohmann::json& doc, const std::string& what) {
    auto out_path = args.Flag("out");
    if (!out_path) {
        fmt.PrintJson(doc);
        return 0;
    }
    auto written = WriteTextFile(*out_path, doc.dump(2));
    if (written.IsErr()) {
        return Fail(fmt, written.Error());
    }
    fmt.PrintSuccess(what + " written to " + *out_path);
    return 0;
}

void PrintAnalyticsTable(const OutputFormatter& fmt, std::ostream& out,
                         const AnalyticsTable& table) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(table.ToJson());
        return;
    }
    std::vector<std::vector<std::string>> rows;
    rows.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        std::vector<std::string> cells;
        cells.reserve(row.size());
        for (const auto& cell : row) {
            cells.push_back(CellToString(cell));
        }
        rows.push_back(std::move(cells));
    }
    out << table.title << "\n";
    fmt.PrintTable(table.columns, rows);
}

DetailSection StatisticsSection(const NetworkStatistics& stats) {
    return DetailSection{"", {
        {"Nodes", std::to_string(stats.nodes)},
        {"Relationships", std::to_string(stats.relationships)},
        {"Isolated nodes", std::to_string(stats.isolated_nodes)},
        {"Average degree", CellToString(stats.average_degree)},
    }};
}

// Opens the store for a command. The handler owns the returned pointer for
// the duration of the call.
Result<std::unique_ptr<IGraphStore>, Error> OpenStore(const CommandContext& ctx) {
    return ctx.make_store(ctx.config.store);
}

// ---------------------------------------------------------------------------
// extract container
// ---------------------------------------------------------------------------
int HandleExtractContainer(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing container path. Usage: aasx-kg extract container <file.aasx> [--out <file>]"));
    }

    auto result = ExtractContainer(args.positional[0]);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& extraction = result.Value();
    fmt.PrintDiagnostics(extraction.diagnostics);
    return EmitDocument(fmt, args, ExtractionToJson(extraction), "Extraction");
}

// ---------------------------------------------------------------------------
// extract graph
// ---------------------------------------------------------------------------
int HandleExtractGraph(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing container path. Usage: aasx-kg extract graph <file.aasx> [--out <file>]"));
    }

    auto result = ExtractContainer(args.positional[0]);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintDiagnostics(result.Value().diagnostics);
    auto batch = TransformExtraction(result.Value());
    return EmitDocument(fmt, args, GraphBatchToJson(batch), "Graph batch");
}

// ---------------------------------------------------------------------------
// etl run
// ---------------------------------------------------------------------------
int HandleEtlRun(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing input directory. Usage: aasx-kg etl run <dir> [--out <dir>]"));
    }

    EtlConfig etl = ctx.config.etl;
    if (auto out_dir = args.Flag("out")) {
        etl.output_directory = *out_dir;
    }
    auto workers = ParseIntFlag(args, "workers", etl.max_workers);
    if (workers.IsErr()) {
        return Fail(fmt, workers.Error());
    }
    if (workers.Value() <= 0) {
        return Fail(fmt, MakeUsageError("--workers must be positive"));
    }
    etl.max_workers = workers.Value();
    if (args.HasFlag("recursive")) {
        etl.recursive = true;
    }

    EtlWorkflow workflow(etl);
    auto result = workflow.Run(args.positional[0]);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& report = result.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(report.ToJson());
    } else if (!ctx.config.quiet) {
        std::vector<std::vector<std::string>> rows;
        for (const auto& f : report.files) {
            rows.push_back({f.source_file, StepOutcomeName(f.outcome),
                            std::to_string(f.entities), std::to_string(f.nodes),
                            std::to_string(f.edges), std::to_string(f.dangling_references),
                            f.message});
        }
        fmt.PrintTable({"File", "Outcome", "Entities", "Nodes", "Edges", "Dangling", "Message"},
                       rows);
        ctx.out << "\n" << report.summary << " (" << report.total_duration.count() << "ms)\n";
    }

    for (const auto& f : report.files) {
        if (f.diagnostic.has_value()) {
            return Error{"EtlWorkflow", f.source_file, std::nullopt, f.message,
                         std::nullopt, f.diagnostic->category}.ExitCode();
        }
    }
    return 0;
}

// ---------------------------------------------------------------------------
// graph import
// ---------------------------------------------------------------------------
int HandleGraphImport(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing graph file. Usage: aasx-kg graph import <file_graph.json>"));
    }

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphImporter importer(*store.Value(), MakeImporterOptions(ctx.config.store));
    auto result = importer.ImportFile(args.positional[0]);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }

    const auto& counts = result.Value();
    fmt.PrintDetail("Imported " + args.positional[0], {DetailSection{"", {
        {"Nodes created", std::to_string(counts.nodes_created)},
        {"Nodes updated", std::to_string(counts.nodes_updated)},
        {"Edges created", std::to_string(counts.edges_created)},
        {"Edges updated", std::to_string(counts.edges_updated)},
    }}});
    return 0;
}

// ---------------------------------------------------------------------------
// graph import-dir
// ---------------------------------------------------------------------------
int HandleGraphImportDir(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing directory. Usage: aasx-kg graph import-dir <dir> [--dry-run]"));
    }
    const bool dry_run = args.HasFlag("dry-run");

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphImporter importer(*store.Value(), MakeImporterOptions(ctx.config.store));
    auto result = importer.ImportDirectory(args.positional[0], dry_run);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& summary = result.Value();

    if (fmt.IsJsonMode()) {
        auto files = nlohmann::json::array();
        for (const auto& f : summary.files) {
            nlohmann::json item = {
                {"path", f.path},
                {"outcome", FileOutcomeName(f.outcome)},
                {"nodes", f.nodes},
                {"edges", f.edges},
                {"nodesCreated", f.counts.nodes_created},
                {"nodesUpdated", f.counts.nodes_updated},
                {"edgesCreated", f.counts.edges_created},
                {"edgesUpdated", f.counts.edges_updated},
                {"durationMs", f.duration.count()},
            };
            if (f.diagnostic.has_value()) {
                item["category"] = CategoryName(f.diagnostic->category);
                item["message"] = f.diagnostic->message;
            }
            files.push_back(std::move(item));
        }
        fmt.PrintJson({{"dryRun", summary.dry_run},
                       {"files", files},
                       {"summary", summary.Summary()},
                       {"durationMs", summary.duration.count()}});
    } else {
        std::vector<std::vector<std::string>> rows;
        for (const auto& f : summary.files) {
            rows.push_back({f.path, FileOutcomeName(f.outcome), std::to_string(f.nodes),
                            std::to_string(f.edges),
                            std::to_string(f.counts.nodes_created + f.counts.edges_created),
                            std::to_string(f.counts.nodes_updated + f.counts.edges_updated),
                            f.diagnostic ? f.diagnostic->message : ""});
        }
        fmt.PrintTable({"File", "Outcome", "Nodes", "Edges", "Created", "Updated", "Message"},
                       rows);
        ctx.out << "\n" << summary.Summary() << "\n";
    }

    for (const auto& f : summary.files) {
        if (f.diagnostic.has_value()) {
            return Error{"ImportDirectory", f.path, std::nullopt, f.diagnostic->message,
                         std::nullopt, f.diagnostic->category}.ExitCode();
        }
    }
    return 0;
}

// ---------------------------------------------------------------------------
// graph indexes
// ---------------------------------------------------------------------------
int HandleGraphIndexes(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphImporter importer(*store.Value(), MakeImporterOptions(ctx.config.store));
    auto result = importer.CreateIndexes();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintSuccess("Indexes and constraints are in place");
    return 0;
}

// ---------------------------------------------------------------------------
// graph info
// ---------------------------------------------------------------------------
int HandleGraphInfo(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphImporter importer(*store.Value(), MakeImporterOptions(ctx.config.store));
    auto result = importer.GetDatabaseInfo();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& info = result.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson({{"endpoint", store.Value()->Endpoint()},
                       {"nodes", info.nodes},
                       {"relationships", info.relationships},
                       {"labels", info.labels},
                       {"relationshipTypes", info.relationship_types}});
        return 0;
    }

    DetailSection totals{"", {
        {"Endpoint", store.Value()->Endpoint()},
        {"Nodes", std::to_string(info.nodes)},
        {"Relationships", std::to_string(info.relationships)},
    }};
    DetailSection labels{"Labels", {}};
    for (const auto& [label, count] : info.labels) {
        labels.entries.emplace_back(label, std::to_string(count));
    }
    DetailSection types{"Relationship types", {}};
    for (const auto& [type, count] : info.relationship_types) {
        types.entries.emplace_back(type, std::to_string(count));
    }
    fmt.PrintDetail("Graph database", {totals, labels, types});
    return 0;
}

// ---------------------------------------------------------------------------
// graph clear
// ---------------------------------------------------------------------------
int HandleGraphClear(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (!args.HasFlag("yes")) {
        return Fail(fmt, MakeUsageError(
            "Refusing to delete all imported nodes without --yes"));
    }
    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphImporter importer(*store.Value(), MakeImporterOptions(ctx.config.store));
    auto result = importer.ClearGraph();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintSuccess("Deleted " + std::to_string(result.Value()) + " nodes");
    return 0;
}

// ---------------------------------------------------------------------------
// graph wait
// ---------------------------------------------------------------------------
int HandleGraphWait(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto timeout = ParseIntFlag(args, "timeout", ctx.config.store.ready_timeout_seconds);
    if (timeout.IsErr()) {
        return Fail(fmt, timeout.Error());
    }
    if (timeout.Value() <= 0) {
        return Fail(fmt, MakeUsageError("--timeout must be positive"));
    }

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphImporter importer(*store.Value(), MakeImporterOptions(ctx.config.store));
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout.Value());
    auto result = importer.WaitUntilReady(deadline);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintSuccess("Graph store at " + store.Value()->Endpoint() + " is ready");
    return 0;
}

// ---------------------------------------------------------------------------
// analyze run
// ---------------------------------------------------------------------------
int HandleAnalyzeRun(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = analytics.RunFullAnalysis();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    const auto& report = result.Value();

    if (auto export_path = args.Flag("export")) {
        auto exported = ExportReport(report, *export_path);
        if (exported.IsErr()) {
            return Fail(fmt, exported.Error());
        }
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(report.ToJson());
        return 0;
    }
    fmt.PrintDetail("Network statistics", {StatisticsSection(report.statistics)});
    for (const auto& table : report.tables) {
        ctx.out << "\n";
        PrintAnalyticsTable(fmt, ctx.out, table);
    }
    if (auto export_path = args.Flag("export")) {
        ctx.out << "\n";
        fmt.PrintSuccess("Report exported to " + *export_path);
    }
    return 0;
}

// ---------------------------------------------------------------------------
// analyze quality | compliance | types | patterns | isolated
// ---------------------------------------------------------------------------
using TableQuery = Result<AnalyticsTable, Error> (GraphAnalytics::*)();

int RunTableQuery(const CommandContext& ctx, const CommandArgs& args, TableQuery query) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = (analytics.*query)();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintAnalyticsTable(fmt, ctx.out, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// analyze stats
// ---------------------------------------------------------------------------
int HandleAnalyzeStats(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = analytics.Statistics();
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    fmt.PrintDetail("Network statistics", {StatisticsSection(result.Value())});
    return 0;
}

// ---------------------------------------------------------------------------
// analyze related
// ---------------------------------------------------------------------------
int HandleAnalyzeRelated(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing element id. Usage: aasx-kg analyze related <id> [--hops N]"));
    }
    auto hops = ParseIntFlag(args, "hops", kDefaultHops);
    if (hops.IsErr()) {
        return Fail(fmt, hops.Error());
    }

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = analytics.RelatedEntities(args.positional[0], hops.Value());
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintAnalyticsTable(fmt, ctx.out, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// analyze search
// ---------------------------------------------------------------------------
int HandleAnalyzeSearch(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing search term. Usage: aasx-kg analyze search <term> [--type <type>]"));
    }

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = analytics.Search(args.positional[0], args.Flag("type"));
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintAnalyticsTable(fmt, ctx.out, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// analyze path
// ---------------------------------------------------------------------------
int HandleAnalyzePath(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.size() < 2) {
        return Fail(fmt, MakeUsageError(
            "Missing element ids. Usage: aasx-kg analyze path <from-id> <to-id>"));
    }

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = analytics.ShortestPath(args.positional[0], args.positional[1]);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    if (result.Value().rows.empty() && !fmt.IsJsonMode()) {
        ctx.out << "No path between " << args.positional[0] << " and "
                << args.positional[1] << "\n";
        return 0;
    }
    PrintAnalyticsTable(fmt, ctx.out, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// analyze query
// ---------------------------------------------------------------------------
int HandleAnalyzeQuery(const CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, MakeUsageError(
            "Missing statement. Usage: aasx-kg analyze query \"<cypher>\""));
    }

    nlohmann::json parameters = nlohmann::json::object();
    if (auto raw = args.Flag("params")) {
        try {
            parameters = nlohmann::json::parse(*raw);
        } catch (const nlohmann::json::parse_error& e) {
            return Fail(fmt, MakeUsageError(std::string("--params is not valid JSON: ") +
                                            e.what()));
        }
        if (!parameters.is_object()) {
            return Fail(fmt, MakeUsageError("--params must be a JSON object"));
        }
    }

    auto store = OpenStore(ctx);
    if (store.IsErr()) {
        return Fail(fmt, store.Error());
    }
    GraphAnalytics analytics(*store.Value());
    auto result = analytics.AdHocQuery(args.positional[0], parameters);
    if (result.IsErr()) {
        return Fail(fmt, result.Error());
    }
    PrintAnalyticsTable(fmt, ctx.out, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// Top-level help
// ---------------------------------------------------------------------------
struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Yellow(const std::string& s) {
        if (color) out << ansi::kYellow;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

// Left column for a command: usage without the "aasx-kg <group> " prefix and
// without the trailing flag list.
std::string CommandColumn(const std::string& group, const CommandInfo& cmd) {
    if (!cmd.help.has_value() || cmd.help->usage.empty()) {
        return cmd.action;
    }
    const auto prefix = std::string("aasx-kg ") + group + " ";
    const auto& usage = cmd.help->usage;
    if (usage.compare(0, prefix.size(), prefix) != 0) {
        return cmd.action;
    }
    auto rest = usage.substr(prefix.size());
    auto end = std::min(rest.find('['), rest.find("--"));
    if (end != std::string::npos) {
        rest = rest.substr(0, end);
    }
    while (!rest.empty() && rest.back() == ' ') {
        rest.pop_back();
    }
    return rest;
}

} // anonymous namespace

GraphStoreFactory DefaultGraphStoreFactory() {
    return [](const StoreConfig& store) -> Result<std::unique_ptr<IGraphStore>, Error> {
        auto made = MakeGraphStore(store);
        if (made.IsErr()) {
            return Result<std::unique_ptr<IGraphStore>, Error>::Err(std::move(made).Error());
        }
        std::unique_ptr<IGraphStore> base = std::move(made).Value();
        return Result<std::unique_ptr<IGraphStore>, Error>::Ok(std::move(base));
    };
}

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    Ansi a{out, color};

    a.Bold("aasx-kg").Normal(" - AASX containers to a queryable knowledge graph").Nl().Nl();
    a.Dim("  Extracts Asset Administration Shell metadata, builds graph batches,").Nl();
    a.Dim("  loads them into Neo4j and runs analytics over the result.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  aasx-kg [global-flags] <group> <action> [args] [flags]\n";

    const std::vector<std::pair<std::string, std::string>> group_order = {
        {"extract", "EXTRACT"},
        {"etl", "ETL"},
        {"graph", "GRAPH STORE"},
        {"analyze", "ANALYTICS"},
    };

    size_t max_left = 0;
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> displays;
    for (const auto& [group, label] : group_order) {
        for (const auto& cmd : router.CommandsForGroup(group)) {
            auto left = "  " + group + " " + CommandColumn(group, cmd);
            max_left = std::max(max_left, left.size());
            displays[group].emplace_back(std::move(left), cmd.description);
        }
    }
    max_left = std::min(std::max(max_left, static_cast<size_t>(36)), static_cast<size_t>(48));

    for (const auto& [group, label] : group_order) {
        auto it = displays.find(group);
        if (it == displays.end()) {
            continue;
        }
        out << "\n";
        a.Bold(label).Nl();
        for (const auto& [left, desc] : it->second) {
            out << left;
            if (left.size() < max_left) {
                out << std::string(max_left - left.size() + 2, ' ');
            } else {
                out << "\n" << std::string(max_left + 2, ' ');
            }
            a.Dim(desc).Nl();
        }
    }

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();
    const std::vector<std::pair<std::string, std::string>> global_flags = {
        {"--config <path>", "YAML config file"},
        {"--uri <url>", "Graph store endpoint (default http://localhost:7474)"},
        {"--database <name>", "Graph store database (default neo4j)"},
        {"--user <name>", "Graph store user (default neo4j)"},
        {"--password <pw>", "Graph store password"},
        {"--password-env <var>", "Read the password from this variable (default AASX_KG_STORE_PASSWORD)"},
        {"--json", "Machine-readable JSON output"},
        {"--color / --no-color", "Force or disable colored output"},
        {"--log-file <path>", "Also write log lines to a file"},
        {"--log-json", "Log as JSON lines"},
        {"-v / -vv", "Info / debug logging on stderr"},
        {"--version", "Print version and exit"},
    };
    for (const auto& [flag, desc] : global_flags) {
        out << "  ";
        a.Yellow(flag);
        out << std::string(flag.size() < 24 ? 24 - flag.size() : 1, ' ');
        a.Dim(desc).Nl();
    }

    out << "\n";
    a.Bold("QUICK START").Nl();
    a.Dim("  $ aasx-kg extract container motor.aasx").Nl();
    a.Dim("  $ aasx-kg etl run ./containers --out ./graphs --workers 8").Nl();
    a.Dim("  $ aasx-kg graph import-dir ./graphs").Nl();
    a.Dim("  $ aasx-kg analyze run --export report.json").Nl();

    out << "\nUse \"aasx-kg <group> --help\" for the actions of a group.\n";
}

void RegisterAllCommands(CommandRouter& router, const CommandContext& context) {
    auto bind = [&context](int (*handler)(const CommandContext&, const CommandArgs&)) {
        CommandContext ctx = context;
        return [ctx, handler](const CommandArgs& args) { return handler(ctx, args); };
    };

    // -----------------------------------------------------------------------
    // Group descriptions and examples
    // -----------------------------------------------------------------------
    router.SetGroupDescription("extract", "Read AASX containers without touching the store");
    router.SetGroupExamples("extract", {
        "$ aasx-kg extract container motor.aasx",
        "$ aasx-kg extract graph motor.aasx --out motor_graph.json",
    });

    router.SetGroupDescription("etl", "Turn a directory of containers into graph batch files");
    router.SetGroupExamples("etl", {
        "$ aasx-kg etl run ./containers --out ./graphs",
        "$ aasx-kg --json etl run ./containers --recursive --workers 8",
    });

    router.SetGroupDescription("graph", "Load graph batches into the graph store");
    router.SetGroupExamples("graph", {
        "$ aasx-kg graph wait --timeout 120",
        "$ aasx-kg graph indexes",
        "$ aasx-kg graph import-dir ./graphs --dry-run",
        "$ aasx-kg graph import-dir ./graphs",
        "$ aasx-kg graph info",
    });

    router.SetGroupDescription("analyze", "Query the imported graph");
    router.SetGroupExamples("analyze", {
        "$ aasx-kg analyze run --export report.csv",
        "$ aasx-kg analyze related urn:example:shell:1 --hops 3",
        "$ aasx-kg analyze search motor --type Submodel",
        "$ aasx-kg analyze query \"MATCH (n:AasElement) RETURN count(n)\"",
    });

    // -----------------------------------------------------------------------
    // extract
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "aasx-kg extract container <file.aasx> [flags]";
        help.args_description = "<file.aasx>    Container to read";
        help.long_description =
            "Prints the extraction document: shells, assets and submodels with their "
            "source entries, embedded documents, and any entries that failed to parse.";
        help.flags = {
            {"out", "<file>", "Write the document to a file instead of stdout", false},
        };
        help.examples = {
            "aasx-kg extract container motor.aasx",
            "aasx-kg extract container motor.aasx --out motor_extraction.json",
        };
        router.Register("extract", "container", "Extract metadata from one container",
                        bind(HandleExtractContainer), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg extract graph <file.aasx> [flags]";
        help.args_description = "<file.aasx>    Container to read";
        help.flags = {
            {"out", "<file>", "Write the batch to a file instead of stdout", false},
        };
        help.examples = {
            "aasx-kg extract graph motor.aasx --out motor_graph.json",
        };
        router.Register("extract", "graph", "Extract and transform one container",
                        bind(HandleExtractGraph), std::move(help));
    }

    // -----------------------------------------------------------------------
    // etl
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "aasx-kg etl run <dir> [flags]";
        help.args_description = "<dir>    Directory containing .aasx containers";
        help.long_description =
            "Writes <name>_extraction.json and <name>_graph.json per container and "
            "etl_report.json into the output directory. A failing container does "
            "not stop the others.";
        help.flags = {
            {"out", "<dir>", "Output directory (default from config: output)", false},
            {"workers", "<n>", "Containers extracted in parallel (default 4)", false},
            {"recursive", "", "Descend into sub-directories", false},
        };
        help.examples = {
            "aasx-kg etl run ./containers --out ./graphs",
            "aasx-kg etl run ./containers --recursive --workers 8",
        };
        router.Register("etl", "run", "Extract and transform a directory of containers",
                        bind(HandleEtlRun), std::move(help));
    }

    // -----------------------------------------------------------------------
    // graph
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "aasx-kg graph import <file_graph.json>";
        help.args_description = "<file_graph.json>    Graph batch file";
        help.long_description =
            "Upserts nodes by id and edges by (from, to, type) in one transaction. "
            "Importing the same file twice leaves the graph unchanged.";
        help.examples = {"aasx-kg graph import ./graphs/motor_graph.json"};
        router.Register("graph", "import", "Import one graph batch file",
                        bind(HandleGraphImport), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg graph import-dir <dir> [flags]";
        help.args_description = "<dir>    Directory searched recursively for *_graph.json";
        help.flags = {
            {"dry-run", "", "Validate and count without connecting to the store", false},
        };
        help.examples = {
            "aasx-kg graph import-dir ./graphs --dry-run",
            "aasx-kg --json graph import-dir ./graphs",
        };
        router.Register("graph", "import-dir", "Import every graph batch in a directory",
                        bind(HandleGraphImportDir), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg graph indexes";
        help.long_description =
            "Creates the uniqueness constraint on AasElement.id and indexes on "
            "elementType and qualityLevel. Safe to run repeatedly.";
        router.Register("graph", "indexes", "Create indexes and constraints",
                        bind(HandleGraphIndexes), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg graph info";
        help.examples = {"aasx-kg graph info", "aasx-kg --json graph info"};
        router.Register("graph", "info", "Show node, label and relationship counts",
                        bind(HandleGraphInfo), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg graph clear --yes";
        help.flags = {
            {"yes", "", "Confirm deletion", true},
        };
        router.Register("graph", "clear", "Delete all imported nodes and relationships",
                        bind(HandleGraphClear), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg graph wait [flags]";
        help.flags = {
            {"timeout", "<seconds>", "Give up after this long (default from config: 60)", false},
        };
        help.examples = {"aasx-kg graph wait --timeout 120"};
        router.Register("graph", "wait", "Wait until the graph store answers",
                        bind(HandleGraphWait), std::move(help));
    }

    // -----------------------------------------------------------------------
    // analyze
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "aasx-kg analyze run [flags]";
        help.flags = {
            {"export", "<file>", "Also write the report (.json, otherwise CSV)", false},
        };
        help.examples = {
            "aasx-kg analyze run",
            "aasx-kg analyze run --export report.csv",
        };
        router.Register("analyze", "run", "Run every fixed analysis",
                        bind(HandleAnalyzeRun), std::move(help));
    }
    router.Register("analyze", "quality", "Quality level per element type",
                    [ctx = context](const CommandArgs& args) {
                        return RunTableQuery(ctx, args, &GraphAnalytics::QualityDistribution);
                    },
                    CommandHelp{"aasx-kg analyze quality", "", "", {}, {}});
    router.Register("analyze", "compliance", "Compliance status summary",
                    [ctx = context](const CommandArgs& args) {
                        return RunTableQuery(ctx, args, &GraphAnalytics::ComplianceSummary);
                    },
                    CommandHelp{"aasx-kg analyze compliance", "", "", {}, {}});
    router.Register("analyze", "types", "Element type distribution",
                    [ctx = context](const CommandArgs& args) {
                        return RunTableQuery(ctx, args, &GraphAnalytics::EntityTypeDistribution);
                    },
                    CommandHelp{"aasx-kg analyze types", "", "", {}, {}});
    router.Register("analyze", "patterns", "Relationship patterns between element types",
                    [ctx = context](const CommandArgs& args) {
                        return RunTableQuery(ctx, args, &GraphAnalytics::RelationshipPatterns);
                    },
                    CommandHelp{"aasx-kg analyze patterns", "", "", {}, {}});
    router.Register("analyze", "isolated", "Elements without relationships",
                    [ctx = context](const CommandArgs& args) {
                        return RunTableQuery(ctx, args, &GraphAnalytics::IsolatedNodes);
                    },
                    CommandHelp{"aasx-kg analyze isolated", "", "", {}, {}});
    router.Register("analyze", "stats", "Network statistics",
                    bind(HandleAnalyzeStats),
                    CommandHelp{"aasx-kg analyze stats", "", "", {}, {}});
    {
        CommandHelp help;
        help.usage = "aasx-kg analyze related <id> [flags]";
        help.args_description = "<id>    Element id (shell, asset or submodel identity)";
        help.flags = {
            {"hops", "<n>", "Maximum path length, 1-10 (default 2)", false},
        };
        help.examples = {"aasx-kg analyze related urn:example:shell:1 --hops 3"};
        router.Register("analyze", "related", "Elements within N hops of an element",
                        bind(HandleAnalyzeRelated), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg analyze search <term> [flags]";
        help.args_description = "<term>    Case-insensitive text matched against id, shortName and description";
        help.flags = {
            {"type", "<type>", "Restrict to shell, asset or submodel", false},
        };
        help.examples = {
            "aasx-kg analyze search motor",
            "aasx-kg analyze search nameplate --type submodel",
        };
        router.Register("analyze", "search", "Free-text search over elements",
                        bind(HandleAnalyzeSearch), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg analyze path <from-id> <to-id>";
        help.args_description = "<from-id> <to-id>    Element ids";
        router.Register("analyze", "path", "Shortest path between two elements",
                        bind(HandleAnalyzePath), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "aasx-kg analyze query \"<cypher>\" [flags]";
        help.args_description = "<cypher>    Statement run in a read transaction";
        help.flags = {
            {"params", "<json>", "Statement parameters as a JSON object", false},
        };
        help.examples = {
            "aasx-kg analyze query \"MATCH (n:Shell) RETURN n.id LIMIT 10\"",
            "aasx-kg analyze query \"MATCH (n {id: $id}) RETURN n\" --params '{\"id\":\"urn:x\"}'",
        };
        router.Register("analyze", "query", "Run an ad-hoc read query",
                        bind(HandleAnalyzeQuery), std::move(help));
    }
}

} // namespace aasx_kg
