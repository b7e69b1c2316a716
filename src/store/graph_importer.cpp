#include <aasx_kg/store/graph_importer.hpp>

#include <aasx_kg/core/log.hpp>
#include <aasx_kg/core/types.hpp>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>
#include <thread>

namespace aasx_kg {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "import";

// A planned statement and whether its counts belong to edges.
struct PlannedStatement {
    CypherStatement statement;
    bool is_edge = false;
};

std::string LabelClause(const std::vector<GraphIdentifier>& labels) {
    std::string clause;
    for (const auto& l : labels) {
        clause += ":" + l.Quoted();
    }
    return clause;
}

std::string NodeStatement(const std::vector<GraphIdentifier>& labels,
                          const GraphIdentifier& base) {
    return "UNWIND $rows AS row\n"
           "MERGE (n:" + base.Quoted() + " {id: row.id})\n"
           "SET n = row.properties\n"
           "SET n.id = row.id\n"
           "SET n" + LabelClause(labels) + "\n"
           "RETURN count(n) AS merged";
}

std::string EdgeStatement(const GraphIdentifier& type, const GraphIdentifier& base) {
    return "UNWIND $rows AS row\n"
           "MATCH (a:" + base.Quoted() + " {id: row.from})\n"
           "MATCH (b:" + base.Quoted() + " {id: row.to})\n"
           "MERGE (a)-[r:" + type.Quoted() + "]->(b)\n"
           "SET r = row.properties\n"
           "RETURN count(r) AS merged";
}

// Split `rows` into statements of at most `chunk` rows each.
void AppendChunked(std::vector<PlannedStatement>& out, const std::string& text,
                   const json& rows, size_t chunk, bool is_edge) {
    chunk = std::max<size_t>(chunk, 1);
    for (size_t begin = 0; begin < rows.size(); begin += chunk) {
        json part = json::array();
        for (size_t i = begin; i < std::min(rows.size(), begin + chunk); ++i) {
            part.push_back(rows[i]);
        }
        out.push_back({CypherStatement{text, json{{"rows", part}}}, is_edge});
    }
}

Error MakeImportError(const std::string& operation, const std::string& target,
                      const std::string& message, ErrorCategory category) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

Result<std::vector<PlannedStatement>, Error> PlanImport(const GraphBatch& batch,
                                                        size_t rows_per_statement) {
    using PlanResult = Result<std::vector<PlannedStatement>, Error>;
    auto base = GraphIdentifier::Create(kBaseLabel).Value();

    // Groups keep first-appearance order so the plan is deterministic.
    std::vector<std::pair<std::vector<GraphIdentifier>, json>> node_groups;
    for (const auto& node : batch.nodes) {
        std::vector<GraphIdentifier> labels;
        for (const auto& l : node.labels) {
            auto id = GraphIdentifier::Create(l);
            if (id.IsErr()) {
                return PlanResult::Err(MakeImportError(
                    "Import", batch.name, "node " + node.id + ": " + id.Error(),
                    ErrorCategory::ImportValidationFailure));
            }
            labels.push_back(std::move(id).Value());
        }
        auto group = std::find_if(node_groups.begin(), node_groups.end(),
                                  [&](const auto& g) { return g.first == labels; });
        if (group == node_groups.end()) {
            node_groups.emplace_back(labels, json::array());
            group = std::prev(node_groups.end());
        }
        group->second.push_back({{"id", node.id}, {"properties", node.properties}});
    }

    std::vector<std::pair<GraphIdentifier, json>> edge_groups;
    for (const auto& edge : batch.edges) {
        auto type = GraphIdentifier::Create(edge.type);
        if (type.IsErr() || !IsKnownRelationshipType(edge.type)) {
            return PlanResult::Err(MakeImportError(
                "Import", batch.name, "unknown relationship type '" + edge.type + "'",
                ErrorCategory::ImportValidationFailure));
        }
        auto group = std::find_if(edge_groups.begin(), edge_groups.end(),
                                  [&](const auto& g) { return g.first == type.Value(); });
        if (group == edge_groups.end()) {
            edge_groups.emplace_back(type.Value(), json::array());
            group = std::prev(edge_groups.end());
        }
        group->second.push_back(
            {{"from", edge.from}, {"to", edge.to}, {"properties", edge.properties}});
    }

    std::vector<PlannedStatement> plan;
    for (const auto& [labels, rows] : node_groups) {
        AppendChunked(plan, NodeStatement(labels, base), rows, rows_per_statement, false);
    }
    for (const auto& [type, rows] : edge_groups) {
        AppendChunked(plan, EdgeStatement(type, base), rows, rows_per_statement, true);
    }
    return PlanResult::Ok(std::move(plan));
}

int64_t FirstCell(const QueryResult& result) {
    if (result.rows.empty() || result.rows.front().empty() ||
        !result.rows.front().front().is_number_integer()) {
        return 0;
    }
    return result.rows.front().front().get<int64_t>();
}

bool IsFatalForImport(const Error& error) {
    return error.category == ErrorCategory::ConnectionFailure ||
           error.category == ErrorCategory::Authentication;
}

std::chrono::milliseconds ElapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

} // anonymous namespace

std::string FileOutcomeName(FileOutcome outcome) {
    switch (outcome) {
        case FileOutcome::Imported:  return "imported";
        case FileOutcome::Validated: return "validated";
        case FileOutcome::Failed:    return "failed";
    }
    return "failed";
}

size_t DirectoryImportResult::FailedCount() const {
    return static_cast<size_t>(std::count_if(
        files.begin(), files.end(),
        [](const FileImportResult& f) { return f.outcome == FileOutcome::Failed; }));
}

std::string DirectoryImportResult::Summary() const {
    std::ostringstream oss;
    const size_t failed = FailedCount();
    oss << files.size() << " files: " << (files.size() - failed)
        << (dry_run ? " valid, " : " imported, ") << failed << " failed";
    if (dry_run) {
        size_t nodes = 0;
        size_t edges = 0;
        for (const auto& f : files) {
            nodes += f.nodes;
            edges += f.edges;
        }
        oss << "; would import " << nodes << " nodes, " << edges << " edges (dry run)";
    } else {
        oss << "; nodes " << totals.nodes_created << " created / "
            << totals.nodes_updated << " updated, edges " << totals.edges_created
            << " created / " << totals.edges_updated << " updated";
    }
    return oss.str();
}

GraphImporter::GraphImporter(IGraphStore& store, ImporterOptions options)
    : store_(store), options_(options) {}

Result<void, Error> GraphImporter::WaitUntilReady() {
    return WaitUntilReady(std::chrono::steady_clock::now() + options_.ready_timeout);
}

Result<void, Error> GraphImporter::WaitUntilReady(
    std::chrono::steady_clock::time_point deadline) {
    const auto start = std::chrono::steady_clock::now();
    auto backoff = options_.initial_backoff;
    int attempt = 0;

    while (true) {
        ++attempt;
        auto ping = store_.Ping();
        if (ping.IsOk()) {
            ready_ = true;
            LogInfo(kComponent, "Store ready at " + store_.Endpoint() + " after " +
                                    std::to_string(attempt) + " attempt(s)");
            return Result<void, Error>::Ok();
        }

        const auto& error = ping.Error();
        if (error.category != ErrorCategory::ConnectionFailure) {
            return Result<void, Error>::Err(error);
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return Result<void, Error>::Err(Error{
                "WaitUntilReady", store_.Endpoint(), std::nullopt,
                "Store not reachable after " + std::to_string(attempt) +
                    " attempts in " + std::to_string(ElapsedSince(start).count()) +
                    "ms: " + error.message,
                std::nullopt, ErrorCategory::ConnectionFailure});
        }

        LogInfo(kComponent, "Store not ready (" + error.message + "), retrying in " +
                                std::to_string(backoff.count()) + "ms");
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(backoff, remaining));
        backoff = std::min(backoff * 2, options_.max_backoff);
    }
}

Result<std::vector<CypherStatement>, Error> GraphImporter::BuildImportStatements(
    const GraphBatch& batch) const {
    auto plan = PlanImport(batch, options_.rows_per_statement);
    if (plan.IsErr()) {
        return Result<std::vector<CypherStatement>, Error>::Err(std::move(plan).Error());
    }
    std::vector<CypherStatement> out;
    for (auto& p : std::move(plan).Value()) {
        out.push_back(std::move(p.statement));
    }
    return Result<std::vector<CypherStatement>, Error>::Ok(std::move(out));
}

Result<ImportCounts, Error> GraphImporter::Import(const GraphBatch& batch) {
    auto planned = PlanImport(batch, options_.rows_per_statement);
    if (planned.IsErr()) {
        return Result<ImportCounts, Error>::Err(std::move(planned).Error());
    }
    const auto plan = std::move(planned).Value();
    if (plan.empty()) {
        return Result<ImportCounts, Error>::Ok(ImportCounts{});
    }

    std::vector<CypherStatement> statements;
    statements.reserve(plan.size());
    for (const auto& p : plan) {
        statements.push_back(p.statement);
    }

    if (!ready_) {
        auto ready = WaitUntilReady();
        if (ready.IsErr()) {
            return Result<ImportCounts, Error>::Err(std::move(ready).Error());
        }
    }

    LogInfo(kComponent, "Importing " + batch.name + ": " +
                            std::to_string(batch.nodes.size()) + " nodes, " +
                            std::to_string(batch.edges.size()) + " edges");
    auto written = store_.ExecuteWrite(statements);
    if (written.IsErr() && written.Error().category == ErrorCategory::ConnectionFailure) {
        // The transaction did not commit; wait for the store and retry once.
        LogWarn(kComponent, "Connection lost during import of " + batch.name);
        ready_ = false;
        auto ready = WaitUntilReady();
        if (ready.IsErr()) {
            return Result<ImportCounts, Error>::Err(std::move(ready).Error());
        }
        written = store_.ExecuteWrite(statements);
    }
    if (written.IsErr()) {
        auto error = std::move(written).Error();
        error.target = batch.name;
        return Result<ImportCounts, Error>::Err(std::move(error));
    }

    const auto& results = written.Value();
    ImportCounts counts;
    for (size_t i = 0; i < plan.size() && i < results.size(); ++i) {
        const auto merged = static_cast<size_t>(FirstCell(results[i]));
        if (plan[i].is_edge) {
            const auto created = static_cast<size_t>(results[i].stats.relationships_created);
            counts.edges_created += created;
            counts.edges_updated += merged > created ? merged - created : 0;
        } else {
            const auto created = static_cast<size_t>(results[i].stats.nodes_created);
            counts.nodes_created += created;
            counts.nodes_updated += merged > created ? merged - created : 0;
        }
    }
    LogInfo(kComponent, batch.name + ": nodes " + std::to_string(counts.nodes_created) +
                            " created / " + std::to_string(counts.nodes_updated) +
                            " updated, edges " + std::to_string(counts.edges_created) +
                            " created / " + std::to_string(counts.edges_updated) +
                            " updated");
    return Result<ImportCounts, Error>::Ok(counts);
}

Result<ImportCounts, Error> GraphImporter::ImportFile(const std::string& path) {
    auto batch = LoadGraphBatchFile(path);
    if (batch.IsErr()) {
        return Result<ImportCounts, Error>::Err(std::move(batch).Error());
    }
    return Import(batch.Value());
}

Result<DirectoryImportResult, Error> GraphImporter::ImportDirectory(
    const std::string& directory, bool dry_run) {
    auto discovered = DiscoverGraphFiles(directory);
    if (discovered.IsErr()) {
        return Result<DirectoryImportResult, Error>::Err(std::move(discovered).Error());
    }

    const auto start = std::chrono::steady_clock::now();
    DirectoryImportResult out;
    out.dry_run = dry_run;
    LogInfo(kComponent, "Found " + std::to_string(discovered.Value().size()) +
                            " graph files in " + directory);

    for (const auto& path : discovered.Value()) {
        const auto file_start = std::chrono::steady_clock::now();
        FileImportResult file;
        file.path = path;

        auto batch = LoadGraphBatchFile(path);
        if (batch.IsErr()) {
            LogWarn(kComponent, batch.Error().ToString());
            file.outcome = FileOutcome::Failed;
            file.diagnostic = Diagnostic::FromError(batch.Error());
            file.duration = ElapsedSince(file_start);
            out.files.push_back(std::move(file));
            continue;
        }
        file.nodes = batch.Value().nodes.size();
        file.edges = batch.Value().edges.size();

        if (dry_run) {
            file.outcome = FileOutcome::Validated;
            file.duration = ElapsedSince(file_start);
            out.files.push_back(std::move(file));
            continue;
        }

        auto counts = Import(batch.Value());
        if (counts.IsErr()) {
            if (IsFatalForImport(counts.Error())) {
                return Result<DirectoryImportResult, Error>::Err(std::move(counts).Error());
            }
            LogWarn(kComponent, counts.Error().ToString());
            file.outcome = FileOutcome::Failed;
            file.diagnostic = Diagnostic::FromError(counts.Error());
            file.diagnostic->target = path;
        } else {
            file.outcome = FileOutcome::Imported;
            file.counts = counts.Value();
            out.totals.nodes_created += file.counts.nodes_created;
            out.totals.nodes_updated += file.counts.nodes_updated;
            out.totals.edges_created += file.counts.edges_created;
            out.totals.edges_updated += file.counts.edges_updated;
        }
        file.duration = ElapsedSince(file_start);
        out.files.push_back(std::move(file));
    }

    out.duration = ElapsedSince(start);
    LogInfo(kComponent, out.Summary());
    return Result<DirectoryImportResult, Error>::Ok(std::move(out));
}

Result<void, Error> GraphImporter::CreateIndexes() {
    if (!ready_) {
        auto ready = WaitUntilReady();
        if (ready.IsErr()) {
            return ready;
        }
    }

    // Schema changes cannot share a transaction with each other's writes,
    // so each runs on its own.
    const std::vector<std::string> schema = {
        "CREATE CONSTRAINT aas_element_id IF NOT EXISTS "
        "FOR (n:AasElement) REQUIRE n.id IS UNIQUE",
        "CREATE INDEX aas_element_type IF NOT EXISTS "
        "FOR (n:AasElement) ON (n.elementType)",
        "CREATE INDEX aas_element_quality IF NOT EXISTS "
        "FOR (n:AasElement) ON (n.qualityLevel)",
    };
    for (const auto& text : schema) {
        auto result = store_.ExecuteWrite({CypherStatement{text}});
        if (result.IsErr()) {
            return Result<void, Error>::Err(std::move(result).Error());
        }
    }
    LogInfo(kComponent, "Indexes ensured");
    return Result<void, Error>::Ok();
}

Result<int64_t, Error> GraphImporter::ClearGraph() {
    if (!ready_) {
        auto ready = WaitUntilReady();
        if (ready.IsErr()) {
            return Result<int64_t, Error>::Err(std::move(ready).Error());
        }
    }
    auto result = store_.ExecuteWrite({CypherStatement{"MATCH (n:AasElement) DETACH DELETE n"}});
    if (result.IsErr()) {
        return Result<int64_t, Error>::Err(std::move(result).Error());
    }
    const int64_t deleted = result.Value().empty() ? 0 : result.Value()[0].stats.nodes_deleted;
    LogWarn(kComponent, "Cleared graph: " + std::to_string(deleted) + " nodes deleted");
    return Result<int64_t, Error>::Ok(deleted);
}

Result<DatabaseInfo, Error> GraphImporter::GetDatabaseInfo() {
    auto result = store_.ExecuteRead({
        CypherStatement{"MATCH (n:AasElement) RETURN count(n) AS nodes"},
        CypherStatement{"MATCH (:AasElement)-[r]->(:AasElement) RETURN count(r) AS relationships"},
        CypherStatement{"MATCH (n:AasElement) UNWIND labels(n) AS label "
                        "RETURN label, count(*) AS count ORDER BY count DESC"},
        CypherStatement{"MATCH (:AasElement)-[r]->(:AasElement) "
                        "RETURN type(r) AS type, count(*) AS count ORDER BY count DESC"},
    });
    if (result.IsErr()) {
        return Result<DatabaseInfo, Error>::Err(std::move(result).Error());
    }

    const auto& tables = result.Value();
    if (tables.size() != 4) {
        return Result<DatabaseInfo, Error>::Err(MakeImportError(
            "GetDatabaseInfo", store_.Endpoint(),
            "Expected 4 result sets, got " + std::to_string(tables.size()),
            ErrorCategory::Internal));
    }

    DatabaseInfo info;
    info.nodes = FirstCell(tables[0]);
    info.relationships = FirstCell(tables[1]);
    auto fill = [](const QueryResult& table, std::map<std::string, int64_t>& out) {
        for (const auto& row : table.rows) {
            if (row.size() >= 2 && row[0].is_string() && row[1].is_number_integer()) {
                out[row[0].get<std::string>()] = row[1].get<int64_t>();
            }
        }
    };
    fill(tables[2], info.labels);
    fill(tables[3], info.relationship_types);
    return Result<DatabaseInfo, Error>::Ok(std::move(info));
}

Result<std::vector<std::string>, Error> DiscoverGraphFiles(const std::string& directory) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Result<std::vector<std::string>, Error>::Err(MakeImportError(
            "DiscoverGraphFiles", directory, "Not a directory", ErrorCategory::NotFound));
    }

    static const std::string kSuffix = "_graph.json";
    std::vector<std::string> files;
    for (fs::recursive_directory_iterator it(directory, ec), end; !ec && it != end;
         it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (name.size() >= kSuffix.size() &&
            name.compare(name.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        return Result<std::vector<std::string>, Error>::Err(MakeImportError(
            "DiscoverGraphFiles", directory, ec.message(), ErrorCategory::Internal));
    }
    std::sort(files.begin(), files.end());
    return Result<std::vector<std::string>, Error>::Ok(std::move(files));
}

} // namespace aasx_kg
