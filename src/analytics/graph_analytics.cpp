#include <aasx_kg/analytics/graph_analytics.hpp>

#include <aasx_kg/core/log.hpp>
#include <aasx_kg/core/types.hpp>
#include <aasx_kg/extract/entity.hpp>
#include <aasx_kg/extract/extraction.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace aasx_kg {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "analytics";

constexpr const char* kQualityQuery =
    "MATCH (n:AasElement) WHERE n.qualityLevel IS NOT NULL "
    "RETURN n.elementType AS element_type, n.qualityLevel AS quality_level, "
    "count(*) AS count ORDER BY element_type, quality_level";

constexpr const char* kComplianceQuery =
    "MATCH (n:AasElement) WHERE n.complianceStatus IS NOT NULL "
    "WITH count(n) AS total "
    "MATCH (m:AasElement) WHERE m.complianceStatus IS NOT NULL "
    "WITH total, m.complianceStatus AS status, count(m) AS count "
    "RETURN status, count, round(100.0 * count / total, 2) AS percentage "
    "ORDER BY count DESC";

constexpr const char* kTypeQuery =
    "MATCH (n:AasElement) "
    "RETURN coalesce(n.elementType, 'document') AS element_type, count(*) AS count "
    "ORDER BY count DESC";

constexpr const char* kRelationshipQuery =
    "MATCH (a:AasElement)-[r]->(b:AasElement) "
    "RETURN type(r) AS relationship_type, a.elementType AS source_type, "
    "b.elementType AS target_type, count(*) AS count ORDER BY count DESC";

constexpr const char* kIsolatedQuery =
    "MATCH (n:AasElement) WHERE NOT (n)--() "
    "RETURN n.id AS id, n.elementType AS element_type, n.description AS description "
    "ORDER BY element_type, description";

constexpr const char* kStatisticsQuery =
    "MATCH (n:AasElement) "
    "OPTIONAL MATCH (n)-[r]->(:AasElement) "
    "WITH n, count(r) AS out_degree "
    "RETURN count(n) AS nodes, sum(out_degree) AS relationships, "
    "sum(CASE WHEN NOT (n)--() THEN 1 ELSE 0 END) AS isolated";

constexpr const char* kShortestPathQuery =
    "MATCH (a:AasElement {id: $from}), (b:AasElement {id: $to}) "
    "MATCH path = shortestPath((a)-[*]-(b)) "
    "RETURN length(path) AS path_length, "
    "[x IN nodes(path) | x.id] AS node_ids, "
    "[x IN nodes(path) | x.elementType] AS node_types";

Error MakeAnalyticsError(const std::string& operation, const std::string& message,
                         ErrorCategory category) {
    return Error{operation, "analytics", std::nullopt, message, std::nullopt, category};
}

int64_t CellAsInt(const std::vector<json>& row, size_t index) {
    if (index >= row.size() || !row[index].is_number()) {
        return 0;
    }
    return row[index].get<int64_t>();
}

std::string CsvField(const json& value) {
    std::string text = value.is_string() ? value.get<std::string>()
                     : value.is_null()   ? std::string()
                                         : value.dump();
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    return quoted + "\"";
}

} // anonymous namespace

json AnalyticsTable::ToJson() const {
    json rows_json = json::array();
    for (const auto& row : rows) {
        json object = json::object();
        for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
            object[columns[i]] = row[i];
        }
        rows_json.push_back(std::move(object));
    }
    return json{{"title", title}, {"columns", columns}, {"rows", rows_json}};
}

json AnalysisReport::ToJson() const {
    json tables_json = json::array();
    for (const auto& t : tables) {
        tables_json.push_back(t.ToJson());
    }
    return json{
        {"generatedAt", generated_at},
        {"statistics",
         {{"nodes", statistics.nodes},
          {"relationships", statistics.relationships},
          {"isolatedNodes", statistics.isolated_nodes},
          {"averageDegree", statistics.average_degree}}},
        {"tables", tables_json},
    };
}

std::string AnalysisReport::ToCsv() const {
    std::ostringstream out;
    out << "# Network statistics\n"
        << "metric,value\n"
        << "nodes," << statistics.nodes << '\n'
        << "relationships," << statistics.relationships << '\n'
        << "isolated_nodes," << statistics.isolated_nodes << '\n'
        << "average_degree," << statistics.average_degree << '\n';
    for (const auto& t : tables) {
        out << "\n# " << t.title << '\n';
        for (size_t i = 0; i < t.columns.size(); ++i) {
            out << (i ? "," : "") << CsvField(t.columns[i]);
        }
        out << '\n';
        for (const auto& row : t.rows) {
            for (size_t i = 0; i < row.size(); ++i) {
                out << (i ? "," : "") << CsvField(row[i]);
            }
            out << '\n';
        }
    }
    return out.str();
}

GraphAnalytics::GraphAnalytics(IGraphStore& store) : store_(store) {}

Result<AnalyticsTable, Error> GraphAnalytics::Run(const std::string& title,
                                                  CypherStatement statement) {
    LogDebug(kComponent, title + ": " + statement.text);
    const auto text = statement.text;
    auto result = store_.ExecuteRead({std::move(statement)});
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        if (!error.query.has_value()) {
            error.query = text;
        }
        if (error.category == ErrorCategory::Internal) {
            error.category = ErrorCategory::QueryExecutionFailure;
        }
        return Result<AnalyticsTable, Error>::Err(std::move(error));
    }

    auto tables = std::move(result).Value();
    if (tables.empty()) {
        return Result<AnalyticsTable, Error>::Ok(AnalyticsTable{title, {}, {}});
    }
    auto& first = tables.front();
    return Result<AnalyticsTable, Error>::Ok(
        AnalyticsTable{title, std::move(first.columns), std::move(first.rows)});
}

Result<AnalyticsTable, Error> GraphAnalytics::QualityDistribution() {
    return Run("Quality distribution", CypherStatement{kQualityQuery});
}

Result<AnalyticsTable, Error> GraphAnalytics::ComplianceSummary() {
    return Run("Compliance summary", CypherStatement{kComplianceQuery});
}

Result<AnalyticsTable, Error> GraphAnalytics::EntityTypeDistribution() {
    return Run("Entity types", CypherStatement{kTypeQuery});
}

Result<AnalyticsTable, Error> GraphAnalytics::RelationshipPatterns() {
    return Run("Relationships", CypherStatement{kRelationshipQuery});
}

Result<AnalyticsTable, Error> GraphAnalytics::IsolatedNodes() {
    return Run("Isolated nodes", CypherStatement{kIsolatedQuery});
}

Result<NetworkStatistics, Error> GraphAnalytics::Statistics() {
    auto table = Run("Network statistics", CypherStatement{kStatisticsQuery});
    if (table.IsErr()) {
        return Result<NetworkStatistics, Error>::Err(std::move(table).Error());
    }
    NetworkStatistics stats;
    if (!table.Value().rows.empty()) {
        const auto& row = table.Value().rows.front();
        stats.nodes = CellAsInt(row, 0);
        stats.relationships = CellAsInt(row, 1);
        stats.isolated_nodes = CellAsInt(row, 2);
    }
    if (stats.nodes > 0) {
        stats.average_degree = 2.0 * static_cast<double>(stats.relationships) /
                               static_cast<double>(stats.nodes);
    }
    return Result<NetworkStatistics, Error>::Ok(stats);
}

Result<AnalyticsTable, Error> GraphAnalytics::RelatedEntities(const std::string& id,
                                                              int hops) {
    auto hop_count = HopCount::Create(hops);
    if (hop_count.IsErr()) {
        return Result<AnalyticsTable, Error>::Err(MakeAnalyticsError(
            "RelatedEntities", hop_count.Error(), ErrorCategory::QueryExecutionFailure));
    }
    // Path length bounds cannot be parameters; the validated count is inlined.
    const std::string text =
        "MATCH path = (start:AasElement {id: $id})-[*1.." +
        std::to_string(hop_count.Value().Value()) + "]-(related:AasElement) "
        "WHERE start <> related "
        "WITH related, min(length(path)) AS distance "
        "RETURN related.id AS id, related.elementType AS element_type, "
        "related.description AS description, distance "
        "ORDER BY distance, element_type, id";
    return Run("Related entities of " + id, CypherStatement{text, json{{"id", id}}});
}

Result<AnalyticsTable, Error> GraphAnalytics::Search(
    const std::string& term,
    const std::optional<std::string>& element_type) {
    json params = {{"term", term}};
    std::string text =
        "MATCH (n:AasElement) "
        "WHERE (toLower(coalesce(n.id, '')) CONTAINS toLower($term) "
        "OR toLower(coalesce(n.shortName, '')) CONTAINS toLower($term) "
        "OR toLower(coalesce(n.description, '')) CONTAINS toLower($term))";
    if (element_type.has_value()) {
        if (!ParseElementType(*element_type).has_value()) {
            return Result<AnalyticsTable, Error>::Err(MakeAnalyticsError(
                "Search", "Unknown element type '" + *element_type +
                              "' (expected shell, asset or submodel)",
                ErrorCategory::QueryExecutionFailure));
        }
        text += " AND n.elementType = $type";
        params["type"] = *element_type;
    }
    text += " RETURN n.id AS id, n.elementType AS element_type, n.shortName AS short_name, "
            "n.description AS description ORDER BY element_type, description";
    return Run("Search '" + term + "'", CypherStatement{text, params});
}

Result<AnalyticsTable, Error> GraphAnalytics::ShortestPath(const std::string& from_id,
                                                           const std::string& to_id) {
    return Run("Path " + from_id + " -> " + to_id,
               CypherStatement{kShortestPathQuery, json{{"from", from_id}, {"to", to_id}}});
}

Result<AnalyticsTable, Error> GraphAnalytics::AdHocQuery(const std::string& statement,
                                                         const json& parameters) {
    if (statement.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Result<AnalyticsTable, Error>::Err(MakeAnalyticsError(
            "AdHocQuery", "Query text is empty", ErrorCategory::QueryExecutionFailure));
    }
    return Run("Query", CypherStatement{statement, parameters});
}

Result<AnalysisReport, Error> GraphAnalytics::RunFullAnalysis() {
    AnalysisReport report;
    report.generated_at = UtcTimestampNow();

    auto stats = Statistics();
    if (stats.IsErr()) {
        return Result<AnalysisReport, Error>::Err(std::move(stats).Error());
    }
    report.statistics = stats.Value();

    using Query = Result<AnalyticsTable, Error> (GraphAnalytics::*)();
    const Query queries[] = {
        &GraphAnalytics::QualityDistribution,
        &GraphAnalytics::ComplianceSummary,
        &GraphAnalytics::EntityTypeDistribution,
        &GraphAnalytics::RelationshipPatterns,
        &GraphAnalytics::IsolatedNodes,
    };
    for (auto query : queries) {
        auto table = (this->*query)();
        if (table.IsErr()) {
            return Result<AnalysisReport, Error>::Err(std::move(table).Error());
        }
        report.tables.push_back(std::move(table).Value());
    }
    LogInfo(kComponent, "Analysis complete: " + std::to_string(report.tables.size()) +
                            " tables, " + std::to_string(report.statistics.nodes) + " nodes");
    return Result<AnalysisReport, Error>::Ok(std::move(report));
}

Result<void, Error> ExportReport(const AnalysisReport& report, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        return Result<void, Error>::Err(Error{
            "ExportReport", path, std::nullopt, "Failed to open file for writing",
            std::nullopt, ErrorCategory::Internal});
    }
    if (std::filesystem::path(path).extension() == ".json") {
        ofs << report.ToJson().dump(2) << '\n';
    } else {
        ofs << report.ToCsv();
    }
    LogInfo(kComponent, "Report written to " + path);
    return Result<void, Error>::Ok();
}

} // namespace aasx_kg
