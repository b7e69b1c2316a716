#pragma once

#include <aasx_kg/core/result.hpp>
#include <aasx_kg/store/i_graph_store.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// AnalyticsTable — a titled query result ready for printing or export.
// ---------------------------------------------------------------------------
struct AnalyticsTable {
    std::string title;
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct NetworkStatistics {
    int64_t nodes = 0;
    int64_t relationships = 0;
    int64_t isolated_nodes = 0;
    double average_degree = 0.0;  // 2 * relationships / nodes
};

struct AnalysisReport {
    std::string generated_at;  // UTC, "YYYY-MM-DDTHH:MM:SSZ"
    NetworkStatistics statistics;
    std::vector<AnalyticsTable> tables;

    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] std::string ToCsv() const;
};

// ---------------------------------------------------------------------------
// GraphAnalytics — read-only queries over an imported graph.
//
// Every query runs in a read transaction. A store rejection surfaces as
// QueryExecutionFailure with the statement text in Error::query.
// ---------------------------------------------------------------------------
class GraphAnalytics {
public:
    explicit GraphAnalytics(IGraphStore& store);

    [[nodiscard]] Result<AnalyticsTable, Error> QualityDistribution();
    [[nodiscard]] Result<AnalyticsTable, Error> ComplianceSummary();
    [[nodiscard]] Result<AnalyticsTable, Error> EntityTypeDistribution();
    [[nodiscard]] Result<AnalyticsTable, Error> RelationshipPatterns();
    [[nodiscard]] Result<AnalyticsTable, Error> IsolatedNodes();
    [[nodiscard]] Result<NetworkStatistics, Error> Statistics();

    /// Entities reachable from `id` within `hops` relationships (1..10),
    /// each with its shortest distance.
    [[nodiscard]] Result<AnalyticsTable, Error> RelatedEntities(const std::string& id,
                                                                int hops);

    /// Case-insensitive substring search on id, shortName and description,
    /// optionally restricted to one element type.
    [[nodiscard]] Result<AnalyticsTable, Error> Search(
        const std::string& term,
        const std::optional<std::string>& element_type = std::nullopt);

    [[nodiscard]] Result<AnalyticsTable, Error> ShortestPath(const std::string& from_id,
                                                             const std::string& to_id);

    /// Arbitrary statement in a read transaction.
    [[nodiscard]] Result<AnalyticsTable, Error> AdHocQuery(
        const std::string& statement,
        const nlohmann::json& parameters = nlohmann::json::object());

    /// Statistics plus every fixed query.
    [[nodiscard]] Result<AnalysisReport, Error> RunFullAnalysis();

private:
    Result<AnalyticsTable, Error> Run(const std::string& title, CypherStatement statement);

    IGraphStore& store_;
};

/// Write a report as JSON (".json") or CSV (any other extension).
[[nodiscard]] Result<void, Error> ExportReport(const AnalysisReport& report,
                                              const std::string& path);

} // namespace aasx_kg
