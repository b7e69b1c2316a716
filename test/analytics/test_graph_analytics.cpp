#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "../helpers/zip_fixture.hpp"
#include "../mocks/mock_graph_store.hpp"
#include <aasx_kg/analytics/graph_analytics.hpp>

#include <fstream>
#include <sstream>

using namespace aasx_kg;
using namespace aasx_kg::testing;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

void EnqueueTable(MockGraphStore& mock, QueryResult table) {
    mock.EnqueueRead(MockGraphStore::Results({std::move(table)}));
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

// ===========================================================================
// Fixed queries
// ===========================================================================

TEST_CASE("QualityDistribution: returns the store table", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table(
                           {"element_type", "quality_level", "count"},
                           {{"shell", "HIGH", 3}, {"submodel", "LOW", 5}}));
    GraphAnalytics analytics(mock);

    auto table = analytics.QualityDistribution();
    REQUIRE(table.IsOk());
    CHECK(table.Value().title == "Quality distribution");
    CHECK(table.Value().columns.size() == 3);
    REQUIRE(table.Value().rows.size() == 2);
    CHECK(table.Value().rows[1][2] == 5);

    REQUIRE(mock.ReadCallCount() == 1);
    CHECK(mock.WriteCallCount() == 0);
    CHECK(mock.ReadCalls()[0][0].text.find("n.qualityLevel") != std::string::npos);
}

TEST_CASE("Fixed queries: read-only transactions only", "[analytics]") {
    MockGraphStore mock;
    for (int i = 0; i < 4; ++i) {
        EnqueueTable(mock, MockGraphStore::Table({"x"}));
    }
    GraphAnalytics analytics(mock);
    CHECK(analytics.ComplianceSummary().IsOk());
    CHECK(analytics.EntityTypeDistribution().IsOk());
    CHECK(analytics.RelationshipPatterns().IsOk());
    CHECK(analytics.IsolatedNodes().IsOk());
    CHECK(mock.ReadCallCount() == 4);
    CHECK(mock.WriteCallCount() == 0);
    CHECK(mock.ReadCalls()[3][0].text.find("NOT (n)--()") != std::string::npos);
}

TEST_CASE("Statistics: average degree", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"nodes", "relationships", "isolated"},
                                             {{8, 6, 2}}));
    GraphAnalytics analytics(mock);
    auto stats = analytics.Statistics();
    REQUIRE(stats.IsOk());
    CHECK(stats.Value().nodes == 8);
    CHECK(stats.Value().relationships == 6);
    CHECK(stats.Value().isolated_nodes == 2);
    CHECK_THAT(stats.Value().average_degree, WithinAbs(1.5, 1e-9));
}

TEST_CASE("Statistics: empty graph", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"nodes", "relationships", "isolated"},
                                             {{0, 0, 0}}));
    GraphAnalytics analytics(mock);
    auto stats = analytics.Statistics();
    REQUIRE(stats.IsOk());
    CHECK(stats.Value().average_degree == 0.0);
}

// ===========================================================================
// Parameterised queries
// ===========================================================================

TEST_CASE("RelatedEntities: hop bound is inlined, id is a parameter", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"id", "element_type", "description", "distance"},
                                             {{"urn:ex:2", "submodel", "Specs", 1}}));
    GraphAnalytics analytics(mock);

    auto table = analytics.RelatedEntities("urn:ex:1", 3);
    REQUIRE(table.IsOk());
    CHECK(table.Value().rows.size() == 1);
    const auto& statement = mock.ReadCalls()[0][0];
    CHECK(statement.text.find("[*1..3]") != std::string::npos);
    CHECK(statement.text.find("urn:ex:1") == std::string::npos);
    CHECK(statement.parameters["id"] == "urn:ex:1");
}

TEST_CASE("RelatedEntities: hop count out of range", "[analytics]") {
    MockGraphStore mock;
    GraphAnalytics analytics(mock);
    for (int hops : {0, 11, -1}) {
        auto table = analytics.RelatedEntities("urn:ex:1", hops);
        REQUIRE(table.IsErr());
        CHECK(table.Error().category == ErrorCategory::QueryExecutionFailure);
    }
    CHECK(mock.ReadCallCount() == 0);
}

TEST_CASE("Search: term and type are parameters", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"id"}));
    EnqueueTable(mock, MockGraphStore::Table({"id"}));
    GraphAnalytics analytics(mock);

    REQUIRE(analytics.Search("Motor").IsOk());
    CHECK(mock.ReadCalls()[0][0].parameters["term"] == "Motor");
    CHECK_FALSE(mock.ReadCalls()[0][0].parameters.contains("type"));

    REQUIRE(analytics.Search("pump' OR 1=1", std::string("submodel")).IsOk());
    const auto& statement = mock.ReadCalls()[1][0];
    CHECK(statement.parameters["type"] == "submodel");
    CHECK(statement.parameters["term"] == "pump' OR 1=1");
    CHECK(statement.text.find("1=1") == std::string::npos);
}

TEST_CASE("Search: unknown element type", "[analytics]") {
    MockGraphStore mock;
    GraphAnalytics analytics(mock);
    auto table = analytics.Search("x", std::string("document"));
    REQUIRE(table.IsErr());
    CHECK(table.Error().category == ErrorCategory::QueryExecutionFailure);
    CHECK(mock.ReadCallCount() == 0);
}

TEST_CASE("ShortestPath: endpoints are parameters", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"path_length", "node_ids", "node_types"},
                                             {{2, json::array({"a", "b", "c"}),
                                               json::array({"shell", "submodel", "shell"})}}));
    GraphAnalytics analytics(mock);
    auto table = analytics.ShortestPath("a", "c");
    REQUIRE(table.IsOk());
    CHECK(table.Value().rows[0][0] == 2);
    CHECK(mock.ReadCalls()[0][0].parameters["from"] == "a");
    CHECK(mock.ReadCalls()[0][0].parameters["to"] == "c");
}

TEST_CASE("AdHocQuery: runs in a read transaction", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"count"}, {{12}}));
    GraphAnalytics analytics(mock);
    auto table = analytics.AdHocQuery("MATCH (n) RETURN count(n) AS count",
                                      json{{"limit", 5}});
    REQUIRE(table.IsOk());
    CHECK(table.Value().rows[0][0] == 12);
    CHECK(mock.ReadCalls()[0][0].parameters["limit"] == 5);
}

TEST_CASE("AdHocQuery: blank statement", "[analytics]") {
    MockGraphStore mock;
    GraphAnalytics analytics(mock);
    auto table = analytics.AdHocQuery("  \n\t");
    REQUIRE(table.IsErr());
    CHECK(table.Error().category == ErrorCategory::QueryExecutionFailure);
    CHECK(mock.ReadCallCount() == 0);
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("Store rejection keeps the query text", "[analytics]") {
    MockGraphStore mock;
    mock.EnqueueRead(StoreResults::Err(
        MockGraphStore::StoreError(ErrorCategory::Internal, "write not allowed")));
    GraphAnalytics analytics(mock);

    auto table = analytics.AdHocQuery("CREATE (n)");
    REQUIRE(table.IsErr());
    CHECK(table.Error().category == ErrorCategory::QueryExecutionFailure);
    CHECK(table.Error().query == "CREATE (n)");
    CHECK(table.Error().ExitCode() == 5);
}

TEST_CASE("Connection failure keeps its category", "[analytics]") {
    MockGraphStore mock;
    mock.EnqueueRead(StoreResults::Err(
        MockGraphStore::StoreError(ErrorCategory::ConnectionFailure, "refused")));
    GraphAnalytics analytics(mock);
    auto table = analytics.IsolatedNodes();
    REQUIRE(table.IsErr());
    CHECK(table.Error().category == ErrorCategory::ConnectionFailure);
}

// ===========================================================================
// Full analysis and export
// ===========================================================================

TEST_CASE("RunFullAnalysis: statistics plus five tables", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"nodes", "relationships", "isolated"},
                                             {{4, 2, 1}}));
    for (int i = 0; i < 5; ++i) {
        EnqueueTable(mock, MockGraphStore::Table({"name", "count"}, {{"x", i}}));
    }
    GraphAnalytics analytics(mock);

    auto report = analytics.RunFullAnalysis();
    REQUIRE(report.IsOk());
    CHECK(report.Value().statistics.nodes == 4);
    REQUIRE(report.Value().tables.size() == 5);
    CHECK(report.Value().tables[0].title == "Quality distribution");
    CHECK(report.Value().tables[4].title == "Isolated nodes");
    CHECK_FALSE(report.Value().generated_at.empty());
    CHECK(mock.ReadCallCount() == 6);
}

TEST_CASE("RunFullAnalysis: stops at the first failure", "[analytics]") {
    MockGraphStore mock;
    EnqueueTable(mock, MockGraphStore::Table({"nodes", "relationships", "isolated"},
                                             {{4, 2, 1}}));
    mock.EnqueueRead(StoreResults::Err(
        MockGraphStore::StoreError(ErrorCategory::QueryExecutionFailure, "boom")));
    GraphAnalytics analytics(mock);
    auto report = analytics.RunFullAnalysis();
    REQUIRE(report.IsErr());
    CHECK(mock.ReadCallCount() == 2);
}

TEST_CASE("AnalysisReport: JSON and CSV renderings", "[analytics]") {
    AnalysisReport report;
    report.generated_at = "2026-01-01T00:00:00Z";
    report.statistics.nodes = 2;
    report.statistics.relationships = 1;
    report.statistics.average_degree = 1.0;
    report.tables.push_back(AnalyticsTable{
        "Isolated nodes", {"id", "description"}, {{"urn:x", "Pump, \"main\""}}});

    auto doc = report.ToJson();
    CHECK(doc["statistics"]["nodes"] == 2);
    CHECK(doc["tables"][0]["rows"][0]["id"] == "urn:x");

    auto csv = report.ToCsv();
    CHECK(csv.find("nodes,2\n") != std::string::npos);
    CHECK(csv.find("# Isolated nodes\nid,description\n") != std::string::npos);
    CHECK(csv.find("urn:x,\"Pump, \"\"main\"\"\"\n") != std::string::npos);
}

TEST_CASE("ExportReport: format follows the extension", "[analytics]") {
    TempDir dir;
    AnalysisReport report;
    report.generated_at = "2026-01-01T00:00:00Z";

    REQUIRE(ExportReport(report, dir.File("report.json")).IsOk());
    auto doc = json::parse(ReadFile(dir.File("report.json")));
    CHECK(doc["generatedAt"] == "2026-01-01T00:00:00Z");

    REQUIRE(ExportReport(report, dir.File("report.csv")).IsOk());
    CHECK(ReadFile(dir.File("report.csv")).rfind("# Network statistics", 0) == 0);

    auto failed = ExportReport(report, "/nonexistent/aasx_kg/report.json");
    REQUIRE(failed.IsErr());
    CHECK(failed.Error().category == ErrorCategory::Internal);
}
