#include <catch2/catch_test_macros.hpp>

#include <aasx_kg/cli/output_formatter.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace aasx_kg;

namespace {

Error ValidationError() {
    return Error{"ImportFile", "a_graph.json", std::nullopt,
                 "nodes[0].id: missing or empty", std::nullopt,
                 ErrorCategory::ImportValidationFailure};
}

} // namespace

// ===========================================================================
// PrintTable
// ===========================================================================

TEST_CASE("OutputFormatter: plain table pads columns", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"id", "type"}, {{"urn:a", "shell"}, {"urn:bb", "asset"}});

    CHECK(out.str() ==
          "id      type \n"
          "------  -----\n"
          "urn:a   shell\n"
          "urn:bb  asset\n");
    CHECK(err.str().empty());
}

TEST_CASE("OutputFormatter: plain table without rows prints headers", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"metric", "value"}, {});

    CHECK(out.str() == "metric  value\n------  -----\n");
}

TEST_CASE("OutputFormatter: JSON table is an array of objects", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintTable({"id", "type"}, {{"urn:a", "shell"}, {"urn:b"}});

    auto parsed = nlohmann::json::parse(out.str());
    REQUIRE(parsed.size() == 2);
    CHECK(parsed[0]["id"] == "urn:a");
    CHECK(parsed[0]["type"] == "shell");
    // Short rows only carry the columns they have.
    CHECK_FALSE(parsed[1].contains("type"));
}

// ===========================================================================
// PrintDetail
// ===========================================================================

TEST_CASE("OutputFormatter: detail tree with root entries and sections", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintDetail("Graph database", {
        DetailSection{"", {{"Nodes", "3"}}},
        DetailSection{"Labels", {{"Shell", "1"}, {"Asset", "2"}}},
        DetailSection{"Relationship types", {{"HAS_SUBMODEL", "2"}}},
    });

    CHECK(out.str() ==
          "Graph database\n"
          "|-- Nodes: 3\n"
          "|-- Labels\n"
          "|   |-- Shell: 1\n"
          "|   +-- Asset: 2\n"
          "+-- Relationship types\n"
          "    +-- HAS_SUBMODEL: 2\n");
}

TEST_CASE("OutputFormatter: empty sections are omitted", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintDetail("Summary", {
        DetailSection{"", {{"Files", "2"}}},
        DetailSection{"Labels", {}},
    });

    CHECK(out.str() == "Summary\n+-- Files: 2\n");
}

TEST_CASE("OutputFormatter: JSON detail nests titled sections", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintDetail("ignored", {
        DetailSection{"", {{"Nodes", "3"}}},
        DetailSection{"Labels", {{"Shell", "1"}}},
    });

    auto parsed = nlohmann::json::parse(out.str());
    CHECK(parsed["Nodes"] == "3");
    CHECK(parsed["Labels"]["Shell"] == "1");
    CHECK_FALSE(parsed.contains("ignored"));
}

// ===========================================================================
// PrintError / PrintDiagnostics
// ===========================================================================

TEST_CASE("OutputFormatter: plain error goes to stderr", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintError(ValidationError());

    CHECK(out.str().empty());
    CHECK(err.str() ==
          "Error: ImportFile [import_validation_failure]\n"
          "  Target: a_graph.json\n"
          "  nodes[0].id: missing or empty\n");
}

TEST_CASE("OutputFormatter: plain error shows store code and query", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    Error error{"ExecuteRead", "", 500, "Unknown function 'foo'",
                "Neo.ClientError.Statement.SyntaxError",
                ErrorCategory::QueryExecutionFailure, "RETURN foo()"};
    fmt.PrintError(error);

    const auto text = err.str();
    CHECK(text.find("Error: ExecuteRead [query_execution_failure] (HTTP 500)\n") == 0);
    CHECK(text.find("Target:") == std::string::npos);
    CHECK(text.find("  Store: Neo.ClientError.Statement.SyntaxError\n") != std::string::npos);
    CHECK(text.find("  Query: RETURN foo()\n") != std::string::npos);
}

TEST_CASE("OutputFormatter: JSON error carries category and exit code", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintError(ValidationError());

    auto parsed = nlohmann::json::parse(err.str());
    CHECK(parsed["error"]["category"] == "import_validation_failure");
    CHECK(parsed["error"]["target"] == "a_graph.json");
    CHECK(parsed["error"]["exit_code"] == 4);
}

TEST_CASE("OutputFormatter: diagnostics print as warnings", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintDiagnostics({
        Diagnostic{ErrorCategory::EntryParseFailure, "aasx/broken.json", "JSON is not valid"},
    });

    CHECK(err.str() == "warning [entry_parse_failure] aasx/broken.json: JSON is not valid\n");
}

TEST_CASE("OutputFormatter: diagnostics are silent in JSON mode", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintDiagnostics({
        Diagnostic{ErrorCategory::EntryParseFailure, "aasx/broken.json", "JSON is not valid"},
    });

    CHECK(out.str().empty());
    CHECK(err.str().empty());
}

// ===========================================================================
// PrintSuccess
// ===========================================================================

TEST_CASE("OutputFormatter: success message", "[cli][formatter]") {
    std::ostringstream out;
    std::ostringstream err;

    OutputFormatter plain(false, false, out, err);
    plain.PrintSuccess("Deleted 3 nodes");
    CHECK(out.str() == "Deleted 3 nodes\n");

    out.str("");
    OutputFormatter json(true, false, out, err);
    json.PrintSuccess("Deleted 3 nodes");
    auto parsed = nlohmann::json::parse(out.str());
    CHECK(parsed["success"] == true);
    CHECK(parsed["message"] == "Deleted 3 nodes");

    out.str("");
    OutputFormatter color(false, true, out, err);
    color.PrintSuccess("Deleted 3 nodes");
    CHECK(out.str().find("OK") != std::string::npos);
    CHECK(out.str().find("Deleted 3 nodes") != std::string::npos);
}

TEST_CASE("OutputFormatter: JSON mode disables color", "[cli][formatter]") {
    OutputFormatter fmt(true, true);
    CHECK(fmt.IsJsonMode());
    CHECK_FALSE(fmt.IsColorMode());
}

// ===========================================================================
// CellToString
// ===========================================================================

TEST_CASE("CellToString: renders result cells", "[cli][formatter]") {
    CHECK(CellToString(nullptr) == "");
    CHECK(CellToString("Motor") == "Motor");
    CHECK(CellToString(42) == "42");
    CHECK(CellToString(1.0 / 3.0) == "0.33");
    CHECK(CellToString(true) == "true");
    CHECK(CellToString(nlohmann::json::array({"a", 1})) == R"(["a",1])");
}
