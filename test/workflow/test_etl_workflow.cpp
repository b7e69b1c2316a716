#include <catch2/catch_test_macros.hpp>

#include "../helpers/test_data.hpp"
#include "../helpers/zip_fixture.hpp"
#include <aasx_kg/workflow/etl_workflow.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace aasx_kg;
using namespace aasx_kg::testing;

namespace fs = std::filesystem;

namespace {

void WriteMotorContainer(const std::string& path) {
    WriteZip(path, {
        {"[Content_Types].xml", "<Types/>"},
        {"aasx/data.json", LoadTestData("motor_v3.json")},
        {"aasx/docs/Manual.pdf", "%PDF-1.4"},
    });
}

// Packaging parts only: no metadata entries and no documents.
void WriteEmptyContainer(const std::string& path) {
    WriteZip(path, {
        {"[Content_Types].xml", "<Types/>"},
        {"_rels/.rels", "<Relationships/>"},
    });
}

EtlConfig MakeConfig(const TempDir& output) {
    EtlConfig config;
    config.output_directory = output.Path().string();
    config.max_workers = 2;
    return config;
}

nlohmann::json ReadJson(const std::string& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

} // namespace

// ===========================================================================
// DiscoverContainers
// ===========================================================================

TEST_CASE("DiscoverContainers: matches the extension case-insensitively", "[workflow][etl]") {
    TempDir dir;
    WriteTextFile(dir.File("b.aasx"), "");
    WriteTextFile(dir.File("A.AASX"), "");
    WriteTextFile(dir.File("notes.txt"), "");
    fs::create_directories(dir.Path() / "nested");
    WriteTextFile((dir.Path() / "nested" / "c.aasx").string(), "");

    auto flat = DiscoverContainers(dir.Path().string(), "*.aasx", false);
    REQUIRE(flat.IsOk());
    CHECK(flat.Value() == std::vector<std::string>{dir.File("A.AASX"), dir.File("b.aasx")});

    auto deep = DiscoverContainers(dir.Path().string(), ".aasx", true);
    REQUIRE(deep.IsOk());
    CHECK(deep.Value().size() == 3);
}

TEST_CASE("DiscoverContainers: pattern without a dot", "[workflow][etl]") {
    TempDir dir;
    WriteTextFile(dir.File("a.aasx"), "");

    auto result = DiscoverContainers(dir.Path().string(), "aasx", false);
    REQUIRE(result.IsOk());
    CHECK(result.Value().size() == 1);
}

TEST_CASE("DiscoverContainers: missing directory", "[workflow][etl]") {
    TempDir dir;
    auto result = DiscoverContainers(dir.File("absent"), ".aasx", false);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotFound);
}

// ===========================================================================
// EtlWorkflow::Run
// ===========================================================================

TEST_CASE("EtlWorkflow: completed, skipped and failed containers", "[workflow][etl]") {
    TempDir input;
    TempDir output;
    WriteMotorContainer(input.File("motor.aasx"));
    WriteEmptyContainer(input.File("empty.aasx"));
    WriteTextFile(input.File("broken.aasx"), "not a zip archive");

    auto config = MakeConfig(output);
    EtlWorkflow workflow(config);
    auto result = workflow.Run(input.Path().string());
    REQUIRE(result.IsOk());
    const auto& report = result.Value();

    REQUIRE(report.files.size() == 3);
    CHECK_FALSE(report.success);
    CHECK(report.FailedCount() == 1);
    CHECK(report.summary == "1 completed, 1 skipped, 1 failed");

    // Sorted by path.
    const auto& broken = report.files[0];
    CHECK(broken.outcome == StepOutcome::Failed);
    REQUIRE(broken.diagnostic.has_value());
    CHECK(broken.diagnostic->category == ErrorCategory::InvalidContainerFormat);

    const auto& empty = report.files[1];
    CHECK(empty.outcome == StepOutcome::Skipped);
    CHECK(empty.message == "No metadata entries or documents");
    CHECK(empty.graph_file.empty());
    CHECK_FALSE(fs::exists(output.File("empty_graph.json")));

    const auto& motor = report.files[2];
    CHECK(motor.outcome == StepOutcome::Completed);
    CHECK(motor.entities == 3);
    CHECK(motor.documents == 1);
    CHECK(motor.nodes == 4);
    CHECK(motor.edges == 1);
    CHECK(motor.dangling_references == 1);
    CHECK(motor.warnings == 1);
    CHECK(motor.graph_file == output.File("motor_graph.json"));
    CHECK(motor.extraction_file == output.File("motor_extraction.json"));
}

TEST_CASE("EtlWorkflow: writes extraction, graph and report files", "[workflow][etl]") {
    TempDir input;
    TempDir output;
    WriteMotorContainer(input.File("motor.aasx"));

    auto config = MakeConfig(output);
    EtlWorkflow workflow(config);
    auto result = workflow.Run(input.Path().string());
    REQUIRE(result.IsOk());
    CHECK(result.Value().success);

    auto extraction = ReadJson(output.File("motor_extraction.json"));
    CHECK(extraction["processingMethod"] == "zip_extraction");
    CHECK(extraction["sourceFile"] == input.File("motor.aasx"));

    auto graph = ReadJson(output.File("motor_graph.json"));
    CHECK(graph["format"] == "graph");
    CHECK(graph["name"] == "motor");
    CHECK(graph["nodes"].size() == 4);

    auto report = ReadJson(output.File(kEtlReportFile));
    CHECK(report["success"] == true);
    CHECK(report["summary"] == "1 completed, 0 skipped, 0 failed");
    CHECK(report["inputDirectory"] == input.Path().string());
    REQUIRE(report["files"].size() == 1);
    CHECK(report["files"][0]["outcome"] == "completed");
    CHECK(report["files"][0]["graphFile"] == output.File("motor_graph.json"));
}

TEST_CASE("EtlWorkflow: repeated container names get a suffix", "[workflow][etl]") {
    TempDir input;
    TempDir output;
    fs::create_directories(input.Path() / "line1");
    fs::create_directories(input.Path() / "line2");
    WriteMotorContainer((input.Path() / "line1" / "motor.aasx").string());
    WriteMotorContainer((input.Path() / "line2" / "motor.aasx").string());

    auto config = MakeConfig(output);
    config.recursive = true;
    EtlWorkflow workflow(config);
    auto result = workflow.Run(input.Path().string());
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().files.size() == 2);

    CHECK(result.Value().files[0].graph_file == output.File("motor_graph.json"));
    CHECK(result.Value().files[1].graph_file == output.File("motor_1_graph.json"));
    CHECK(fs::exists(output.File("motor_1_extraction.json")));
}

TEST_CASE("EtlWorkflow: empty input directory succeeds", "[workflow][etl]") {
    TempDir input;
    TempDir output;

    auto config = MakeConfig(output);
    EtlWorkflow workflow(config);
    auto result = workflow.Run(input.Path().string());
    REQUIRE(result.IsOk());
    CHECK(result.Value().files.empty());
    CHECK(result.Value().success);
    CHECK(fs::exists(output.File(kEtlReportFile)));
}

TEST_CASE("EtlWorkflow: missing input directory", "[workflow][etl]") {
    TempDir output;
    auto config = MakeConfig(output);
    EtlWorkflow workflow(config);

    auto result = workflow.Run(output.File("absent"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("EtlWorkflow: output directory cannot be created", "[workflow][etl]") {
    TempDir input;
    TempDir scratch;
    WriteTextFile(scratch.File("occupied"), "");

    EtlConfig config;
    config.output_directory = scratch.File("occupied") + "/out";
    EtlWorkflow workflow(config);

    auto result = workflow.Run(input.Path().string());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Internal);
    CHECK(result.Error().message.find("Failed to create output directory") != std::string::npos);
}

TEST_CASE("StepOutcomeName: names", "[workflow][etl]") {
    CHECK(StepOutcomeName(StepOutcome::Completed) == "completed");
    CHECK(StepOutcomeName(StepOutcome::Skipped) == "skipped");
    CHECK(StepOutcomeName(StepOutcome::Failed) == "failed");
}
