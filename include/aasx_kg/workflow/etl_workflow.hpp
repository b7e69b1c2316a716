#pragma once

#include <aasx_kg/config/app_config.hpp>
#include <aasx_kg/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace aasx_kg {

// Name of the run report written next to the per-container outputs.
constexpr const char* kEtlReportFile = "etl_report.json";

// ---------------------------------------------------------------------------
// StepOutcome — outcome for each container of an ETL run.
// ---------------------------------------------------------------------------
enum class StepOutcome {
    Completed,
    Skipped,
    Failed,
};

[[nodiscard]] std::string StepOutcomeName(StepOutcome outcome);

// ---------------------------------------------------------------------------
// EtlFileResult — what happened to one container.
// ---------------------------------------------------------------------------
struct EtlFileResult {
    std::string source_file;
    StepOutcome outcome = StepOutcome::Failed;
    std::string message;
    size_t entities = 0;
    size_t documents = 0;
    size_t nodes = 0;
    size_t edges = 0;
    size_t dangling_references = 0;
    size_t diagnostics = 0;
    size_t warnings = 0;
    std::string extraction_file;
    std::string graph_file;
    std::optional<Diagnostic> diagnostic; // set when outcome is Failed
};

// ---------------------------------------------------------------------------
// EtlReport — aggregated results of one run, in discovery order.
// ---------------------------------------------------------------------------
struct EtlReport {
    bool success = false;
    std::string input_directory;
    std::string output_directory;
    std::string started_at;
    std::vector<EtlFileResult> files;
    std::string summary;
    std::chrono::milliseconds total_duration{0};

    [[nodiscard]] size_t FailedCount() const;
    [[nodiscard]] nlohmann::json ToJson() const;
};

/// Files below `directory` whose extension matches `pattern` (".aasx" or
/// "*.aasx", case-insensitive), sorted.
[[nodiscard]] Result<std::vector<std::string>, Error> DiscoverContainers(
    const std::string& directory,
    const std::string& pattern,
    bool recursive);

// ---------------------------------------------------------------------------
// EtlWorkflow — directory of containers to graph batch files.
//
// For each container: extract (in parallel, bounded by max_workers),
// transform, then write <stem>_extraction.json and <stem>_graph.json into
// the output directory. A failing container is reported and the rest carry
// on. The run report is written as etl_report.json.
// ---------------------------------------------------------------------------
class EtlWorkflow {
public:
    explicit EtlWorkflow(const EtlConfig& config);

    EtlWorkflow(const EtlWorkflow&) = delete;
    EtlWorkflow& operator=(const EtlWorkflow&) = delete;

    [[nodiscard]] Result<EtlReport, Error> Run(const std::string& input_directory);

private:
    const EtlConfig& config_;
};

} // namespace aasx_kg
