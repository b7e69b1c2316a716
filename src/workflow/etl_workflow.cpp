#include <aasx_kg/workflow/etl_workflow.hpp>

#include <aasx_kg/core/log.hpp>
#include <aasx_kg/extract/extraction.hpp>
#include <aasx_kg/graph/graph_transformer.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>

namespace aasx_kg {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "etl";

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Elapsed(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool MatchesPattern(const fs::path& file, const std::string& extension) {
    return ToLower(file.extension().string()) == extension;
}

Result<void, Error> WriteJsonFile(const nlohmann::json& doc, const std::string& path,
                                  const std::string& operation) {
    std::ofstream ofs(path);
    if (!ofs) {
        return Result<void, Error>::Err(Error{
            operation, path, std::nullopt, "Failed to open file for writing",
            std::nullopt, ErrorCategory::Internal});
    }
    ofs << doc.dump(2) << '\n';
    return Result<void, Error>::Ok();
}

// Output stem for a container; a repeated stem (same file name in two
// sub-directories) gets a numeric suffix so outputs never overwrite.
std::string UniqueStem(const std::string& path, std::map<std::string, int>& seen) {
    auto stem = fs::path(path).stem().string();
    auto count = seen[stem]++;
    if (count == 0) {
        return stem;
    }
    LogWarn(kComponent, "Duplicate container name '" + stem + "', writing as " + stem +
                            "_" + std::to_string(count));
    return stem + "_" + std::to_string(count);
}

} // namespace

std::string StepOutcomeName(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::Completed: return "completed";
        case StepOutcome::Skipped: return "skipped";
        case StepOutcome::Failed: return "failed";
    }
    return "failed";
}

size_t EtlReport::FailedCount() const {
    return static_cast<size_t>(std::count_if(files.begin(), files.end(), [](const auto& f) {
        return f.outcome == StepOutcome::Failed;
    }));
}

nlohmann::json EtlReport::ToJson() const {
    auto list = nlohmann::json::array();
    for (const auto& f : files) {
        nlohmann::json item = {
            {"sourceFile", f.source_file},
            {"outcome", StepOutcomeName(f.outcome)},
            {"entities", f.entities},
            {"documents", f.documents},
            {"nodes", f.nodes},
            {"edges", f.edges},
            {"danglingReferences", f.dangling_references},
            {"diagnostics", f.diagnostics},
            {"warnings", f.warnings},
        };
        if (!f.message.empty()) {
            item["message"] = f.message;
        }
        if (f.diagnostic.has_value()) {
            item["category"] = CategoryName(f.diagnostic->category);
        }
        if (!f.extraction_file.empty()) {
            item["extractionFile"] = f.extraction_file;
        }
        if (!f.graph_file.empty()) {
            item["graphFile"] = f.graph_file;
        }
        list.push_back(std::move(item));
    }
    return {
        {"success", success},
        {"inputDirectory", input_directory},
        {"outputDirectory", output_directory},
        {"startedAt", started_at},
        {"durationMs", total_duration.count()},
        {"summary", summary},
        {"files", list},
    };
}

Result<std::vector<std::string>, Error> DiscoverContainers(const std::string& directory,
                                                           const std::string& pattern,
                                                           bool recursive) {
    using R = Result<std::vector<std::string>, Error>;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return R::Err(Error{"DiscoverContainers", directory, std::nullopt,
                            "Input directory does not exist", std::nullopt,
                            ErrorCategory::NotFound});
    }

    auto extension = ToLower(pattern);
    if (!extension.empty() && extension.front() == '*') {
        extension.erase(0, 1);
    }
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::vector<std::string> found;
    auto visit = [&](const fs::directory_entry& entry) {
        if (entry.is_regular_file(ec) && MatchesPattern(entry.path(), extension)) {
            found.push_back(entry.path().string());
        }
    };
    if (recursive) {
        for (fs::recursive_directory_iterator it(directory, ec), end; !ec && it != end;
             it.increment(ec)) {
            visit(*it);
        }
    } else {
        for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
             it.increment(ec)) {
            visit(*it);
        }
    }
    if (ec) {
        return R::Err(Error{"DiscoverContainers", directory, std::nullopt,
                            "Failed to list directory: " + ec.message(), std::nullopt,
                            ErrorCategory::Internal});
    }
    std::sort(found.begin(), found.end());
    return R::Ok(std::move(found));
}

EtlWorkflow::EtlWorkflow(const EtlConfig& config) : config_(config) {}

Result<EtlReport, Error> EtlWorkflow::Run(const std::string& input_directory) {
    auto total_start = Clock::now();

    auto discovered = DiscoverContainers(input_directory, config_.file_pattern,
                                         config_.recursive);
    if (discovered.IsErr()) {
        return Result<EtlReport, Error>::Err(std::move(discovered).Error());
    }
    auto paths = std::move(discovered).Value();

    std::error_code ec;
    fs::create_directories(config_.output_directory, ec);
    if (ec) {
        return Result<EtlReport, Error>::Err(Error{
            "EtlWorkflow", config_.output_directory, std::nullopt,
            "Failed to create output directory: " + ec.message(), std::nullopt,
            ErrorCategory::Internal});
    }

    EtlReport report;
    report.input_directory = input_directory;
    report.output_directory = config_.output_directory;
    report.started_at = UtcTimestampNow();

    LogInfo(kComponent, "Processing " + std::to_string(paths.size()) + " container(s) from " +
                            input_directory + " with " +
                            std::to_string(config_.max_workers) + " worker(s)");

    auto extractions = ExtractContainers(paths, config_.max_workers);
    std::map<std::string, int> seen_stems;

    for (size_t i = 0; i < paths.size(); ++i) {
        EtlFileResult file;
        file.source_file = paths[i];

        auto& extraction = extractions[i];
        if (extraction.IsErr()) {
            const auto& error = extraction.Error();
            LogError(kComponent, paths[i] + ": " + error.message);
            file.outcome = StepOutcome::Failed;
            file.message = error.ToString();
            file.diagnostic = Diagnostic::FromError(error);
            report.files.push_back(std::move(file));
            continue;
        }

        const auto& result = extraction.Value();
        file.entities = result.entities.size();
        file.documents = result.documents.size();
        file.diagnostics = result.diagnostics.size();
        file.warnings = result.warnings.size();

        if (result.entities.empty() && result.documents.empty()) {
            // Nothing to load; no output files either.
            file.outcome = StepOutcome::Skipped;
            file.message = "No metadata entries or documents";
            LogWarn(kComponent, paths[i] + ": " + file.message);
            report.files.push_back(std::move(file));
            continue;
        }

        auto batch = TransformExtraction(result);
        file.nodes = batch.nodes.size();
        file.edges = batch.edges.size();
        file.dangling_references = batch.dangling_references;

        auto stem = UniqueStem(paths[i], seen_stems);
        auto extraction_path =
            (fs::path(config_.output_directory) / (stem + "_extraction.json")).string();
        auto graph_path =
            (fs::path(config_.output_directory) / (stem + "_graph.json")).string();

        auto written = WriteJsonFile(ExtractionToJson(result), extraction_path, "EtlWorkflow");
        if (written.IsOk()) {
            written = SaveGraphBatchFile(batch, graph_path);
        }
        if (written.IsErr()) {
            file.outcome = StepOutcome::Failed;
            file.message = written.Error().ToString();
            file.diagnostic = Diagnostic::FromError(written.Error());
            LogError(kComponent, file.message);
            report.files.push_back(std::move(file));
            continue;
        }

        file.extraction_file = extraction_path;
        file.graph_file = graph_path;
        file.outcome = StepOutcome::Completed;
        LogInfo(kComponent, paths[i] + ": " + std::to_string(file.nodes) + " nodes, " +
                                std::to_string(file.edges) + " edges");
        report.files.push_back(std::move(file));
    }

    size_t completed = 0;
    size_t skipped = 0;
    for (const auto& f : report.files) {
        if (f.outcome == StepOutcome::Completed) {
            ++completed;
        } else if (f.outcome == StepOutcome::Skipped) {
            ++skipped;
        }
    }
    const size_t failed = report.FailedCount();

    report.success = failed == 0;
    report.total_duration = Elapsed(total_start);

    std::ostringstream oss;
    oss << completed << " completed, " << skipped << " skipped, " << failed << " failed";
    report.summary = oss.str();

    auto report_path = (fs::path(config_.output_directory) / kEtlReportFile).string();
    auto saved = WriteJsonFile(report.ToJson(), report_path, "EtlWorkflow");
    if (saved.IsErr()) {
        return Result<EtlReport, Error>::Err(std::move(saved).Error());
    }

    LogInfo(kComponent, "ETL finished: " + report.summary);
    return Result<EtlReport, Error>::Ok(std::move(report));
}

} // namespace aasx_kg
