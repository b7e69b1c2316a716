#pragma once

#include <aasx_kg/core/result.hpp>
#include <aasx_kg/graph/graph_model.hpp>
#include <aasx_kg/store/i_graph_store.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// ImporterOptions — readiness polling window and backoff.
// ---------------------------------------------------------------------------
struct ImporterOptions {
    std::chrono::milliseconds ready_timeout{60000};
    std::chrono::milliseconds initial_backoff{500};
    std::chrono::milliseconds max_backoff{5000};
    size_t rows_per_statement = 1000;
};

struct ImportCounts {
    size_t nodes_created = 0;
    size_t nodes_updated = 0;
    size_t edges_created = 0;
    size_t edges_updated = 0;
};

enum class FileOutcome {
    Imported,
    Validated,  // dry run: valid, nothing written
    Failed,
};

[[nodiscard]] std::string FileOutcomeName(FileOutcome outcome);

struct FileImportResult {
    std::string path;
    FileOutcome outcome = FileOutcome::Failed;
    size_t nodes = 0;  // submitted (or, in a dry run, intended)
    size_t edges = 0;
    ImportCounts counts;
    std::optional<Diagnostic> diagnostic;
    std::chrono::milliseconds duration{0};
};

// ---------------------------------------------------------------------------
// DirectoryImportResult — one entry per discovered batch file, in sorted
// path order. Failed files do not stop the others.
// ---------------------------------------------------------------------------
struct DirectoryImportResult {
    bool dry_run = false;
    std::vector<FileImportResult> files;
    ImportCounts totals;
    std::chrono::milliseconds duration{0};

    [[nodiscard]] size_t FailedCount() const;
    [[nodiscard]] std::string Summary() const;
};

struct DatabaseInfo {
    int64_t nodes = 0;
    int64_t relationships = 0;
    std::map<std::string, int64_t> labels;
    std::map<std::string, int64_t> relationship_types;
};

// ---------------------------------------------------------------------------
// GraphImporter — idempotent upsert of graph batches into an IGraphStore.
//
// Nodes are merged on `id` under the AasElement base label and their
// properties overwritten; edges are merged on (from, to, type). One batch is
// one write transaction, so a failed import leaves nothing behind.
// ---------------------------------------------------------------------------
class GraphImporter {
public:
    explicit GraphImporter(IGraphStore& store, ImporterOptions options = {});

    /// Poll Ping() with exponential backoff until it succeeds or the window
    /// closes (ConnectionFailure). Authentication failures return at once.
    [[nodiscard]] Result<void, Error> WaitUntilReady();
    [[nodiscard]] Result<void, Error> WaitUntilReady(
        std::chrono::steady_clock::time_point deadline);

    [[nodiscard]] Result<ImportCounts, Error> Import(const GraphBatch& batch);

    /// Read, validate and import one batch file.
    [[nodiscard]] Result<ImportCounts, Error> ImportFile(const std::string& path);

    /// Import every `*_graph.json` below `directory`. Each file is validated
    /// before the store is touched; invalid files are reported and skipped.
    /// A dry run never connects.
    [[nodiscard]] Result<DirectoryImportResult, Error> ImportDirectory(
        const std::string& directory, bool dry_run);

    [[nodiscard]] Result<void, Error> CreateIndexes();

    /// Delete every AasElement node and its relationships; returns the number
    /// of nodes removed.
    [[nodiscard]] Result<int64_t, Error> ClearGraph();

    [[nodiscard]] Result<DatabaseInfo, Error> GetDatabaseInfo();

    /// Statements Import() would send for `batch` (one per label set / edge
    /// type chunk). Exposed for dry-run output and tests.
    [[nodiscard]] Result<std::vector<CypherStatement>, Error> BuildImportStatements(
        const GraphBatch& batch) const;

private:
    IGraphStore& store_;
    ImporterOptions options_;
    bool ready_ = false;
};

/// `*_graph.json` files below `directory`, recursively, sorted.
[[nodiscard]] Result<std::vector<std::string>, Error> DiscoverGraphFiles(
    const std::string& directory);

} // namespace aasx_kg
