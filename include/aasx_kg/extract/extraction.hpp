#pragma once

#include <aasx_kg/core/result.hpp>
#include <aasx_kg/extract/entity.hpp>
#include <aasx_kg/extract/raw_record.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// ExtractionResult — everything pulled out of one container.
//
// `entities` keeps archive order (entry by entry, records in source order).
// Entry-level failures are in `diagnostics`; field-level gaps in `warnings`.
// ---------------------------------------------------------------------------
struct ExtractionResult {
    std::string source_file;
    uint64_t file_size = 0;
    std::string processing_timestamp;  // UTC, "YYYY-MM-DDTHH:MM:SSZ"
    std::vector<Entity> entities;
    std::vector<DocumentRef> documents;
    std::vector<std::string> json_files;
    std::vector<std::string> xml_files;
    std::vector<Diagnostic> diagnostics;
    std::vector<FieldWarning> warnings;

    /// Shells and assets, in extraction order.
    [[nodiscard]] std::vector<const Entity*> Assets() const;
    [[nodiscard]] std::vector<const Entity*> Submodels() const;
};

/// Extract one container. Fails only when the container itself cannot be
/// opened (NotFound / InvalidContainerFormat); a malformed metadata entry is
/// recorded as an EntryParseFailure diagnostic and skipped.
[[nodiscard]] Result<ExtractionResult, Error> ExtractContainer(const std::string& path);

/// Extract many containers on at most `max_workers` threads. Results are in
/// input order; one failing container does not affect the others.
[[nodiscard]] std::vector<Result<ExtractionResult, Error>> ExtractContainers(
    const std::vector<std::string>& paths,
    int max_workers);

/// Extraction output document (processingMethod, sourceFile, assets, ...).
[[nodiscard]] nlohmann::json ExtractionToJson(const ExtractionResult& result);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string UtcTimestampNow();

} // namespace aasx_kg
