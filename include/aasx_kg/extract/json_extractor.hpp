#pragma once

#include <aasx_kg/core/result.hpp>
#include <aasx_kg/extract/raw_record.hpp>

#include <string>
#include <string_view>

namespace aasx_kg {

/// Extract shells and submodels from one JSON metadata entry
/// (`assetAdministrationShells` / `submodels` arrays). Invalid JSON yields an
/// EntryParseFailure; absent keys become nullopt plus a FieldWarning.
[[nodiscard]] Result<ExtractorOutput, Error> ExtractJsonEntry(
    std::string_view content,
    const std::string& entry_name);

} // namespace aasx_kg
