#pragma once

#include <aasx_kg/core/result.hpp>
#include <aasx_kg/extract/raw_record.hpp>

#include <array>
#include <string>
#include <string_view>

namespace aasx_kg {

// Namespaces recognised in legacy metadata.
constexpr const char* kAasNamespaceV1 = "http://www.admin-shell.io/aas/1/0";
constexpr const char* kAasNamespaceV2 = "http://www.admin-shell.io/aas/2/0";
constexpr const char* kAasNamespaceV3 = "http://www.admin-shell.io/aas/3/0";
constexpr const char* kMeasurementUnitNamespace = "http://www.admin-shell.io/IEC61360/1/0";
constexpr const char* kXsiNamespace = "http://www.w3.org/2001/XMLSchema-instance";

// ---------------------------------------------------------------------------
// LookupStrategy — one way of matching a child element by local name.
//
//   QualifiedAas              prefix (or default namespace) bound to an AAS URI
//   QualifiedMeasurementUnit  prefix bound to the IEC61360 URI
//   Unqualified               local name only, whatever the prefix
// ---------------------------------------------------------------------------
enum class LookupStrategy {
    QualifiedAas,
    QualifiedMeasurementUnit,
    Unqualified,
};

// Tried in this order for every field; the first non-empty value wins.
constexpr std::array<LookupStrategy, 3> kFieldLookupOrder = {
    LookupStrategy::QualifiedAas,
    LookupStrategy::QualifiedMeasurementUnit,
    LookupStrategy::Unqualified,
};

[[nodiscard]] std::string LookupStrategyName(LookupStrategy strategy);

/// Extract shells, assets and submodels from one legacy XML metadata entry.
/// A document that is not well-formed yields an EntryParseFailure error;
/// missing fields become empty values plus a FieldWarning.
[[nodiscard]] Result<ExtractorOutput, Error> ExtractXmlEntry(
    std::string_view content,
    const std::string& entry_name);

} // namespace aasx_kg
