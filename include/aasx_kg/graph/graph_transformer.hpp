#pragma once

#include <aasx_kg/extract/entity.hpp>
#include <aasx_kg/extract/extraction.hpp>
#include <aasx_kg/graph/graph_model.hpp>

#include <string>
#include <vector>

namespace aasx_kg {

enum class QualityLevel {
    High,
    Medium,
    Low,
};

enum class ComplianceStatus {
    Compliant,
    Partial,
    NonCompliant,
};

/// "HIGH", "MEDIUM", "LOW".
[[nodiscard]] std::string QualityLevelName(QualityLevel level);

/// "COMPLIANT", "PARTIAL", "NON_COMPLIANT".
[[nodiscard]] std::string ComplianceStatusName(ComplianceStatus status);

/// HIGH when identity, shortName, description and kind are all non-empty,
/// MEDIUM when at least two are, LOW otherwise.
[[nodiscard]] QualityLevel DeriveQualityLevel(const Entity& entity);

/// COMPLIANT with identity and description, PARTIAL with identity only.
[[nodiscard]] ComplianceStatus DeriveComplianceStatus(const Entity& entity);

/// Node labels for an element type (shell -> Asset, Shell).
[[nodiscard]] std::vector<std::string> LabelsFor(ElementType type);

/// Node id for an embedded document.
[[nodiscard]] std::string DocumentNodeId(const DocumentRef& document);

// ---------------------------------------------------------------------------
// Graph transformation
//
// One node per entity (id = entity key) and per document. The first node for
// an id wins; later ones are counted in duplicate_nodes. Shell submodel
// references become HAS_SUBMODEL edges and asset references DESCRIBES edges,
// but only when the target id is a node of the same batch; the rest are
// counted in dangling_references. Output order follows input order, so the
// same input always yields the same batch.
// ---------------------------------------------------------------------------
[[nodiscard]] GraphBatch TransformToGraph(const std::string& name,
                                          const std::vector<Entity>& entities,
                                          const std::vector<DocumentRef>& documents);

/// Transform one container's extraction; the batch is named after the file stem.
[[nodiscard]] GraphBatch TransformExtraction(const ExtractionResult& result);

/// Transform several extractions into a single batch.
[[nodiscard]] GraphBatch TransformExtractions(const std::string& name,
                                              const std::vector<ExtractionResult>& results);

} // namespace aasx_kg
