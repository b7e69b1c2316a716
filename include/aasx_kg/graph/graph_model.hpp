#pragma once

#include <aasx_kg/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace aasx_kg {

// Relationship types the transformer emits and the importer accepts.
constexpr const char* kHasSubmodel = "HAS_SUBMODEL";
constexpr const char* kDescribes = "DESCRIBES";

[[nodiscard]] bool IsKnownRelationshipType(const std::string& type);

// Label every imported node carries in addition to its own labels.
constexpr const char* kBaseLabel = "AasElement";

struct GraphNode {
    std::string id;
    std::vector<std::string> labels;
    nlohmann::json properties = nlohmann::json::object();
};

struct GraphEdge {
    std::string from;
    std::string to;
    std::string type;
    nlohmann::json properties = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// GraphBatch — the unit of import: one named set of nodes and edges.
//
// Node ids are unique within a batch; edges are unique by (from, to, type).
// The two counters are transformer diagnostics carried into the batch file.
// ---------------------------------------------------------------------------
struct GraphBatch {
    std::string name;
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
    size_t dangling_references = 0;
    size_t duplicate_nodes = 0;
};

/// Batch file document: {format, version, name, nodes, edges, diagnostics}.
[[nodiscard]] nlohmann::json GraphBatchToJson(const GraphBatch& batch);

/// Validate a parsed batch document and convert it. Any shape violation is an
/// ImportValidationFailure whose message names the first offending path,
/// e.g. "nodes[3].labels[0]: not a valid label".
[[nodiscard]] Result<GraphBatch, Error> GraphBatchFromJson(const nlohmann::json& doc,
                                                           const std::string& target);

/// Read, parse and validate a `*_graph.json` file.
[[nodiscard]] Result<GraphBatch, Error> LoadGraphBatchFile(const std::string& path);

/// Write a batch file (pretty-printed).
[[nodiscard]] Result<void, Error> SaveGraphBatchFile(const GraphBatch& batch,
                                                     const std::string& path);

} // namespace aasx_kg
