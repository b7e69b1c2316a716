#include <aasx_kg/graph/graph_model.hpp>

#include <aasx_kg/core/types.hpp>

#include <fstream>

namespace aasx_kg {

namespace {

using json = nlohmann::json;

Error MakeValidationError(const std::string& target, const std::string& message) {
    return Error{"ValidateGraphBatch", target, std::nullopt, message, std::nullopt,
                 ErrorCategory::ImportValidationFailure};
}

// Property values the store can hold: scalars and arrays of scalars.
bool IsStorableValue(const json& value) {
    if (value.is_primitive()) {
        return true;
    }
    if (!value.is_array()) {
        return false;
    }
    for (const auto& item : value) {
        if (!item.is_primitive() || item.is_null()) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> CheckProperties(const json& item, const std::string& path,
                                           json& out) {
    auto it = item.find("properties");
    if (it == item.end() || it->is_null()) {
        out = json::object();
        return std::nullopt;
    }
    if (!it->is_object()) {
        return path + ".properties: not an object";
    }
    for (const auto& [key, value] : it->items()) {
        if (!IsStorableValue(value)) {
            return path + ".properties." + key + ": nested values are not storable";
        }
    }
    out = *it;
    return std::nullopt;
}

bool IsNonEmptyString(const json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_string() && !it->get<std::string>().empty();
}

} // anonymous namespace

bool IsKnownRelationshipType(const std::string& type) {
    return type == kHasSubmodel || type == kDescribes;
}

json GraphBatchToJson(const GraphBatch& batch) {
    json nodes = json::array();
    for (const auto& n : batch.nodes) {
        nodes.push_back({{"id", n.id}, {"labels", n.labels}, {"properties", n.properties}});
    }
    json edges = json::array();
    for (const auto& e : batch.edges) {
        edges.push_back({{"from", e.from},
                         {"to", e.to},
                         {"type", e.type},
                         {"properties", e.properties}});
    }
    return json{
        {"format", "graph"},
        {"version", "1.0"},
        {"name", batch.name},
        {"nodes", nodes},
        {"edges", edges},
        {"diagnostics",
         {{"danglingReferences", batch.dangling_references},
          {"duplicateNodes", batch.duplicate_nodes}}},
    };
}

Result<GraphBatch, Error> GraphBatchFromJson(const json& doc, const std::string& target) {
    using BatchResult = Result<GraphBatch, Error>;
    auto fail = [&target](const std::string& message) {
        return BatchResult::Err(MakeValidationError(target, message));
    };

    if (!doc.is_object()) {
        return fail("document: not a JSON object");
    }
    if (auto format = doc.find("format"); format != doc.end()) {
        if (!format->is_string() || format->get<std::string>() != "graph") {
            return fail("format: expected \"graph\"");
        }
    }
    auto nodes = doc.find("nodes");
    if (nodes == doc.end() || !nodes->is_array()) {
        return fail("nodes: missing or not an array");
    }
    auto edges = doc.find("edges");
    if (edges == doc.end() || !edges->is_array()) {
        return fail("edges: missing or not an array");
    }

    GraphBatch batch;
    batch.name = doc.value("name", target);

    for (size_t i = 0; i < nodes->size(); ++i) {
        const auto& item = (*nodes)[i];
        const auto path = "nodes[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            return fail(path + ": not an object");
        }
        if (!IsNonEmptyString(item, "id")) {
            return fail(path + ".id: missing or empty");
        }
        auto labels = item.find("labels");
        if (labels == item.end() || !labels->is_array() || labels->empty()) {
            return fail(path + ".labels: missing or empty");
        }

        GraphNode node;
        node.id = item["id"].get<std::string>();
        for (size_t j = 0; j < labels->size(); ++j) {
            const auto& label = (*labels)[j];
            if (!label.is_string() ||
                GraphIdentifier::Create(label.get<std::string>()).IsErr()) {
                return fail(path + ".labels[" + std::to_string(j) + "]: not a valid label");
            }
            node.labels.push_back(label.get<std::string>());
        }
        if (auto problem = CheckProperties(item, path, node.properties)) {
            return fail(*problem);
        }
        batch.nodes.push_back(std::move(node));
    }

    for (size_t i = 0; i < edges->size(); ++i) {
        const auto& item = (*edges)[i];
        const auto path = "edges[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            return fail(path + ": not an object");
        }
        if (!IsNonEmptyString(item, "from")) {
            return fail(path + ".from: missing or empty");
        }
        if (!IsNonEmptyString(item, "to")) {
            return fail(path + ".to: missing or empty");
        }
        if (!item.contains("type") || !item["type"].is_string() ||
            !IsKnownRelationshipType(item["type"].get<std::string>())) {
            return fail(path + ".type: expected HAS_SUBMODEL or DESCRIBES");
        }

        GraphEdge edge;
        edge.from = item["from"].get<std::string>();
        edge.to = item["to"].get<std::string>();
        edge.type = item["type"].get<std::string>();
        if (auto problem = CheckProperties(item, path, edge.properties)) {
            return fail(*problem);
        }
        batch.edges.push_back(std::move(edge));
    }

    if (auto diag = doc.find("diagnostics"); diag != doc.end() && diag->is_object()) {
        batch.dangling_references = diag->value("danglingReferences", size_t{0});
        batch.duplicate_nodes = diag->value("duplicateNodes", size_t{0});
    }
    return BatchResult::Ok(std::move(batch));
}

Result<GraphBatch, Error> LoadGraphBatchFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Result<GraphBatch, Error>::Err(Error{
            "LoadGraphBatch", path, std::nullopt, "Cannot open graph file",
            std::nullopt, ErrorCategory::NotFound});
    }

    json doc;
    try {
        ifs >> doc;
    } catch (const json::parse_error& e) {
        return Result<GraphBatch, Error>::Err(
            MakeValidationError(path, "Malformed JSON: " + std::string(e.what())));
    }
    return GraphBatchFromJson(doc, path);
}

Result<void, Error> SaveGraphBatchFile(const GraphBatch& batch, const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        return Result<void, Error>::Err(Error{
            "SaveGraphBatch", path, std::nullopt, "Failed to open file for writing",
            std::nullopt, ErrorCategory::Internal});
    }
    ofs << GraphBatchToJson(batch).dump(2) << '\n';
    return Result<void, Error>::Ok();
}

} // namespace aasx_kg
