#include <aasx_kg/graph/graph_transformer.hpp>

#include <aasx_kg/core/log.hpp>

#include <filesystem>
#include <initializer_list>
#include <set>
#include <tuple>

namespace aasx_kg {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "graph";

json EntityProperties(const Entity& e) {
    json props = {
        {"id", e.key},
        {"identity", e.identity},
        {"shortName", e.short_name},
        {"description", e.description},
        {"kind", e.kind},
        {"elementType", ElementTypeName(e.element_type)},
        {"sourceFile", e.source_file},
        {"entryName", e.entry_name},
        {"originFormat", OriginFormatName(e.origin_format)},
        {"qualityLevel", QualityLevelName(DeriveQualityLevel(e))},
        {"complianceStatus", ComplianceStatusName(DeriveComplianceStatus(e))},
    };
    if (!e.global_asset_id.empty()) {
        props["globalAssetId"] = e.global_asset_id;
    }
    return props;
}

class BatchBuilder {
public:
    explicit BatchBuilder(std::string name) { batch_.name = std::move(name); }

    void AddNode(GraphNode node) {
        if (node_ids_.count(node.id) > 0) {
            ++batch_.duplicate_nodes;
            LogDebug(kComponent, "Duplicate node " + node.id + " ignored");
            return;
        }
        node_ids_.insert(node.id);
        batch_.nodes.push_back(std::move(node));
    }

    bool HasNode(const std::string& id) const { return node_ids_.count(id) > 0; }

    void AddEdgeIfResolved(const std::string& from, const std::string& to,
                           const char* type, json properties) {
        if (!HasNode(to)) {
            ++batch_.dangling_references;
            LogDebug(kComponent, std::string(type) + " " + from + " -> " + to +
                                     ": target not in batch");
            return;
        }
        auto key = std::make_tuple(from, to, std::string(type));
        if (edge_keys_.count(key) > 0) {
            return;
        }
        edge_keys_.insert(std::move(key));
        batch_.edges.push_back(GraphEdge{from, to, type, std::move(properties)});
    }

    GraphBatch Finish() {
        LogInfo(kComponent, batch_.name + ": " + std::to_string(batch_.nodes.size()) +
                                " nodes, " + std::to_string(batch_.edges.size()) +
                                " edges, " + std::to_string(batch_.dangling_references) +
                                " dangling references");
        return std::move(batch_);
    }

private:
    GraphBatch batch_;
    std::set<std::string> node_ids_;
    std::set<std::tuple<std::string, std::string, std::string>> edge_keys_;
};

size_t CountPresent(const Entity& e) {
    size_t n = 0;
    for (const auto* field : {&e.identity, &e.short_name, &e.description, &e.kind}) {
        if (!field->empty()) {
            ++n;
        }
    }
    return n;
}

std::string FileStem(const std::string& path) {
    return std::filesystem::path(path).stem().string();
}

} // anonymous namespace

std::string QualityLevelName(QualityLevel level) {
    switch (level) {
        case QualityLevel::High:   return "HIGH";
        case QualityLevel::Medium: return "MEDIUM";
        case QualityLevel::Low:    return "LOW";
    }
    return "LOW";
}

std::string ComplianceStatusName(ComplianceStatus status) {
    switch (status) {
        case ComplianceStatus::Compliant:    return "COMPLIANT";
        case ComplianceStatus::Partial:      return "PARTIAL";
        case ComplianceStatus::NonCompliant: return "NON_COMPLIANT";
    }
    return "NON_COMPLIANT";
}

QualityLevel DeriveQualityLevel(const Entity& entity) {
    const auto present = CountPresent(entity);
    if (present == 4) {
        return QualityLevel::High;
    }
    return present >= 2 ? QualityLevel::Medium : QualityLevel::Low;
}

ComplianceStatus DeriveComplianceStatus(const Entity& entity) {
    if (entity.identity.empty()) {
        return ComplianceStatus::NonCompliant;
    }
    return entity.description.empty() ? ComplianceStatus::Partial
                                      : ComplianceStatus::Compliant;
}

std::vector<std::string> LabelsFor(ElementType type) {
    switch (type) {
        case ElementType::Shell:    return {"Asset", "Shell"};
        case ElementType::Asset:    return {"Asset"};
        case ElementType::Submodel: return {"Submodel"};
    }
    return {"Asset"};
}

std::string DocumentNodeId(const DocumentRef& document) {
    return "doc:" + document.source_file + "#" + document.entry_name;
}

GraphBatch TransformToGraph(const std::string& name,
                            const std::vector<Entity>& entities,
                            const std::vector<DocumentRef>& documents) {
    BatchBuilder builder(name);

    // Nodes first so that edge resolution sees the whole batch.
    for (const auto& e : entities) {
        builder.AddNode(GraphNode{e.key, LabelsFor(e.element_type), EntityProperties(e)});
    }
    for (const auto& d : documents) {
        const auto id = DocumentNodeId(d);
        builder.AddNode(GraphNode{id, {"Document"}, json{
            {"id", id},
            {"filename", d.filename},
            {"entryName", d.entry_name},
            {"size", d.size},
            {"type", d.type},
            {"sourceFile", d.source_file},
        }});
    }

    for (const auto& e : entities) {
        if (e.element_type != ElementType::Shell) {
            continue;
        }
        for (const auto& ref : e.submodel_refs) {
            builder.AddEdgeIfResolved(e.key, ref, kHasSubmodel,
                                      json{{"sourceFile", e.source_file}});
        }
        if (e.asset_ref.has_value() && !e.asset_ref->empty()) {
            builder.AddEdgeIfResolved(e.key, *e.asset_ref, kDescribes,
                                      json{{"sourceFile", e.source_file}});
        }
    }
    return builder.Finish();
}

GraphBatch TransformExtraction(const ExtractionResult& result) {
    return TransformToGraph(FileStem(result.source_file), result.entities,
                            result.documents);
}

GraphBatch TransformExtractions(const std::string& name,
                                const std::vector<ExtractionResult>& results) {
    std::vector<Entity> entities;
    std::vector<DocumentRef> documents;
    for (const auto& r : results) {
        entities.insert(entities.end(), r.entities.begin(), r.entities.end());
        documents.insert(documents.end(), r.documents.begin(), r.documents.end());
    }
    return TransformToGraph(name, entities, documents);
}

} // namespace aasx_kg
