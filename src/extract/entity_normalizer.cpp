#include <aasx_kg/extract/entity_normalizer.hpp>

#include <aasx_kg/core/log.hpp>
#include <aasx_kg/extract/description_resolver.hpp>

#include <cctype>
#include <variant>

namespace aasx_kg {

namespace {

std::string TrimCopy(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

void FinishEntity(Entity& entity, size_t ordinal, const RecordOrigin& origin) {
    entity.source_file = origin.source_file;
    entity.entry_name = origin.entry_name;
    entity.identity = TrimCopy(entity.identity);
    if (!entity.identity.empty()) {
        entity.key = entity.identity;
        return;
    }
    entity.key = SyntheticKey(origin, entity.short_name, entity.element_type, ordinal);
    LogDebug("normalize", "No identity for " + ElementTypeName(entity.element_type) +
                              " in " + origin.entry_name + ", using " + entity.key);
}

struct Normalizer {
    const RecordOrigin& origin;

    Entity operator()(const JsonRawRecord& r) const {
        Entity e;
        e.identity = r.id.value_or("");
        e.short_name = r.id_short.value_or("");
        e.description = ResolveDescription(r.description);
        e.kind = r.kind.value_or("");
        e.element_type = r.element_type;
        e.origin_format = OriginFormat::JsonV3;
        e.submodel_refs = r.submodel_refs;
        e.global_asset_id = r.global_asset_id.value_or("");
        FinishEntity(e, r.ordinal, origin);
        return e;
    }

    Entity operator()(const XmlRawRecord& r) const {
        Entity e;
        e.identity = r.identification.value_or("");
        e.short_name = r.id_short.value_or("");
        e.description = ResolveDescription(r.description);
        e.kind = r.kind.value_or("");
        e.element_type = r.element_type;
        e.origin_format = OriginFormat::XmlV1;
        e.submodel_refs = r.submodel_refs;
        e.asset_ref = r.asset_ref;
        FinishEntity(e, r.ordinal, origin);
        return e;
    }
};

} // anonymous namespace

std::string SyntheticKey(const RecordOrigin& origin,
                         const std::string& short_name,
                         ElementType type,
                         size_t ordinal) {
    return "synthetic:" + origin.source_file + "#" + origin.entry_name + "#" +
           ElementTypeName(type) + "#" + short_name + "#" + std::to_string(ordinal);
}

Entity NormalizeRecord(const RawRecord& record, const RecordOrigin& origin) {
    return std::visit(Normalizer{origin}, record);
}

std::vector<Entity> NormalizeRecords(const std::vector<RawRecord>& records,
                                     const RecordOrigin& origin) {
    std::vector<Entity> entities;
    entities.reserve(records.size());
    for (const auto& record : records) {
        entities.push_back(NormalizeRecord(record, origin));
    }
    return entities;
}

} // namespace aasx_kg
