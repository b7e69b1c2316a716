#pragma once

#include <aasx_kg/extract/description_resolver.hpp>
#include <aasx_kg/extract/entity.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aasx_kg {

// ---------------------------------------------------------------------------
// JsonRawRecord — one shell or submodel from the JSON (v3) schema, as read.
// Absent keys stay nullopt; the normalizer turns them into "".
// ---------------------------------------------------------------------------
struct JsonRawRecord {
    ElementType element_type = ElementType::Shell;
    size_t ordinal = 0;  // position among records of the same type in the entry
    std::optional<std::string> id;
    std::optional<std::string> id_short;
    std::optional<std::string> kind;
    DescriptionValue description;
    std::optional<std::string> global_asset_id;
    std::vector<std::string> submodel_refs;
};

// ---------------------------------------------------------------------------
// XmlRawRecord — one shell, asset or submodel from the legacy XML schema.
// ---------------------------------------------------------------------------
struct XmlRawRecord {
    ElementType element_type = ElementType::Shell;
    size_t ordinal = 0;
    std::optional<std::string> identification;
    std::optional<std::string> id_short;
    std::optional<std::string> kind;
    DescriptionValue description;
    std::vector<std::string> submodel_refs;
    std::optional<std::string> asset_ref;
};

using RawRecord = std::variant<JsonRawRecord, XmlRawRecord>;

// ---------------------------------------------------------------------------
// FieldWarning — a field that could not be read; extraction carries on with
// an empty value.
// ---------------------------------------------------------------------------
struct FieldWarning {
    std::string entry;    // entry name inside the container
    std::string element;  // e.g. "submodel[2]"
    std::string field;    // e.g. "idShort"
    std::string message;
};

struct ExtractorOutput {
    std::vector<RawRecord> records;
    std::vector<FieldWarning> warnings;
};

} // namespace aasx_kg
