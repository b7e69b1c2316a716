#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aasx_kg {

enum class ElementType {
    Shell,
    Asset,
    Submodel,
};

enum class OriginFormat {
    JsonV3,
    XmlV1,
};

/// "shell", "asset", "submodel".
[[nodiscard]] std::string ElementTypeName(ElementType type);

/// Inverse of ElementTypeName; nullopt for unknown names.
[[nodiscard]] std::optional<ElementType> ParseElementType(const std::string& name);

/// "JSON_V3", "XML_V1".
[[nodiscard]] std::string OriginFormatName(OriginFormat format);

// ---------------------------------------------------------------------------
// Entity — canonical record for one shell, asset or submodel.
//
// Immutable after normalization. `description` is the resolved single
// string ("" when unresolvable). `key` is the identity when non-empty,
// otherwise a synthetic key unique within the extraction batch.
// ---------------------------------------------------------------------------
struct Entity {
    std::string identity;
    std::string short_name;
    std::string description;
    std::string kind;
    ElementType element_type = ElementType::Shell;
    std::string source_file;
    std::string entry_name;
    OriginFormat origin_format = OriginFormat::JsonV3;
    std::string key;

    // Shell -> submodel identities, and shell -> asset identity (legacy XML).
    std::vector<std::string> submodel_refs;
    std::optional<std::string> asset_ref;

    // assetInformation.globalAssetId of a JSON shell; "" otherwise.
    std::string global_asset_id;
};

// ---------------------------------------------------------------------------
// DocumentRef — an embedded document found next to the metadata.
// ---------------------------------------------------------------------------
struct DocumentRef {
    std::string filename;
    std::string entry_name;
    uint64_t size = 0;
    std::string type;  // lowercased extension, e.g. ".pdf"
    std::string source_file;
};

} // namespace aasx_kg
