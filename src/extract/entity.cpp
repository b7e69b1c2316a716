#include <aasx_kg/extract/entity.hpp>

namespace aasx_kg {

std::string ElementTypeName(ElementType type) {
    switch (type) {
        case ElementType::Shell:    return "shell";
        case ElementType::Asset:    return "asset";
        case ElementType::Submodel: return "submodel";
    }
    return "shell";
}

std::optional<ElementType> ParseElementType(const std::string& name) {
    if (name == "shell") return ElementType::Shell;
    if (name == "asset") return ElementType::Asset;
    if (name == "submodel") return ElementType::Submodel;
    return std::nullopt;
}

std::string OriginFormatName(OriginFormat format) {
    switch (format) {
        case OriginFormat::JsonV3: return "JSON_V3";
        case OriginFormat::XmlV1:  return "XML_V1";
    }
    return "JSON_V3";
}

} // namespace aasx_kg
