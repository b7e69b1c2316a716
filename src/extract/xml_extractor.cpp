#include <aasx_kg/extract/xml_extractor.hpp>

#include "xml_utils.hpp"
#include <aasx_kg/core/log.hpp>

#include <tinyxml2.h>

#include <initializer_list>
#include <set>
#include <utility>

namespace aasx_kg {

namespace {

using tinyxml2::XMLElement;
using xml_utils::Attr;
using xml_utils::IEquals;
using xml_utils::LocalName;
using xml_utils::SplitQName;
using xml_utils::Text;

constexpr const char* kComponent = "extract.xml";

bool IsAasNamespace(const std::string& uri) {
    return uri == kAasNamespaceV1 || uri == kAasNamespaceV2 || uri == kAasNamespaceV3;
}

// tinyxml2 does not track namespaces, so prefixes are resolved by walking
// the ancestor chain for the nearest xmlns / xmlns:<prefix> declaration.
std::string ResolveNamespace(const XMLElement* element, std::string_view prefix) {
    const std::string attr = prefix.empty()
        ? std::string("xmlns")
        : "xmlns:" + std::string(prefix);
    for (const tinyxml2::XMLNode* node = element; node != nullptr; node = node->Parent()) {
        const XMLElement* e = node->ToElement();
        if (e == nullptr) {
            break;
        }
        if (const char* uri = e->Attribute(attr.c_str())) {
            return uri;
        }
    }
    return "";
}

bool Matches(const XMLElement* element, std::string_view local, LookupStrategy strategy) {
    auto [prefix, name] = SplitQName(element->Name());
    if (name != local) {
        return false;
    }
    switch (strategy) {
        case LookupStrategy::QualifiedAas:
            return IsAasNamespace(ResolveNamespace(element, prefix));
        case LookupStrategy::QualifiedMeasurementUnit:
            return ResolveNamespace(element, prefix) == kMeasurementUnitNamespace;
        case LookupStrategy::Unqualified:
            return true;
    }
    return false;
}

// xsi:nil="true" under whatever prefix is bound to the XML-instance namespace.
bool IsNil(const XMLElement* element) {
    for (const tinyxml2::XMLAttribute* a = element->FirstAttribute(); a != nullptr;
         a = a->Next()) {
        auto [prefix, name] = SplitQName(a->Name());
        if (name == "nil" && !prefix.empty() &&
            ResolveNamespace(element, prefix) == kXsiNamespace) {
            return IEquals(a->Value(), "true");
        }
    }
    return false;
}

// First direct child with the given local name, trying each strategy in
// kFieldLookupOrder over all children before moving to the next.
const XMLElement* FindChild(const XMLElement* parent, std::string_view local) {
    if (parent == nullptr) {
        return nullptr;
    }
    for (auto strategy : kFieldLookupOrder) {
        for (const XMLElement* child = parent->FirstChildElement(); child != nullptr;
             child = child->NextSiblingElement()) {
            if (Matches(child, local, strategy) && !IsNil(child)) {
                return child;
            }
        }
    }
    return nullptr;
}

std::vector<const XMLElement*> ChildrenNamed(const XMLElement* parent,
                                             std::string_view local) {
    std::vector<const XMLElement*> out;
    if (parent == nullptr) {
        return out;
    }
    for (const XMLElement* child = parent->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (LocalName(child) == local && !IsNil(child)) {
            out.push_back(child);
        }
    }
    return out;
}

// "type" as attribute (v1/v2) or child element (v3); same for the value.
std::pair<std::string, std::string> ReadKey(const XMLElement* key) {
    std::string type = Attr(key, "type");
    if (type.empty()) {
        type = Text(FindChild(key, "type"));
    }
    std::string value = Text(FindChild(key, "value"));
    if (value.empty()) {
        value = Text(key);
    }
    return {type, value};
}

// Target of a reference: the last key typed as `wanted`, otherwise the
// last key with a value.
std::optional<std::string> ReadReferenceTarget(const XMLElement* reference,
                                               std::string_view wanted) {
    const XMLElement* keys = FindChild(reference, "keys");
    std::optional<std::string> typed;
    std::optional<std::string> last;
    for (const XMLElement* key : ChildrenNamed(keys, "key")) {
        auto [type, value] = ReadKey(key);
        if (value.empty()) {
            continue;
        }
        if (IEquals(type, wanted)) {
            typed = value;
        }
        last = value;
    }
    return typed.has_value() ? typed : last;
}

class XmlEntryExtractor {
public:
    explicit XmlEntryExtractor(const std::string& entry_name) : entry_name_(entry_name) {}

    ExtractorOutput Run(const XMLElement* root) {
        Walk(root);
        return std::move(output_);
    }

private:
    void Walk(const XMLElement* element) {
        for (const XMLElement* e = element; e != nullptr; e = e->NextSiblingElement()) {
            Visit(e);
            Walk(e->FirstChildElement());
        }
    }

    void Visit(const XMLElement* element) {
        const auto local = LocalName(element);
        std::optional<ElementType> type;
        if (local == "assetAdministrationShell") {
            type = ElementType::Shell;
        } else if (local == "asset") {
            type = ElementType::Asset;
        } else if (local == "submodel") {
            type = ElementType::Submodel;
        }
        if (!type.has_value() || IsNil(element)) {
            return;
        }
        if (!Matches(element, local, LookupStrategy::QualifiedAas)) {
            LogDebug(kComponent, entry_name_ + ": <" + element->Name() +
                                     "> matched by unqualified fallback");
        }

        const size_t ordinal = ordinals_[static_cast<int>(*type)]++;
        auto record = BuildRecord(element, *type, ordinal);

        if (record.identification.has_value()) {
            auto key = std::make_pair(static_cast<int>(*type), *record.identification);
            if (seen_.count(key) > 0) {
                Warn(Label(*type, ordinal), "identification",
                     "duplicate identity '" + *record.identification + "' skipped");
                return;
            }
            seen_.insert(std::move(key));
        }
        output_.records.emplace_back(std::move(record));
    }

    XmlRawRecord BuildRecord(const XMLElement* element, ElementType type, size_t ordinal) {
        const auto label = Label(type, ordinal);
        XmlRawRecord record;
        record.element_type = type;
        record.ordinal = ordinal;
        record.identification = Field(element, {"identification", "id"}, label, true);
        record.id_short = Field(element, {"idShort"}, label, true);
        if (type == ElementType::Shell) {
            record.kind = Field(element, {"category", "kind"}, label, false);
        } else {
            record.kind = Field(element, {"kind"}, label, false);
        }
        record.description = Description(element);

        if (type == ElementType::Shell) {
            for (const XMLElement* ref : ChildrenNamed(FindChild(element, "submodelRefs"),
                                                       "submodelRef")) {
                if (auto target = ReadReferenceTarget(ref, "Submodel")) {
                    record.submodel_refs.push_back(*target);
                }
            }
            for (const XMLElement* ref : ChildrenNamed(FindChild(element, "submodels"),
                                                       "reference")) {
                if (auto target = ReadReferenceTarget(ref, "Submodel")) {
                    record.submodel_refs.push_back(*target);
                }
            }
            if (const XMLElement* asset_ref = FindChild(element, "assetRef")) {
                record.asset_ref = ReadReferenceTarget(asset_ref, "Asset");
            }
        }
        return record;
    }

    // Names are tried in order; within a name, strategies in
    // kFieldLookupOrder. Empty and nil elements do not count as found.
    std::optional<std::string> Field(const XMLElement* element,
                                     std::initializer_list<const char*> names,
                                     const std::string& label,
                                     bool warn_if_missing) {
        for (const char* name : names) {
            for (auto strategy : kFieldLookupOrder) {
                for (const XMLElement* child = element->FirstChildElement();
                     child != nullptr; child = child->NextSiblingElement()) {
                    if (!Matches(child, name, strategy) || IsNil(child)) {
                        continue;
                    }
                    auto text = Text(child);
                    if (text.empty()) {
                        continue;
                    }
                    if (strategy != LookupStrategy::QualifiedAas) {
                        LogDebug(kComponent, entry_name_ + ": " + label + "." + name +
                                                 " resolved via " +
                                                 LookupStrategyName(strategy));
                    }
                    return text;
                }
            }
        }
        if (warn_if_missing) {
            Warn(label, *names.begin(), "not found under any lookup strategy");
        }
        return std::nullopt;
    }

    DescriptionValue Description(const XMLElement* element) {
        const XMLElement* description = FindChild(element, "description");
        if (description == nullptr) {
            return std::monostate{};
        }

        LangStrings alternatives;
        for (const XMLElement* ls : ChildrenNamed(description, "langString")) {
            std::string lang = Attr(ls, "lang");
            if (lang.empty()) {
                lang = Attr(ls, "xml:lang");
            }
            alternatives.emplace_back(lang, Text(ls));
        }
        for (const XMLElement* ls : ChildrenNamed(description, "langStringTextType")) {
            alternatives.emplace_back(Text(FindChild(ls, "language")),
                                      Text(FindChild(ls, "text")));
        }
        if (!alternatives.empty()) {
            return alternatives;
        }

        auto text = Text(description);
        if (!text.empty()) {
            return text;
        }
        return std::monostate{};
    }

    void Warn(const std::string& element, const std::string& field,
              const std::string& message) {
        LogDebug(kComponent, entry_name_ + ": " + element + "." + field + " " + message);
        output_.warnings.push_back({entry_name_, element, field, message});
    }

    static std::string Label(ElementType type, size_t ordinal) {
        return ElementTypeName(type) + "[" + std::to_string(ordinal) + "]";
    }

    const std::string& entry_name_;
    ExtractorOutput output_;
    size_t ordinals_[3] = {0, 0, 0};
    std::set<std::pair<int, std::string>> seen_;
};

} // anonymous namespace

std::string LookupStrategyName(LookupStrategy strategy) {
    switch (strategy) {
        case LookupStrategy::QualifiedAas:             return "qualified(aas)";
        case LookupStrategy::QualifiedMeasurementUnit: return "qualified(IEC61360)";
        case LookupStrategy::Unqualified:              return "unqualified";
    }
    return "unqualified";
}

Result<ExtractorOutput, Error> ExtractXmlEntry(std::string_view content,
                                               const std::string& entry_name) {
    tinyxml2::XMLDocument doc;
    if (auto error = xml_utils::ParseXmlOrError(doc, content, "ExtractXmlEntry",
                                                entry_name)) {
        return Result<ExtractorOutput, Error>::Err(std::move(*error));
    }
    const XMLElement* root = doc.RootElement();
    if (root == nullptr) {
        return Result<ExtractorOutput, Error>::Err(Error{
            "ExtractXmlEntry", entry_name, std::nullopt,
            "XML document has no root element", std::nullopt,
            ErrorCategory::EntryParseFailure});
    }

    auto output = XmlEntryExtractor(entry_name).Run(root);
    LogInfo(kComponent, entry_name + ": " + std::to_string(output.records.size()) +
                            " records, " + std::to_string(output.warnings.size()) +
                            " field warnings");
    return Result<ExtractorOutput, Error>::Ok(std::move(output));
}

} // namespace aasx_kg
