#pragma once

#include <aasx_kg/core/result.hpp>

#include <tinyxml2.h>

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace aasx_kg::xml_utils {

inline bool IEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        const auto lc = static_cast<unsigned char>(lhs[i]);
        const auto rc = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

inline std::string Trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return std::string(s.substr(begin, end - begin));
}

// "aas:idShort" -> {"aas", "idShort"}; "idShort" -> {"", "idShort"}.
inline std::pair<std::string_view, std::string_view> SplitQName(std::string_view qname) {
    auto colon = qname.find(':');
    if (colon == std::string_view::npos) {
        return {std::string_view{}, qname};
    }
    return {qname.substr(0, colon), qname.substr(colon + 1)};
}

inline std::string_view LocalName(const tinyxml2::XMLElement* element) {
    if (!element || !element->Name()) {
        return {};
    }
    return SplitQName(element->Name()).second;
}

inline std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element || !name) {
        return {};
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

// Trimmed text content of the element's first text child.
inline std::string Text(const tinyxml2::XMLElement* element) {
    if (!element || !element->GetText()) {
        return {};
    }
    return Trim(element->GetText());
}

inline std::optional<Error> ParseXmlOrError(tinyxml2::XMLDocument& doc,
                                            std::string_view xml,
                                            std::string_view operation,
                                            std::string_view target) {
    if (doc.Parse(xml.data(), xml.size()) == tinyxml2::XML_SUCCESS) {
        return std::nullopt;
    }

    std::string message = "XML is not well-formed";
    if (const char* err = doc.ErrorStr(); err != nullptr && *err != '\0') {
        message += ": ";
        message += err;
    }
    const int line = doc.ErrorLineNum();
    if (line > 0) {
        message += " (line " + std::to_string(line) + ")";
    }

    return Error{
        std::string(operation),
        std::string(target),
        std::nullopt,
        std::move(message),
        std::nullopt,
        ErrorCategory::EntryParseFailure};
}

} // namespace aasx_kg::xml_utils
