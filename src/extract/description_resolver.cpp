#include <aasx_kg/extract/description_resolver.hpp>

#include <algorithm>
#include <cctype>

namespace aasx_kg {

namespace {

bool IsEnglish(const std::string& lang) {
    return lang.size() == 2 &&
           std::tolower(static_cast<unsigned char>(lang[0])) == 'e' &&
           std::tolower(static_cast<unsigned char>(lang[1])) == 'n';
}

struct Resolver {
    std::string operator()(std::monostate) const { return ""; }

    std::string operator()(const std::string& text) const { return text; }

    std::string operator()(const LangStrings& alternatives) const {
        if (alternatives.empty()) {
            return "";
        }
        auto it = std::find_if(alternatives.begin(), alternatives.end(),
                               [](const auto& entry) { return IsEnglish(entry.first); });
        if (it != alternatives.end()) {
            return it->second;
        }
        return alternatives.front().second;
    }
};

} // anonymous namespace

std::string ResolveDescription(const DescriptionValue& value) {
    return std::visit(Resolver{}, value);
}

} // namespace aasx_kg
