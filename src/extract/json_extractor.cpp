#include <aasx_kg/extract/json_extractor.hpp>

#include <aasx_kg/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <set>
#include <utility>

namespace aasx_kg {

namespace {

using json = nlohmann::json;

constexpr const char* kComponent = "extract.json";

class JsonEntryExtractor {
public:
    explicit JsonEntryExtractor(const std::string& entry_name) : entry_name_(entry_name) {}

    ExtractorOutput Run(const json& doc) {
        Walk(doc, "assetAdministrationShells", ElementType::Shell);
        Walk(doc, "submodels", ElementType::Submodel);
        return std::move(output_);
    }

private:
    void Walk(const json& doc, const char* key, ElementType type) {
        auto it = doc.find(key);
        if (it == doc.end()) {
            return;
        }
        if (!it->is_array()) {
            Warn(key, key, "expected an array, found " + std::string(it->type_name()));
            return;
        }

        size_t ordinal = 0;
        for (const auto& element : *it) {
            const size_t position = ordinal++;
            const auto label = ElementTypeName(type) + "[" + std::to_string(position) + "]";
            if (!element.is_object()) {
                Warn(label, "", "element is not an object, skipped");
                continue;
            }

            auto record = BuildRecord(element, type, position, label);
            if (record.id.has_value()) {
                auto seen_key = std::make_pair(static_cast<int>(type), *record.id);
                if (seen_.count(seen_key) > 0) {
                    Warn(label, "id", "duplicate identity '" + *record.id + "' skipped");
                    continue;
                }
                seen_.insert(std::move(seen_key));
            }
            output_.records.emplace_back(std::move(record));
        }
    }

    JsonRawRecord BuildRecord(const json& element, ElementType type, size_t ordinal,
                              const std::string& label) {
        JsonRawRecord record;
        record.element_type = type;
        record.ordinal = ordinal;
        record.id = Identity(element);
        if (!record.id.has_value()) {
            Warn(label, "id", "missing");
        }
        record.id_short = Scalar(element, "idShort");
        if (!record.id_short.has_value()) {
            Warn(label, "idShort", "missing");
        }
        record.kind = Scalar(element, "kind");
        if (!record.kind.has_value() && type == ElementType::Shell) {
            record.kind = Scalar(element, "category");
        }
        record.description = Description(element, label);

        if (type == ElementType::Shell) {
            if (auto info = element.find("assetInformation");
                info != element.end() && info->is_object()) {
                record.global_asset_id = Scalar(*info, "globalAssetId");
            }
            if (auto refs = element.find("submodels");
                refs != element.end() && refs->is_array()) {
                for (const auto& ref : *refs) {
                    if (auto target = ReferenceTarget(ref)) {
                        record.submodel_refs.push_back(std::move(*target));
                    }
                }
            }
        }
        return record;
    }

    // Strings as-is, other scalars via dump(); null and containers count as absent.
    static std::optional<std::string> Scalar(const json& object, const char* key) {
        auto it = object.find(key);
        if (it == object.end() || it->is_null() || it->is_structured()) {
            return std::nullopt;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        return it->dump();
    }

    // Trimmed "id"; blank counts as absent so the record falls back to a
    // synthetic key instead of colliding on the empty string.
    static std::optional<std::string> Identity(const json& element) {
        auto id = Scalar(element, "id");
        if (!id.has_value()) {
            return std::nullopt;
        }
        size_t begin = 0;
        while (begin < id->size() && std::isspace(static_cast<unsigned char>((*id)[begin]))) {
            ++begin;
        }
        size_t end = id->size();
        while (end > begin && std::isspace(static_cast<unsigned char>((*id)[end - 1]))) {
            --end;
        }
        if (begin == end) {
            return std::nullopt;
        }
        return id->substr(begin, end - begin);
    }

    DescriptionValue Description(const json& element, const std::string& label) {
        auto it = element.find("description");
        if (it == element.end() || it->is_null()) {
            return std::monostate{};
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }

        LangStrings alternatives;
        if (it->is_object()) {
            // nlohmann::json orders object keys alphabetically; that order is
            // the "first entry" fallback.
            for (const auto& [lang, text] : it->items()) {
                if (text.is_string()) {
                    alternatives.emplace_back(lang, text.get<std::string>());
                }
            }
        } else if (it->is_array()) {
            for (const auto& entry : *it) {
                if (!entry.is_object()) {
                    continue;
                }
                auto lang = Scalar(entry, "language");
                auto text = Scalar(entry, "text");
                if (text.has_value()) {
                    alternatives.emplace_back(lang.value_or(""), std::move(*text));
                }
            }
        } else {
            Warn(label, "description", "unsupported value type " +
                                           std::string(it->type_name()));
            return std::monostate{};
        }
        return alternatives;
    }

    // Value of the last key typed "Submodel", otherwise the last key.
    static std::optional<std::string> ReferenceTarget(const json& ref) {
        if (!ref.is_object()) {
            return std::nullopt;
        }
        auto keys = ref.find("keys");
        if (keys == ref.end() || !keys->is_array()) {
            return std::nullopt;
        }
        std::optional<std::string> typed;
        std::optional<std::string> last;
        for (const auto& key : *keys) {
            if (!key.is_object()) {
                continue;
            }
            auto value = Scalar(key, "value");
            if (!value.has_value() || value->empty()) {
                continue;
            }
            if (Scalar(key, "type").value_or("") == "Submodel") {
                typed = value;
            }
            last = std::move(value);
        }
        return typed.has_value() ? typed : last;
    }

    void Warn(const std::string& element, const std::string& field,
              const std::string& message) {
        LogDebug(kComponent, entry_name_ + ": " + element + "." + field + " " + message);
        output_.warnings.push_back({entry_name_, element, field, message});
    }

    const std::string& entry_name_;
    ExtractorOutput output_;
    std::set<std::pair<int, std::string>> seen_;
};

} // anonymous namespace

Result<ExtractorOutput, Error> ExtractJsonEntry(std::string_view content,
                                                const std::string& entry_name) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        return Result<ExtractorOutput, Error>::Err(Error{
            "ExtractJsonEntry", entry_name, std::nullopt,
            std::string("JSON is not valid: ") + e.what(), std::nullopt,
            ErrorCategory::EntryParseFailure});
    }
    if (!doc.is_object()) {
        return Result<ExtractorOutput, Error>::Err(Error{
            "ExtractJsonEntry", entry_name, std::nullopt,
            "Top-level JSON value is not an object", std::nullopt,
            ErrorCategory::EntryParseFailure});
    }

    auto output = JsonEntryExtractor(entry_name).Run(doc);
    LogInfo(kComponent, entry_name + ": " + std::to_string(output.records.size()) +
                            " records, " + std::to_string(output.warnings.size()) +
                            " field warnings");
    return Result<ExtractorOutput, Error>::Ok(std::move(output));
}

} // namespace aasx_kg
