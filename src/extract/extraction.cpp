#include <aasx_kg/extract/extraction.hpp>

#include <aasx_kg/container/container_reader.hpp>
#include <aasx_kg/core/log.hpp>
#include <aasx_kg/extract/entity_normalizer.hpp>
#include <aasx_kg/extract/json_extractor.hpp>
#include <aasx_kg/extract/xml_extractor.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace aasx_kg {

namespace {

constexpr const char* kComponent = "container";

using json = nlohmann::json;

json EntityToJson(const Entity& e) {
    return json{
        {"identity", e.identity},
        {"shortName", e.short_name},
        {"description", e.description},
        {"kind", e.kind},
        {"source", e.source_file},
        {"format", OriginFormatName(e.origin_format)},
        {"elementType", ElementTypeName(e.element_type)},
        {"key", e.key},
    };
}

void AppendEntry(const ContainerReader& reader, const ContainerEntry& entry,
                 ExtractionResult& out) {
    auto contents = reader.ReadEntry(entry);
    if (contents.IsErr()) {
        LogWarn(kComponent, contents.Error().ToString());
        out.diagnostics.push_back(Diagnostic::FromError(contents.Error()));
        return;
    }

    auto extracted = entry.kind == EntryKind::JsonMetadata
        ? ExtractJsonEntry(contents.Value(), entry.name)
        : ExtractXmlEntry(contents.Value(), entry.name);
    if (extracted.IsErr()) {
        LogWarn(kComponent, "Skipping " + entry.name + ": " + extracted.Error().message);
        out.diagnostics.push_back(Diagnostic::FromError(extracted.Error()));
        return;
    }

    auto output = std::move(extracted).Value();
    auto entities = NormalizeRecords(output.records, RecordOrigin{out.source_file, entry.name});
    out.entities.insert(out.entities.end(),
                        std::make_move_iterator(entities.begin()),
                        std::make_move_iterator(entities.end()));
    out.warnings.insert(out.warnings.end(), output.warnings.begin(),
                        output.warnings.end());
}

} // anonymous namespace

std::vector<const Entity*> ExtractionResult::Assets() const {
    std::vector<const Entity*> out;
    for (const auto& e : entities) {
        if (e.element_type != ElementType::Submodel) {
            out.push_back(&e);
        }
    }
    return out;
}

std::vector<const Entity*> ExtractionResult::Submodels() const {
    std::vector<const Entity*> out;
    for (const auto& e : entities) {
        if (e.element_type == ElementType::Submodel) {
            out.push_back(&e);
        }
    }
    return out;
}

std::string UtcTimestampNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

Result<ExtractionResult, Error> ExtractContainer(const std::string& path) {
    auto opened = ContainerReader::Open(path);
    if (opened.IsErr()) {
        return Result<ExtractionResult, Error>::Err(std::move(opened).Error());
    }
    auto reader = std::move(opened).Value();

    ExtractionResult result;
    result.source_file = path;
    result.file_size = reader->FileSize();
    result.processing_timestamp = UtcTimestampNow();

    for (const auto& entry : reader->Entries()) {
        switch (entry.kind) {
            case EntryKind::Ignorable:
                break;
            case EntryKind::Document:
                result.documents.push_back(DocumentRef{
                    EntryBaseName(entry.name), entry.name, entry.size,
                    EntryExtension(entry.name), path});
                break;
            case EntryKind::JsonMetadata:
                result.json_files.push_back(entry.name);
                AppendEntry(*reader, entry, result);
                break;
            case EntryKind::XmlMetadata:
                result.xml_files.push_back(entry.name);
                AppendEntry(*reader, entry, result);
                break;
        }
    }

    LogInfo(kComponent, path + ": " + std::to_string(result.entities.size()) +
                            " entities, " + std::to_string(result.documents.size()) +
                            " documents, " + std::to_string(result.diagnostics.size()) +
                            " failed entries");
    return Result<ExtractionResult, Error>::Ok(std::move(result));
}

std::vector<Result<ExtractionResult, Error>> ExtractContainers(
    const std::vector<std::string>& paths,
    int max_workers) {
    // Result has no default constructor; slots are filled by index.
    std::vector<std::optional<Result<ExtractionResult, Error>>> slots(paths.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < paths.size(); i = next++) {
            slots[i].emplace(ExtractContainer(paths[i]));
        }
    };

    const size_t workers = std::min<size_t>(
        paths.size(), static_cast<size_t>(std::max(1, max_workers)));
    if (workers <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back(worker);
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    std::vector<Result<ExtractionResult, Error>> results;
    results.reserve(paths.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

json ExtractionToJson(const ExtractionResult& result) {
    json assets = json::array();
    json submodels = json::array();
    for (const auto& e : result.entities) {
        (e.element_type == ElementType::Submodel ? submodels : assets)
            .push_back(EntityToJson(e));
    }

    json documents = json::array();
    for (const auto& d : result.documents) {
        documents.push_back({{"filename", d.filename}, {"size", d.size}, {"type", d.type}});
    }

    json diagnostics = json::array();
    for (const auto& d : result.diagnostics) {
        diagnostics.push_back({{"category", CategoryName(d.category)},
                               {"target", d.target},
                               {"message", d.message}});
    }

    json warnings = json::array();
    for (const auto& w : result.warnings) {
        warnings.push_back({{"source", w.entry},
                            {"element", w.element},
                            {"field", w.field},
                            {"message", w.message}});
    }

    return json{
        {"processingMethod", "zip_extraction"},
        {"sourceFile", result.source_file},
        {"fileSizeBytes", result.file_size},
        {"processingTimestamp", result.processing_timestamp},
        {"assets", assets},
        {"submodels", submodels},
        {"documents", documents},
        {"rawData", {{"jsonFiles", result.json_files}, {"xmlFiles", result.xml_files}}},
        {"diagnostics", diagnostics},
        {"warnings", warnings},
    };
}

} // namespace aasx_kg
