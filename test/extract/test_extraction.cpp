#include <catch2/catch_test_macros.hpp>

#include "../helpers/test_data.hpp"
#include "../helpers/zip_fixture.hpp"
#include <aasx_kg/extract/extraction.hpp>

#include <algorithm>
#include <regex>

using namespace aasx_kg;
using namespace aasx_kg::testing;

namespace {

// motor_v3.json (3 records), motor_v2.aas.xml (3 records after the
// duplicate), one broken JSON entry, two documents and packaging noise.
std::string WriteMotorContainer(const TempDir& dir) {
    auto path = dir.File("motor.aasx");
    WriteZip(path, {
        {"[Content_Types].xml", "<Types/>"},
        {"_rels/.rels", "<Relationships/>"},
        {"aasx/", ""},
        {"aasx/data.json", LoadTestData("motor_v3.json")},
        {"aasx/motor/motor.aas.xml", LoadTestData("motor_v2.aas.xml")},
        {"aasx/broken.json", "{\"submodels\": ["},
        {"aasx/aasx-origin", ""},
        {"aasx/docs/Manual.PDF", "%PDF-1.4"},
        {"aasx/docs/readme.txt", "hello"},
    });
    return path;
}

const Entity* FindByKey(const ExtractionResult& result, const std::string& key) {
    auto it = std::find_if(result.entities.begin(), result.entities.end(),
                           [&](const Entity& e) { return e.key == key; });
    return it == result.entities.end() ? nullptr : &*it;
}

} // namespace

// ===========================================================================
// ExtractContainer
// ===========================================================================

TEST_CASE("ExtractContainer: entities from JSON and XML entries", "[extract][container]") {
    TempDir dir;
    auto path = WriteMotorContainer(dir);

    auto result = ExtractContainer(path);
    REQUIRE(result.IsOk());
    const auto& extraction = result.Value();

    CHECK(extraction.source_file == path);
    CHECK(extraction.file_size > 0);
    REQUIRE(extraction.entities.size() == 6);

    // Archive order: the JSON entry precedes the XML entry.
    CHECK(extraction.entities[0].key == "urn:ex:1");
    CHECK(extraction.entities[0].origin_format == OriginFormat::JsonV3);
    CHECK(extraction.entities[3].key == "urn:xml:shell:7");
    CHECK(extraction.entities[3].origin_format == OriginFormat::XmlV1);

    CHECK(extraction.Assets().size() == 3);
    CHECK(extraction.Submodels().size() == 3);

    REQUIRE(extraction.json_files.size() == 2);
    CHECK(extraction.json_files[0] == "aasx/data.json");
    REQUIRE(extraction.xml_files.size() == 1);
    CHECK(extraction.xml_files[0] == "aasx/motor/motor.aas.xml");
}

TEST_CASE("ExtractContainer: malformed entry becomes a diagnostic", "[extract][container]") {
    TempDir dir;
    auto result = ExtractContainer(WriteMotorContainer(dir));
    REQUIRE(result.IsOk());
    const auto& diagnostics = result.Value().diagnostics;
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].category == ErrorCategory::EntryParseFailure);
    CHECK(diagnostics[0].target == "aasx/broken.json");
}

TEST_CASE("ExtractContainer: malformed XML entry does not stop valid entries",
          "[extract][container]") {
    TempDir dir;
    auto path = dir.File("mixed.aasx");
    WriteZip(path, {
        {"aasx/data.json", LoadTestData("motor_v3.json")},
        {"aasx/broken/broken.aas.xml", "<aas:aasenv><aas:assetAdministrationShells>"},
        {"aasx/motor/motor.aas.xml", LoadTestData("motor_v2.aas.xml")},
    });

    auto result = ExtractContainer(path);
    REQUIRE(result.IsOk());
    CHECK(result.Value().entities.size() == 6);
    CHECK(result.Value().Assets().size() == 3);
    CHECK(result.Value().Submodels().size() == 3);

    const auto& diagnostics = result.Value().diagnostics;
    REQUIRE(diagnostics.size() == 1);
    CHECK(diagnostics[0].category == ErrorCategory::EntryParseFailure);
    CHECK(diagnostics[0].target == "aasx/broken/broken.aas.xml");
}

TEST_CASE("ExtractContainer: documents are listed with type and size", "[extract][container]") {
    TempDir dir;
    auto result = ExtractContainer(WriteMotorContainer(dir));
    REQUIRE(result.IsOk());
    const auto& documents = result.Value().documents;
    REQUIRE(documents.size() == 2);
    CHECK(documents[0].filename == "Manual.PDF");
    CHECK(documents[0].entry_name == "aasx/docs/Manual.PDF");
    CHECK(documents[0].type == ".pdf");
    CHECK(documents[0].size == 8);
    CHECK(documents[1].type == ".txt");
}

TEST_CASE("ExtractContainer: entity without identity gets a synthetic key", "[extract][container]") {
    TempDir dir;
    auto path = WriteMotorContainer(dir);
    auto result = ExtractContainer(path);
    REQUIRE(result.IsOk());
    const auto* nameplate =
        FindByKey(result.Value(), "synthetic:" + path + "#aasx/data.json#submodel#Nameplate#1");
    REQUIRE(nameplate != nullptr);
    CHECK(nameplate->short_name == "Nameplate");
    CHECK(nameplate->kind == "Template");
}

TEST_CASE("ExtractContainer: field warnings are collected", "[extract][container]") {
    TempDir dir;
    auto result = ExtractContainer(WriteMotorContainer(dir));
    REQUIRE(result.IsOk());
    // Missing id in the JSON entry, duplicate submodel in the XML entry.
    CHECK(result.Value().warnings.size() == 2);
}

TEST_CASE("ExtractContainer: archive without metadata", "[extract][container]") {
    TempDir dir;
    auto path = dir.File("docs_only.aasx");
    WriteZip(path, {{"manual.pdf", "%PDF"}});
    auto result = ExtractContainer(path);
    REQUIRE(result.IsOk());
    CHECK(result.Value().entities.empty());
    CHECK(result.Value().documents.size() == 1);
}

TEST_CASE("ExtractContainer: missing file is NotFound", "[extract][container]") {
    auto result = ExtractContainer("/nonexistent/aasx_kg/none.aasx");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("ExtractContainer: non-ZIP file is InvalidContainerFormat", "[extract][container]") {
    TempDir dir;
    auto path = dir.File("fake.aasx");
    WriteTextFile(path, "this is not a zip archive");
    auto result = ExtractContainer(path);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::InvalidContainerFormat);
}

// ===========================================================================
// ExtractContainers
// ===========================================================================

TEST_CASE("ExtractContainers: results keep input order", "[extract][container]") {
    TempDir dir;
    auto good = WriteMotorContainer(dir);
    auto other = dir.File("other.aasx");
    WriteZip(other, {{"aasx/data.json", R"({"submodels":[{"id":"urn:o","idShort":"O"}]})"}});
    const std::vector<std::string> paths = {good, dir.File("missing.aasx"), other, good};

    auto results = ExtractContainers(paths, 3);
    REQUIRE(results.size() == 4);
    REQUIRE(results[0].IsOk());
    CHECK(results[0].Value().entities.size() == 6);
    REQUIRE(results[1].IsErr());
    CHECK(results[1].Error().category == ErrorCategory::NotFound);
    REQUIRE(results[2].IsOk());
    REQUIRE(results[2].Value().entities.size() == 1);
    CHECK(results[2].Value().entities[0].key == "urn:o");
    REQUIRE(results[3].IsOk());
    CHECK(results[3].Value().source_file == good);
}

TEST_CASE("ExtractContainers: zero workers runs inline", "[extract][container]") {
    TempDir dir;
    auto path = WriteMotorContainer(dir);
    auto results = ExtractContainers({path}, 0);
    REQUIRE(results.size() == 1);
    CHECK(results[0].IsOk());
}

TEST_CASE("ExtractContainers: empty input", "[extract][container]") {
    CHECK(ExtractContainers({}, 4).empty());
}

// ===========================================================================
// Output document
// ===========================================================================

TEST_CASE("ExtractionToJson: document layout", "[extract][container]") {
    TempDir dir;
    auto result = ExtractContainer(WriteMotorContainer(dir));
    REQUIRE(result.IsOk());
    auto doc = ExtractionToJson(result.Value());

    CHECK(doc["processingMethod"] == "zip_extraction");
    CHECK(doc["assets"].size() == 3);
    CHECK(doc["submodels"].size() == 3);
    CHECK(doc["documents"].size() == 2);
    CHECK(doc["rawData"]["jsonFiles"].size() == 2);
    CHECK(doc["rawData"]["xmlFiles"].size() == 1);
    CHECK(doc["diagnostics"][0]["category"] == "entry_parse_failure");

    const auto& motor = doc["assets"][0];
    CHECK(motor["identity"] == "urn:ex:1");
    CHECK(motor["shortName"] == "Motor1");
    CHECK(motor["description"] == "Electric motor");
    CHECK(motor["format"] == "JSON_V3");
    CHECK(motor["elementType"] == "shell");
}

TEST_CASE("UtcTimestampNow: ISO-8601 with Z suffix", "[extract][container]") {
    static const std::regex kPattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    CHECK(std::regex_match(UtcTimestampNow(), kPattern));
}
