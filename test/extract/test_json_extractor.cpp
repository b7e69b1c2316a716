#include <catch2/catch_test_macros.hpp>

#include "../helpers/test_data.hpp"
#include <aasx_kg/extract/description_resolver.hpp>
#include <aasx_kg/extract/json_extractor.hpp>

#include <string>
#include <variant>

using namespace aasx_kg;
using namespace aasx_kg::testing;

namespace {

const JsonRawRecord& AsJson(const RawRecord& record) {
    return std::get<JsonRawRecord>(record);
}

} // namespace

// ===========================================================================
// Well-formed documents
// ===========================================================================

TEST_CASE("ExtractJsonEntry: shells and submodels from the v3 schema", "[extract][json]") {
    auto result = ExtractJsonEntry(LoadTestData("motor_v3.json"), "aasx/data.json");
    REQUIRE(result.IsOk());
    const auto& records = result.Value().records;
    REQUIRE(records.size() == 3);

    const auto& shell = AsJson(records[0]);
    CHECK(shell.element_type == ElementType::Shell);
    CHECK(shell.ordinal == 0);
    CHECK(shell.id == "urn:ex:1");
    CHECK(shell.id_short == "Motor1");
    CHECK(shell.kind == "CONSTANT");
    CHECK(shell.global_asset_id == "urn:asset:motor:1");
    CHECK(ResolveDescription(shell.description) == "Electric motor");
    REQUIRE(shell.submodel_refs.size() == 2);
    CHECK(shell.submodel_refs[0] == "urn:ex:2");
    CHECK(shell.submodel_refs[1] == "urn:ex:missing");

    const auto& specs = AsJson(records[1]);
    CHECK(specs.element_type == ElementType::Submodel);
    CHECK(specs.ordinal == 0);
    CHECK(specs.kind == "Instance");
    CHECK(std::get<std::string>(specs.description) == "Technical data");

    const auto& nameplate = AsJson(records[2]);
    CHECK(nameplate.ordinal == 1);
    CHECK_FALSE(nameplate.id.has_value());
    CHECK(nameplate.id_short == "Nameplate");
}

TEST_CASE("ExtractJsonEntry: missing id produces a field warning", "[extract][json]") {
    auto result = ExtractJsonEntry(LoadTestData("motor_v3.json"), "aasx/data.json");
    REQUIRE(result.IsOk());
    const auto& warnings = result.Value().warnings;
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].entry == "aasx/data.json");
    CHECK(warnings[0].element == "submodel[1]");
    CHECK(warnings[0].field == "id");
}

TEST_CASE("ExtractJsonEntry: description as language object", "[extract][json]") {
    auto result = ExtractJsonEntry(
        R"({"submodels":[{"id":"a","idShort":"A","description":{"fr":"Vanne","de":"Ventil"}}]})",
        "e.json");
    REQUIRE(result.IsOk());
    const auto& record = AsJson(result.Value().records[0]);
    // Object keys iterate alphabetically, so "de" is first.
    CHECK(ResolveDescription(record.description) == "Ventil");
}

TEST_CASE("ExtractJsonEntry: non-string scalars are rendered", "[extract][json]") {
    auto result = ExtractJsonEntry(R"({"submodels":[{"id":42,"idShort":true}]})", "e.json");
    REQUIRE(result.IsOk());
    const auto& record = AsJson(result.Value().records[0]);
    CHECK(record.id == "42");
    CHECK(record.id_short == "true");
}

TEST_CASE("ExtractJsonEntry: reference without typed key uses the last key", "[extract][json]") {
    auto result = ExtractJsonEntry(
        R"({"assetAdministrationShells":[{"id":"s","idShort":"S","submodels":[
            {"keys":[{"value":"urn:first"},{"value":"urn:last"}]}]}]})",
        "e.json");
    REQUIRE(result.IsOk());
    const auto& record = AsJson(result.Value().records[0]);
    REQUIRE(record.submodel_refs.size() == 1);
    CHECK(record.submodel_refs[0] == "urn:last");
}

TEST_CASE("ExtractJsonEntry: duplicate identity is skipped with a warning", "[extract][json]") {
    auto result = ExtractJsonEntry(
        R"({"submodels":[{"id":"dup","idShort":"A"},{"id":"dup","idShort":"B"}]})", "e.json");
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().records.size() == 1);
    CHECK(AsJson(result.Value().records[0]).id_short == "A");
    REQUIRE(result.Value().warnings.size() == 1);
    CHECK(result.Value().warnings[0].message.find("duplicate") != std::string::npos);
}

TEST_CASE("ExtractJsonEntry: blank identities are absent, not duplicates", "[extract][json]") {
    auto result = ExtractJsonEntry(
        R"({"submodels":[{"id":"","idShort":"A"},{"id":"","idShort":"B"},
                         {"id":"  ","idShort":"C"}]})", "e.json");
    REQUIRE(result.IsOk());
    const auto& records = result.Value().records;
    REQUIRE(records.size() == 3);
    CHECK_FALSE(AsJson(records[0]).id.has_value());
    CHECK(AsJson(records[1]).id_short == "B");
    CHECK_FALSE(AsJson(records[2]).id.has_value());
    for (const auto& warning : result.Value().warnings) {
        CHECK(warning.message.find("duplicate") == std::string::npos);
    }
}

TEST_CASE("ExtractJsonEntry: identities are trimmed before the duplicate check", "[extract][json]") {
    auto result = ExtractJsonEntry(
        R"({"submodels":[{"id":" urn:x ","idShort":"A"},{"id":"urn:x","idShort":"B"}]})",
        "e.json");
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().records.size() == 1);
    CHECK(AsJson(result.Value().records[0]).id == std::optional<std::string>("urn:x"));
    REQUIRE(result.Value().warnings.size() == 1);
    CHECK(result.Value().warnings[0].message.find("duplicate") != std::string::npos);
}

TEST_CASE("ExtractJsonEntry: same id under different types is kept", "[extract][json]") {
    auto result = ExtractJsonEntry(
        R"({"assetAdministrationShells":[{"id":"x","idShort":"S"}],
            "submodels":[{"id":"x","idShort":"M"}]})", "e.json");
    REQUIRE(result.IsOk());
    CHECK(result.Value().records.size() == 2);
}

TEST_CASE("ExtractJsonEntry: non-array section is a warning", "[extract][json]") {
    auto result = ExtractJsonEntry(R"({"submodels":{"id":"x"}})", "e.json");
    REQUIRE(result.IsOk());
    CHECK(result.Value().records.empty());
    REQUIRE(result.Value().warnings.size() == 1);
    CHECK(result.Value().warnings[0].field == "submodels");
}

TEST_CASE("ExtractJsonEntry: document without known sections is empty", "[extract][json]") {
    auto result = ExtractJsonEntry(R"({"conceptDescriptions":[]})", "e.json");
    REQUIRE(result.IsOk());
    CHECK(result.Value().records.empty());
    CHECK(result.Value().warnings.empty());
}

// ===========================================================================
// Malformed documents
// ===========================================================================

TEST_CASE("ExtractJsonEntry: invalid JSON is an EntryParseFailure", "[extract][json]") {
    auto result = ExtractJsonEntry(R"({"submodels": [)", "aasx/broken.json");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::EntryParseFailure);
    CHECK(result.Error().target == "aasx/broken.json");
}

TEST_CASE("ExtractJsonEntry: top-level array is an EntryParseFailure", "[extract][json]") {
    auto result = ExtractJsonEntry("[1, 2, 3]", "e.json");
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::EntryParseFailure);
}
