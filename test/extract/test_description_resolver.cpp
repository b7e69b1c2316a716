#include <catch2/catch_test_macros.hpp>

#include <aasx_kg/extract/description_resolver.hpp>

using namespace aasx_kg;

TEST_CASE("ResolveDescription: absent gives empty string", "[extract][description]") {
    CHECK(ResolveDescription(DescriptionValue{}).empty());
    CHECK(ResolveDescription(LangStrings{}).empty());
}

TEST_CASE("ResolveDescription: bare string is returned as-is", "[extract][description]") {
    CHECK(ResolveDescription(std::string("Technical data")) == "Technical data");
}

TEST_CASE("ResolveDescription: English wins", "[extract][description]") {
    LangStrings alternatives = {{"de", "Motor"}, {"en", "Motor EN"}, {"fr", "Moteur"}};
    CHECK(ResolveDescription(alternatives) == "Motor EN");
}

TEST_CASE("ResolveDescription: English match ignores case", "[extract][description]") {
    LangStrings alternatives = {{"de", "Pumpe"}, {"EN", "Pump"}};
    CHECK(ResolveDescription(alternatives) == "Pump");
}

TEST_CASE("ResolveDescription: first entry without English", "[extract][description]") {
    LangStrings alternatives = {{"fr", "Vanne"}, {"de", "Ventil"}};
    CHECK(ResolveDescription(alternatives) == "Vanne");
}

TEST_CASE("ResolveDescription: regional English does not count as en", "[extract][description]") {
    LangStrings alternatives = {{"de", "Ventil"}, {"en-US", "Valve"}};
    CHECK(ResolveDescription(alternatives) == "Ventil");
}
