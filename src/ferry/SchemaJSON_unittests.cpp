#include "ferry/SchemaJSON.hpp"

#include "ferry/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <cstring>

namespace ferry {

TEST_CASE("DumpSchemaJSON") {
    ErrorReporter errorReporter(true);

    SUBCASE("empty program") {
        idl::Program program;
        std::string json;
        REQUIRE(DumpSchemaJSON(&program, &errorReporter, json));
        CHECK_EQ(json, "{\"declarations\":[],\"actor\":null}");
    }

    SUBCASE("declarations and actor") {
        idl::Program program;
        auto record = std::make_unique<idl::RecordType>();
        record->fields.emplace_back(idl::Field { 23515, "id", std::make_unique<idl::PrimType>(idl::kNat) });
        record->fields.emplace_back(idl::Field {
            1224700491, "name", std::make_unique<idl::VectorType>(std::make_unique<idl::PrimType>(idl::kText)) });
        program.declarations.emplace_back(idl::TypeDeclaration { "Entry", std::move(record) });

        auto service = std::make_unique<idl::ServiceType>();
        auto lookup = std::make_unique<idl::FunctionType>();
        lookup->arguments.emplace_back(idl::Field { 0, "0", std::make_unique<idl::PrimType>(idl::kNat) });
        lookup->results.emplace_back(
            idl::Field { 0, "0", std::make_unique<idl::OptionalType>(std::make_unique<idl::VarType>("Entry")) });
        lookup->modes.emplace_back(idl::kQuery);
        service->methods.emplace_back(idl::Method { "lookup", std::move(lookup) });
        program.actor = std::move(service);

        std::string json;
        REQUIRE(DumpSchemaJSON(&program, &errorReporter, json));

        rapidjson::Document document;
        document.Parse(json.data());
        REQUIRE(!document.HasParseError());
        REQUIRE(document.IsObject());

        REQUIRE(document["declarations"].IsArray());
        REQUIRE_EQ(document["declarations"].Size(), 1);
        const rapidjson::Value& entry = document["declarations"][0u];
        CHECK_EQ(std::strcmp(entry["name"].GetString(), "Entry"), 0);
        CHECK_EQ(std::strcmp(entry["type"]["kind"].GetString(), "record"), 0);
        const rapidjson::Value& fields = entry["type"]["fields"];
        REQUIRE_EQ(fields.Size(), 2);
        CHECK_EQ(fields[0u]["id"].GetUint(), 23515);
        CHECK_EQ(std::strcmp(fields[0u]["type"]["prim"].GetString(), "nat"), 0);
        CHECK_EQ(std::strcmp(fields[1u]["name"].GetString(), "name"), 0);
        CHECK_EQ(std::strcmp(fields[1u]["type"]["kind"].GetString(), "vec"), 0);

        const rapidjson::Value& actor = document["actor"];
        CHECK_EQ(std::strcmp(actor["kind"].GetString(), "service"), 0);
        REQUIRE_EQ(actor["methods"].Size(), 1);
        const rapidjson::Value& method = actor["methods"][0u];
        CHECK_EQ(std::strcmp(method["name"].GetString(), "lookup"), 0);
        CHECK_EQ(std::strcmp(method["type"]["kind"].GetString(), "func"), 0);
        CHECK_EQ(method["type"]["arguments"].Size(), 1);
        CHECK_EQ(std::strcmp(method["type"]["results"][0u]["element"]["name"].GetString(), "Entry"), 0);
        CHECK_EQ(std::strcmp(method["type"]["modes"][0u].GetString(), "query"), 0);
        CHECK(errorReporter.ok());
    }

    SUBCASE("placeholder") {
        idl::Program program;
        program.declarations.emplace_back(idl::TypeDeclaration { "A", std::make_unique<idl::PreType>() });
        std::string json;
        CHECK(!DumpSchemaJSON(&program, &errorReporter, json));
        REQUIRE_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.errors()[0].kind, ErrorReporter::kInternal);
    }
}

} // namespace ferry
