#include "ferry/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>

namespace ferry {

TEST_CASE("ErrorReporter line numbers") {
    SUBCASE("empty string") {
        ErrorReporter er(true);
        std::string code("");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data()) == 1);
    }
    SUBCASE("one liner") {
        ErrorReporter er(true);
        std::string code("{ \"constructors\": [ { \"name\": \"List\", \"kind\": \"def\" } ] }");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data()) == 1);
        CHECK(er.getLineNumber(code.data() + 10) == 1);
        CHECK(er.getLineNumber(code.data() + code.size()) == 1);
    }
    SUBCASE("multiline string") {
        ErrorReporter er(true);
        std::string code("one\n two\n three\n four\n five\n");
        er.setCode(code.data());
        CHECK(er.getLineNumber(code.data() + 1) == 1);
        CHECK(er.getLineNumber(code.data() + 4) == 2);
        CHECK(er.getLineNumber(code.data() + 9) == 3);
        CHECK(er.getLineNumber(code.data() + 16) == 4);
        CHECK(er.getLineNumber(code.data() + 22) == 5);
    }
}

TEST_CASE("ErrorReporter collects typed errors") {
    ErrorReporter er(true);
    CHECK(er.ok());

    Location location;
    location.lineNumber = 12;
    location.characterNumber = 4;
    er.addUnrepresentableTypeError(location, "type variable 'T'");
    er.addFileNotFoundError("missing.json");

    CHECK_FALSE(er.ok());
    REQUIRE_EQ(er.errorCount(), 2);
    CHECK_EQ(er.errors()[0].kind, ErrorReporter::kUnrepresentableType);
    CHECK_EQ(er.errors()[0].location.lineNumber, 12);
    CHECK_EQ(er.errors()[0].location.characterNumber, 4);
    CHECK_NE(er.errors()[0].message.find("type variable 'T'"), std::string::npos);
    CHECK_EQ(er.errors()[1].kind, ErrorReporter::kFileNotFound);
    CHECK_FALSE(er.errors()[1].location.isKnown());
}

} // namespace ferry
