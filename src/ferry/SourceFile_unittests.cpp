#include "ferry/SourceFile.hpp"

#include "ferry/ErrorReporter.hpp"
#include "ferry/internal/FileSystem.hpp"

#include "doctest/doctest.h"

#include <fstream>

namespace ferry {

TEST_CASE("SourceFile read") {
    ErrorReporter errorReporter(true);

    SUBCASE("missing file") {
        SourceFile sourceFile((fs::temp_directory_path() / "ferry_missing_source_file.json").string());
        CHECK(!sourceFile.read(&errorReporter));
        REQUIRE_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(errorReporter.errors()[0].kind, ErrorReporter::kFileNotFound);
    }

    SUBCASE("existing file") {
        auto path = fs::temp_directory_path() / "ferry_source_file_unittest.json";
        {
            std::ofstream outFile(path, std::ofstream::binary);
            outFile << "{ \"constructors\": [] }";
        }
        SourceFile sourceFile(path.string());
        REQUIRE(sourceFile.read(&errorReporter));
        CHECK(errorReporter.ok());
        CHECK_EQ(sourceFile.codeView(), "{ \"constructors\": [] }");
        CHECK_EQ(sourceFile.code()[sourceFile.size() - 1], '\0');
        fs::remove(path);
    }
}

} // namespace ferry
