#ifndef SRC_FERRY_ERROR_REPORTER_HPP_
#define SRC_FERRY_ERROR_REPORTER_HPP_

#include "ferry/Location.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ferry {

class ErrorReporter {
public:
    enum Kind {
        kFileNotFound,
        kFileOpen,
        kFileRead,
        kJSONParse,
        kMalformedTypeGraph,
        // A type that has no representation at the interface boundary reached the translator. Always a compiler
        // defect or an unrepresentable program, never something to approximate.
        kUnrepresentableType,
        kFieldIdCollision,
        kSymbolCollision,
        kInternal
    };

    struct Error {
        Kind kind;
        Location location;
        std::string message;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log)
    explicit ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    // Name used to prefix logged errors, typically the input file path.
    void setFileName(std::string fileName) { m_fileName = std::move(fileName); }
    // Must be called before getLineNumber() can be called.
    void setCode(const char* code) { m_code = code; }

    void addError(Kind kind, Location location, std::string message);

    // Specific errors.

    // Fatal error, unable to locate a file under filePath.
    void addFileNotFoundError(std::string_view filePath);
    // Fatal error, unable to open file at filePath.
    void addFileOpenError(std::string_view filePath);
    // Fatal error, failed to read file at filePath.
    void addFileReadError(std::string_view filePath);
    // Fatal compiler error, |description| names the type shape that can't cross the boundary.
    void addUnrepresentableTypeError(Location location, std::string_view description);

    size_t getLineNumber(const char* location);
    size_t errorCount() const { return m_errors.size(); }
    bool ok() const { return m_errors.size() == 0; }
    const std::vector<Error>& errors() const { return m_errors; }

private:
    bool m_suppress;
    std::string m_fileName;
    const char* m_code;
    std::vector<Error> m_errors;
    std::vector<const char*> m_lineEndings;
};

} // namespace ferry

#endif // SRC_FERRY_ERROR_REPORTER_HPP_
