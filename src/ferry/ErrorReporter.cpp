#include "ferry/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace ferry {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress), m_code(nullptr) { }

ErrorReporter::~ErrorReporter() { }

void ErrorReporter::addError(Kind kind, Location location, std::string message) {
    if (!m_suppress) {
        if (location.isKnown()) {
            spdlog::error("{}:{}:{}: {}", m_fileName.empty() ? "<input>" : m_fileName, location.lineNumber,
                          location.characterNumber, message);
        } else {
            spdlog::error(message);
        }
    }
    m_errors.emplace_back(Error { kind, location, std::move(message) });
}

void ErrorReporter::addFileNotFoundError(std::string_view filePath) {
    addError(kFileNotFound, Location(), fmt::format("File '{}' not found.", filePath));
}

void ErrorReporter::addFileOpenError(std::string_view filePath) {
    addError(kFileOpen, Location(), fmt::format("Unable to open file '{}'.", filePath));
}

void ErrorReporter::addFileReadError(std::string_view filePath) {
    addError(kFileRead, Location(), fmt::format("Failed to read file '{}'.", filePath));
}

void ErrorReporter::addUnrepresentableTypeError(Location location, std::string_view description) {
    addError(kUnrepresentableType, location,
             fmt::format("Internal compiler error: {} cannot be represented in the interface description.",
                         description));
}

size_t ErrorReporter::getLineNumber(const char* location) {
    // Lazily construct the line number map on first request for line number.
    if (!m_lineEndings.size()) {
        const char* code = m_code;
        m_lineEndings.emplace_back(code);
        while (*code != '\0') {
            if (*code == '\n') {
                m_lineEndings.emplace_back(code);
            }
            ++code;
        }
        m_lineEndings.emplace_back(code);
    }

    // Binary search on ranges to find line number.
    size_t start = 0;
    size_t end = m_lineEndings.size() - 1;
    while (start < end) {
        size_t middle = start + ((end - start) / 2);
        if (m_lineEndings[middle] < location) {
            if (m_lineEndings[middle + 1] >= location) {
                return middle + 1;
            }
            start = middle;
        } else {
            end = middle;
        }
    }

    return start + 1;
}

} // namespace ferry
