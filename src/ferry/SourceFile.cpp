#include "ferry/SourceFile.hpp"

#include "ferry/ErrorReporter.hpp"
#include "ferry/internal/FileSystem.hpp"

#include "spdlog/spdlog.h"

#include <fstream>

namespace ferry {

SourceFile::SourceFile(std::string path): m_path(path), m_codeSize(0) { }

bool SourceFile::read(ErrorReporter* errorReporter) {
    fs::path filePath(m_path);
    std::error_code errorCode;
    if (!fs::exists(filePath, errorCode) || !fs::is_regular_file(filePath, errorCode)) {
        errorReporter->addFileNotFoundError(m_path);
        return false;
    }

    auto fileSize = fs::file_size(filePath, errorCode);
    if (errorCode) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    // Make room for the null terminator.
    m_codeSize = fileSize + 1;
    m_code = std::make_unique<char[]>(m_codeSize);
    m_code[m_codeSize - 1] = '\0';
    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        errorReporter->addFileOpenError(m_path);
        return false;
    }
    inFile.read(m_code.get(), m_codeSize - 1);
    if (!inFile) {
        errorReporter->addFileReadError(m_path);
        return false;
    }

    SPDLOG_DEBUG("Read {} bytes from '{}'", m_codeSize - 1, m_path);
    return true;
}

} // namespace ferry
