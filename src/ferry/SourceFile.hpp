#ifndef SRC_FERRY_SOURCE_FILE_HPP_
#define SRC_FERRY_SOURCE_FILE_HPP_

#include <memory>
#include <string>
#include <string_view>

namespace ferry {

class ErrorReporter;

// An input file loaded whole into memory. Inserts a null character at the end of the loaded string, for ease of use
// when parsing.
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(std::string path);
    ~SourceFile() = default;

    // Reports file not found, open and read failures to |errorReporter|.
    bool read(ErrorReporter* errorReporter);

    const std::string& path() const { return m_path; }
    const char* code() const { return m_code.get(); }
    size_t size() const { return m_codeSize; }
    std::string_view codeView() const { return std::string_view(m_code.get(), m_codeSize > 0 ? m_codeSize - 1 : 0); }

private:
    std::string m_path;
    size_t m_codeSize;
    std::unique_ptr<char[]> m_code;
};

} // namespace ferry

#endif // SRC_FERRY_SOURCE_FILE_HPP_
