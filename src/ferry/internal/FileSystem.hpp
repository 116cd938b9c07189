#ifndef SRC_FERRY_INTERNAL_FILE_SYSTEM_HPP_
#define SRC_FERRY_INTERNAL_FILE_SYSTEM_HPP_

#include <filesystem>
namespace fs = std::filesystem;

#endif // SRC_FERRY_INTERNAL_FILE_SYSTEM_HPP_
