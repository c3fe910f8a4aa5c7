/**
 * @file Files.cpp
 * @brief File access helpers
 */

#include "gura/Files.hpp"
#include "gura/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace gura {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path, std::ptrdiff_t position, std::size_t line) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ParseError(ErrorKind::FileNotFound, "The file " + path + " does not exist", position, line);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace gura
