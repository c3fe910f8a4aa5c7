/**
 * @file Files.hpp
 * @brief File access used by parse_file() and the import expander
 */

#ifndef GURA_FILES_HPP
#define GURA_FILES_HPP

#include <cstddef>
#include <string>

namespace gura {

/**
 * @brief Check that a path names an existing regular file
 */
bool file_exists(const std::string& path);

/**
 * @brief Read an entire file
 *
 * @param path File to read
 * @param position Position reported if the file cannot be read
 * @param line Line reported if the file cannot be read
 * @return File content, byte for byte
 * @throws ParseError (FileNotFound) if the file cannot be opened
 */
std::string read_file(const std::string& path, std::ptrdiff_t position = 0, std::size_t line = 1);

} // namespace gura

#endif // GURA_FILES_HPP
