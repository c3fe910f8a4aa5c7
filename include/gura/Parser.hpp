/**
 * @file Parser.hpp
 * @brief Public entry points of the Gura parser
 *
 * Typical usage:
 * @code
 *   gura::Value config = gura::parse_file("service.ura");
 *   const auto& port = config.at("service").at("port");
 *   std::cout << gura::dump(config) << "\n";
 * @endcode
 */

#ifndef GURA_PARSER_HPP
#define GURA_PARSER_HPP

#include "gura/Dump.hpp"
#include "gura/Errors.hpp"
#include "gura/Value.hpp"

#include <string>

namespace gura {

/**
 * @brief Parse a Gura document
 *
 * Relative import paths are used as written (relative to the working
 * directory).
 *
 * @param text UTF-8 document
 * @return Root object (empty object for a document without pairs)
 * @throws ParseError on any syntax, indentation, key, variable or import error
 */
Value parse(const std::string& text);

/**
 * @brief Read and parse a Gura file
 *
 * Relative import paths resolve against the directory of the file, which
 * counts as already imported.
 *
 * @param path File to parse
 * @return Root object
 * @throws ParseError (FileNotFound) if the file cannot be read, or any
 *         error of parse()
 */
Value parse_file(const std::string& path);

} // namespace gura

#endif // GURA_PARSER_HPP
