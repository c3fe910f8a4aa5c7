/**
 * @file Imports.hpp
 * @brief Import expansion pre-pass
 *
 * `import "file.ura"` directives may only appear at the top of a document,
 * mixed with variable definitions and useless lines. Before the main parse
 * they are replaced by the (recursively expanded) content of the imported
 * files, producing one flattened document.
 *
 * Each file may be imported once per parse. Importing it again, directly
 * or through a cycle, is a DuplicatedImportError.
 */

#ifndef GURA_IMPORTS_HPP
#define GURA_IMPORTS_HPP

#include "gura/Cursor.hpp"

#include <filesystem>
#include <optional>
#include <set>
#include <string>

namespace gura {

/**
 * @brief Expand the leading import directives of the cursor's text
 *
 * Consumes the leading block of imports, variable definitions and useless
 * lines (defining the variables). When imports were found, the cursor's
 * text is replaced by the imported content followed by the rest of the
 * document, and scanning restarts at its beginning. Otherwise the cursor is
 * left after the consumed block.
 *
 * @param cursor Cursor at the start of a document
 * @param origin_dir Directory relative paths are joined to, none to use
 *                   them as written
 * @throws ParseError DuplicatedImport, FileNotFound, or any error of an
 *         imported file's own pre-pass
 */
void expand_imports(Cursor& cursor, const std::optional<std::filesystem::path>& origin_dir);

/**
 * @brief Expanded text of one imported file
 *
 * The file's variable definitions are kept ahead of its own imports so the
 * main parse defines them again.
 *
 * @param content File content
 * @param origin_dir Directory of the file
 * @param imported Identifiers of the files imported so far, updated
 */
std::string expand_imported_text(const std::string& content, const std::filesystem::path& origin_dir,
                                 std::set<std::string>& imported);

/**
 * @brief Identifier of a file for duplicate detection (canonical absolute path)
 */
std::string import_identifier(const std::filesystem::path& path);

} // namespace gura

#endif // GURA_IMPORTS_HPP
