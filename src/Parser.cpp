/**
 * @file Parser.cpp
 * @brief parse() and parse_file()
 */

#include "gura/Parser.hpp"
#include "gura/Cursor.hpp"
#include "gura/Files.hpp"
#include "gura/Grammar.hpp"
#include "gura/Imports.hpp"
#include "gura/Log.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace gura {

Value parse(const std::string& text) {
    Cursor cursor(text);
    Grammar grammar(cursor);
    return grammar.start();
}

Value parse_file(const std::string& path) {
    if (!file_exists(path)) {
        throw ParseError(ErrorKind::FileNotFound, "The file " + path + " does not exist", 0, 1);
    }

    const std::string content = read_file(path);
    const std::string id = import_identifier(path);
    Log::debug("Parsing " + id);

    Cursor cursor(content);
    cursor.imported_files().insert(id);
    Grammar grammar(cursor);
    return grammar.start(fs::path(id).parent_path());
}

} // namespace gura
