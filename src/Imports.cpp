/**
 * @file Imports.cpp
 * @brief Import expansion pre-pass
 */

#include "gura/Imports.hpp"
#include "gura/Files.hpp"
#include "gura/Grammar.hpp"
#include "gura/Log.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace gura {

namespace {

struct PendingImport {
    std::string path;
    std::optional<fs::path> origin_dir;
    std::ptrdiff_t position;
    std::size_t line;
};

struct Header {
    std::vector<PendingImport> imports;
    std::string definitions;
};

/**
 * @brief Consume the leading imports, variable definitions and useless lines
 */
Header scan_header(Cursor& cursor, const std::optional<fs::path>& origin_dir) {
    Grammar grammar(cursor);
    Header header;

    while (!cursor.at_end()) {
        const std::ptrdiff_t before = cursor.position();
        auto node = grammar.maybe_match({&Grammar::gura_import, &Grammar::variable, &Grammar::useless_line});
        if (!node) {
            break;
        }

        if (node->kind == NodeKind::Import) {
            header.imports.push_back(PendingImport{node->key, origin_dir, node->position, node->line});
        } else if (node->kind == NodeKind::Variable) {
            header.definitions += cursor.slice(before, cursor.position()) + "\n";
        }
    }
    return header;
}

/**
 * @brief Read and expand every pending import, in order
 */
std::string splice_imports(const std::vector<PendingImport>& imports, std::set<std::string>& imported) {
    std::string text;

    for (const auto& pending : imports) {
        const fs::path target = pending.origin_dir ? *pending.origin_dir / pending.path : fs::path(pending.path);
        const std::string id = import_identifier(target);

        if (imported.count(id) != 0) {
            throw ParseError(ErrorKind::DuplicatedImport,
                             "The file " + target.string() + " has been already imported",
                             pending.position, pending.line);
        }
        if (!file_exists(target.string())) {
            throw ParseError(ErrorKind::FileNotFound, "The file " + target.string() + " does not exist",
                             pending.position, pending.line);
        }

        // Recorded before recursing so that a cycle is reported as a duplicate
        imported.insert(id);
        Log::debug("Importing " + id);

        const std::string content = read_file(target.string(), pending.position, pending.line);
        text += expand_imported_text(content, fs::path(id).parent_path(), imported);
        text += "\n";
    }
    return text;
}

} // anonymous namespace

std::string import_identifier(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        canonical = fs::absolute(path, ec).lexically_normal();
        if (ec) {
            return path.lexically_normal().string();
        }
    }
    return canonical.string();
}

std::string expand_imported_text(const std::string& content, const fs::path& origin_dir,
                                 std::set<std::string>& imported) {
    Cursor cursor(content);
    Header header = scan_header(cursor, origin_dir);
    if (header.imports.empty()) {
        return content;
    }
    return header.definitions + splice_imports(header.imports, imported) + cursor.remainder();
}

void expand_imports(Cursor& cursor, const std::optional<fs::path>& origin_dir) {
    Header header = scan_header(cursor, origin_dir);
    if (header.imports.empty()) {
        return;
    }

    const std::string text = splice_imports(header.imports, cursor.imported_files()) + cursor.remainder();
    cursor.reset(text);
}

} // namespace gura
