/**
 * @file Graphemes.cpp
 * @brief ICU based grapheme segmentation
 */

#include "gura/Graphemes.hpp"

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <memory>
#include <stdexcept>

namespace gura {

std::vector<std::string> split_graphemes(const std::string& text) {
    std::vector<std::string> clusters;
    if (text.empty()) {
        return clusters;
    }

    icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(),
                                                                               static_cast<int32_t>(text.size())));

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::BreakIterator> iter(
        icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));
    if (U_FAILURE(status) || !iter) {
        throw std::runtime_error(std::string("Cannot create grapheme iterator: ") + u_errorName(status));
    }

    iter->setText(unicode);
    clusters.reserve(text.size());

    int32_t start = iter->first();
    for (int32_t end = iter->next(); end != icu::BreakIterator::DONE; start = end, end = iter->next()) {
        std::string cluster;
        unicode.tempSubStringBetween(start, end).toUTF8String(cluster);
        clusters.push_back(std::move(cluster));
    }

    return clusters;
}

std::optional<std::size_t> invalid_utf8_offset(const std::string& text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());

    int32_t index = 0;
    while (index < length) {
        const int32_t start = index;
        UChar32 code_point;
        U8_NEXT(bytes, index, length, code_point);
        if (code_point < 0) {
            return static_cast<std::size_t>(start);
        }
    }
    return std::nullopt;
}

bool append_utf8(std::string& out, unsigned long code_point) {
    if (code_point > 0x10FFFF || U_IS_SURROGATE(code_point)) {
        return false;
    }

    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    UBool error = false;
    U8_APPEND(buffer, length, U8_MAX_LENGTH, static_cast<UChar32>(code_point), error);
    if (error) {
        return false;
    }
    out.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(length));
    return true;
}

} // namespace gura
