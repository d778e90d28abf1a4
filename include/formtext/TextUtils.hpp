#ifndef FORMTEXT_TEXT_UTILS_HPP
#define FORMTEXT_TEXT_UTILS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace formtext {
namespace text {

/**
 * @brief Byte offset of every UTF-8 code point in text
 *
 * The returned vector has one entry per code point plus a final entry equal
 * to text.size(), so entry i..i+1 spans code point i. Bytes that are not
 * valid UTF-8 count as code points of their own.
 */
std::vector<std::size_t> codePointOffsets(const std::string &text);

/// Number of UTF-8 code points in text.
std::size_t codePointLength(const std::string &text);

/// Copy of text without '_' filler characters.
std::string removeUnderscores(const std::string &text);

/// Concatenate parts with separator, skipping empty parts.
std::string joinNonEmpty(const std::vector<std::string> &parts,
                         const std::string &separator);

} // namespace text
} // namespace formtext

#endif // FORMTEXT_TEXT_UTILS_HPP
