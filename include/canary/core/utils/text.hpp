#pragma once

#include <string>
#include <string_view>

namespace Canary {

/**
 * @brief Check that a byte sequence is well-formed UTF-8
 *
 * Rejects overlong encodings, surrogates (U+D800..U+DFFF) and code points
 * above U+10FFFF.
 */
bool isValidUtf8(std::string_view bytes);

/**
 * @brief Escape &, <, >, " and ' for HTML text and attribute context
 */
std::string escapeHtml(std::string_view text);

/**
 * @brief Compare two strings without early exit on the first differing byte
 *
 * Running time depends on the lengths only, not on where the contents differ.
 */
bool constantTimeEquals(std::string_view lhs, std::string_view rhs);

} // namespace Canary
