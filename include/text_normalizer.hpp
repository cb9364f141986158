#pragma once

#include <string>

// Canonicalize raw token text before numeric detection:
//  1. the triangle sign glyphs (U+25B3, U+25B2) become '-'
//  2. thousands separators (',' and U+FF0C) are removed
//  3. a fully parenthesized numeral "(123.4)" becomes "-123.4"
// Everything else, including units, currency symbols and '%', is kept.
std::string normalizeText(const std::string& text);
