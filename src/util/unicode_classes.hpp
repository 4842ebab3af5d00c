#ifndef IDREDACT_UTIL_UNICODE_CLASSES_HPP
#define IDREDACT_UTIL_UNICODE_CLASSES_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>

/**
 * @file unicode_classes.hpp
 * @brief Code point classification for the Unicode whitespace and decimal
 *        digit (general category Nd) sets, independent of the C library's
 *        locale tables.
 *
 * glibc's iswspace() leaves out U+00A0 and U+202F, and iswdigit() only knows
 * ASCII 0-9. Identifier numbers copied from PDFs or web pages routinely use
 * those separators, and some sources write the digits in another script.
 *
 * Tables follow Unicode 14.0.
 */

namespace idredact {
namespace util {
namespace unicode {

struct CodePointRange
{
    uint32_t first;
    uint32_t last;   ///< inclusive
};

namespace detail {

constexpr CodePointRange kWhitespace[] = {
    {0x9, 0xD},       {0x1C, 0x20},     {0x85, 0x85},     {0xA0, 0xA0},
    {0x1680, 0x1680}, {0x2000, 0x200A}, {0x2028, 0x2029}, {0x202F, 0x202F},
    {0x205F, 0x205F}, {0x3000, 0x3000},
};

constexpr CodePointRange kDecimalDigits[] = {
    {0x30, 0x39},
    {0x660, 0x669}, {0x6F0, 0x6F9}, {0x7C0, 0x7C9}, {0x966, 0x96F},
    {0x9E6, 0x9EF}, {0xA66, 0xA6F}, {0xAE6, 0xAEF}, {0xB66, 0xB6F},
    {0xBE6, 0xBEF}, {0xC66, 0xC6F}, {0xCE6, 0xCEF}, {0xD66, 0xD6F},
    {0xDE6, 0xDEF}, {0xE50, 0xE59}, {0xED0, 0xED9}, {0xF20, 0xF29},
    {0x1040, 0x1049}, {0x1090, 0x1099}, {0x17E0, 0x17E9}, {0x1810, 0x1819},
    {0x1946, 0x194F}, {0x19D0, 0x19D9}, {0x1A80, 0x1A89}, {0x1A90, 0x1A99},
    {0x1B50, 0x1B59}, {0x1BB0, 0x1BB9}, {0x1C40, 0x1C49}, {0x1C50, 0x1C59},
    {0xA620, 0xA629}, {0xA8D0, 0xA8D9}, {0xA900, 0xA909}, {0xA9D0, 0xA9D9},
    {0xA9F0, 0xA9F9}, {0xAA50, 0xAA59}, {0xABF0, 0xABF9}, {0xFF10, 0xFF19},
    {0x104A0, 0x104A9}, {0x10D30, 0x10D39}, {0x11066, 0x1106F}, {0x110F0, 0x110F9},
    {0x11136, 0x1113F}, {0x111D0, 0x111D9}, {0x112F0, 0x112F9}, {0x11450, 0x11459},
    {0x114D0, 0x114D9}, {0x11650, 0x11659}, {0x116C0, 0x116C9}, {0x11730, 0x11739},
    {0x118E0, 0x118E9}, {0x11950, 0x11959}, {0x11C50, 0x11C59}, {0x11D50, 0x11D59},
    {0x11DA0, 0x11DA9}, {0x16A60, 0x16A69}, {0x16AC0, 0x16AC9}, {0x16B50, 0x16B59},
    {0x1D7CE, 0x1D7FF}, {0x1E140, 0x1E149}, {0x1E2F0, 0x1E2F9}, {0x1E950, 0x1E959},
    {0x1FBF0, 0x1FBF9},
};

template <std::size_t N>
inline bool inTable(const CodePointRange (&table)[N], uint32_t cp)
{
    // first range whose last code point is >= cp
    const CodePointRange *it = std::lower_bound(
        std::begin(table), std::end(table), cp,
        [](const CodePointRange &r, uint32_t value) { return r.last < value; });
    return it != std::end(table) && it->first <= cp;
}

} // namespace detail

/// Unicode whitespace, including no-break and narrow no-break spaces.
inline bool isWhitespace(uint32_t cp)
{
    return detail::inTable(detail::kWhitespace, cp);
}

/// Decimal digit in any script (general category Nd).
inline bool isDecimalDigit(uint32_t cp)
{
    return detail::inTable(detail::kDecimalDigits, cp);
}

} // namespace unicode
} // namespace util
} // namespace idredact

#endif // IDREDACT_UTIL_UNICODE_CLASSES_HPP
