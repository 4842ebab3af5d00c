#ifndef IDREDACT_UTIL_UTF8_HPP
#define IDREDACT_UTIL_UTF8_HPP

#include <string>
#include <cstddef>

/**
 * @file utf8.hpp
 * @brief UTF-8 <-> code point conversion.
 *
 * Redaction offsets are code point offsets, so text is decoded into a
 * std::wstring (one wchar_t per code point, UTF-32 on Linux) before matching
 * and encoded back afterwards. Malformed or truncated sequences decode to
 * U+FFFD.
 */

namespace idredact {
namespace util {
namespace utf8 {

static_assert(sizeof(wchar_t) >= 4, "wchar_t must hold a full code point");

constexpr wchar_t kReplacementChar = 0xFFFD;

namespace detail {

inline bool isContinuation(unsigned char byte)
{
    return (byte & 0xC0) == 0x80;
}

} // namespace detail

inline std::wstring decode(const std::string &text)
{
    std::wstring result;
    result.reserve(text.size());
    const unsigned char *data = reinterpret_cast<const unsigned char *>(text.data());
    const std::size_t length = text.size();
    std::size_t i = 0;
    while (i < length) {
        unsigned char byte = data[i];
        if (byte < 0x80) {
            result.push_back(static_cast<wchar_t>(byte));
            ++i;
            continue;
        }

        std::size_t need = 0;
        wchar_t cp = 0;
        if ((byte >> 5) == 0x6) {
            need = 1;
            cp = byte & 0x1F;
        } else if ((byte >> 4) == 0xE) {
            need = 2;
            cp = byte & 0x0F;
        } else if ((byte >> 3) == 0x1E) {
            need = 3;
            cp = byte & 0x07;
        } else {
            result.push_back(kReplacementChar);
            ++i;
            continue;
        }

        std::size_t j = 1;
        for (; j <= need && i + j < length; ++j) {
            if (!detail::isContinuation(data[i + j])) {
                break;
            }
            cp = static_cast<wchar_t>((cp << 6) | (data[i + j] & 0x3F));
        }
        if (j <= need) {
            // truncated or interrupted sequence: consume what was read
            result.push_back(kReplacementChar);
            i += j;
            continue;
        }
        result.push_back(cp);
        i += need + 1;
    }
    return result;
}

inline std::string encode(const std::wstring &text)
{
    std::string result;
    result.reserve(text.size() * 2);
    for (wchar_t wc : text) {
        auto cp = static_cast<unsigned long>(wc);
        if (cp < 0x80) {
            result.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            result.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            result.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            result.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            result.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return result;
}

/**
 * @brief Number of code points in a UTF-8 string, counted the same way decode() does.
 */
inline std::size_t codePointLength(const std::string &text)
{
    return decode(text).size();
}

} // namespace utf8
} // namespace util
} // namespace idredact

#endif // IDREDACT_UTIL_UTF8_HPP
