#ifndef IDREDACT_REDACTION_PLACEHOLDER_HPP
#define IDREDACT_REDACTION_PLACEHOLDER_HPP

#include <string>
#include "../util/utf8.hpp"

namespace idredact {
namespace redaction {

constexpr const char *kDefaultPlaceholder = "<ID>";

/**
 * @brief Left-justify the placeholder in exactly `width` code points:
 *        right-padded with spaces when shorter, truncated when longer.
 *
 *   fitPlaceholder(L"<ID>", 7) == L"<ID>   "
 *   fitPlaceholder(L"<ID>", 2) == L"<I"
 */
inline std::wstring fitPlaceholder(const std::wstring &placeholder, size_t width)
{
    if (placeholder.size() >= width) {
        return placeholder.substr(0, width);
    }
    std::wstring out = placeholder;
    out.append(width - placeholder.size(), L' ');
    return out;
}

/// UTF-8 overload; width is in code points.
inline std::string fitPlaceholder(const std::string &placeholder, size_t width)
{
    return idredact::util::utf8::encode(fitPlaceholder(idredact::util::utf8::decode(placeholder), width));
}

} // namespace redaction
} // namespace idredact

#endif // IDREDACT_REDACTION_PLACEHOLDER_HPP
