#ifndef IDREDACT_CATALOG_UNICODE_REGEX_TRAITS_HPP
#define IDREDACT_CATALOG_UNICODE_REGEX_TRAITS_HPP

#include <regex>
#include <string>
#include "../util/unicode_classes.hpp"

/**
 * @file unicode_regex_traits.hpp
 * @brief std::regex_traits<wchar_t> with Unicode-wide \s and \d.
 *
 * The stock traits classify through the imbued locale's ctype facet. That
 * already covers letters (so \w and \b handle Ñ and É under a UTF-8 locale),
 * but not the no-break spaces or non-ASCII digits. isctype() here also
 * accepts any Unicode whitespace for the "s" class and any Nd digit for the
 * "d" class. Every class that contains them (\w, [[:alnum:]], the negated
 * forms) follows automatically.
 */

namespace idredact {
namespace catalog {

class UnicodeRegexTraits : public std::regex_traits<wchar_t>
{
public:
    bool isctype(char_type c, char_class_type f) const
    {
        if (std::regex_traits<wchar_t>::isctype(c, f)) {
            return true;
        }
        const auto cp = static_cast<uint32_t>(c);
        if (contains(f, spaceClass()) && idredact::util::unicode::isWhitespace(cp)) {
            return true;
        }
        if (contains(f, digitClass()) && idredact::util::unicode::isDecimalDigit(cp)) {
            return true;
        }
        return false;
    }

private:
    static bool contains(char_class_type f, char_class_type cls)
    {
        return (f & cls) == cls;
    }

    // class masks do not depend on the imbued locale
    static char_class_type spaceClass()
    {
        static const char_class_type cls = lookup(L"s");
        return cls;
    }

    static char_class_type digitClass()
    {
        static const char_class_type cls = lookup(L"d");
        return cls;
    }

    static char_class_type lookup(const wchar_t *name)
    {
        std::regex_traits<wchar_t> plain;
        return plain.lookup_classname(name, name + 1);
    }
};

using UnicodeRegex = std::basic_regex<wchar_t, UnicodeRegexTraits>;
using UnicodeRegexIterator = std::regex_iterator<std::wstring::const_iterator, wchar_t, UnicodeRegexTraits>;

} // namespace catalog
} // namespace idredact

#endif // IDREDACT_CATALOG_UNICODE_REGEX_TRAITS_HPP
