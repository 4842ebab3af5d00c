#ifndef IDREDACT_CATALOG_PATTERN_FILE_HPP
#define IDREDACT_CATALOG_PATTERN_FILE_HPP

#include <string>
#include <vector>
#include <fstream>
#include <istream>
#include <stdexcept>
#include "builtin_patterns.hpp"
#include "../util/logger.hpp"

/**
 * @file pattern_file.hpp
 * @brief Loads an ordered pattern list from a plain-text file.
 *
 * FORMAT (UTF-8):
 *   # comment
 *   RUT_CHI=\b\d{1,2}[.\s-]\d{3}[.\s-]\d{3}[.\s-]?[\dkK]\b
 *   PAS_MEX=\bG-\d{8}\b
 *
 * The label ends at the first '='; the rest of the line is the regex.
 * Both are trimmed, so a regex that must begin or end with a blank has to
 * spell it as \s or [ ]. File order becomes catalog order.
 */

namespace idredact {
namespace catalog {

namespace detail {

inline void trimInPlace(std::string &s)
{
    static const char *whitespace = " \t\r\n";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        s.clear();
        return;
    }
    auto last = s.find_last_not_of(whitespace);
    s = s.substr(first, last - first + 1);
}

} // namespace detail

/**
 * @brief Parse "LABEL=regex" lines from a stream.
 * @param origin Name used in error messages.
 * @throw std::runtime_error on a line without '=' or with an empty label or regex.
 */
inline std::vector<PatternSource> parsePatternLines(std::istream &in, const std::string &origin)
{
    std::vector<PatternSource> sources;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        detail::trimInPlace(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw std::runtime_error("PatternFile: " + origin + ":" + std::to_string(lineNo) +
                                     ": expected LABEL=regex");
        }
        std::string label = line.substr(0, pos);
        std::string regex = line.substr(pos + 1);
        detail::trimInPlace(label);
        detail::trimInPlace(regex);
        if (label.empty() || regex.empty()) {
            throw std::runtime_error("PatternFile: " + origin + ":" + std::to_string(lineNo) +
                                     ": empty label or regex");
        }
        sources.emplace_back(label, regex);
    }
    return sources;
}

/**
 * @brief Read a pattern file from disk.
 * @throw std::runtime_error if the file cannot be opened or is malformed.
 */
inline std::vector<PatternSource> loadPatternFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("PatternFile: cannot open " + path);
    }
    auto sources = parsePatternLines(in, path);
    idredact::util::logger::info("PatternFile: read " + std::to_string(sources.size()) +
                                 " patterns from " + path);
    return sources;
}

} // namespace catalog
} // namespace idredact

#endif // IDREDACT_CATALOG_PATTERN_FILE_HPP
