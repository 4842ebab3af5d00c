#ifndef IDREDACT_CATALOG_MATCH_SPAN_HPP
#define IDREDACT_CATALOG_MATCH_SPAN_HPP

#include <string>
#include <cstddef>

namespace idredact {
namespace catalog {

/**
 * @struct MatchSpan
 * @brief Half-open code point range [start, end) inside one input text.
 */
struct MatchSpan
{
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }

    bool overlaps(const MatchSpan &other) const
    {
        return start < other.end && other.start < end;
    }

    bool operator==(const MatchSpan &other) const
    {
        return start == other.start && end == other.end;
    }
    bool operator!=(const MatchSpan &other) const { return !(*this == other); }
};

/**
 * @struct LabeledSpan
 * @brief A span plus the label of the pattern that produced it.
 *        The label is for diagnostics only; selection never looks at it.
 */
struct LabeledSpan
{
    std::string label;
    MatchSpan span;
};

} // namespace catalog
} // namespace idredact

#endif // IDREDACT_CATALOG_MATCH_SPAN_HPP
