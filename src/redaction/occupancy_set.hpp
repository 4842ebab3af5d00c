#ifndef IDREDACT_REDACTION_OCCUPANCY_SET_HPP
#define IDREDACT_REDACTION_OCCUPANCY_SET_HPP

#include <map>
#include <vector>
#include <iterator>
#include "../catalog/match_span.hpp"

namespace idredact {
namespace redaction {

/**
 * @class OccupancySet
 * @brief Sorted set of disjoint half-open intervals already claimed by
 *        accepted spans. Overlap queries are O(log n) in the number of
 *        accepted spans, independent of text length.
 */
class OccupancySet
{
public:
    /**
     * @brief True if any position in [span.start, span.end) is claimed.
     */
    bool intersects(const catalog::MatchSpan &span) const
    {
        if (span.start >= span.end) {
            return false;
        }
        // first interval starting strictly after span.start
        auto it = intervals_.upper_bound(span.start);
        if (it != intervals_.end() && it->first < span.end) {
            return true;
        }
        if (it != intervals_.begin()) {
            auto prev = std::prev(it);
            if (prev->second > span.start) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Claim the span if it is entirely free.
     * @return false (and no change) if any position was already claimed.
     */
    bool tryClaim(const catalog::MatchSpan &span)
    {
        if (intersects(span)) {
            return false;
        }
        if (span.start < span.end) {
            intervals_.emplace(span.start, span.end);
        }
        return true;
    }

    size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }

    /// Claimed intervals in ascending start order.
    std::vector<catalog::MatchSpan> intervals() const
    {
        std::vector<catalog::MatchSpan> out;
        out.reserve(intervals_.size());
        for (const auto &kv : intervals_) {
            out.push_back(catalog::MatchSpan{kv.first, kv.second});
        }
        return out;
    }

private:
    std::map<size_t, size_t> intervals_;   ///< start -> end
};

} // namespace redaction
} // namespace idredact

#endif // IDREDACT_REDACTION_OCCUPANCY_SET_HPP
