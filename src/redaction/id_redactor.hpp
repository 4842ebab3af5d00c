#ifndef IDREDACT_REDACTION_ID_REDACTOR_HPP
#define IDREDACT_REDACTION_ID_REDACTOR_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <cstddef>
#include "occupancy_set.hpp"
#include "placeholder.hpp"
#include "../catalog/match_span.hpp"
#include "../catalog/pattern_catalog.hpp"
#include "../util/utf8.hpp"

/**
 * @file id_redactor.hpp
 * @brief Masks identifier numbers found by a PatternCatalog without changing
 *        the text's length in code points.
 *
 * SELECTION RULE:
 *   1. Collect every match of every pattern.
 *   2. Order candidates by descending length, then ascending start. Candidates
 *      with identical geometry keep catalog order.
 *   3. Walk the ordered list; accept a candidate only if none of its
 *      positions is already claimed, otherwise drop it whole.
 *   4. Overwrite each accepted span with the placeholder, space-padded or
 *      truncated to the span width.
 *
 * The outcome depends only on span geometry, never on pattern order, so two
 * catalogs holding the same patterns in different orders redact identically.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace idredact;
 *   redaction::IdRedactor redactor(catalog::PatternCatalog::builtin());
 *   std::string out = redactor.redact("Mi RUT es 12.345.678-9");
 *   // out == "Mi RUT es <ID>        "
 *   @endcode
 */

namespace idredact {
namespace redaction {

/**
 * @struct RedactionReport
 * @brief Redacted text plus the spans that were overwritten, in ascending start order.
 */
struct RedactionReport
{
    std::string text;
    std::vector<catalog::LabeledSpan> redacted;
};

/**
 * @brief Choose the non-conflicting subset of candidates, longest first,
 *        leftmost on ties. Returned in ascending start order.
 */
inline std::vector<catalog::LabeledSpan> selectSpans(std::vector<catalog::LabeledSpan> candidates)
{
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const catalog::LabeledSpan &a, const catalog::LabeledSpan &b) {
                         if (a.span.length() != b.span.length()) {
                             return a.span.length() > b.span.length();
                         }
                         return a.span.start < b.span.start;
                     });

    OccupancySet occupied;
    std::vector<catalog::LabeledSpan> accepted;
    for (auto &candidate : candidates) {
        if (candidate.span.length() == 0) {
            continue;
        }
        if (occupied.tryClaim(candidate.span)) {
            accepted.push_back(std::move(candidate));
        }
    }

    std::sort(accepted.begin(), accepted.end(),
              [](const catalog::LabeledSpan &a, const catalog::LabeledSpan &b) {
                  return a.span.start < b.span.start;
              });
    return accepted;
}

/**
 * @brief Overwrite each span of `text` with the fitted placeholder.
 *        Spans must be disjoint and inside the text.
 */
inline void applySpans(std::wstring &text,
                       const std::vector<catalog::LabeledSpan> &spans,
                       const std::wstring &placeholder)
{
    for (const auto &s : spans) {
        const std::wstring fill = fitPlaceholder(placeholder, s.span.length());
        std::copy(fill.begin(), fill.end(), text.begin() + static_cast<std::ptrdiff_t>(s.span.start));
    }
}

class IdRedactor
{
public:
    /**
     * @param patterns Must outlive the redactor; never modified.
     * @param placeholder UTF-8 token written over each identifier.
     */
    explicit IdRedactor(const catalog::PatternCatalog &patterns,
                        const std::string &placeholder = kDefaultPlaceholder)
        : catalog_(patterns)
        , placeholder_(idredact::util::utf8::decode(placeholder))
    {
    }

    /**
     * @brief Redact a decoded text. The result has the same size as the input.
     */
    std::wstring redact(const std::wstring &text) const
    {
        auto accepted = selectSpans(catalog_.findAll(text));
        if (accepted.empty()) {
            return text;
        }
        std::wstring out = text;
        applySpans(out, accepted, placeholder_);
        return out;
    }

    /**
     * @brief Redact UTF-8 text. If nothing matches, the input is returned
     *        byte for byte, including any malformed sequences.
     */
    std::string redact(const std::string &text) const
    {
        return redactWithReport(text).text;
    }

    RedactionReport redactWithReport(const std::string &text) const
    {
        RedactionReport report;
        if (text.empty()) {
            return report;
        }

        std::wstring decoded = idredact::util::utf8::decode(text);
        report.redacted = selectSpans(catalog_.findAll(decoded));
        if (report.redacted.empty()) {
            report.text = text;
            return report;
        }

        applySpans(decoded, report.redacted, placeholder_);
        report.text = idredact::util::utf8::encode(decoded);
        return report;
    }

    const catalog::PatternCatalog &patternCatalog() const { return catalog_; }

    std::string placeholder() const { return idredact::util::utf8::encode(placeholder_); }

private:
    const catalog::PatternCatalog &catalog_;
    std::wstring placeholder_;
};

/**
 * @brief One-shot redaction against an explicit catalog.
 */
inline std::string redact(const std::string &text,
                          const catalog::PatternCatalog &patterns,
                          const std::string &placeholder = kDefaultPlaceholder)
{
    return IdRedactor(patterns, placeholder).redact(text);
}

} // namespace redaction
} // namespace idredact

#endif // IDREDACT_REDACTION_ID_REDACTOR_HPP
