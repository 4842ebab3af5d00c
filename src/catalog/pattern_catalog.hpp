#ifndef IDREDACT_CATALOG_PATTERN_CATALOG_HPP
#define IDREDACT_CATALOG_PATTERN_CATALOG_HPP

#include <string>
#include <vector>
#include <regex>
#include <locale>
#include <stdexcept>
#include <unordered_set>
#include "builtin_patterns.hpp"
#include "match_span.hpp"
#include "unicode_regex_traits.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"
#include "../util/utf8.hpp"

/**
 * @file pattern_catalog.hpp
 * @brief Ordered, immutable set of compiled identifier patterns.
 *
 * DESIGN GOALS:
 *   - Compile every pattern exactly once, case-insensitively, and fail loudly
 *     if any of them is malformed. A silently dropped pattern would weaken
 *     redaction coverage without anyone noticing.
 *   - Match over code points (a wide regex on a decoded std::wstring) so that
 *     reported offsets are code point offsets. \b, \w and case folding
 *     follow the imbued UTF-8 locale (Ñ counts as a word character); \s and
 *     \d also accept Unicode whitespace and digits (see UnicodeRegexTraits).
 *   - No mutable state after build(): one catalog may be shared by any
 *     number of threads calling findAll() concurrently.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace idredact::catalog;
 *
 *   const PatternCatalog &cat = PatternCatalog::builtin();
 *   for (const auto &hit : cat.findAll("Mi RUT es 12.345.678-9")) {
 *       // hit.label == "RUT_CHI" (or "CI_URU"), hit.span == {10, 22}
 *   }
 *
 *   auto custom = PatternCatalog::build({{"ORDER", R"(\bORD-\d{6}\b)"}});
 *   @endcode
 */

namespace idredact {
namespace catalog {

constexpr const char *kDefaultRegexLocale = "C.UTF-8";

/**
 * @class PatternCompilationError
 * @brief A pattern source is not a valid expression, or its label is unusable.
 */
class PatternCompilationError : public std::runtime_error
{
public:
    PatternCompilationError(const std::string &label, const std::string &engineMessage)
        : std::runtime_error("PatternCatalog: pattern '" + label + "' failed to compile: " + engineMessage)
        , label_(label)
        , engineMessage_(engineMessage)
    {
    }

    const std::string &label() const { return label_; }
    const std::string &engineMessage() const { return engineMessage_; }

private:
    std::string label_;
    std::string engineMessage_;
};

/**
 * @struct PatternEntry
 * @brief One compiled pattern. Only exposed by const reference.
 */
struct PatternEntry
{
    std::string label;
    std::string source;     ///< UTF-8 source as given to build()
    UnicodeRegex matcher;
};

/**
 * @brief Resolve a locale by name. Falls back to the environment locale,
 *        then to the classic "C" locale, logging a warning each time.
 */
inline std::locale resolveRegexLocale(const std::string &name)
{
    try {
        return std::locale(name.c_str());
    }
    catch (const std::runtime_error &ex) {
        idredact::util::logger::warn("PatternCatalog: locale '" + name + "' unavailable (" + ex.what() +
                                     "), falling back to the environment locale");
    }
    try {
        return std::locale("");
    }
    catch (const std::runtime_error &ex) {
        idredact::util::logger::warn(std::string("PatternCatalog: environment locale unavailable (") +
                                     ex.what() + "), non-ASCII word boundaries will be ASCII-only");
    }
    return std::locale::classic();
}

class PatternCatalog
{
public:
    /**
     * @brief Compile an ordered list of (label, source) pairs.
     * @param sources Patterns in iteration order.
     * @param localeName Locale imbued into every regex's traits.
     * @throw PatternCompilationError on an empty or duplicate label, or a malformed source.
     */
    static PatternCatalog build(const std::vector<PatternSource> &sources,
                                const std::string &localeName = kDefaultRegexLocale)
    {
        PatternCatalog catalog;
        catalog.locale_ = resolveRegexLocale(localeName);
        catalog.entries_.reserve(sources.size());

        std::unordered_set<std::string> seen;
        std::vector<std::string> fingerprintLines;
        fingerprintLines.reserve(sources.size());

        for (const auto &src : sources) {
            const std::string &label = src.first;
            if (label.empty()) {
                throw PatternCompilationError(label, "empty label");
            }
            if (!seen.insert(label).second) {
                throw PatternCompilationError(label, "duplicate label");
            }

            PatternEntry entry;
            entry.label = label;
            entry.source = src.second;
            try {
                entry.matcher.imbue(catalog.locale_);
                entry.matcher.assign(idredact::util::utf8::decode(src.second),
                                     std::regex_constants::ECMAScript | std::regex_constants::icase);
            }
            catch (const std::regex_error &ex) {
                idredact::util::logger::error("PatternCatalog: rejecting pattern '" + label + "': " + ex.what());
                throw PatternCompilationError(label, ex.what());
            }

            fingerprintLines.push_back(label + "=" + src.second);
            catalog.entries_.push_back(std::move(entry));
        }

        catalog.fingerprint_ = idredact::util::hashing::sha256Lines(fingerprintLines);
        idredact::util::logger::debug("PatternCatalog: compiled " + std::to_string(catalog.entries_.size()) +
                                      " patterns, fingerprint " + catalog.fingerprint_);
        return catalog;
    }

    /**
     * @brief The process-wide catalog of built-in Latin-American identifier
     *        patterns. Built on first use; read-only afterwards.
     * @throw PatternCompilationError if the built-in set fails to compile.
     */
    static const PatternCatalog &builtin()
    {
        static const PatternCatalog instance = build(builtinPatterns());
        return instance;
    }

    /**
     * @brief Every match of every pattern in a decoded text.
     *
     * Per pattern, matches are the engine's leftmost, non-overlapping
     * successive matches. Matches of different patterns may overlap.
     * Results are grouped by pattern in catalog order; within a pattern they
     * are in ascending start order. Empty matches are skipped.
     */
    std::vector<LabeledSpan> findAll(const std::wstring &text) const
    {
        std::vector<LabeledSpan> hits;
        for (const auto &entry : entries_) {
            auto begin = UnicodeRegexIterator(text.begin(), text.end(), entry.matcher);
            for (auto it = begin; it != UnicodeRegexIterator(); ++it) {
                const auto &m = *it;
                if (m.length(0) == 0) {
                    continue;
                }
                MatchSpan span;
                span.start = static_cast<size_t>(m.position(0));
                span.end = span.start + static_cast<size_t>(m.length(0));
                hits.push_back(LabeledSpan{entry.label, span});
            }
        }
        return hits;
    }

    /**
     * @brief UTF-8 convenience overload; offsets are code points of the decoded text.
     */
    std::vector<LabeledSpan> findAll(const std::string &text) const
    {
        return findAll(idredact::util::utf8::decode(text));
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const std::vector<PatternEntry> &entries() const { return entries_; }

    /// SHA-256 (hex) of the ordered "label=source" lines.
    const std::string &fingerprint() const { return fingerprint_; }

    const std::locale &locale() const { return locale_; }

private:
    PatternCatalog() = default;

    std::vector<PatternEntry> entries_;
    std::string fingerprint_;
    std::locale locale_;
};

} // namespace catalog
} // namespace idredact

#endif // IDREDACT_CATALOG_PATTERN_CATALOG_HPP
