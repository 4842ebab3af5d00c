#ifndef IDREDACT_PIPELINE_ANONYMIZATION_PIPELINE_HPP
#define IDREDACT_PIPELINE_ANONYMIZATION_PIPELINE_HPP

#include <string>
#include <vector>
#include <unordered_set>
#include <stdexcept>
#include "entity_detector.hpp"
#include "../catalog/match_span.hpp"
#include "../catalog/pattern_catalog.hpp"
#include "../redaction/id_redactor.hpp"
#include "../util/utf8.hpp"

/**
 * @file anonymization_pipeline.hpp
 * @brief Two-pass anonymization: free-text entities first, identifier numbers second.
 *
 * DESIGN GOALS:
 *   - Entity pass: replace each detected entity with "<CATEGORY>". This pass
 *     may change the text length, like the usual replace-with-label anonymizers.
 *     Overlapping detections are resolved with the same longest-first rule as
 *     identifiers.
 *   - Identifier pass: IdRedactor on the entity-masked text. Tokens inserted
 *     by the first pass are plain text to it and do not match any identifier
 *     pattern.
 *   - Texts longer than maxEntityTextLength code points skip the entity pass
 *     only; identifiers are always redacted.
 *   - An optional category allow-list limits which detections are masked.
 *   - A text that neither pass changes is returned byte for byte, even if it
 *     holds malformed UTF-8.
 *
 * USAGE:
 *   @code
 *   using namespace idredact;
 *   MyNerDetector detector;
 *   pipeline::AnonymizationPipeline anon(catalog::PatternCatalog::builtin(), &detector);
 *   std::string clean = anon.process("Correo: juan@x.com, RUT 12.345.678-9");
 *   @endcode
 */

namespace idredact {
namespace pipeline {

class AnonymizationPipeline
{
public:
    /**
     * @param patterns Identifier catalog; must outlive the pipeline.
     * @param detector Optional entity detector (nullptr = identifier pass only); not owned.
     */
    explicit AnonymizationPipeline(const catalog::PatternCatalog &patterns,
                                   const EntityDetector *detector = nullptr,
                                   const std::string &placeholder = redaction::kDefaultPlaceholder,
                                   size_t maxEntityTextLength = 100000)
        : redactor_(patterns, placeholder)
        , detector_(detector)
        , maxEntityTextLength_(maxEntityTextLength)
    {
    }

    /**
     * @brief Run both passes over one UTF-8 text.
     * @throw std::runtime_error if the detector reports a span outside the text.
     */
    std::string process(const std::string &text) const
    {
        if (detector_ == nullptr) {
            return redactor_.redact(text);
        }
        std::wstring decoded = idredact::util::utf8::decode(text);
        if (decoded.size() > maxEntityTextLength_) {
            return redactor_.redact(text);
        }

        std::wstring redacted = redactor_.redact(maskEntities(decoded));
        if (redacted == decoded) {
            return text;
        }
        return idredact::util::utf8::encode(redacted);
    }

    /**
     * @brief Mask only detections whose category is listed. An empty list
     *        (the default) masks every category. Not synchronized: call
     *        before the pipeline is shared with worker threads.
     */
    void setEntityCategories(const std::vector<std::string> &categories)
    {
        entityCategories_ = std::unordered_set<std::string>(categories.begin(), categories.end());
    }

    const redaction::IdRedactor &redactor() const { return redactor_; }
    bool hasEntityPass() const { return detector_ != nullptr; }

private:
    std::wstring maskEntities(const std::wstring &text) const
    {
        std::vector<catalog::LabeledSpan> candidates;
        for (const auto &e : detector_->detect(text)) {
            if (e.start > e.end || e.end > text.size()) {
                throw std::runtime_error("AnonymizationPipeline: detector returned span [" +
                                         std::to_string(e.start) + ", " + std::to_string(e.end) +
                                         ") outside text of length " + std::to_string(text.size()));
            }
            if (!entityCategories_.empty() && entityCategories_.count(e.category) == 0) {
                continue;
            }
            catalog::LabeledSpan c;
            c.label = e.category;
            c.span.start = e.start;
            c.span.end = e.end;
            candidates.push_back(c);
        }
        if (candidates.empty()) {
            return text;
        }

        auto accepted = redaction::selectSpans(std::move(candidates));

        std::wstring out;
        out.reserve(text.size());
        size_t cursor = 0;
        for (const auto &a : accepted) {
            out.append(text, cursor, a.span.start - cursor);
            out.push_back(L'<');
            out.append(idredact::util::utf8::decode(a.label));
            out.push_back(L'>');
            cursor = a.span.end;
        }
        out.append(text, cursor, std::wstring::npos);
        return out;
    }

    redaction::IdRedactor redactor_;
    const EntityDetector *detector_;
    size_t maxEntityTextLength_;
    std::unordered_set<std::string> entityCategories_;
};

} // namespace pipeline
} // namespace idredact

#endif // IDREDACT_PIPELINE_ANONYMIZATION_PIPELINE_HPP
