#ifndef IDREDACT_PIPELINE_ENTITY_DETECTOR_HPP
#define IDREDACT_PIPELINE_ENTITY_DETECTOR_HPP

#include <string>
#include <vector>
#include <cstddef>

/**
 * @file entity_detector.hpp
 * @brief Seam for an external free-text PII detector (emails, phone numbers,
 *        names, ...). idredact ships no implementation; callers plug in an
 *        adapter around whatever NLP engine they run.
 *
 * Implementations are called from several worker threads at once and must
 * make detect() safe for that. An engine that is not thread-safe should be
 * created once per worker and wrapped in its own detector instance.
 */

namespace idredact {
namespace pipeline {

/**
 * @struct EntitySpan
 * @brief One detected entity, as code point offsets into the decoded text.
 */
struct EntitySpan
{
    std::string category;   ///< e.g. "EMAIL_ADDRESS", "PHONE_NUMBER"
    size_t start = 0;
    size_t end = 0;         ///< exclusive
};

class EntityDetector
{
public:
    virtual ~EntityDetector() = default;

    /**
     * @brief Detect entities in a decoded text.
     * @param text Code points of the input.
     * @return Spans in any order; they may overlap.
     */
    virtual std::vector<EntitySpan> detect(const std::wstring &text) const = 0;
};

} // namespace pipeline
} // namespace idredact

#endif // IDREDACT_PIPELINE_ENTITY_DETECTOR_HPP
