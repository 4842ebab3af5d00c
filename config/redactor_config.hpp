#ifndef IDREDACT_CONFIG_REDACTOR_CONFIG_HPP
#define IDREDACT_CONFIG_REDACTOR_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file redactor_config.hpp
 * @brief Runtime settings for the idredact command-line filter.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp, then overridden
 *     by command-line flags in main.cpp.
 */

namespace idredact {
namespace config {

/**
 * @struct RedactorConfig
 * @brief Settings for one redaction run:
 *   - placeholder: token written over each identifier span.
 *   - patternFile: optional LABEL=regex file replacing the built-in catalog.
 *   - workerThreads: pool size for the line batch driver (0 = hardware concurrency).
 *   - regexLocale: locale imbued into the regex traits for Unicode classification.
 *   - logLevel / logFile: logger setup.
 *   - maxEntityTextLength: texts longer than this skip the entity pass.
 */
struct RedactorConfig
{
    RedactorConfig()
        : placeholder("<ID>"),
          patternFile(),
          workerThreads(0),
          regexLocale("C.UTF-8"),
          logLevel("info"),
          logFile(),
          maxEntityTextLength(100000)
    {
    }

    std::string placeholder;

    /// Empty means "use the built-in Latin-American catalog".
    std::string patternFile;

    uint32_t workerThreads;

    std::string regexLocale;

    std::string logLevel;

    /// Empty disables file output.
    std::string logFile;

    uint64_t maxEntityTextLength;
};

} // namespace config
} // namespace idredact

#endif // IDREDACT_CONFIG_REDACTOR_CONFIG_HPP
