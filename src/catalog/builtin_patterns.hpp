#ifndef IDREDACT_CATALOG_BUILTIN_PATTERNS_HPP
#define IDREDACT_CATALOG_BUILTIN_PATTERNS_HPP

#include <string>
#include <utility>
#include <vector>

/**
 * @file builtin_patterns.hpp
 * @brief The fixed Latin-American identifier pattern set.
 *
 * Sources are UTF-8, ECMAScript grammar, compiled case-insensitively.
 * Labels are <document type>_<country code>, e.g. RUT_CHI, CURP_MEX.
 *
 * CI_NIC and RUC_NIC share one source. Both stay in the set: the redactor
 * receives two identical spans and keeps one of them.
 */

namespace idredact {
namespace catalog {

/// (label, regex source)
using PatternSource = std::pair<std::string, std::string>;

inline const std::vector<PatternSource> &builtinPatterns()
{
    static const std::vector<PatternSource> patterns = {
        {"CI_NIC",   R"(\b\d{3}[-\s]\d{6}[-\s]\d{4}[A-Z]?\b)"},
        {"RUC_NIC",  R"(\b\d{3}[-\s]\d{6}[-\s]\d{4}[A-Z]?\b)"},
        {"CPF_BRA",  R"(\b\d{3}[.\s-]\d{3}[.\s-]\d{3}[.\s-]\d{2}\b)"},
        {"DPI_GTM",  R"(\b\d{4}\s\d{5}\s\d{4}\b)"},
        {"CURP_MEX", R"(\b[A-Z]{4}-?\d{6}-?[HM][A-Z]{5}[A-Z0-9]\b)"},
        {"RFC_MEX",  R"(\b[A-ZÑ&]{3,4}-?\d{6}-?[A-Z0-9]{3}\b)"},
        {"RIF_VEN",  R"(\b[JGVEP][- ]\d{8}[- ]\d\b)"},
        {"CI_BOL",   R"(\b\d{6,8}[-\s][A-Z]{2}\b)"},
        {"RUC_PRY",  R"(\b\d{6,8}[A-Z]?[-\s]\d\b)"},
        {"CUIT_ARG", R"(\b\d{2}[.\s-]\d{8}[.\s-]\d\b)"},
        {"CI_URU",   R"(\b\d{1,2}[.\s-]\d{3}[.\s-]\d{3}[.\s-]\d\b)"},
        {"RUT_CHI",  R"(\b\d{1,2}[.\s-]\d{3}[.\s-]\d{3}[.\s-]?[\dkK]\b)"},
        {"CI_VEN",   R"(\b[VvEe][- ]\d{6,8}\b)"},
        {"PAS_ARG",  R"(\bAA[-\s]\d{7}\b)"},
        {"PAS_CHI",  R"(\b[Cc]-\d{8}\b)"},
        {"PAS_MEX",  R"(\bG-\d{8}\b)"},
        {"ID_HTI",   R"(\b\d{2}[-\s]\d{2}[-\s]\d{2}[-\s]\d{5}\b)"},
        {"CI_CRI",   R"(\bCR[-\s]?\d[-\s]?\d{4}[-\s]?\d{4}\b)"},
        {"CI_CUB",   R"(\bCUB[-\s]?\d{6}[-\s]?\d{5}\b)"},
        {"NIT_BOL",  R"(\bBO[-\s]?\d{6,8}[-\s]?\d\b)"},
        {"NIT_COL",  R"(\bCOL[-\s]?\d{8,10}-\d\b)"},
        {"NIT_GTM",  R"(\bGT[-\s]?\d{6,8}[-\s]?\d\b)"},
        {"NIT_SLV",  R"(\bSV[-\s]?\d{4}[-\s]?\d{6}[-\s]?\d{3}[-\s]?\d\b)"},
        {"RNC_DOM",  R"(\bRD[-\s]?\d[-\s]?\d{2}[-\s]?\d{5}[-\s]?\d\b)"},
        {"RTN_HND",  R"(\bHN[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{5}\b)"},
        {"RUC_ECU",  R"(\bEC[-\s]?\d{10}[-\s]?\d{3}\b)"},
        {"RUC_PAN",  R"(\bP[-\s]?\d{1,4}[-\s]?\d{1,4}[-\s]?\d{1,4}\b)"},
        {"RUC_PER",  R"(\bPE[-\s]?(10|15|16|17|20)\d{8}\b)"},
    };
    return patterns;
}

} // namespace catalog
} // namespace idredact

#endif // IDREDACT_CATALOG_BUILTIN_PATTERNS_HPP
