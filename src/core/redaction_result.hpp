#ifndef PIIGUARD_CORE_REDACTION_RESULT_HPP
#define PIIGUARD_CORE_REDACTION_RESULT_HPP

#include <string>
#include <sstream>
#include "counters.hpp"
#include "../util/json.hpp"

namespace piiguard {
namespace core {

/**
 * @struct RedactionResult
 * @brief What one redact() call hands back to its host. Built once, never modified.
 *
 * JSON shape (toJson):
 *   {"redacted":"...","counts":{"emails":0,...,"phones":0},"pii_score":12.3,
 *    "ner_available":false,"synthetic_available":true}
 * "counts" also carries "entities" when entity substitution was active.
 */
struct RedactionResult
{
    RedactionResult(std::string text, Counters c, double score,
                    bool ner, bool synthetic, bool entitiesCounted)
        : redactedText(std::move(text))
        , counts(c)
        , piiScore(score)
        , nerAvailable(ner)
        , syntheticAvailable(synthetic)
        , entityBucket(entitiesCounted)
    {
    }

    const std::string redactedText;
    const Counters counts;
    const double piiScore;          ///< already rounded to one decimal
    const bool nerAvailable;
    const bool syntheticAvailable;
    const bool entityBucket;        ///< counts.entities is meaningful (NER redact mode)

    std::string toJson() const
    {
        std::ostringstream oss;
        oss << "{\"redacted\":" << util::json::quote(redactedText)
            << ",\"counts\":" << counts.toJson(entityBucket)
            << ",\"pii_score\":" << util::json::oneDecimal(piiScore)
            << ",\"ner_available\":" << util::json::boolean(nerAvailable)
            << ",\"synthetic_available\":" << util::json::boolean(syntheticAvailable)
            << "}";
        return oss.str();
    }
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_REDACTION_RESULT_HPP
