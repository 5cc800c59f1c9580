#ifndef PIIGUARD_CORE_REDACTION_ENGINE_HPP
#define PIIGUARD_CORE_REDACTION_ENGINE_HPP

#include <string>
#include <vector>
#include <memory>
#include <sstream>
#include "capabilities.hpp"
#include "line_reader.hpp"
#include "redaction_pipeline.hpp"
#include "redaction_result.hpp"
#include "redaction_run.hpp"
#include "risk_scorer.hpp"
#include "../detection/pattern_registry.hpp"
#include "../ner/entity_recognizer.hpp"
#include "../util/json.hpp"
#include "../util/logger.hpp"
#include "../../config/redactor_config.hpp"

/**
 * @file redaction_engine.hpp
 * @brief The entry point hosts call: raw text in, RedactionResult out.
 *
 * DESIGN GOALS:
 *   - Capabilities are resolved once and owned here; every call gets fresh
 *     per-run state (Counters + SyntheticCache), so one engine can serve
 *     concurrent requests without locking.
 *   - redact() treats every byte string as plain text. There is no invalid
 *     input.
 *   - extractEntities() is the advisory NER surface, independent of nerMode.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   core::RedactionEngine engine(core::Capabilities::resolve(cfg), cfg.nerMode);
 *   core::RedactionResult r = engine.redact("Contact: alice@example.com");
 *   std::cout << r.toJson() << std::endl;
 *   @endcode
 */

namespace piiguard {
namespace core {

class RedactionEngine
{
public:
    RedactionEngine(Capabilities caps, config::NerMode nerMode)
        : caps_(std::move(caps))
        , pipeline_(detection::PatternRegistry::defaultRegistry(), *caps_.recognizer, nerMode)
    {
        util::logger::debug(std::string("RedactionEngine: nerMode=") + config::toString(nerMode)
                            + (pipeline_.substitutesEntities() ? " (entity substitution on)" : ""));
    }

    RedactionEngine(const RedactionEngine&) = delete;
    RedactionEngine& operator=(const RedactionEngine&) = delete;

    /**
     * @brief Redact a whole document.
     * @param raw Any text; empty is fine.
     */
    RedactionResult redact(const std::string &raw) const
    {
        RedactionRun run(*caps_.synthetic);
        std::string redacted;
        redacted.reserve(raw.size());
        for (const std::string &line : splitLinesKeepEnds(raw)) {
            redacted += pipeline_.redactLine(line, run);
        }

        const Counters &counts = run.counters();
        double piiScore = roundToTenth(score(raw, counts.total()));

        util::logger::debug("RedactionEngine: " + std::to_string(raw.size()) + " bytes in, "
                            + std::to_string(counts.total()) + " replacements");

        return RedactionResult(std::move(redacted), counts, piiScore,
                               caps_.nerAvailable(), caps_.syntheticAvailable(),
                               pipeline_.substitutesEntities());
    }

    /**
     * @brief Advisory NER analysis; empty when the recognizer is unavailable.
     */
    std::vector<ner::Entity> extractEntities(const std::string &raw) const
    {
        return caps_.recognizer->extract(raw);
    }

    /**
     * @brief A lazy redactor with its own fresh state. Must not outlive the engine.
     */
    std::unique_ptr<StreamRedactor> makeStream() const
    {
        return std::make_unique<StreamRedactor>(pipeline_, *caps_.synthetic);
    }

    bool nerAvailable() const { return caps_.nerAvailable(); }

    bool syntheticAvailable() const { return caps_.syntheticAvailable(); }

    // Stream mode reports counts the same way redact() does.
    bool countsEntities() const { return pipeline_.substitutesEntities(); }

private:
    Capabilities caps_;
    RedactionPipeline pipeline_;
};

/**
 * @brief {"entities":[{"text":..,"label":..,"start":..,"end":..}],"ner_available":..}
 */
inline std::string entitiesToJson(const std::vector<ner::Entity> &entities, bool nerAvailable)
{
    std::ostringstream oss;
    oss << "{\"entities\":[";
    for (size_t i = 0; i < entities.size(); ++i) {
        const ner::Entity &e = entities[i];
        if (i > 0) {
            oss << ",";
        }
        oss << "{\"text\":" << util::json::quote(e.text)
            << ",\"label\":" << util::json::quote(ner::labelFor(e.category))
            << ",\"start\":" << e.start
            << ",\"end\":" << e.end << "}";
    }
    oss << "],\"ner_available\":" << util::json::boolean(nerAvailable) << "}";
    return oss.str();
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_REDACTION_ENGINE_HPP
