#ifndef PIIGUARD_CORE_REDACTION_PIPELINE_HPP
#define PIIGUARD_CORE_REDACTION_PIPELINE_HPP

#include <string>
#include <vector>
#include <istream>
#include <ostream>
#include "category.hpp"
#include "counters.hpp"
#include "line_reader.hpp"
#include "redaction_run.hpp"
#include "risk_scorer.hpp"
#include "../detection/pattern_registry.hpp"
#include "../ner/entity_recognizer.hpp"
#include "../synthetic/synthetic_generator.hpp"
#include "../../config/redactor_config.hpp"
#include "../util/logger.hpp"

/**
 * @file redaction_pipeline.hpp
 * @brief Line-at-a-time redaction: (optional entity pass) then the pattern registry.
 *
 * DESIGN GOALS:
 *   - redactLine() is the only place a line is rewritten. Both the buffered
 *     RedactionEngine::redact() and the lazy StreamRedactor go through it.
 *   - No matching across line boundaries. A token split by a newline is not
 *     detected.
 *   - The line terminator is part of the line and comes out untouched.
 *   - The pipeline itself is stateless; all mutable state lives in the
 *     RedactionRun passed in.
 *
 * USAGE EXAMPLE:
 *   @code
 *   RedactionPipeline pipeline(PatternRegistry::defaultRegistry(), recognizer, NerMode::ADVISORY);
 *   StreamRedactor stream(pipeline, generator);
 *   stream.redactStream(std::cin, std::cout);
 *   // stream.counters(), stream.score()
 *   @endcode
 */

namespace piiguard {
namespace core {

class RedactionPipeline
{
public:
    RedactionPipeline(const detection::PatternRegistry &registry,
                      const ner::EntityRecognizer &recognizer,
                      config::NerMode nerMode)
        : registry_(registry)
        , recognizer_(recognizer)
        , nerMode_(nerMode)
    {
    }

    /**
     * @brief Redact one line, recording every replacement in the run.
     */
    std::string redactLine(const std::string &line, RedactionRun &run) const
    {
        if (substitutesEntities()) {
            return registry_.applyAll(redactEntities(line, run), run);
        }
        return registry_.applyAll(line, run);
    }

    /**
     * @brief True when recognized PERSON/ORGANIZATION/GPE spans are replaced too.
     */
    bool substitutesEntities() const
    {
        return nerMode_ == config::NerMode::REDACT && recognizer_.isAvailable();
    }

private:
    // PRODUCT spans are reported by the recognizer but kept verbatim.
    std::string redactEntities(const std::string &line, RedactionRun &run) const
    {
        std::vector<ner::Entity> entities = recognizer_.extract(line);
        if (entities.empty()) {
            return line;
        }
        std::string out;
        out.reserve(line.size());
        size_t cursor = 0;
        for (const ner::Entity &e : entities) {
            if (e.category == Category::PRODUCT) {
                continue;
            }
            out.append(line, cursor, e.start - cursor);
            out += run.substitute(e.category, e.text);
            run.record(e.category);
            cursor = e.end;
        }
        out.append(line, cursor, std::string::npos);
        return out;
    }

    const detection::PatternRegistry &registry_;
    const ner::EntityRecognizer &recognizer_;
    config::NerMode nerMode_;
};

/*
  StreamRedactor
  --------------------------------
  Lazy mode: redacts and hands back one line at a time. All lines share one
  RedactionRun, so counts and synthetic replacements are consistent across
  the whole stream, and a RiskAccumulator scores the original text as it
  passes through.
*/
class StreamRedactor
{
public:
    StreamRedactor(const RedactionPipeline &pipeline, synthetic::SyntheticGenerator &generator)
        : pipeline_(pipeline)
        , run_(generator)
    {
    }

    StreamRedactor(const StreamRedactor&) = delete;
    StreamRedactor& operator=(const StreamRedactor&) = delete;

    std::string next(const std::string &line)
    {
        risk_.add(line);
        ++lines_;
        return pipeline_.redactLine(line, run_);
    }

    /**
     * @brief Redact everything readable from in, writing each line to out as soon as it is done.
     * @return Number of lines processed.
     */
    uint64_t redactStream(std::istream &in, std::ostream &out)
    {
        uint64_t processed = 0;
        std::string line;
        while (readLineKeepEnd(in, line)) {
            out << next(line);
            out.flush();
            ++processed;
        }
        util::logger::debug("StreamRedactor: processed " + std::to_string(processed) + " lines");
        return processed;
    }

    const Counters& counters() const { return run_.counters(); }

    double score() const { return risk_.score(run_.counters().total()); }

    uint64_t lines() const { return lines_; }

private:
    const RedactionPipeline &pipeline_;
    RedactionRun run_;
    RiskAccumulator risk_;
    uint64_t lines_ = 0;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_REDACTION_PIPELINE_HPP
