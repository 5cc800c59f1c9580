#ifndef PIIGUARD_CORE_CAPABILITIES_HPP
#define PIIGUARD_CORE_CAPABILITIES_HPP

#include <memory>
#include "../../config/redactor_config.hpp"
#include "../ner/entity_recognizer.hpp"
#include "../synthetic/synthetic_generator.hpp"
#include "../util/logger.hpp"

namespace piiguard {
namespace core {

/**
 * @struct Capabilities
 * @brief The optional parts of the engine, resolved exactly once at startup.
 *
 * Neither member is ever null: a capability that could not be brought up is
 * represented by its Unavailable* stand-in, and the engine degrades to
 * placeholder redaction / advisory-less operation without failing.
 */
struct Capabilities
{
    std::unique_ptr<synthetic::SyntheticGenerator> synthetic;
    std::unique_ptr<ner::EntityRecognizer> recognizer;

    static Capabilities resolve(const config::RedactorConfig &cfg)
    {
        Capabilities caps;
        caps.synthetic = synthetic::makeSyntheticGenerator(cfg.syntheticEnabled, cfg.syntheticSeed);
        caps.recognizer = ner::makeEntityRecognizer(cfg.nerDatabase);
        util::logger::info(std::string("Capabilities: ner_available=")
                           + (caps.nerAvailable() ? "true" : "false")
                           + " synthetic_available="
                           + (caps.syntheticAvailable() ? "true" : "false"));
        return caps;
    }

    /// Both capabilities off. Useful for hosts that only want placeholders.
    static Capabilities none()
    {
        Capabilities caps;
        caps.synthetic = std::make_unique<synthetic::UnavailableSyntheticGenerator>();
        caps.recognizer = std::make_unique<ner::UnavailableEntityRecognizer>();
        return caps;
    }

    bool nerAvailable() const { return recognizer && recognizer->isAvailable(); }

    bool syntheticAvailable() const { return synthetic && synthetic->isAvailable(); }
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_CAPABILITIES_HPP
