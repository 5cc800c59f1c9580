#ifndef PIIGUARD_CONFIG_REDACTOR_CONFIG_HPP
#define PIIGUARD_CONFIG_REDACTOR_CONFIG_HPP

#include <string>
#include <cstdint>

/**
 * @file redactor_config.hpp
 * @brief Defines process configuration for a PiiGuard host (HTTP server or CLI).
 *
 * USAGE:
 *   - This struct can be populated either manually or through config_parser.hpp
 *   - Contains the listening address, logging, capability toggles, etc.
 */

namespace piiguard {
namespace config {

/**
 * @brief Whether entities found by the recognizer are only reported, or also
 *        substituted in the redacted text.
 */
enum class NerMode {
    ADVISORY,
    REDACT
};

/**
 * @struct RedactorConfig
 * @brief Holds the local configuration of one PiiGuard process:
 *   - host/port: Where the HTTP host listens.
 *   - debug: Forces DEBUG logging.
 *   - logLevel/logFile: Logger setup.
 *   - workerThreads: Size of the request worker pool (0 = hardware concurrency).
 *   - maxBodyBytes: Largest request body accepted by the HTTP host.
 *   - gzipResponses: Honour "Accept-Encoding: gzip".
 *   - syntheticEnabled/syntheticSeed: Synthetic value generator capability.
 *   - nerDatabase/nerMode: Entity recognizer capability.
 */
struct RedactorConfig
{
    /**
     * @brief Construct a new RedactorConfig with some defaults:
     *   host = "127.0.0.1", port = 5000, logLevel = "info",
     *   maxBodyBytes = 8 MiB, synthetic generation on, NER off (no database).
     */
    RedactorConfig()
        : host("127.0.0.1"),
          port(5000),
          debug(false),
          logLevel("info"),
          logFile(""),
          workerThreads(4),
          maxBodyBytes(8u * 1024u * 1024u),
          gzipResponses(true),
          syntheticEnabled(true),
          syntheticSeed(0),
          nerDatabase(""),
          nerMode(NerMode::ADVISORY)
    {
    }

    /// Interface to bind the HTTP host on.
    std::string host;

    /// TCP port of the HTTP host.
    uint16_t port;

    /// When true the logger runs at DEBUG regardless of logLevel.
    bool debug;

    /// Minimal log level name: debug, info, warn, error, critical.
    std::string logLevel;

    /// Optional log file; empty means console only.
    std::string logFile;

    uint16_t workerThreads;

    uint64_t maxBodyBytes;

    bool gzipResponses;

    /// Turns the synthetic value generator on; off means placeholders only.
    bool syntheticEnabled;

    /// Non-zero seeds the generator deterministically (tests, reproducible runs).
    uint64_t syntheticSeed;

    /// SQLite gazetteer path. Empty leaves the entity recognizer unavailable.
    std::string nerDatabase;

    NerMode nerMode;
};

inline std::string toString(NerMode mode)
{
    return mode == NerMode::REDACT ? "redact" : "advisory";
}

} // namespace config
} // namespace piiguard

#endif // PIIGUARD_CONFIG_REDACTOR_CONFIG_HPP
