#ifndef PIIGUARD_UTIL_CONFIG_PARSER_HPP
#define PIIGUARD_UTIL_CONFIG_PARSER_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <algorithm>
#include <cctype>
#include <mutex>
#include "../../config/redactor_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Provides a minimal, fully functional parser for PiiGuard's RedactorConfig.
 *
 * DESIGN GOALS:
 *   - Read a simple "key=value" style configuration file.
 *   - Populate piiguard::config::RedactorConfig fields (host, port, nerDatabase, ...).
 *   - Apply PIIGUARD_* environment overrides after the file, so a container can
 *     reconfigure the host without shipping a new file.
 *   - Header-only, no external libraries.
 *
 * USAGE:
 *   @code
 *   using namespace piiguard::util;
 *
 *   piiguard::config::RedactorConfig cfg;
 *   ConfigParser parser(cfg);
 *   parser.loadFromFile("piiguard.conf");
 *   parser.applyEnvironment();
 *   @endcode
 */

namespace piiguard {
namespace util {

/**
 * @class ConfigParser
 * @brief Minimal parser that reads a plain text key=value config, updates RedactorConfig fields.
 */
class ConfigParser
{
public:
    /**
     * @brief Construct a new ConfigParser object, referencing a RedactorConfig to populate.
     */
    explicit ConfigParser(piiguard::config::RedactorConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys in config_.
     * @param filepath The path to the config file.
     * @throw std::runtime_error if lines are malformed. A missing file only logs a warning.
     */
    inline void loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            piiguard::util::logger::warn("ConfigParser: File not found: " + filepath + ", using defaults");
            return;
        }

        piiguard::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        piiguard::util::logger::info("ConfigParser: Config loaded.");
    }

    /**
     * @brief Parse key=value lines from any stream (used by loadFromFile and by tests).
     */
    inline void loadFromStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);

            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo)
                                         + " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    /**
     * @brief Apply PIIGUARD_HOST, PIIGUARD_PORT, PIIGUARD_DEBUG and PIIGUARD_NER_DB.
     */
    inline void applyEnvironment()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const char *host = std::getenv("PIIGUARD_HOST")) {
            config_.host = host;
            piiguard::util::logger::debug("ConfigParser: host overridden by PIIGUARD_HOST");
        }
        if (const char *port = std::getenv("PIIGUARD_PORT")) {
            config_.port = parsePort(port);
            piiguard::util::logger::debug("ConfigParser: port overridden by PIIGUARD_PORT");
        }
        if (const char *dbg = std::getenv("PIIGUARD_DEBUG")) {
            std::string v(dbg);
            std::transform(v.begin(), v.end(), v.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            config_.debug = (v == "true");
        }
        if (const char *db = std::getenv("PIIGUARD_NER_DB")) {
            config_.nerDatabase = db;
            piiguard::util::logger::debug("ConfigParser: nerDatabase overridden by PIIGUARD_NER_DB");
        }
    }

private:
    piiguard::config::RedactorConfig &config_;
    std::mutex mutex_;

    /**
     * @brief Apply a recognized key-value pair to config_ fields. Unknown keys are logged.
     */
    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "host") {
            config_.host = val;
        }
        else if (key == "port") {
            config_.port = parsePort(val);
        }
        else if (key == "debug") {
            config_.debug = parseBool(key, val);
        }
        else if (key == "logLevel") {
            // throws on an unknown level name
            piiguard::util::logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "workerThreads") {
            config_.workerThreads = static_cast<uint16_t>(parseUInt(val, std::numeric_limits<uint16_t>::max()));
        }
        else if (key == "maxBodyBytes") {
            config_.maxBodyBytes = parseUInt(val, std::numeric_limits<uint64_t>::max());
        }
        else if (key == "gzipResponses") {
            config_.gzipResponses = parseBool(key, val);
        }
        else if (key == "syntheticEnabled") {
            config_.syntheticEnabled = parseBool(key, val);
        }
        else if (key == "syntheticSeed") {
            config_.syntheticSeed = parseUInt(val, std::numeric_limits<uint64_t>::max());
        }
        else if (key == "nerDatabase") {
            config_.nerDatabase = val;
        }
        else if (key == "nerMode") {
            if (val == "advisory") {
                config_.nerMode = piiguard::config::NerMode::ADVISORY;
            } else if (val == "redact") {
                config_.nerMode = piiguard::config::NerMode::REDACT;
            } else {
                throw std::runtime_error("ConfigParser: nerMode must be 'advisory' or 'redact', got '" + val + "'");
            }
        }
        else {
            piiguard::util::logger::warn("ConfigParser: Unrecognized key '" + key + "'");
            return;
        }
        piiguard::util::logger::debug("ConfigParser: " + key + " set");
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(0, pos);
        }
        else {
            s.clear();
            return;
        }
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    inline bool parseBool(const std::string &key, const std::string &val) const
    {
        if (val == "true" || val == "1")  return true;
        if (val == "false" || val == "0") return false;
        throw std::runtime_error("ConfigParser: " + key + " expects true/false, got '" + val + "'");
    }

    /**
     * @brief Parse a string into an unsigned integer no larger than maxValue. If invalid, throw.
     */
    inline uint64_t parseUInt(const std::string &val, uint64_t maxValue) const
    {
        uint64_t n = 0;
        try {
            if (val.empty() || val[0] == '-' || val[0] == '+') {
                throw std::runtime_error("not an unsigned number");
            }
            size_t idx = 0;
            n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
        if (n > maxValue) {
            throw std::runtime_error("ConfigParser: value out of range: " + val);
        }
        return n;
    }

    inline uint16_t parsePort(const std::string &val) const
    {
        uint64_t port = parseUInt(val, std::numeric_limits<uint16_t>::max());
        if (port == 0) {
            throw std::runtime_error("ConfigParser: port must be non-zero");
        }
        return static_cast<uint16_t>(port);
    }
};

} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CONFIG_PARSER_HPP
