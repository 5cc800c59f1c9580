#ifndef PIIGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define PIIGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP

#include <gtest/gtest.h>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/redactor_config.hpp"
#include "util/config_parser.hpp"

namespace {

void parseConfigText(piiguard::config::RedactorConfig& cfg, const std::string& text) {
    piiguard::util::ConfigParser parser(cfg);
    std::istringstream in(text);
    parser.loadFromStream(in);
}

} // namespace

TEST(ConfigParserTest, Defaults) {
    piiguard::config::RedactorConfig cfg;
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_FALSE(cfg.debug);
    EXPECT_TRUE(cfg.syntheticEnabled);
    EXPECT_TRUE(cfg.nerDatabase.empty());
    EXPECT_EQ(cfg.nerMode, piiguard::config::NerMode::ADVISORY);
}

TEST(ConfigParserTest, AppliesKeys) {
    piiguard::config::RedactorConfig cfg;
    parseConfigText(cfg,
                    "# PiiGuard host\n"
                    "host = 0.0.0.0\n"
                    "port=8080\n"
                    "\n"
                    "logLevel=WARN\n"
                    "workerThreads=8\n"
                    "maxBodyBytes=1024\n"
                    "gzipResponses=false\n"
                    "syntheticSeed=42\n"
                    "nerDatabase=/var/lib/piiguard/gazetteer.sqlite\n"
                    "nerMode=redact\n"
                    "colour=blue\n");
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.logLevel, "WARN");
    EXPECT_EQ(cfg.workerThreads, 8);
    EXPECT_EQ(cfg.maxBodyBytes, (uint64_t)1024);
    EXPECT_FALSE(cfg.gzipResponses);
    EXPECT_EQ(cfg.syntheticSeed, (uint64_t)42);
    EXPECT_EQ(cfg.nerDatabase, "/var/lib/piiguard/gazetteer.sqlite");
    EXPECT_EQ(cfg.nerMode, piiguard::config::NerMode::REDACT);
}

TEST(ConfigParserTest, RejectsMalformedValues) {
    piiguard::config::RedactorConfig cfg;
    EXPECT_THROW(parseConfigText(cfg, "port 8080\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "port=http\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "port=0\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "port=70000\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "port=-1\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "debug=yes\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "logLevel=verbose\n"), std::runtime_error);
    EXPECT_THROW(parseConfigText(cfg, "nerMode=loud\n"), std::runtime_error);
    // nothing was applied
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.nerMode, piiguard::config::NerMode::ADVISORY);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    piiguard::config::RedactorConfig cfg;
    piiguard::util::ConfigParser parser(cfg);
    EXPECT_NO_THROW(parser.loadFromFile("no_such_piiguard.conf"));
    EXPECT_EQ(cfg.port, 5000);
}

TEST(ConfigParserTest, EnvironmentOverridesFile) {
    piiguard::config::RedactorConfig cfg;
    parseConfigText(cfg, "port=8080\nnerDatabase=file.sqlite\n");

    ::unsetenv("PIIGUARD_HOST");
    ::setenv("PIIGUARD_PORT", "6001", 1);
    ::setenv("PIIGUARD_DEBUG", "TRUE", 1);
    ::setenv("PIIGUARD_NER_DB", "env.sqlite", 1);

    piiguard::util::ConfigParser parser(cfg);
    parser.applyEnvironment();

    ::unsetenv("PIIGUARD_PORT");
    ::unsetenv("PIIGUARD_DEBUG");
    ::unsetenv("PIIGUARD_NER_DB");

    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 6001);
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.nerDatabase, "env.sqlite");
}

TEST(ConfigParserTest, DebugEnvOnlyTrueEnables) {
    piiguard::config::RedactorConfig cfg;
    cfg.debug = true;
    ::setenv("PIIGUARD_DEBUG", "1", 1);
    piiguard::util::ConfigParser parser(cfg);
    parser.applyEnvironment();
    ::unsetenv("PIIGUARD_DEBUG");
    EXPECT_FALSE(cfg.debug);
}

#endif // PIIGUARD_TEST_UNIT_TEST_CONFIG_PARSER_HPP
