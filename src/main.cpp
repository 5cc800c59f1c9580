#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "config/redactor_config.hpp"
#include "core/capabilities.hpp"
#include "core/redaction_engine.hpp"
#include "core/risk_scorer.hpp"
#include "network/http_redact_server.hpp"
#include "util/config_parser.hpp"
#include "util/json.hpp"
#include "util/logger.hpp"

namespace {

std::atomic<bool> g_stopRequested(false);

void onSignal(int) { g_stopRequested = true; }

void printUsage(const char* prog) {
    std::cerr << "usage: " << prog << " [--config <file>] [--serve] [--stream [file]]\n"
              << "  --config <file>  key=value configuration (default: piiguard.conf)\n"
              << "  --serve          run the HTTP redaction host (default)\n"
              << "  --stream [file]  redact a file, or stdin, to stdout line by line\n";
}

int runStream(const piiguard::core::RedactionEngine& engine, const std::string& inputPath) {
    std::ifstream file;
    if (!inputPath.empty()) {
        file.open(inputPath, std::ios::binary);
        if (!file.is_open()) {
            piiguard::util::logger::critical("[main] Cannot open input file: " + inputPath);
            return 1;
        }
    }
    std::istream& in = inputPath.empty() ? std::cin : file;

    std::unique_ptr<piiguard::core::StreamRedactor> stream = engine.makeStream();
    stream->redactStream(in, std::cout);

    double score = piiguard::core::roundToTenth(stream->score());
    piiguard::util::logger::info("[main] Stream finished: lines=" + std::to_string(stream->lines())
                                 + " counts=" + stream->counters().toJson(engine.countsEntities())
                                 + " pii_score=" + piiguard::util::json::oneDecimal(score));
    return 0;
}

int runServer(const piiguard::core::RedactionEngine& engine,
              const piiguard::config::RedactorConfig& cfg) {
    piiguard::network::HttpRedactServer server(engine, cfg);
    if (!server.Start()) {
        piiguard::util::logger::critical("[main] Failed to start HTTP server");
        return 1;
    }
    while (!g_stopRequested.load() && server.IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    piiguard::util::logger::info("[main] Shutting down.");
    server.Stop();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto& log = piiguard::util::logger::Logger::getInstance();

    // 1. Command line
    std::string configPath = "piiguard.conf";
    std::string streamPath;
    bool streamMode = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--serve") {
            streamMode = false;
        } else if (arg == "--stream") {
            streamMode = true;
            if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                streamPath = argv[++i];
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }

    // stdout carries redacted text in stream mode
    log.setConsoleToStderr(streamMode);

    // 2. Configuration: file, then environment
    piiguard::config::RedactorConfig cfg;
    try {
        piiguard::util::ConfigParser parser(cfg);
        parser.loadFromFile(configPath);
        parser.applyEnvironment();
        log.setLogLevel(cfg.debug ? piiguard::util::logger::LogLevel::DEBUG
                                  : piiguard::util::logger::parseLogLevel(cfg.logLevel));
        if (!cfg.logFile.empty()) {
            log.enableFileOutput(cfg.logFile, true);
        }
    } catch (const std::exception& e) {
        log.critical(std::string("[main] Configuration error: ") + e.what());
        return 1;
    }

    log.info("[main] PiiGuard starting (nerMode=" + piiguard::config::toString(cfg.nerMode) + ")");

    // 3. Optional capabilities, resolved once
    piiguard::core::RedactionEngine engine(piiguard::core::Capabilities::resolve(cfg), cfg.nerMode);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // 4. Run
    int rc = streamMode ? runStream(engine, streamPath) : runServer(engine, cfg);

    log.info("[main] PiiGuard exiting.");
    return rc;
}
