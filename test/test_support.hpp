#ifndef PIIGUARD_TEST_TEST_SUPPORT_HPP
#define PIIGUARD_TEST_TEST_SUPPORT_HPP

#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>

#include "config/redactor_config.hpp"
#include "core/capabilities.hpp"
#include "core/redaction_engine.hpp"
#include "ner/entity_recognizer.hpp"
#include "synthetic/synthetic_generator.hpp"

namespace piiguard {
namespace test {

// Engine with both optional capabilities off: every replacement is a placeholder.
inline std::unique_ptr<core::RedactionEngine> makePlaceholderEngine(
    config::NerMode mode = config::NerMode::ADVISORY) {
    return std::make_unique<core::RedactionEngine>(core::Capabilities::none(), mode);
}

inline std::unique_ptr<core::RedactionEngine> makeSyntheticEngine(uint64_t seed) {
    core::Capabilities caps;
    caps.synthetic = std::make_unique<synthetic::FakeDataGenerator>(seed);
    caps.recognizer = std::make_unique<ner::UnavailableEntityRecognizer>();
    return std::make_unique<core::RedactionEngine>(std::move(caps), config::NerMode::ADVISORY);
}

inline std::unique_ptr<ner::GazetteerEntityRecognizer> makeSampleGazetteer() {
    std::vector<ner::GazetteerEntityRecognizer::Term> terms = {
        {"Alice Smith", core::Category::PERSON},
        {"Acme Corp", core::Category::ORGANIZATION},
        {"France", core::Category::GPE},
        {"Widget", core::Category::PRODUCT},
    };
    return std::make_unique<ner::GazetteerEntityRecognizer>(std::move(terms));
}

// Inflate a gzip member; empty string on any zlib error.
inline std::string gunzip(const std::string& data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, 15 + 16) != Z_OK)
        return "";
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[4096];
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END)
            break;
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    }
    inflateEnd(&zs);
    return rc == Z_STREAM_END ? out : "";
}

} // namespace test
} // namespace piiguard

#endif // PIIGUARD_TEST_TEST_SUPPORT_HPP
