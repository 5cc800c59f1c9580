#ifndef PIIGUARD_CORE_RISK_SCORER_HPP
#define PIIGUARD_CORE_RISK_SCORER_HPP

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include "../util/unicode_space.hpp"

/**
 * @file risk_scorer.hpp
 * @brief Heuristic 0-100 privacy risk score of a document.
 *
 * ALGORITHM:
 *   words  = whitespace-delimited tokens of the original text
 *   ratio  = min(redactions / max(words / 10, 1) * 100, 100)
 *   risky  = distinct keywords {password, secret, token, key, credential}
 *            found case-insensitively anywhere in the original text
 *   score  = min(ratio * 0.7 + risky * 3, 100)
 *   Empty text, or text without words, scores 0.
 *
 * The weights are fixed; changing them breaks score comparisons against
 * previously redacted documents.
 */

namespace piiguard {
namespace core {

/*
  RiskAccumulator
  --------------------------------
  Collects word count and keyword hits chunk by chunk, so the streaming
  redactor can score a document it never holds in memory. Feeding the whole
  text at once or in arbitrary pieces gives the same result.
*/
class RiskAccumulator
{
public:
    static const std::vector<std::string>& riskyKeywords()
    {
        static const std::vector<std::string> keywords = {
            "password", "secret", "token", "key", "credential"
        };
        return keywords;
    }

    RiskAccumulator()
        : found_(riskyKeywords().size(), false)
    {
    }

    void add(const std::string &chunk)
    {
        if (chunk.empty()) {
            return;
        }
        sawText_ = true;

        countWords(chunk);

        // lower-case the carried tail plus this chunk, so keywords split across chunks are still seen
        std::string window = carry_;
        window.reserve(carry_.size() + chunk.size());
        for (unsigned char c : chunk) {
            window.push_back(static_cast<char>(std::tolower(c)));
        }

        const auto &keywords = riskyKeywords();
        for (size_t i = 0; i < keywords.size(); ++i) {
            if (!found_[i] && window.find(keywords[i]) != std::string::npos) {
                found_[i] = true;
            }
        }

        size_t keep = longestKeyword() - 1;
        carry_ = window.size() > keep ? window.substr(window.size() - keep) : window;
    }

    uint64_t words() const
    {
        // a held-back tail that never completed a separator is word text
        return words_ + ((!pending_.empty() && !inWord_) ? 1 : 0);
    }

    size_t riskyCount() const
    {
        return static_cast<size_t>(std::count(found_.begin(), found_.end(), true));
    }

    double score(uint64_t redactionCount) const
    {
        uint64_t wordCount = words();
        if (!sawText_ || wordCount == 0) {
            return 0.0;
        }
        double ratio = std::min((static_cast<double>(redactionCount)
                                 / std::max(static_cast<double>(wordCount) / 10.0, 1.0)) * 100.0,
                                100.0);
        double finalScore = (ratio * 0.7) + (static_cast<double>(riskyCount()) * 3.0);
        return std::min(finalScore, 100.0);
    }

private:
    // Words are runs between whitespace, multi-byte separators included. A
    // separator split across two chunks is held back in pending_.
    void countWords(const std::string &chunk)
    {
        std::string text;
        const std::string *src = &chunk;
        if (!pending_.empty()) {
            text = pending_ + chunk;
            pending_.clear();
            src = &text;
        }
        const std::string &s = *src;

        size_t i = 0;
        while (i < s.size()) {
            size_t n = util::unicode::spaceAt(s, i);
            if (n > 0) {
                inWord_ = false;
                i += n;
                continue;
            }
            if (util::unicode::mayBeTruncatedSpace(s, i)) {
                pending_ = s.substr(i);
                return;
            }
            if (!inWord_) {
                inWord_ = true;
                ++words_;
            }
            ++i;
        }
    }

    static size_t longestKeyword()
    {
        size_t n = 0;
        for (const auto &k : riskyKeywords()) {
            n = std::max(n, k.size());
        }
        return n;
    }

    uint64_t words_ = 0;
    bool inWord_ = false;
    bool sawText_ = false;
    std::vector<bool> found_;
    std::string carry_;
    std::string pending_;
};

/**
 * @brief Score a complete document.
 * @param text The original, unredacted text.
 * @param redactionCount Total replacements made in it.
 */
inline double score(const std::string &text, uint64_t redactionCount)
{
    RiskAccumulator acc;
    acc.add(text);
    return acc.score(redactionCount);
}

/**
 * @brief Round to one decimal for the response payload.
 *
 * Uses printf's correctly rounded "%.1f" (ties go to even on the exact binary
 * value), which agrees with how most scripting runtimes round floats.
 */
inline double roundToTenth(double value)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return std::strtod(buf, nullptr);
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_RISK_SCORER_HPP
