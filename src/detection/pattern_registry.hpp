#ifndef PIIGUARD_DETECTION_PATTERN_REGISTRY_HPP
#define PIIGUARD_DETECTION_PATTERN_REGISTRY_HPP

#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <re2/re2.h>
#include "../core/category.hpp"
#include "../core/redaction_run.hpp"
#include "../util/unicode_space.hpp"

/**
 * @file pattern_registry.hpp
 * @brief The ordered set of regex detectors used to find sensitive tokens in a line.
 *
 * DESIGN GOALS:
 *   - Detectors run in a fixed order, each on the output of the previous one:
 *       1. EMAIL   2. IP   3. URL   4. AWS_KEY   5. JWT   6. PHONE   7. SECRET
 *     A later detector therefore sees the replacement tokens of an earlier one.
 *     The order is load-bearing (it decides precedence between overlapping
 *     shapes); do not merge the detectors into one combined pattern.
 *   - EMAIL and PHONE go through the run's synthetic cache; IP, URL, AWS_KEY and
 *     JWT become "[REDACTED_<CATEGORY>]"; SECRET keeps its key:
 *     "password=hunter2" -> "password=[REDACTED_SECRET]".
 *   - Every replacement increments exactly one counter bucket of the run.
 *   - Patterns are compiled once with RE2 in Latin-1 mode, so they match bytes
 *     and run in time linear in the line length without recursing on it. The
 *     default registry is shared read-only by all runs.
 *   - URL and SECRET end at whitespace, and that includes the multi-byte
 *     separators (U+00A0, U+2028, ...). RE2 classes only see bytes, so those
 *     detectors cut their last capture group at the first such separator
 *     after matching; a match whose group becomes empty is dropped and the
 *     search resumes one byte further on.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard;
 *   const auto &registry = detection::PatternRegistry::defaultRegistry();
 *   core::RedactionRun run(generator);
 *   std::string out = registry.applyAll("Contact: alice@example.com\n", run);
 *   // run.counters().emails == 1
 *   @endcode
 */

namespace piiguard {
namespace detection {

/**
 * @brief How a detector turns a match into its replacement.
 */
enum class ReplacementPolicy
{
    PLACEHOLDER,    ///< "[REDACTED_<CATEGORY>]"
    SYNTHETIC,      ///< run's synthetic cache (placeholder when the capability is off)
    KEY_PRESERVING  ///< "<group 1>=[REDACTED_<CATEGORY>]"
};

/**
 * @struct Detector
 * @brief One category matcher.
 */
struct Detector
{
    core::Category category;
    std::string name;
    std::shared_ptr<const re2::RE2> pattern;
    ReplacementPolicy policy;
    bool endsAtUnicodeSpace = false; ///< cut the last capture group at a multi-byte separator
};

/**
 * @brief Compile a detector pattern.
 * @throw std::runtime_error if RE2 rejects it.
 */
inline std::shared_ptr<const re2::RE2> compilePattern(const std::string &pattern)
{
    re2::RE2::Options opts;
    opts.set_encoding(re2::RE2::Options::EncodingLatin1);
    opts.set_log_errors(false);
    auto re = std::make_shared<const re2::RE2>(pattern, opts);
    if (!re->ok()) {
        throw std::runtime_error("PatternRegistry: invalid pattern '" + pattern + "': " + re->error());
    }
    return re;
}

/**
 * @struct Match
 * @brief A located occurrence inside the text a detector was applied to.
 */
struct Match
{
    std::string text;       ///< matched substring
    size_t start;           ///< byte offset, inclusive
    size_t end;             ///< byte offset, exclusive
    core::Category category;
    const Detector* detector;
    std::string key;        ///< captured key name (KEY_PRESERVING detectors only)
};

class PatternRegistry
{
public:
    explicit PatternRegistry(std::vector<Detector> detectors)
        : detectors_(std::move(detectors))
    {
    }

    /**
     * @brief The seven standard detectors, compiled on first use.
     */
    static const PatternRegistry& defaultRegistry()
    {
        static const PatternRegistry registry(defaultDetectors());
        return registry;
    }

    /**
     * @brief The key names the SECRET detector recognizes (case-sensitive).
     */
    static const std::vector<std::string>& secretKeys()
    {
        static const std::vector<std::string> keys = {"password", "secret", "api_key"};
        return keys;
    }

    const std::vector<Detector>& detectors() const { return detectors_; }

    /**
     * @brief All non-overlapping matches of one detector, left to right.
     */
    std::vector<Match> scan(const Detector &detector, const std::string &text) const
    {
        std::vector<Match> matches;
        const re2::RE2 &re = *detector.pattern;
        const int groupCount = std::min(re.NumberOfCapturingGroups(), kMaxGroups - 1);
        re2::StringPiece input(text);
        re2::StringPiece groups[kMaxGroups];

        size_t pos = 0;
        while (pos < text.size()
               && re.Match(input, pos, text.size(), re2::RE2::UNANCHORED, groups, groupCount + 1)) {
            size_t start = static_cast<size_t>(groups[0].data() - text.data());
            size_t end = start + groups[0].size();

            if (detector.endsAtUnicodeSpace && groupCount > 0 && groups[groupCount].data() != nullptr) {
                size_t tail = static_cast<size_t>(groups[groupCount].data() - text.data());
                size_t cut = util::unicode::findMultiByteSpace(text, tail, end);
                if (cut == tail) {
                    pos = start + 1;
                    continue;
                }
                end = cut;
            }
            if (end == start) {
                pos = start + 1;
                continue;
            }

            Match match;
            match.text = text.substr(start, end - start);
            match.start = start;
            match.end = end;
            match.category = detector.category;
            match.detector = &detector;
            if (detector.policy == ReplacementPolicy::KEY_PRESERVING && groupCount > 0) {
                match.key = groups[1].ToString();
            }
            matches.push_back(std::move(match));
            pos = end;
        }
        return matches;
    }

    /**
     * @brief Rewrite every match of one detector, recording each replacement in the run.
     */
    std::string apply(const Detector &detector, const std::string &text, core::RedactionRun &run) const
    {
        std::vector<Match> matches = scan(detector, text);
        if (matches.empty()) {
            return text;
        }

        std::string out;
        out.reserve(text.size());
        size_t cursor = 0;
        for (const Match &m : matches) {
            out.append(text, cursor, m.start - cursor);
            out += replacementFor(m, run);
            cursor = m.end;
        }
        out.append(text, cursor, std::string::npos);
        return out;
    }

    /**
     * @brief Thread a line through every detector in registry order.
     */
    std::string applyAll(const std::string &line, core::RedactionRun &run) const
    {
        std::string current = line;
        for (const Detector &d : detectors_) {
            current = apply(d, current, run);
        }
        return current;
    }

private:
    static constexpr int kMaxGroups = 4;

    std::vector<Detector> detectors_;

    static std::string replacementFor(const Match &m, core::RedactionRun &run)
    {
        switch (m.detector->policy) {
        case ReplacementPolicy::SYNTHETIC:
            run.record(m.category);
            return run.substitute(m.category, m.text);
        case ReplacementPolicy::KEY_PRESERVING: {
            std::string placeholder = core::placeholderFor(m.category);
            // "password=[REDACTED_SECRET]" is already redacted: leave it and do not count it
            if (m.text.size() == m.key.size() + 1 + placeholder.size()
                && m.text.compare(m.key.size() + 1, std::string::npos, placeholder) == 0) {
                return m.text;
            }
            run.record(m.category);
            return m.key + "=" + placeholder;
        }
        case ReplacementPolicy::PLACEHOLDER:
        default:
            run.record(m.category);
            return core::placeholderFor(m.category);
        }
    }

    static std::vector<Detector> defaultDetectors()
    {
        std::string secretAlternation;
        for (const auto &k : secretKeys()) {
            if (!secretAlternation.empty()) {
                secretAlternation += "|";
            }
            secretAlternation += k;
        }

        // ASCII whitespace: \t-\r, space and \x1c-\x1f (RE2's \s has neither \v nor \x1c-\x1f)
        const std::string space = R"(\x09-\x0d\x20\x1c-\x1f)";

        std::vector<Detector> d;
        d.push_back(Detector{core::Category::EMAIL, "email",
            compilePattern(R"([A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,})"),
            ReplacementPolicy::SYNTHETIC});
        d.push_back(Detector{core::Category::IP, "ipv4",
            compilePattern(R"(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)"),
            ReplacementPolicy::PLACEHOLDER});
        d.push_back(Detector{core::Category::URL, "url",
            compilePattern(R"(\bhttps?://([^)" + space + R"(<>"'\)]+))"),
            ReplacementPolicy::PLACEHOLDER, true});
        d.push_back(Detector{core::Category::AWS_KEY, "aws_access_key_id",
            compilePattern(R"(\bAKIA[0-9A-Z]{16}\b)"),
            ReplacementPolicy::PLACEHOLDER});
        d.push_back(Detector{core::Category::JWT, "jwt",
            compilePattern(R"(\b[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\.[A-Za-z0-9_-]{10,}\b)"),
            ReplacementPolicy::PLACEHOLDER});
        d.push_back(Detector{core::Category::PHONE, "phone",
            compilePattern(R"(\b(?:\+?\d{1,3}[-. ]?)?(?:\(?\d{3}\)?[-. ]?)\d{3}[-. ]?\d{4}\b)"),
            ReplacementPolicy::SYNTHETIC});
        d.push_back(Detector{core::Category::SECRET, "secret_assignment",
            compilePattern(R"(\b()" + secretAlternation + R"()=([^)" + space + R"(]+))"),
            ReplacementPolicy::KEY_PRESERVING, true});
        return d;
    }
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_PATTERN_REGISTRY_HPP
