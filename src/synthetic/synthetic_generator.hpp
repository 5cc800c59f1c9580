#ifndef PIIGUARD_SYNTHETIC_SYNTHETIC_GENERATOR_HPP
#define PIIGUARD_SYNTHETIC_SYNTHETIC_GENERATOR_HPP

#include <string>
#include <vector>
#include <random>
#include <mutex>
#include <memory>
#include <cstdint>
#include <algorithm>
#include <cctype>
#include "../core/category.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"

/**
 * @file synthetic_generator.hpp
 * @brief The optional synthetic-value capability: fake but structurally
 *        plausible emails, phone numbers, names, companies and countries.
 *
 * DESIGN GOALS:
 *   - One interface, two variants resolved once at startup:
 *       FakeDataGenerator              -> capability present
 *       UnavailableSyntheticGenerator  -> capability absent, placeholders only
 *   - Values are drawn at random and never derived from the original, so the
 *     same person gets unrelated fake identities in two different documents.
 *   - A single generator serves all concurrent runs; its RNG is mutex-guarded.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::synthetic;
 *   auto gen = makeSyntheticGenerator(true, 0);   // seeded from OpenSSL
 *   if (gen->isAvailable()) {
 *       std::string email = gen->generate(piiguard::core::Category::EMAIL);
 *   }
 *   @endcode
 */

namespace piiguard {
namespace synthetic {

class SyntheticGenerator
{
public:
    virtual ~SyntheticGenerator() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Produce a fresh value for the category. Categories without a
     *        synthetic shape yield their "[REDACTED_<CATEGORY>]" placeholder.
     */
    virtual std::string generate(core::Category category) = 0;
};

/**
 * @class UnavailableSyntheticGenerator
 * @brief Stand-in when synthetic generation is disabled or could not start.
 */
class UnavailableSyntheticGenerator : public SyntheticGenerator
{
public:
    bool isAvailable() const override { return false; }

    std::string generate(core::Category category) override
    {
        return core::placeholderFor(category);
    }
};

/**
 * @class FakeDataGenerator
 * @brief Built-in en_US style fake data provider.
 */
class FakeDataGenerator : public SyntheticGenerator
{
public:
    explicit FakeDataGenerator(uint64_t seed)
        : rng_(seed)
    {
    }

    bool isAvailable() const override { return true; }

    std::string generate(core::Category category) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (category) {
        case core::Category::EMAIL:        return email();
        case core::Category::PHONE:        return phoneNumber();
        case core::Category::PERSON:       return firstName() + " " + lastName();
        case core::Category::ORGANIZATION: return company();
        case core::Category::GPE:          return pick(countries());
        default:
            return core::placeholderFor(category);
        }
    }

private:
    std::mt19937_64 rng_;
    std::mutex mutex_;

    const std::string& pick(const std::vector<std::string> &items)
    {
        std::uniform_int_distribution<size_t> dist(0, items.size() - 1);
        return items[dist(rng_)];
    }

    int digit(int lo = 0, int hi = 9)
    {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(rng_);
    }

    // NXX: first digit 2-9, as in the North American numbering plan.
    std::string nxx()
    {
        return std::to_string(digit(2, 9)) + std::to_string(digit()) + std::to_string(digit());
    }

    std::string lineNumber()
    {
        std::string s;
        for (int i = 0; i < 4; ++i) {
            s += std::to_string(digit());
        }
        return s;
    }

    std::string firstName() { return pick(firstNames()); }
    std::string lastName()  { return pick(lastNames()); }

    std::string email()
    {
        std::string local = firstName() + "." + lastName();
        if (digit(0, 3) == 0) {
            local += std::to_string(digit(10, 99));
        }
        std::transform(local.begin(), local.end(), local.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return local + "@" + pick(freeEmailDomains());
    }

    std::string phoneNumber()
    {
        switch (digit(0, 2)) {
        case 0:  return "(" + nxx() + ") " + nxx() + "-" + lineNumber();
        case 1:  return "+1-" + nxx() + "-" + nxx() + "-" + lineNumber();
        default: return nxx() + "." + nxx() + "." + lineNumber();
        }
    }

    std::string company()
    {
        if (digit(0, 2) == 0) {
            return lastName() + ", " + lastName() + " and " + lastName();
        }
        return lastName() + " " + pick(companySuffixes());
    }

    static const std::vector<std::string>& firstNames()
    {
        static const std::vector<std::string> names = {
            "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
            "David", "Elizabeth", "William", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
            "Thomas", "Sarah", "Charles", "Karen", "Daniel", "Nancy", "Matthew", "Lisa",
            "Anthony", "Betty", "Mark", "Sandra", "Steven", "Ashley", "Andrew", "Kimberly",
            "Joshua", "Emily", "Kevin", "Donna", "Brian", "Michelle", "George", "Carol"
        };
        return names;
    }

    static const std::vector<std::string>& lastNames()
    {
        static const std::vector<std::string> names = {
            "Smith", "Johnson", "Williams", "Brown", "Jones", "Garcia", "Miller", "Davis",
            "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez", "Wilson", "Anderson",
            "Thomas", "Taylor", "Moore", "Jackson", "Martin", "Lee", "Perez", "Thompson",
            "White", "Harris", "Sanchez", "Clark", "Ramirez", "Lewis", "Robinson", "Walker",
            "Young", "Allen", "King", "Wright", "Scott", "Torres", "Nguyen", "Hill", "Flores"
        };
        return names;
    }

    static const std::vector<std::string>& companySuffixes()
    {
        static const std::vector<std::string> suffixes = {
            "Inc", "LLC", "Group", "PLC", "Ltd", "and Sons"
        };
        return suffixes;
    }

    static const std::vector<std::string>& freeEmailDomains()
    {
        static const std::vector<std::string> domains = {
            "gmail.com", "yahoo.com", "hotmail.com"
        };
        return domains;
    }

    static const std::vector<std::string>& countries()
    {
        static const std::vector<std::string> names = {
            "Argentina", "Australia", "Austria", "Belgium", "Brazil", "Canada", "Chile",
            "Denmark", "Egypt", "Finland", "France", "Germany", "Ghana", "Greece", "Iceland",
            "India", "Indonesia", "Ireland", "Italy", "Japan", "Kenya", "Mexico", "Morocco",
            "Netherlands", "New Zealand", "Nigeria", "Norway", "Peru", "Poland", "Portugal",
            "Singapore", "South Africa", "Spain", "Sweden", "Switzerland", "Thailand",
            "Turkey", "Uruguay", "Vietnam", "Zambia"
        };
        return names;
    }
};

/**
 * @brief Resolve the synthetic capability once at startup.
 * @param enabled Configuration toggle; false always yields the Unavailable variant.
 * @param fixedSeed Non-zero for reproducible output; zero draws a seed from OpenSSL.
 */
inline std::unique_ptr<SyntheticGenerator> makeSyntheticGenerator(bool enabled, uint64_t fixedSeed)
{
    if (!enabled) {
        util::logger::warn("SyntheticGenerator: disabled by configuration, using [REDACTED_*] placeholders.");
        return std::make_unique<UnavailableSyntheticGenerator>();
    }

    uint64_t seed = fixedSeed;
    if (seed == 0 && !util::hashing::randomSeed(seed)) {
        util::logger::warn("SyntheticGenerator: OpenSSL RAND_bytes failed, using [REDACTED_*] placeholders.");
        return std::make_unique<UnavailableSyntheticGenerator>();
    }

    util::logger::info(std::string("SyntheticGenerator: fake data generator ready")
                       + (fixedSeed != 0 ? " (fixed seed)" : ""));
    return std::make_unique<FakeDataGenerator>(seed);
}

} // namespace synthetic
} // namespace piiguard

#endif // PIIGUARD_SYNTHETIC_SYNTHETIC_GENERATOR_HPP
