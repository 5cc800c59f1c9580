#ifndef PIIGUARD_SYNTHETIC_SYNTHETIC_CACHE_HPP
#define PIIGUARD_SYNTHETIC_SYNTHETIC_CACHE_HPP

#include <string>
#include <unordered_map>
#include "synthetic_generator.hpp"
#include "../core/category.hpp"
#include "../util/hashing.hpp"

/**
 * @file synthetic_cache.hpp
 * @brief Memoizes one replacement per (category, original value) within a run.
 *
 * The same original email always becomes the same fake email inside one
 * document, which keeps the redacted text readable. The cache is owned by a
 * single run and dies with it, so nothing links identities across documents.
 *
 * Keys hold the SHA-256 digest of the original rather than the original
 * itself.
 *
 * USAGE EXAMPLE:
 *   @code
 *   SyntheticCache cache(generator);
 *   auto a = cache.get(Category::EMAIL, "alice@corp.com");
 *   auto b = cache.get(Category::EMAIL, "alice@corp.com");
 *   // a == b
 *   @endcode
 */

namespace piiguard {
namespace synthetic {

class SyntheticCache
{
public:
    /**
     * @param generator Shared capability; must outlive the cache.
     */
    explicit SyntheticCache(SyntheticGenerator &generator)
        : generator_(generator)
    {
    }

    SyntheticCache(const SyntheticCache&) = delete;
    SyntheticCache& operator=(const SyntheticCache&) = delete;

    /**
     * @brief Replacement for an original value.
     *        Without the capability this is always the placeholder and nothing is stored.
     */
    std::string get(core::Category category, const std::string &original)
    {
        if (!generator_.isAvailable()) {
            return core::placeholderFor(category);
        }

        std::string key = makeKey(category, original);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            return it->second;
        }

        std::string replacement = generator_.generate(category);
        entries_.emplace(std::move(key), replacement);
        return replacement;
    }

    size_t size() const { return entries_.size(); }

    bool isSynthetic() const { return generator_.isAvailable(); }

private:
    static std::string makeKey(core::Category category, const std::string &original)
    {
        return std::string(core::toString(category)) + ":" + util::hashing::sha256(original);
    }

    SyntheticGenerator &generator_;
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace synthetic
} // namespace piiguard

#endif // PIIGUARD_SYNTHETIC_SYNTHETIC_CACHE_HPP
