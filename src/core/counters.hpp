#ifndef PIIGUARD_CORE_COUNTERS_HPP
#define PIIGUARD_CORE_COUNTERS_HPP

#include <cstdint>
#include <string>
#include <sstream>
#include "category.hpp"

/**
 * @file counters.hpp
 * @brief Per-run tallies of replaced occurrences, one bucket per category group.
 *
 * A Counters instance belongs to exactly one redaction run. Every replacement
 * increments exactly one bucket; nothing ever decrements.
 */

namespace piiguard {
namespace core {

struct Counters
{
    uint64_t emails = 0;
    uint64_t ips = 0;
    uint64_t secrets = 0;
    uint64_t urls = 0;
    uint64_t awsKeys = 0;
    uint64_t jwts = 0;
    uint64_t phones = 0;
    /// PERSON/ORGANIZATION/GPE replacements; only non-zero in NER redact mode.
    uint64_t entities = 0;

    /**
     * @brief Increment the bucket that owns the given category.
     *        PRODUCT is never substituted, so it has no bucket.
     */
    void increment(Category c)
    {
        switch (c) {
        case Category::EMAIL:   ++emails;   break;
        case Category::IP:      ++ips;      break;
        case Category::URL:     ++urls;     break;
        case Category::AWS_KEY: ++awsKeys;  break;
        case Category::JWT:     ++jwts;     break;
        case Category::PHONE:   ++phones;   break;
        case Category::SECRET:  ++secrets;  break;
        case Category::PERSON:
        case Category::ORGANIZATION:
        case Category::GPE:     ++entities; break;
        case Category::PRODUCT: break;
        }
    }

    uint64_t total() const
    {
        return emails + ips + secrets + urls + awsKeys + jwts + phones + entities;
    }

    /**
     * @brief Serialize as the "counts" object of the response payload.
     * @param includeEntities Emit the "entities" bucket (NER redact mode only).
     */
    std::string toJson(bool includeEntities) const
    {
        std::ostringstream oss;
        oss << "{\"emails\":" << emails
            << ",\"ips\":" << ips
            << ",\"secrets\":" << secrets
            << ",\"urls\":" << urls
            << ",\"aws_keys\":" << awsKeys
            << ",\"jwts\":" << jwts
            << ",\"phones\":" << phones;
        if (includeEntities) {
            oss << ",\"entities\":" << entities;
        }
        oss << "}";
        return oss.str();
    }

    bool operator==(const Counters &o) const
    {
        return emails == o.emails && ips == o.ips && secrets == o.secrets && urls == o.urls
            && awsKeys == o.awsKeys && jwts == o.jwts && phones == o.phones && entities == o.entities;
    }
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_COUNTERS_HPP
