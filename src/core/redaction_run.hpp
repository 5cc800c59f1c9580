#ifndef PIIGUARD_CORE_REDACTION_RUN_HPP
#define PIIGUARD_CORE_REDACTION_RUN_HPP

#include <string>
#include "category.hpp"
#include "counters.hpp"
#include "../synthetic/synthetic_cache.hpp"
#include "../synthetic/synthetic_generator.hpp"

namespace piiguard {
namespace core {

/*
  RedactionRun
  --------------------------------
  The mutable state of one redaction call: its Counters and its
  SyntheticCache. Created fresh for every document (or stream) and dropped
  with it, so nothing leaks between requests and concurrent runs need no
  locking.
*/
class RedactionRun
{
public:
    explicit RedactionRun(synthetic::SyntheticGenerator &generator)
        : cache_(generator)
    {
    }

    RedactionRun(const RedactionRun&) = delete;
    RedactionRun& operator=(const RedactionRun&) = delete;

    // Replacement for a detected value; synthetic when the capability is up.
    std::string substitute(Category category, const std::string &original)
    {
        return cache_.get(category, original);
    }

    void record(Category category) { counters_.increment(category); }

    const Counters& counters() const { return counters_; }

private:
    Counters counters_;
    synthetic::SyntheticCache cache_;
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_REDACTION_RUN_HPP
