#ifndef PIIGUARD_CORE_CATEGORY_HPP
#define PIIGUARD_CORE_CATEGORY_HPP

#include <string>

namespace piiguard {
namespace core {

/*
  Category
  --------------------------------
  The closed set of sensitive-token kinds the engine knows about.

  The first seven come from the pattern detectors. PERSON, ORGANIZATION,
  GPE and PRODUCT are produced by the entity recognizer; PRODUCT is
  reported but never substituted.
*/
enum class Category
{
    EMAIL,
    IP,
    URL,
    AWS_KEY,
    JWT,
    PHONE,
    SECRET,
    PERSON,
    ORGANIZATION,
    GPE,
    PRODUCT
};

inline const char* toString(Category c)
{
    switch (c) {
    case Category::EMAIL:        return "EMAIL";
    case Category::IP:           return "IP";
    case Category::URL:          return "URL";
    case Category::AWS_KEY:      return "AWS_KEY";
    case Category::JWT:          return "JWT";
    case Category::PHONE:        return "PHONE";
    case Category::SECRET:       return "SECRET";
    case Category::PERSON:       return "PERSON";
    case Category::ORGANIZATION: return "ORGANIZATION";
    case Category::GPE:          return "GPE";
    case Category::PRODUCT:      return "PRODUCT";
    }
    return "UNKNOWN";
}

// "[REDACTED_EMAIL]", "[REDACTED_AWS_KEY]", ...
inline std::string placeholderFor(Category c)
{
    return std::string("[REDACTED_") + toString(c) + "]";
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_CATEGORY_HPP
