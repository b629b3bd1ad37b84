#ifndef CLOUDBURST_UTIL_HPP
#define CLOUDBURST_UTIL_HPP

#include <cstddef>
#include <string>

#include "types.hpp"

namespace cloudburst {

/** @brief Generate a random alphanumeric readiness token.
 *
 * Thread-safe. Uniqueness is not guaranteed, callers have to check for
 * collisions themselves.
 */
AuthToken
GenerateAuthToken(std::size_t length);

/** @brief Format a duration as seconds with millisecond precision. */
std::string
DurationPrettyPrint(Duration d);
}

#endif
