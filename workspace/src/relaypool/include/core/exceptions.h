#ifndef RELAYPOOL_CORE_EXCEPTIONS_H
#define RELAYPOOL_CORE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace relaypool {

/**
 * @brief Usage exception
 *
 * Thrown when an object is operated after it was disposed. Always a
 * caller bug: it is never retried or swallowed internally.
 */
class UsageException : public std::logic_error {
public:
    explicit UsageException(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * @brief Configuration exception
 *
 * Thrown when a pool definition cannot be parsed or fails validation.
 */
class ConfigurationException : public std::runtime_error {
public:
    explicit ConfigurationException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace relaypool

#endif // RELAYPOOL_CORE_EXCEPTIONS_H
