/**
 * @file exceptions.h
 * @brief Exception hierarchy for the Nisab/Hawl engine
 *
 * Infrastructure and unrecoverable failures are thrown as exceptions.
 * Record lifecycle validation failures are returned as typed results
 * (see lifecycle_result.h) and never use these types.
 *
 * @date 2026-10-18
 */

#pragma once

#include <stdexcept>
#include <string>

namespace nisab::common {

/**
 * @brief Base exception for all Nisab/Hawl engine errors
 */
class NisabException : public std::runtime_error {
public:
    explicit NisabException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Database operation failed
 */
class DatabaseException : public NisabException {
public:
    explicit DatabaseException(const std::string& message)
        : NisabException("Database error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public NisabException {
public:
    explicit ConfigException(const std::string& message)
        : NisabException("Configuration error: " + message) {}
};

/**
 * @brief Malformed external payload (price feed body, stored JSON, ciphertext)
 */
class ParsingException : public NisabException {
public:
    explicit ParsingException(const std::string& message)
        : NisabException("Parsing error: " + message) {}
};

/**
 * @brief Connection pool exhausted
 */
class PoolExhaustedException : public NisabException {
public:
    explicit PoolExhaustedException(const std::string& poolType)
        : NisabException(poolType + " connection pool exhausted") {}
};

/**
 * @brief Encryption or decryption failed (bad key, tampered ciphertext)
 */
class CryptoException : public NisabException {
public:
    explicit CryptoException(const std::string& message)
        : NisabException("Crypto error: " + message) {}
};

/**
 * @brief No fresh or cached metal price exists for the requested pair
 */
class PriceUnavailableException : public NisabException {
public:
    PriceUnavailableException(const std::string& metal, const std::string& currency)
        : NisabException("Price unavailable for " + metal + "/" + currency),
          metal_(metal), currency_(currency) {}

    const std::string& metal() const { return metal_; }
    const std::string& currency() const { return currency_; }

private:
    std::string metal_;
    std::string currency_;
};

/**
 * @brief Audit append failed; the enclosing transition was rolled back
 */
class AuditWriteFailureException : public NisabException {
public:
    explicit AuditWriteFailureException(const std::string& message)
        : NisabException("Audit write failure: " + message) {}
};

} // namespace nisab::common
