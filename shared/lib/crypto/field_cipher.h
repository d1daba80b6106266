/**
 * @file field_cipher.h
 * @brief At-rest encryption of individual text fields
 *
 * Ciphertext format: base64(iv) ":" base64(ciphertext || tag)
 *
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace nisab::common {

/**
 * @brief encrypt/decrypt contract consumed by repositories and services
 */
class IFieldCipher {
public:
    virtual ~IFieldCipher() = default;

    /**
     * @throws CryptoException on failure
     */
    virtual std::string encrypt(const std::string& plaintext) const = 0;

    /**
     * @throws CryptoException on malformed or tampered input
     */
    virtual std::string decrypt(const std::string& ciphertext) const = 0;

    /**
     * @brief Decrypt many values in one pass
     */
    virtual std::vector<std::string> decryptBatch(const std::vector<std::string>& ciphertexts) const;
};

/**
 * @brief AES-256-GCM with a random 96-bit IV per value (OpenSSL EVP)
 */
class AesGcmFieldCipher : public IFieldCipher {
public:
    /**
     * @param hexKey 64 hex characters (32 bytes)
     * @throws ConfigException if the key is malformed
     */
    explicit AesGcmFieldCipher(const std::string& hexKey);

    std::string encrypt(const std::string& plaintext) const override;
    std::string decrypt(const std::string& ciphertext) const override;

    static bool isValidHexKey(const std::string& hexKey);

private:
    std::vector<uint8_t> key_;
};

namespace base64 {
std::string encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> decode(const std::string& encoded);
} // namespace base64

} // namespace nisab::common
