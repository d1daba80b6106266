/**
 * @file field_cipher.cpp
 * @brief AES-256-GCM field encryption via OpenSSL EVP
 */

#include "field_cipher.h"
#include "exceptions.h"
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/rand.h>
#include <memory>

namespace nisab::common {

namespace {

constexpr size_t kKeyLength = 32;
constexpr size_t kIvLength = 12;
constexpr size_t kTagLength = 16;

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtxPtr newContext() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw CryptoException("EVP_CIPHER_CTX_new failed");
    }
    return ctx;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace base64 {

std::string encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, mem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, data.data(), static_cast<int>(data.size()));
    BIO_flush(b64);

    BUF_MEM* buffer = nullptr;
    BIO_get_mem_ptr(b64, &buffer);
    std::string result(buffer->data, buffer->length);
    BIO_free_all(b64);
    return result;
}

std::vector<uint8_t> decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    std::vector<uint8_t> result((encoded.size() * 3) / 4 + 1);

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    mem = BIO_push(b64, mem);
    BIO_set_flags(mem, BIO_FLAGS_BASE64_NO_NL);
    int length = BIO_read(mem, result.data(), static_cast<int>(result.size()));
    BIO_free_all(mem);

    if (length <= 0) {
        throw ParsingException("invalid base64 payload");
    }
    result.resize(static_cast<size_t>(length));
    return result;
}

} // namespace base64

std::vector<std::string> IFieldCipher::decryptBatch(const std::vector<std::string>& ciphertexts) const {
    std::vector<std::string> plaintexts;
    plaintexts.reserve(ciphertexts.size());
    for (const auto& c : ciphertexts) {
        plaintexts.push_back(decrypt(c));
    }
    return plaintexts;
}

bool AesGcmFieldCipher::isValidHexKey(const std::string& hexKey) {
    if (hexKey.size() != kKeyLength * 2) {
        return false;
    }
    for (char c : hexKey) {
        if (hexValue(c) < 0) return false;
    }
    return true;
}

AesGcmFieldCipher::AesGcmFieldCipher(const std::string& hexKey) {
    if (!isValidHexKey(hexKey)) {
        throw ConfigException("encryption key must be 64 hex characters");
    }
    key_.reserve(kKeyLength);
    for (size_t i = 0; i < hexKey.size(); i += 2) {
        key_.push_back(static_cast<uint8_t>((hexValue(hexKey[i]) << 4) | hexValue(hexKey[i + 1])));
    }
}

std::string AesGcmFieldCipher::encrypt(const std::string& plaintext) const {
    std::vector<uint8_t> iv(kIvLength);
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        throw CryptoException("failed to generate IV");
    }

    auto ctx = newContext();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLength), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        throw CryptoException("encrypt init failed");
    }

    std::vector<uint8_t> out(plaintext.size() + kTagLength);
    int len = 0;
    int total = 0;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &len,
                              reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            throw CryptoException("encrypt update failed");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw CryptoException("encrypt final failed");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLength),
                            out.data() + total) != 1) {
        throw CryptoException("failed to read GCM tag");
    }
    out.resize(static_cast<size_t>(total) + kTagLength);

    return base64::encode(iv) + ":" + base64::encode(out);
}

std::string AesGcmFieldCipher::decrypt(const std::string& ciphertext) const {
    auto sep = ciphertext.find(':');
    if (sep == std::string::npos) {
        throw CryptoException("ciphertext is not in iv:data format");
    }

    std::vector<uint8_t> iv;
    std::vector<uint8_t> data;
    try {
        iv = base64::decode(ciphertext.substr(0, sep));
        data = base64::decode(ciphertext.substr(sep + 1));
    } catch (const ParsingException& e) {
        throw CryptoException(e.what());
    }
    if (iv.size() != kIvLength || data.size() < kTagLength) {
        throw CryptoException("ciphertext has wrong length");
    }

    size_t bodyLength = data.size() - kTagLength;
    auto ctx = newContext();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvLength), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv.data()) != 1) {
        throw CryptoException("decrypt init failed");
    }

    std::vector<uint8_t> out(bodyLength + kTagLength);
    int len = 0;
    int total = 0;
    if (bodyLength > 0) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, data.data(), static_cast<int>(bodyLength)) != 1) {
            throw CryptoException("decrypt update failed");
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLength),
                            data.data() + bodyLength) != 1) {
        throw CryptoException("failed to set GCM tag");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
        throw CryptoException("authentication failed (wrong key or tampered data)");
    }
    total += len;

    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(total));
}

} // namespace nisab::common
