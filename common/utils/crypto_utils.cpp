/*
 * Crypto Utilities Implementation
 */

#include "crypto_utils.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace crypto_utils {

static std::string to_hex(const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

static std::string digest_hex(const EVP_MD* md, const uint8_t* data, size_t len) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out, &out_len, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return to_hex(out, out_len);
}

std::string hash_password(const std::string& password, const std::string& salt,
                          int iterations) {
    unsigned char key[PBKDF2_KEY_LENGTH];
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          iterations, EVP_sha256(), sizeof(key), key) != 1) {
        throw std::runtime_error("PBKDF2 failed");
    }
    return to_hex(key, sizeof(key));
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string md5_hex(const uint8_t* data, size_t len) {
    return digest_hex(EVP_md5(), data, len);
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    return digest_hex(EVP_sha256(), data, len);
}

std::string sha256_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 init failed");
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Read error: " + path);
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        throw std::runtime_error("SHA-256 final failed");
    }
    return to_hex(out, out_len);
}

std::string base64_encode(const uint8_t* data, size_t len) {
    if (len == 0) {
        return std::string();
    }
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

bool base64_decode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    if (text.empty()) {
        return true;
    }
    if (text.size() % 4 != 0) {
        return false;
    }

    out.resize(3 * (text.size() / 4));
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        out.clear();
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(n) - padding);
    return true;
}

std::string random_hex(size_t n) {
    std::vector<uint8_t> bytes(n);
    if (n > 0 && RAND_bytes(bytes.data(), static_cast<int>(n)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(bytes.data(), bytes.size());
}

std::string uuid_v4() {
    uint8_t b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    b[6] = (b[6] & 0x0f) | 0x40;  // version 4
    b[8] = (b[8] & 0x3f) | 0x80;  // RFC 4122 variant

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
             b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
    return std::string(buf);
}

} // namespace crypto_utils
