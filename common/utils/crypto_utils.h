/*
 * Crypto Utilities
 *
 * Thin wrappers around OpenSSL libcrypto: password hashing, chunk and
 * file checksums, base64 for binary payloads inside JSON, random ids.
 */

#ifndef CRYPTO_UTILS_H
#define CRYPTO_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace crypto_utils {

constexpr int PBKDF2_ITERATIONS = 100000;
constexpr int PBKDF2_KEY_LENGTH = 64;

/**
 * Salted password hash (PBKDF2-HMAC-SHA256), hex encoded.
 * The relay uses the connection ID as salt.
 */
std::string hash_password(const std::string& password, const std::string& salt,
                          int iterations = PBKDF2_ITERATIONS);

// Constant-time comparison for hashes
bool constant_time_equals(const std::string& a, const std::string& b);

// Per-chunk checksum (MD5, hex)
std::string md5_hex(const uint8_t* data, size_t len);

// Whole-file checksum (SHA-256, hex)
std::string sha256_hex(const uint8_t* data, size_t len);
std::string sha256_file(const std::string& path);

std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);

/**
 * Decode base64 text
 * @return false if the input is not valid base64
 */
bool base64_decode(const std::string& text, std::vector<uint8_t>& out);

// n random bytes, hex encoded (2n characters)
std::string random_hex(size_t n);

// Random RFC 4122 version 4 UUID string
std::string uuid_v4();

} // namespace crypto_utils

#endif // CRYPTO_UTILS_H
