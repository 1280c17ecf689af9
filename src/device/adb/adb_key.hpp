/*
 * adb_key.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: RSA credential used for ADB authentication

**************************************************/

#ifndef FIRETV_DEVICE_ADB_ADB_KEY_HPP
#define FIRETV_DEVICE_ADB_ADB_KEY_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

#include "common/result.hpp"

namespace firetv::device::adb {

inline constexpr size_t AUTH_TOKEN_SIZE = 20;
inline constexpr int ADB_KEY_BITS = 2048;

/**
 * @brief RSA private key in the form ADB expects
 *
 * Signs the 20 byte AUTH token with PKCS#1 v1.5 (the token is treated as a
 * SHA-1 digest) and produces the public key in Android's mincrypt layout,
 * base64 encoded.
 */
class AdbKey {
public:
    /**
     * @brief Load a PEM private key file
     * @return AuthError if the file is unreadable or not an RSA key
     */
    [[nodiscard]] static auto loadFromFile(const std::filesystem::path& path)
        -> Result<AdbKey>;

    [[nodiscard]] static auto fromPem(std::string_view pem) -> Result<AdbKey>;

    AdbKey(AdbKey&&) noexcept = default;
    AdbKey& operator=(AdbKey&&) noexcept = default;

    [[nodiscard]] auto sign(std::string_view token) const
        -> Result<std::string>;

    /**
     * @brief Base64 of the 524 byte mincrypt public key structure
     * @return AuthError unless the key is a 2048 bit RSA key
     */
    [[nodiscard]] auto androidPublicKey() const -> Result<std::string>;

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
    };

    explicit AdbKey(EVP_PKEY* key) : key_(key) {}

    std::unique_ptr<EVP_PKEY, PkeyDeleter> key_;
};

/**
 * @brief Last OpenSSL error as text
 */
[[nodiscard]] auto opensslError() -> std::string;

}  // namespace firetv::device::adb

#endif  // FIRETV_DEVICE_ADB_ADB_KEY_HPP
