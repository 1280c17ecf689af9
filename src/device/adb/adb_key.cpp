/*
 * adb_key.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ADB RSA credential implementation (OpenSSL 3 EVP)

**************************************************/

#include "adb_key.hpp"

#include <array>
#include <format>
#include <fstream>
#include <sstream>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

namespace firetv::device::adb {

namespace {

// Words of a 2048 bit modulus in mincrypt's RSAPublicKey
constexpr uint32_t MODULUS_WORDS = ADB_KEY_BITS / 32;
constexpr size_t MODULUS_BYTES = ADB_KEY_BITS / 8;
constexpr size_t PUBLIC_KEY_SIZE = 4 + 4 + MODULUS_BYTES + MODULUS_BYTES + 4;

struct BnDeleter {
    void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};

void putLE32(unsigned char* out, uint32_t value) {
    out[0] = static_cast<unsigned char>(value & 0xFF);
    out[1] = static_cast<unsigned char>((value >> 8) & 0xFF);
    out[2] = static_cast<unsigned char>((value >> 16) & 0xFF);
    out[3] = static_cast<unsigned char>((value >> 24) & 0xFF);
}

auto authFailure(const std::string& what) -> std::unexpected<Error> {
    return failure(ErrorCode::AuthError,
                   std::format("{}: {}", what, opensslError()));
}

}  // namespace

auto opensslError() -> std::string {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(code, buffer.data(), buffer.size());
    ERR_clear_error();
    return buffer.data();
}

auto AdbKey::loadFromFile(const std::filesystem::path& path)
    -> Result<AdbKey> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return failure(ErrorCode::AuthError,
                       "Cannot read credential " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto key = fromPem(buffer.str());
    if (!key) {
        auto err = key.error();
        err.message = path.string() + ": " + err.message;
        return std::unexpected(err);
    }
    return key;
}

auto AdbKey::fromPem(std::string_view pem) -> Result<AdbKey> {
    std::unique_ptr<BIO, BioDeleter> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return authFailure("Cannot allocate BIO");
    }

    EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (raw == nullptr) {
        return authFailure("Not a PEM private key");
    }
    AdbKey key(raw);

    if (EVP_PKEY_get_base_id(raw) != EVP_PKEY_RSA) {
        return failure(ErrorCode::AuthError, "Credential is not an RSA key");
    }
    return key;
}

auto AdbKey::sign(std::string_view token) const -> Result<std::string> {
    if (token.size() != AUTH_TOKEN_SIZE) {
        return failure(ErrorCode::ProtocolError,
                       std::format("AUTH token has {} bytes, expected {}",
                                   token.size(), AUTH_TOKEN_SIZE));
    }

    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(
        EVP_PKEY_CTX_new(key_.get(), nullptr));
    if (!ctx) {
        return authFailure("Cannot create signing context");
    }
    if (EVP_PKEY_sign_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0 ||
        EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha1()) <= 0) {
        return authFailure("Cannot initialise signing");
    }

    const auto* data = reinterpret_cast<const unsigned char*>(token.data());
    size_t length = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &length, data, token.size()) <= 0) {
        return authFailure("Cannot size signature");
    }

    std::string signature(length, '\0');
    if (EVP_PKEY_sign(ctx.get(),
                      reinterpret_cast<unsigned char*>(signature.data()),
                      &length, data, token.size()) <= 0) {
        return authFailure("Signing failed");
    }
    signature.resize(length);
    return signature;
}

auto AdbKey::androidPublicKey() const -> Result<std::string> {
    BIGNUM* rawN = nullptr;
    BIGNUM* rawE = nullptr;
    if (EVP_PKEY_get_bn_param(key_.get(), OSSL_PKEY_PARAM_RSA_N, &rawN) != 1) {
        return authFailure("Cannot read RSA modulus");
    }
    BnPtr n(rawN);
    if (EVP_PKEY_get_bn_param(key_.get(), OSSL_PKEY_PARAM_RSA_E, &rawE) != 1) {
        return authFailure("Cannot read RSA exponent");
    }
    BnPtr e(rawE);

    if (BN_num_bits(n.get()) != ADB_KEY_BITS) {
        return failure(ErrorCode::AuthError,
                       std::format("ADB requires a {} bit RSA key, got {}",
                                   ADB_KEY_BITS, BN_num_bits(n.get())));
    }

    std::unique_ptr<BN_CTX, BnCtxDeleter> ctx(BN_CTX_new());
    BnPtr r32(BN_new());
    BnPtr n0(BN_new());
    BnPtr rr(BN_new());
    BnPtr r(BN_new());
    if (!ctx || !r32 || !n0 || !rr || !r) {
        return authFailure("Cannot allocate big numbers");
    }

    // n0inv = -1 / n[0] mod 2^32
    BnPtr n0inv;
    if (BN_set_bit(r32.get(), 32) != 1 ||
        BN_mod(n0.get(), n.get(), r32.get(), ctx.get()) != 1) {
        return authFailure("Cannot reduce modulus");
    }
    n0inv.reset(BN_mod_inverse(nullptr, n0.get(), r32.get(), ctx.get()));
    if (!n0inv || BN_sub(n0inv.get(), r32.get(), n0inv.get()) != 1) {
        return authFailure("Cannot invert modulus");
    }

    // rr = (2^2048)^2 mod n
    if (BN_set_bit(r.get(), ADB_KEY_BITS * 2) != 1 ||
        BN_mod(rr.get(), r.get(), n.get(), ctx.get()) != 1) {
        return authFailure("Cannot compute R^2");
    }

    std::array<unsigned char, PUBLIC_KEY_SIZE> blob{};
    unsigned char* out = blob.data();
    putLE32(out, MODULUS_WORDS);
    out += 4;
    putLE32(out, static_cast<uint32_t>(BN_get_word(n0inv.get())));
    out += 4;
    if (BN_bn2lebinpad(n.get(), out, static_cast<int>(MODULUS_BYTES)) < 0) {
        return authFailure("Cannot export modulus");
    }
    out += MODULUS_BYTES;
    if (BN_bn2lebinpad(rr.get(), out, static_cast<int>(MODULUS_BYTES)) < 0) {
        return authFailure("Cannot export R^2");
    }
    out += MODULUS_BYTES;
    putLE32(out, static_cast<uint32_t>(BN_get_word(e.get())));

    std::string encoded(4 * ((PUBLIC_KEY_SIZE + 2) / 3) + 1, '\0');
    int written =
        EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                        blob.data(), static_cast<int>(blob.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

}  // namespace firetv::device::adb
