#include "cidboost/crypto/key_resolver.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include "cidboost/crypto/aes_ctr.h"
#include "cidboost/crypto/codec.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <openssl/crypto.h>

namespace cidboost {

namespace {

constexpr size_t kDerivedKeySize = 32;
constexpr size_t kKeyCheckSize = 8;
constexpr char kKeyCheckLabel[] = "cidboost-key-check";

struct PasswordMeta {
    std::vector<uint8_t> salt;
    std::optional<std::vector<uint8_t>> check;
};

PasswordMeta parse_password_meta(const std::string& metadata) {
    auto sep = metadata.find(':');
    auto salt = from_hex(std::string_view(metadata).substr(0, sep));
    if (!salt || salt->empty()) {
        throw CidBoostError(ErrorCode::DecryptionMetadataInvalid, "salt is not valid hex");
    }
    PasswordMeta meta;
    meta.salt = std::move(*salt);
    if (sep != std::string::npos) {
        auto check = from_hex(std::string_view(metadata).substr(sep + 1));
        if (!check || check->size() != kKeyCheckSize) {
            throw CidBoostError(ErrorCode::DecryptionMetadataInvalid, "key check is not valid hex");
        }
        meta.check = std::move(*check);
    }
    return meta;
}

std::vector<uint8_t> parse_wrapped_meta(const std::string& metadata) {
    auto sealed = from_base64(metadata);
    if (!sealed || sealed->empty()) {
        throw CidBoostError(ErrorCode::DecryptionMetadataInvalid, "wrapped key is not valid base64");
    }
    return std::move(*sealed);
}

} // anonymous namespace

std::optional<EncryptionType> parse_encryption_type(std::string_view name) {
    if (name.empty() || name == "none") return EncryptionType::None;
    if (name == "password") return EncryptionType::Password;
    if (name == "private" || name == "key-wrapped") return EncryptionType::KeyWrapped;
    return std::nullopt;
}

const char* to_string(EncryptionType type) {
    switch (type) {
        case EncryptionType::None: return "none";
        case EncryptionType::Password: return "password";
        case EncryptionType::KeyWrapped: return "private";
    }
    return "unknown";
}

bool argon2id_available() {
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
    if (!kdf) {
        return false;
    }
    EVP_KDF_free(kdf);
    return true;
}

SymmetricKey derive_key_argon2id(const std::string& password, const std::vector<uint8_t>& salt,
                                 const Argon2Params& cost) {
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
    if (!kdf) {
        throw CidBoostError(ErrorCode::CryptoError, "Argon2id is not available in this OpenSSL build");
    }
    EVP_KDF_CTX* ctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!ctx) {
        throw CidBoostError(ErrorCode::CryptoError, "EVP_KDF_CTX_new failed");
    }

    uint32_t iterations = cost.iterations;
    uint32_t lanes = cost.lanes;
    uint32_t threads = 1;
    uint32_t memcost = cost.memory_kib;
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_octet_string("pass", const_cast<char*>(password.data()), password.size()),
        OSSL_PARAM_construct_octet_string("salt", const_cast<uint8_t*>(salt.data()), salt.size()),
        OSSL_PARAM_construct_uint32("iter", &iterations),
        OSSL_PARAM_construct_uint32("lanes", &lanes),
        OSSL_PARAM_construct_uint32("threads", &threads),
        OSSL_PARAM_construct_uint32("memcost", &memcost),
        OSSL_PARAM_construct_end()
    };

    SymmetricKey key(kDerivedKeySize);
    int ok = EVP_KDF_derive(ctx, key.data(), key.size(), params);
    EVP_KDF_CTX_free(ctx);
    if (ok != 1) {
        throw CidBoostError(ErrorCode::CryptoError, "Argon2id derivation failed");
    }
    return key;
}

std::string compute_key_check(const SymmetricKey& key) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(kKeyCheckLabel), sizeof(kKeyCheckLabel) - 1,
              mac, &mac_len)) {
        throw CidBoostError(ErrorCode::CryptoError, "HMAC failed");
    }
    return to_hex(mac, kKeyCheckSize);
}

DefaultKeyResolver::DefaultKeyResolver(KeyDerivationFn derive, KeyUnwrapFn unwrap)
    : derive_(std::move(derive)), unwrap_(std::move(unwrap)) {
    if (!derive_) {
        derive_ = [](const std::string& password, const std::vector<uint8_t>& salt) {
            return derive_key_argon2id(password, salt);
        };
    }
}

void DefaultKeyResolver::validate(const DecryptionParams& params) const {
    switch (params.type) {
        case EncryptionType::None:
            return;
        case EncryptionType::Password:
            parse_password_meta(params.metadata);
            return;
        case EncryptionType::KeyWrapped:
            parse_wrapped_meta(params.metadata);
            return;
    }
}

SymmetricKey DefaultKeyResolver::resolve(const DecryptionParams& params) {
    switch (params.type) {
        case EncryptionType::None:
            return {};

        case EncryptionType::Password: {
            auto meta = parse_password_meta(params.metadata);
            if (!params.password || params.password->empty()) {
                throw CidBoostError(ErrorCode::AccessDenied, "password required");
            }
            SymmetricKey key = derive_(*params.password, meta.salt);
            if (meta.check) {
                auto expected = from_hex(compute_key_check(key));
                if (!expected || CRYPTO_memcmp(expected->data(), meta.check->data(), kKeyCheckSize) != 0) {
                    throw CidBoostError(ErrorCode::AccessDenied, "wrong password");
                }
            } else {
                Logger::instance().warning("Password metadata has no key check; a wrong password "
                                           "will only show as corrupt output");
            }
            if (!AesCtrCipher::valid_key_size(key.size())) {
                throw CidBoostError(ErrorCode::CryptoError, "derived key has invalid size");
            }
            return key;
        }

        case EncryptionType::KeyWrapped: {
            auto sealed = parse_wrapped_meta(params.metadata);
            if (!unwrap_) {
                throw CidBoostError(ErrorCode::AccessDenied, "Account not unlocked");
            }
            auto key = unwrap_(sealed);
            if (!key) {
                throw CidBoostError(ErrorCode::AccessDenied, "Failed to decrypt with your private key");
            }
            if (!AesCtrCipher::valid_key_size(key->size())) {
                throw CidBoostError(ErrorCode::CryptoError, "unwrapped key has invalid size");
            }
            return std::move(*key);
        }
    }
    throw CidBoostError(ErrorCode::InvalidArgument, "unknown encryption type");
}

} // namespace cidboost
