#ifndef CIDBOOST_CRYPTO_KEY_RESOLVER_H
#define CIDBOOST_CRYPTO_KEY_RESOLVER_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cidboost {

enum class EncryptionType {
    None,
    Password,    // key derived from a user password and a stored salt
    KeyWrapped   // per-file key sealed to the account key pair
};

// Accepts "", "none", "password", "private" and "key-wrapped"
std::optional<EncryptionType> parse_encryption_type(std::string_view name);
const char* to_string(EncryptionType type);

struct DecryptionParams {
    EncryptionType type = EncryptionType::None;
    std::string metadata;
    std::optional<std::string> password;
};

using SymmetricKey = std::vector<uint8_t>;

// Turns decryption parameters into key bytes
class KeyResolver {
public:
    virtual ~KeyResolver() = default;

    // Cheap syntactic check of the metadata. Throws
    // CidBoostError(DecryptionMetadataInvalid).
    virtual void validate(const DecryptionParams& params) const = 0;

    // Throws CidBoostError with DecryptionMetadataInvalid, AccessDenied or
    // CryptoError. Returns an empty key for EncryptionType::None.
    virtual SymmetricKey resolve(const DecryptionParams& params) = 0;
};

using KeyDerivationFn = std::function<SymmetricKey(const std::string& password,
                                                   const std::vector<uint8_t>& salt)>;
// Opens a sealed per-file key; nullopt when it does not open
using KeyUnwrapFn = std::function<std::optional<SymmetricKey>(const std::vector<uint8_t>& sealed)>;

// Argon2id cost. The defaults are the ones encrypted objects are written with.
struct Argon2Params {
    uint32_t iterations = 1;
    uint32_t memory_kib = 64 * 1024;
    uint32_t lanes = 4;
};

// 32-byte Argon2id key. Needs the ARGON2ID KDF of OpenSSL 3.2 or later;
// throws CidBoostError(CryptoError) when it is missing.
SymmetricKey derive_key_argon2id(const std::string& password, const std::vector<uint8_t>& salt,
                                 const Argon2Params& params = Argon2Params{});

// Whether the linked OpenSSL provides Argon2id
bool argon2id_available();

// First 8 bytes of HMAC-SHA256(key, "cidboost-key-check"), hex encoded
std::string compute_key_check(const SymmetricKey& key);

// Password metadata: "<salt hex>" or "<salt hex>:<key check hex>".
// Key-wrapped metadata: base64 of the sealed key.
class DefaultKeyResolver : public KeyResolver {
public:
    // derive defaults to derive_key_argon2id with the default cost
    explicit DefaultKeyResolver(KeyDerivationFn derive = nullptr,
                                KeyUnwrapFn unwrap = nullptr);

    void validate(const DecryptionParams& params) const override;
    SymmetricKey resolve(const DecryptionParams& params) override;

private:
    KeyDerivationFn derive_;
    KeyUnwrapFn unwrap_;
};

} // namespace cidboost

#endif // CIDBOOST_CRYPTO_KEY_RESOLVER_H
