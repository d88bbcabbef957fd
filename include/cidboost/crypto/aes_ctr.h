#ifndef CIDBOOST_CRYPTO_AES_CTR_H
#define CIDBOOST_CRYPTO_AES_CTR_H

#include <cstddef>
#include <cstdint>
#include <vector>

typedef struct evp_cipher_ctx_st EVP_CIPHER_CTX;

namespace cidboost {

// Encrypted objects start with the counter block
constexpr size_t kAesIvSize = 16;

// AES in counter mode. The same transform encrypts and decrypts. The key size
// (16, 24 or 32 bytes) selects AES-128/192/256.
class AesCtrCipher {
public:
    // Throws CidBoostError(CryptoError) for unsupported key sizes
    AesCtrCipher(const std::vector<uint8_t>& key, const uint8_t* iv);
    ~AesCtrCipher();

    AesCtrCipher(const AesCtrCipher&) = delete;
    AesCtrCipher& operator=(const AesCtrCipher&) = delete;

    // in and out may alias
    void update(const uint8_t* in, uint8_t* out, size_t len);

    static bool valid_key_size(size_t size) { return size == 16 || size == 24 || size == 32; }

private:
    EVP_CIPHER_CTX* ctx_;
};

} // namespace cidboost

#endif // CIDBOOST_CRYPTO_AES_CTR_H
