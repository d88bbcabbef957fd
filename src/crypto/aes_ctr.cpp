#include "cidboost/crypto/aes_ctr.h"
#include "cidboost/base/error_code.h"
#include <openssl/evp.h>
#include <climits>
#include <string>

namespace cidboost {

AesCtrCipher::AesCtrCipher(const std::vector<uint8_t>& key, const uint8_t* iv)
    : ctx_(nullptr) {
    const EVP_CIPHER* cipher = nullptr;
    switch (key.size()) {
        case 16: cipher = EVP_aes_128_ctr(); break;
        case 24: cipher = EVP_aes_192_ctr(); break;
        case 32: cipher = EVP_aes_256_ctr(); break;
        default:
            throw CidBoostError(ErrorCode::CryptoError,
                                "invalid AES key size " + std::to_string(key.size()));
    }
    ctx_ = EVP_CIPHER_CTX_new();
    if (!ctx_) {
        throw CidBoostError(ErrorCode::CryptoError, "EVP_CIPHER_CTX_new failed");
    }
    if (EVP_EncryptInit_ex(ctx_, cipher, nullptr, key.data(), iv) != 1) {
        EVP_CIPHER_CTX_free(ctx_);
        throw CidBoostError(ErrorCode::CryptoError, "AES-CTR initialisation failed");
    }
}

AesCtrCipher::~AesCtrCipher() {
    EVP_CIPHER_CTX_free(ctx_);
}

void AesCtrCipher::update(const uint8_t* in, uint8_t* out, size_t len) {
    while (len > 0) {
        int step = len > static_cast<size_t>(INT_MAX / 2) ? INT_MAX / 2 : static_cast<int>(len);
        int written = 0;
        if (EVP_EncryptUpdate(ctx_, out, &written, in, step) != 1 || written != step) {
            throw CidBoostError(ErrorCode::CryptoError, "AES-CTR transform failed");
        }
        in += step;
        out += step;
        len -= static_cast<size_t>(step);
    }
}

} // namespace cidboost
