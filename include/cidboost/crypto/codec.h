#ifndef CIDBOOST_CRYPTO_CODEC_H
#define CIDBOOST_CRYPTO_CODEC_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cidboost {

std::string to_hex(const uint8_t* data, size_t size);
std::string to_hex(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> from_hex(std::string_view text);

// Standard alphabet with padding
std::string to_base64(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> from_base64(std::string_view text);

// Cryptographically secure random bytes. Throws CidBoostError(CryptoError).
std::vector<uint8_t> random_bytes(size_t count);

} // namespace cidboost

#endif // CIDBOOST_CRYPTO_CODEC_H
