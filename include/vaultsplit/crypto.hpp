#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vaultsplit/crypto_utils.hpp"

namespace vaultsplit::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);
Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length);

// AES-256-CBC with PKCS7 padding. Decrypt throws PaddingError when the
// final block does not carry well-formed padding.
Bytes AesCbcEncrypt(const Bytes& key, const Bytes& iv, const std::uint8_t* plaintext, std::size_t plaintext_len);
Bytes AesCbcDecrypt(const Bytes& key, const Bytes& iv, const std::uint8_t* ciphertext, std::size_t ciphertext_len);

std::string Md5Hex(const std::uint8_t* data, std::size_t size);
std::string Md5Hex(const Bytes& data);
std::string ToHex(const std::uint8_t* data, std::size_t size);

void Cleanse(Bytes& buffer) noexcept;

// Incremental MD5 for checksumming files without loading them whole.
class Md5Hasher {
public:
    Md5Hasher();

    void Update(const std::uint8_t* data, std::size_t size);
    std::string FinalHex();

private:
    detail::UniqueMDCtx ctx_;
    bool finished_ = false;
};

}  // namespace vaultsplit::crypto
