#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vaultsplit::chunk {

using Bytes = std::vector<std::uint8_t>;

// Returns IV || AES-256-CBC(PKCS7(plaintext)) under a fresh random IV.
Bytes EncryptChunk(const std::uint8_t* plaintext, std::size_t size, const Bytes& key);
Bytes EncryptChunk(const Bytes& plaintext, const Bytes& key);

// Inverse of EncryptChunk. Throws PaddingError on malformed padding or a
// unit too short to hold an IV and one block.
Bytes DecryptChunk(const std::uint8_t* unit, std::size_t size, const Bytes& key);
Bytes DecryptChunk(const Bytes& unit, const Bytes& key);

}  // namespace vaultsplit::chunk
