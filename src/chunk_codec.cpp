#include "vaultsplit/chunk_codec.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/crypto.hpp"
#include "vaultsplit/errors.hpp"

namespace vaultsplit::chunk {

Bytes EncryptChunk(const std::uint8_t* plaintext, std::size_t size, const Bytes& key) {
    Bytes iv = crypto::RandomBytes(constants::kIvSize);
    Bytes ct = crypto::AesCbcEncrypt(key, iv, plaintext, size);

    Bytes unit;
    unit.reserve(iv.size() + ct.size());
    unit.insert(unit.end(), iv.begin(), iv.end());
    unit.insert(unit.end(), ct.begin(), ct.end());
    return unit;
}

Bytes EncryptChunk(const Bytes& plaintext, const Bytes& key) {
    return EncryptChunk(plaintext.data(), plaintext.size(), key);
}

Bytes DecryptChunk(const std::uint8_t* unit, std::size_t size, const Bytes& key) {
    if (size < constants::kMinUnitSize) {
        throw PaddingError("Chunk unit too short: " + std::to_string(size) + " bytes");
    }
    Bytes iv(unit, unit + constants::kIvSize);
    return crypto::AesCbcDecrypt(key, iv, unit + constants::kIvSize, size - constants::kIvSize);
}

Bytes DecryptChunk(const Bytes& unit, const Bytes& key) {
    return DecryptChunk(unit.data(), unit.size(), key);
}

}  // namespace vaultsplit::chunk
