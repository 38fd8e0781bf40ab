#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vaultsplit::keyderiver {

using Bytes = std::vector<std::uint8_t>;

// Holds the derived key for the duration of one codec call and wipes it on
// destruction.
class DerivedKey {
public:
    DerivedKey(Bytes key, Bytes salt);
    ~DerivedKey();

    DerivedKey(const DerivedKey&) = delete;
    DerivedKey& operator=(const DerivedKey&) = delete;
    DerivedKey(DerivedKey&& other) noexcept;
    DerivedKey& operator=(DerivedKey&& other) noexcept;

    const Bytes& Key() const noexcept { return key_; }
    const Bytes& Salt() const noexcept { return salt_; }

private:
    Bytes key_;
    Bytes salt_;
};

// PBKDF2-HMAC-SHA256 into a 32-byte key. A missing salt is generated; a
// supplied salt must be exactly 16 bytes. Iterations of 0 use the configured
// default (100000 unless overridden by VAULTSPLIT_KDF_ITERS).
DerivedKey DeriveKey(const std::string& password,
                     const std::optional<Bytes>& salt = std::nullopt,
                     std::uint32_t iterations = 0);

}  // namespace vaultsplit::keyderiver
