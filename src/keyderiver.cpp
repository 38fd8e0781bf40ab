#include "vaultsplit/keyderiver.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/crypto.hpp"
#include "vaultsplit/errors.hpp"

#include <utility>

namespace vaultsplit::keyderiver {

DerivedKey::DerivedKey(Bytes key, Bytes salt) : key_(std::move(key)), salt_(std::move(salt)) {}

DerivedKey::~DerivedKey() {
    crypto::Cleanse(key_);
}

DerivedKey::DerivedKey(DerivedKey&& other) noexcept
    : key_(std::move(other.key_)), salt_(std::move(other.salt_)) {
    other.key_.clear();
}

DerivedKey& DerivedKey::operator=(DerivedKey&& other) noexcept {
    if (this != &other) {
        crypto::Cleanse(key_);
        key_ = std::move(other.key_);
        salt_ = std::move(other.salt_);
        other.key_.clear();
    }
    return *this;
}

DerivedKey DeriveKey(const std::string& password, const std::optional<Bytes>& salt, std::uint32_t iterations) {
    Bytes effective_salt;
    if (salt.has_value()) {
        if (salt->size() != constants::kSaltSize) {
            throw KeyDerivationError("Salt must be " + std::to_string(constants::kSaltSize)
                                     + " bytes, got " + std::to_string(salt->size()));
        }
        effective_salt = *salt;
    } else {
        effective_salt = crypto::RandomBytes(constants::kSaltSize);
    }
    std::uint32_t iters = iterations == 0 ? constants::KdfIterations() : iterations;
    Bytes key = crypto::Pbkdf2HmacSha256(password, effective_salt, iters, constants::kKeySize);
    return DerivedKey(std::move(key), std::move(effective_salt));
}

}  // namespace vaultsplit::keyderiver
