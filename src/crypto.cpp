#include "vaultsplit/crypto.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/errors.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

namespace vaultsplit::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

void CheckCipherArgs(const Bytes& key, const Bytes& iv, std::size_t data_len) {
    if (key.size() != constants::kKeySize) {
        throw KeyDerivationError("AES-256-CBC expects 32-byte key");
    }
    if (iv.size() != constants::kIvSize) {
        throw std::runtime_error("AES-256-CBC expects 16-byte IV");
    }
    if (data_len > static_cast<std::size_t>(std::numeric_limits<int>::max() - 32)) {
        throw std::runtime_error("AES-256-CBC input too large");
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pbkdf2HmacSha256(const std::string& password, const Bytes& salt, std::size_t iterations, std::size_t length) {
    Bytes out(length);
    Ensure(PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                             static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                             static_cast<int>(out.size()), out.data()) == 1,
           "PBKDF2 failed");
    return out;
}

Bytes AesCbcEncrypt(const Bytes& key, const Bytes& iv, const std::uint8_t* plaintext, std::size_t plaintext_len) {
    CheckCipherArgs(key, iv, plaintext_len);
    // PKCS7 always adds between 1 and 16 bytes.
    Bytes out(plaintext_len + constants::kBlockSize);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;
    Ensure(EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) == 1,
           "AES-CBC init failed");
    if (plaintext_len > 0) {
        Ensure(EVP_EncryptUpdate(ctx.get(), out.data(), &out_len, plaintext, static_cast<int>(plaintext_len)) == 1,
               "AES-CBC encrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_EncryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-CBC final failed");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

Bytes AesCbcDecrypt(const Bytes& key, const Bytes& iv, const std::uint8_t* ciphertext, std::size_t ciphertext_len) {
    CheckCipherArgs(key, iv, ciphertext_len);
    if (ciphertext_len == 0 || ciphertext_len % constants::kBlockSize != 0) {
        throw PaddingError("Ciphertext length " + std::to_string(ciphertext_len)
                           + " is not a positive multiple of the block size");
    }
    Bytes out(ciphertext_len + constants::kBlockSize);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    int out_len = 0;
    int total_len = 0;
    Ensure(EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) == 1,
           "AES-CBC init failed");
    Ensure(EVP_DecryptUpdate(ctx.get(), out.data(), &out_len, ciphertext, static_cast<int>(ciphertext_len)) == 1,
           "AES-CBC decrypt failed");
    total_len += out_len;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total_len, &out_len) != 1) {
        ERR_clear_error();
        OPENSSL_cleanse(out.data(), out.size());
        throw PaddingError("Invalid PKCS7 padding (wrong password or corrupted data)");
    }
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

std::string ToHex(const std::uint8_t* data, std::size_t size) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[(data[i] >> 4) & 0x0F]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string Md5Hex(const std::uint8_t* data, std::size_t size) {
    Md5Hasher hasher;
    hasher.Update(data, size);
    return hasher.FinalHex();
}

std::string Md5Hex(const Bytes& data) {
    return Md5Hex(data.data(), data.size());
}

void Cleanse(Bytes& buffer) noexcept {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
    }
}

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("MD5 context allocation failed");
    }
    Ensure(EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) == 1, "MD5 init failed");
}

void Md5Hasher::Update(const std::uint8_t* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("MD5 hasher already finalized");
    }
    if (size == 0) {
        return;
    }
    Ensure(EVP_DigestUpdate(ctx_.get(), data, size) == 1, "MD5 update failed");
}

std::string Md5Hasher::FinalHex() {
    if (finished_) {
        throw std::logic_error("MD5 hasher already finalized");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    Ensure(EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) == 1, "MD5 final failed");
    finished_ = true;
    return ToHex(digest, digest_len);
}

}  // namespace vaultsplit::crypto
