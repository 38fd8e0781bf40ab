#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <thread>

#include "vaultsplit/env.hpp"

namespace vaultsplit::constants {

inline constexpr std::size_t kSaltSize = 16;
inline constexpr std::size_t kKeySize = 32;
inline constexpr std::size_t kIvSize = 16;
inline constexpr std::size_t kBlockSize = 16;
inline constexpr std::uint32_t kPbkdf2Iterations = 100000;

// Smallest legal unit: IV plus one full padding block.
inline constexpr std::size_t kMinUnitSize = kIvSize + kBlockSize;
inline constexpr std::size_t kUnitLengthPrefix = 4;

inline constexpr std::size_t kDefaultChunkSize = 1u << 20;
inline constexpr std::size_t kMiB = 1u << 20;
inline constexpr std::size_t kDefaultFragmentSizeMb = 1024;

inline constexpr std::string_view kFragmentInfix = ".part";
inline constexpr int kFragmentIndexWidth = 3;
inline constexpr std::string_view kManifestSuffix = ".manifest.json";
inline constexpr std::string_view kEncryptedExt = ".enc";
// Suffix of the backup compression stage; distinct from ".gz" so an input
// that is already gzipped is never mistaken for one vaultsplit compressed.
inline constexpr std::string_view kBackupGzipExt = ".vsz";
inline constexpr std::string_view kFragmentsDirSuffix = "_fragments";
inline constexpr std::string_view kTempPrefix = ".vaultsplit-tmp-";

inline constexpr std::uint8_t kGzipMagic[2] = {0x1f, 0x8b};

inline constexpr std::string_view kEngineVersion = "1.0.0";

inline constexpr std::string_view kEnvKdfIters = "VAULTSPLIT_KDF_ITERS";
inline constexpr std::string_view kEnvTestKdfIters = "VAULTSPLIT_TEST_KDF_ITERS";
inline constexpr std::string_view kEnvWorkers = "VAULTSPLIT_WORKERS";
inline constexpr std::string_view kEnvLogLevel = "VAULTSPLIT_LOG_LEVEL";
inline constexpr std::string_view kEnvPassword = "VAULTSPLIT_PASSWORD";
inline constexpr std::string_view kEnvNoColor = "VAULTSPLIT_NO_COLOR";

inline std::uint32_t KdfIterations() {
    std::uint64_t value = env::GetUnsigned(kEnvKdfIters, 0);
    if (value == 0) {
        value = env::GetUnsigned(kEnvTestKdfIters, kPbkdf2Iterations);
    }
    if (value == 0 || value > 0x7fffffffu) {
        return kPbkdf2Iterations;
    }
    return static_cast<std::uint32_t>(value);
}

inline std::size_t DefaultWorkers() {
    std::uint64_t configured = env::GetUnsigned(kEnvWorkers, 0);
    if (configured > 0) {
        return static_cast<std::size_t>(configured);
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

}  // namespace vaultsplit::constants
