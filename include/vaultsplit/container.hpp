#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "vaultsplit/constants.hpp"
#include "vaultsplit/log.hpp"
#include "vaultsplit/parallel.hpp"

namespace vaultsplit::container {

using Bytes = std::vector<std::uint8_t>;

struct ContainerOptions {
    std::size_t chunk_size = constants::kDefaultChunkSize;
    // 0 uses constants::KdfIterations().
    std::uint32_t kdf_iterations = 0;
    parallel::RunOptions run;
    log::Logger logger;
};

struct UnitSpan {
    std::size_t offset = 0;
    std::size_t length = 0;
};

struct ContainerLayout {
    Bytes salt;
    std::vector<UnitSpan> units;
};

// Container format: salt[16] | (len:u32-BE, unit)* with unit = IV[16] | ciphertext.
ContainerLayout ParseLayout(const Bytes& container);
Bytes FrameUnits(const Bytes& salt, const std::vector<Bytes>& units);

// Empty input yields one empty chunk so that it still occupies one unit.
std::vector<Bytes> SplitChunks(const Bytes& data, std::size_t chunk_size = constants::kDefaultChunkSize);

Bytes EncryptStream(const std::vector<Bytes>& chunks,
                    const std::string& password,
                    const ContainerOptions& options = {},
                    parallel::ExecutionReport* report = nullptr);

// Throws TruncatedContainerError on bad framing and PaddingError naming every
// chunk index whose padding failed.
std::vector<Bytes> DecryptStream(const Bytes& container,
                                 const std::string& password,
                                 const ContainerOptions& options = {},
                                 parallel::ExecutionReport* report = nullptr);

Bytes EncryptBytes(const Bytes& plaintext, const std::string& password, const ContainerOptions& options = {});
Bytes DecryptBytes(const Bytes& container, const std::string& password, const ContainerOptions& options = {});

void EncryptFile(const std::filesystem::path& path_in,
                 const std::filesystem::path& path_out,
                 const std::string& password,
                 const ContainerOptions& options = {});
void DecryptFile(const std::filesystem::path& path_in,
                 const std::filesystem::path& path_out,
                 const std::string& password,
                 const ContainerOptions& options = {});

}  // namespace vaultsplit::container
