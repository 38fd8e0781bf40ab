#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vaultsplit/constants.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/log.hpp"
#include "vaultsplit/manifest.hpp"
#include "vaultsplit/parallel.hpp"

namespace vaultsplit::pipeline {

// Stage order is fixed: compress, encrypt, fragment. Each flag only switches
// its stage on or off.
struct PipelineOptions {
    bool compress = false;
    bool encrypt = true;
    bool fragment = true;
    std::string password;
    std::uint64_t fragment_size = static_cast<std::uint64_t>(constants::kDefaultFragmentSizeMb) * constants::kMiB;
    std::size_t chunk_size = constants::kDefaultChunkSize;
    bool strict_size = false;
    parallel::RunOptions run;
    log::Logger logger;
};

struct BackupResult {
    // The .enc/.gz file, or the fragments directory when fragmenting.
    std::filesystem::path artifact;
    std::optional<manifest::FragmentManifest> manifest;
    std::vector<std::string> stages;
};

struct RestoreResult {
    std::filesystem::path output;
    bool reassembled = false;
    bool decrypted = false;
    bool decompressed = false;
    std::optional<SizeMismatchError> size_mismatch;
};

BackupResult Backup(const std::filesystem::path& input,
                    const std::filesystem::path& output_dir,
                    const PipelineOptions& options);

// `backup` is either a fragments directory holding a manifest or a single
// file. Only the stages Backup applied are undone, newest first: the
// manifest's stage record for a fragments directory, the ".enc" and ".vsz"
// suffixes for a single file. Without a password an encrypted backup is
// restored as the container itself.
RestoreResult Restore(const std::filesystem::path& backup,
                      const std::filesystem::path& output_dir,
                      const PipelineOptions& options);

}  // namespace vaultsplit::pipeline
