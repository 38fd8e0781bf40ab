#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "vaultsplit/log.hpp"
#include "vaultsplit/manifest.hpp"
#include "vaultsplit/parallel.hpp"

namespace vaultsplit::fragmenter {

using Bytes = std::vector<std::uint8_t>;

struct FragmentOptions {
    parallel::RunOptions run;
    log::Logger logger;
    // Free-space query for the destination; empty uses std::filesystem::space.
    std::function<std::uint64_t(const std::filesystem::path&)> available_space;
    // Copied into the manifest's stage record.
    std::optional<std::vector<std::string>> stages;
};

struct FragmentData {
    std::size_t index = 0;
    std::string name;
    Bytes bytes;
};

struct FragmentSet {
    // Sorted by index.
    std::vector<FragmentData> fragments;
    manifest::FragmentManifest manifest;
};

std::size_t FragmentCount(std::uint64_t total_size, std::uint64_t fragment_size);

// MiB to bytes. Throws std::invalid_argument for 0 and std::out_of_range when
// the byte count would overflow.
std::uint64_t FragmentSizeFromMegabytes(std::uint64_t megabytes);

// Fragment names use the stem of `original_name` (last extension dropped).
std::string FragmentStem(const std::string& original_name);

FragmentSet Fragment(const Bytes& source,
                     std::uint64_t fragment_size,
                     const std::string& original_name,
                     const FragmentOptions& options = {});

// Streams `path` into `<dest_dir>/<stem>.partNNN` plus `<stem>.manifest.json`.
// Everything is staged in a hidden directory under dest_dir and renamed into
// place only after every fragment has been written. Throws
// InsufficientSpaceError before writing anything when dest_dir lacks room.
manifest::FragmentManifest FragmentFile(const std::filesystem::path& path,
                                        const std::filesystem::path& dest_dir,
                                        std::uint64_t fragment_size,
                                        const FragmentOptions& options = {});

}  // namespace vaultsplit::fragmenter
