#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "vaultsplit/errors.hpp"
#include "vaultsplit/log.hpp"
#include "vaultsplit/manifest.hpp"
#include "vaultsplit/parallel.hpp"

namespace vaultsplit::reassembler {

using Bytes = std::vector<std::uint8_t>;

struct ReassembleOptions {
    // Throw SizeMismatchError instead of returning it beside the data.
    bool strict_size = false;
    parallel::RunOptions run;
    log::Logger logger;
};

struct ReassemblyResult {
    Bytes data;
    std::optional<SizeMismatchError> size_mismatch;
};

// Checks presence and checksums of every fragment named by the manifest
// without keeping their contents. Throws ManifestError, MissingFragmentsError
// (all missing names) or CorruptFragmentError (all mismatches).
void Verify(const std::filesystem::path& fragments_dir,
            const manifest::FragmentManifest& manifest,
            const ReassembleOptions& options = {});

ReassemblyResult Reassemble(const std::filesystem::path& fragments_dir,
                            const manifest::FragmentManifest& manifest,
                            const ReassembleOptions& options = {});

// In-memory variant keyed by fragment name.
ReassemblyResult Reassemble(const std::map<std::string, Bytes>& fragments,
                            const manifest::FragmentManifest& manifest,
                            const ReassembleOptions& options = {});

// Verifies, then streams the fragments in index order into output_path via a
// temporary sibling. Returns the size mismatch when not strict.
std::optional<SizeMismatchError> ReassembleFile(const std::filesystem::path& fragments_dir,
                                                const manifest::FragmentManifest& manifest,
                                                const std::filesystem::path& output_path,
                                                const ReassembleOptions& options = {});

}  // namespace vaultsplit::reassembler
