#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vaultsplit::manifest {

struct FragmentEntry {
    std::string name;
    std::uint64_t size = 0;
    std::string checksum;
    std::size_t index = 0;
};

struct FragmentManifest {
    std::string original_file;
    std::uint64_t file_size = 0;
    std::uint64_t fragment_size = 0;
    std::size_t fragment_count = 0;
    // Kept sorted by index.
    std::vector<FragmentEntry> fragments;
    std::string created_at;
    std::string engine_version;
    // Backup stages applied before fragmenting, innermost first. Absent for
    // plain fragment sets.
    std::optional<std::vector<std::string>> stages;
};

// "<stem>.part<NNN>"
std::string FragmentName(const std::string& stem, std::size_t index);
std::filesystem::path ManifestPath(const std::filesystem::path& dir, const std::string& stem);
// The single *.manifest.json in `dir`; ManifestError when there are several.
std::optional<std::filesystem::path> FindManifest(const std::filesystem::path& dir);

std::string ToJson(const FragmentManifest& manifest);
// Throws ManifestError on malformed JSON or missing fields.
FragmentManifest FromJson(const std::string& json);

// Checks that indices cover 0..count-1 exactly once and that every name is a
// plain file name. Throws ManifestError.
void Validate(const FragmentManifest& manifest);

void Write(const std::filesystem::path& path, const FragmentManifest& manifest);
FragmentManifest Read(const std::filesystem::path& path);

std::string UtcTimestamp();

}  // namespace vaultsplit::manifest
