#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace vaultsplit::io {

using Bytes = std::vector<std::uint8_t>;

Bytes ReadFile(const std::filesystem::path& path);
void WriteFile(const std::filesystem::path& path, const std::uint8_t* data, std::size_t size);
void WriteFile(const std::filesystem::path& path, const Bytes& data);

// Writes to a hidden sibling and renames it over `path` only once the data
// is fully flushed; the temporary is removed on failure.
void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data);
void WriteTextAtomic(const std::filesystem::path& path, const std::string& text);

std::filesystem::path TempSibling(const std::filesystem::path& target);

// Creates a uniquely named staging directory under `parent`; the directory
// and whatever is left in it are removed on destruction.
class StagingDir {
public:
    explicit StagingDir(const std::filesystem::path& parent);
    ~StagingDir();

    StagingDir(const StagingDir&) = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void RenameInto(const std::filesystem::path& from, const std::filesystem::path& to);

}  // namespace vaultsplit::io
