#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace vaultsplit::pack {

using Bytes = std::vector<std::uint8_t>;

inline constexpr int kDefaultGzipLevel = 6;

bool IsGzip(const Bytes& data);
bool IsGzipFile(const std::filesystem::path& path);

void CompressGzip(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  int level = kDefaultGzipLevel);
void DecompressGzip(const std::filesystem::path& input,
                    const std::filesystem::path& output);

}  // namespace vaultsplit::pack
