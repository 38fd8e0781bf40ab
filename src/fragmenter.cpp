#include "vaultsplit/fragmenter.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/crypto.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace vaultsplit::fragmenter {

namespace {

constexpr std::size_t kCopyBlock = 1u << 20;

manifest::FragmentManifest NewManifest(const std::string& original_name,
                                       std::uint64_t total_size,
                                       std::uint64_t fragment_size,
                                       std::size_t count,
                                       const FragmentOptions& options) {
    manifest::FragmentManifest out;
    out.original_file = original_name;
    out.file_size = total_size;
    out.fragment_size = fragment_size;
    out.fragment_count = count;
    out.fragments.resize(count);
    out.created_at = manifest::UtcTimestamp();
    out.engine_version = std::string(constants::kEngineVersion);
    out.stages = options.stages;
    return out;
}

void ThrowRunFailures(const parallel::ExecutionReport& report, const char* operation) {
    if (report.cancelled) {
        throw CancelledError(std::string(operation) + " cancelled after " + std::to_string(report.completed)
                             + " fragments");
    }
    if (report.failures.empty()) {
        return;
    }
    if (report.failures.size() == 1) {
        std::rethrow_exception(report.failures.front().error);
    }
    std::ostringstream message;
    message << operation << " failed for " << report.failures.size() << " fragments:";
    for (const auto& failure : report.failures) {
        message << " [" << failure.index << "] " << failure.message;
    }
    throw IoError(message.str());
}

void LogRun(const log::Logger& logger, const parallel::ExecutionReport& report, std::size_t count) {
    logger.Debug("Processed " + std::to_string(report.completed) + "/" + std::to_string(count) + " fragments ("
                 + std::string(parallel::ModeName(report.mode)) + ", " + std::to_string(report.workers)
                 + " workers)");
    if (!report.fallback_reason.empty()) {
        logger.Warn("Fragment workers fell back: " + report.fallback_reason);
    }
}

std::filesystem::path NearestExisting(std::filesystem::path path) {
    std::error_code ec;
    if (path.empty()) {
        path = ".";
    }
    while (!std::filesystem::exists(path, ec)) {
        auto parent = path.parent_path();
        if (parent.empty() || parent == path) {
            return ".";
        }
        path = parent;
    }
    return path;
}

void EnsureSpace(const std::filesystem::path& dest_dir, std::uint64_t required, const FragmentOptions& options) {
    auto anchor = NearestExisting(dest_dir);
    std::uint64_t available = 0;
    if (options.available_space) {
        available = options.available_space(anchor);
    } else {
        std::error_code ec;
        auto info = std::filesystem::space(anchor, ec);
        if (ec) {
            throw IoError("Failed to query free space for " + anchor.string() + ": " + ec.message());
        }
        available = info.available;
    }
    if (available < required) {
        throw InsufficientSpaceError(dest_dir.string(), required, available);
    }
}

manifest::FragmentEntry WriteFragment(const std::filesystem::path& source,
                                      const std::filesystem::path& staging,
                                      const std::string& stem,
                                      std::size_t index,
                                      std::uint64_t fragment_size,
                                      std::uint64_t total_size,
                                      const log::Logger& logger) {
    std::uint64_t offset = static_cast<std::uint64_t>(index) * fragment_size;
    std::uint64_t length = std::min<std::uint64_t>(fragment_size, total_size - offset);
    std::string name = manifest::FragmentName(stem, index);
    auto target = staging / name;

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw IoError("Failed to open file: " + source.string());
    }
    in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError("Failed to open output file: " + target.string());
    }

    crypto::Md5Hasher hasher;
    std::vector<char> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(kCopyBlock, std::max<std::uint64_t>(length, 1))));
    std::uint64_t remaining = length;
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got != want) {
            throw IoError("Short read on " + source.string() + " at offset "
                          + std::to_string(offset + (length - remaining)));
        }
        hasher.Update(reinterpret_cast<const std::uint8_t*>(buffer.data()), got);
        out.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!out) {
            throw IoError("Failed to write output file: " + target.string());
        }
        remaining -= got;
    }
    out.close();
    if (!out) {
        throw IoError("Failed to write output file: " + target.string());
    }

    std::error_code ec;
    auto written = std::filesystem::file_size(target, ec);
    if (ec || written != length) {
        logger.Warn("Fragment " + name + " has " + std::to_string(written) + " bytes on disk, expected "
                    + std::to_string(length));
    }

    manifest::FragmentEntry entry;
    entry.name = name;
    entry.size = length;
    entry.checksum = hasher.FinalHex();
    entry.index = index;
    logger.Trace("Wrote " + name + " (" + std::to_string(length) + " bytes, md5 " + entry.checksum + ")");
    return entry;
}

// Moves every staged artifact into dest_dir; on failure the ones already
// moved are removed again so no partial set is left behind.
void Promote(const std::filesystem::path& staging,
             const std::filesystem::path& dest_dir,
             const std::vector<std::string>& names) {
    std::vector<std::filesystem::path> moved;
    moved.reserve(names.size());
    try {
        for (const auto& name : names) {
            io::RenameInto(staging / name, dest_dir / name);
            moved.push_back(dest_dir / name);
        }
    } catch (const std::exception&) {
        std::error_code ec;
        for (const auto& path : moved) {
            std::filesystem::remove(path, ec);
        }
        throw;
    }
}

}  // namespace

std::size_t FragmentCount(std::uint64_t total_size, std::uint64_t fragment_size) {
    if (fragment_size == 0) {
        throw std::invalid_argument("fragment_size must be positive");
    }
    return static_cast<std::size_t>((total_size + fragment_size - 1) / fragment_size);
}

std::uint64_t FragmentSizeFromMegabytes(std::uint64_t megabytes) {
    if (megabytes == 0) {
        throw std::invalid_argument("fragment size must be positive");
    }
    if (megabytes > std::numeric_limits<std::uint64_t>::max() / constants::kMiB) {
        throw std::out_of_range("fragment size of " + std::to_string(megabytes) + " MiB does not fit in 64 bits");
    }
    return megabytes * constants::kMiB;
}

std::string FragmentStem(const std::string& original_name) {
    std::string stem = std::filesystem::path(original_name).stem().string();
    return stem.empty() ? std::string("fragment") : stem;
}

FragmentSet Fragment(const Bytes& source,
                     std::uint64_t fragment_size,
                     const std::string& original_name,
                     const FragmentOptions& options) {
    std::size_t count = FragmentCount(source.size(), fragment_size);
    std::string stem = FragmentStem(original_name);

    FragmentSet set;
    set.manifest = NewManifest(std::filesystem::path(original_name).filename().string(), source.size(),
                               fragment_size, count, options);
    set.fragments.resize(count);
    auto run = parallel::RunIndexed(
        count,
        [&](std::size_t i) {
            std::size_t offset = static_cast<std::size_t>(i * fragment_size);
            std::size_t length = static_cast<std::size_t>(std::min<std::uint64_t>(fragment_size, source.size() - offset));
            FragmentData& fragment = set.fragments[i];
            fragment.index = i;
            fragment.name = manifest::FragmentName(stem, i);
            fragment.bytes.assign(source.begin() + static_cast<std::ptrdiff_t>(offset),
                                  source.begin() + static_cast<std::ptrdiff_t>(offset + length));
            set.manifest.fragments[i] = {fragment.name, length, crypto::Md5Hex(fragment.bytes), i};
        },
        options.run);
    LogRun(options.logger, run, count);
    ThrowRunFailures(run, "Fragmentation");
    return set;
}

manifest::FragmentManifest FragmentFile(const std::filesystem::path& path,
                                        const std::filesystem::path& dest_dir,
                                        std::uint64_t fragment_size,
                                        const FragmentOptions& options) {
    const auto& logger = options.logger;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw IoError("Input file not found: " + path.string());
    }
    std::uint64_t total = std::filesystem::file_size(path, ec);
    if (ec) {
        throw IoError("Failed to stat " + path.string() + ": " + ec.message());
    }
    std::size_t count = FragmentCount(total, fragment_size);
    std::string original_name = path.filename().string();
    std::string stem = FragmentStem(original_name);

    EnsureSpace(dest_dir, total, options);
    logger.Info("Splitting " + path.string() + " (" + std::to_string(total) + " bytes) into "
                + std::to_string(count) + " fragments of " + std::to_string(fragment_size) + " bytes");

    io::StagingDir staging(dest_dir);
    manifest::FragmentManifest result = NewManifest(original_name, total, fragment_size, count, options);
    auto run = parallel::RunIndexed(
        count,
        [&](std::size_t i) {
            result.fragments[i] = WriteFragment(path, staging.Path(), stem, i, fragment_size, total, logger);
        },
        options.run);
    LogRun(logger, run, count);
    if (!run.Ok()) {
        logger.Error("Fragmentation of " + path.string() + " aborted; discarding staged fragments");
    }
    ThrowRunFailures(run, "Fragmentation");

    std::string manifest_name = manifest::ManifestPath({}, stem).filename().string();
    manifest::Write(staging.Path() / manifest_name, result);

    std::vector<std::string> names;
    names.reserve(count + 1);
    for (const auto& entry : result.fragments) {
        names.push_back(entry.name);
    }
    // Manifest last: its presence implies a complete fragment set.
    names.push_back(manifest_name);
    Promote(staging.Path(), dest_dir, names);

    logger.Info("Wrote " + std::to_string(count) + " fragments and manifest to " + dest_dir.string());
    return result;
}

}  // namespace vaultsplit::fragmenter
