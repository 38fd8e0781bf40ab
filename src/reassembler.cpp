#include "vaultsplit/reassembler.hpp"

#include "vaultsplit/crypto.hpp"
#include "vaultsplit/file_io.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <system_error>

namespace vaultsplit::reassembler {

namespace {

constexpr std::size_t kReadBlock = 1u << 20;

struct Digest {
    std::uint64_t size = 0;
    std::string checksum;
};

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return text;
}

Digest HashFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError("Failed to open fragment: " + path.string());
    }
    crypto::Md5Hasher hasher;
    std::vector<char> buffer(kReadBlock);
    Digest digest;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            hasher.Update(reinterpret_cast<const std::uint8_t*>(buffer.data()), static_cast<std::size_t>(got));
            digest.size += static_cast<std::uint64_t>(got);
        }
    }
    if (in.bad()) {
        throw IoError("Failed to read fragment: " + path.string());
    }
    digest.checksum = hasher.FinalHex();
    return digest;
}

std::optional<ChecksumMismatch> Compare(const manifest::FragmentEntry& entry,
                                        const Digest& digest,
                                        const log::Logger& logger) {
    bool checksum_ok = Lower(entry.checksum) == digest.checksum;
    if (digest.size != entry.size) {
        logger.Warn("Fragment " + entry.name + " is " + std::to_string(digest.size) + " bytes, manifest says "
                    + std::to_string(entry.size));
    }
    if (checksum_ok && digest.size == entry.size) {
        return std::nullopt;
    }
    return ChecksumMismatch{entry.name, entry.checksum, digest.checksum};
}

void ThrowMismatches(const std::vector<std::optional<ChecksumMismatch>>& slots, const log::Logger& logger) {
    std::vector<ChecksumMismatch> mismatches;
    for (const auto& slot : slots) {
        if (slot) {
            mismatches.push_back(*slot);
        }
    }
    if (mismatches.empty()) {
        return;
    }
    for (const auto& item : mismatches) {
        logger.Error("Checksum mismatch for " + item.name + ": expected " + item.expected + ", got " + item.actual);
    }
    throw CorruptFragmentError(std::move(mismatches));
}

void ThrowRunFailures(const parallel::ExecutionReport& report) {
    if (report.cancelled) {
        throw CancelledError("Reassembly cancelled after " + std::to_string(report.completed) + " fragments");
    }
    if (report.failures.empty()) {
        return;
    }
    if (report.failures.size() == 1) {
        std::rethrow_exception(report.failures.front().error);
    }
    std::ostringstream message;
    message << "Reassembly failed for " << report.failures.size() << " fragments:";
    for (const auto& failure : report.failures) {
        message << " [" << failure.index << "] " << failure.message;
    }
    throw IoError(message.str());
}

// Positions into manifest.fragments ordered by fragment index.
std::vector<std::size_t> ByIndex(const manifest::FragmentManifest& manifest) {
    std::vector<std::size_t> order(manifest.fragments.size());
    for (std::size_t pos = 0; pos < manifest.fragments.size(); ++pos) {
        order[manifest.fragments[pos].index] = pos;
    }
    return order;
}

void CheckPresence(const std::filesystem::path& dir, const manifest::FragmentManifest& manifest) {
    std::vector<std::string> missing;
    for (std::size_t pos : ByIndex(manifest)) {
        const auto& entry = manifest.fragments[pos];
        std::error_code ec;
        if (!std::filesystem::is_regular_file(dir / entry.name, ec)) {
            missing.push_back(entry.name);
        }
    }
    if (!missing.empty()) {
        throw MissingFragmentsError(std::move(missing));
    }
}

std::optional<SizeMismatchError> CheckSize(const manifest::FragmentManifest& manifest,
                                           std::uint64_t actual,
                                           const ReassembleOptions& options) {
    if (actual == manifest.file_size) {
        return std::nullopt;
    }
    SizeMismatchError mismatch(manifest.file_size, actual);
    if (options.strict_size) {
        throw mismatch;
    }
    options.logger.Warn(std::string(mismatch.what()) + " for " + manifest.original_file);
    return mismatch;
}

// Loads each fragment through `load`, verifies it and concatenates by index.
ReassemblyResult Assemble(const manifest::FragmentManifest& manifest,
                          const std::function<Bytes(const manifest::FragmentEntry&)>& load,
                          const ReassembleOptions& options) {
    const auto& logger = options.logger;
    auto order = ByIndex(manifest);
    std::vector<Bytes> slots(order.size());
    std::vector<std::optional<ChecksumMismatch>> mismatches(order.size());
    auto run = parallel::RunIndexed(
        order.size(),
        [&](std::size_t i) {
            const auto& entry = manifest.fragments[order[i]];
            slots[i] = load(entry);
            Digest digest{static_cast<std::uint64_t>(slots[i].size()), crypto::Md5Hex(slots[i])};
            mismatches[i] = Compare(entry, digest, logger);
        },
        options.run);
    logger.Debug("Checked " + std::to_string(run.completed) + "/" + std::to_string(order.size()) + " fragments ("
                 + std::string(parallel::ModeName(run.mode)) + ")");
    ThrowRunFailures(run);
    ThrowMismatches(mismatches, logger);

    ReassemblyResult result;
    std::size_t total = 0;
    for (const auto& slot : slots) {
        total += slot.size();
    }
    result.data.reserve(total);
    for (auto& slot : slots) {
        result.data.insert(result.data.end(), slot.begin(), slot.end());
        Bytes().swap(slot);
    }
    result.size_mismatch = CheckSize(manifest, result.data.size(), options);
    return result;
}

}  // namespace

void Verify(const std::filesystem::path& fragments_dir,
            const manifest::FragmentManifest& manifest,
            const ReassembleOptions& options) {
    manifest::Validate(manifest);
    CheckPresence(fragments_dir, manifest);
    auto order = ByIndex(manifest);
    std::vector<std::optional<ChecksumMismatch>> mismatches(order.size());
    auto run = parallel::RunIndexed(
        order.size(),
        [&](std::size_t i) {
            const auto& entry = manifest.fragments[order[i]];
            mismatches[i] = Compare(entry, HashFile(fragments_dir / entry.name), options.logger);
        },
        options.run);
    ThrowRunFailures(run);
    ThrowMismatches(mismatches, options.logger);
    options.logger.Debug("All " + std::to_string(order.size()) + " fragments of " + manifest.original_file
                         + " verified");
}

ReassemblyResult Reassemble(const std::filesystem::path& fragments_dir,
                            const manifest::FragmentManifest& manifest,
                            const ReassembleOptions& options) {
    manifest::Validate(manifest);
    CheckPresence(fragments_dir, manifest);
    options.logger.Info("Reassembling " + manifest.original_file + " from " + std::to_string(manifest.fragment_count)
                        + " fragments in " + fragments_dir.string());
    return Assemble(
        manifest, [&](const manifest::FragmentEntry& entry) { return io::ReadFile(fragments_dir / entry.name); },
        options);
}

ReassemblyResult Reassemble(const std::map<std::string, Bytes>& fragments,
                            const manifest::FragmentManifest& manifest,
                            const ReassembleOptions& options) {
    manifest::Validate(manifest);
    std::vector<std::string> missing;
    for (std::size_t pos : ByIndex(manifest)) {
        const auto& entry = manifest.fragments[pos];
        if (fragments.find(entry.name) == fragments.end()) {
            missing.push_back(entry.name);
        }
    }
    if (!missing.empty()) {
        throw MissingFragmentsError(std::move(missing));
    }
    return Assemble(
        manifest, [&](const manifest::FragmentEntry& entry) { return fragments.at(entry.name); }, options);
}

std::optional<SizeMismatchError> ReassembleFile(const std::filesystem::path& fragments_dir,
                                                const manifest::FragmentManifest& manifest,
                                                const std::filesystem::path& output_path,
                                                const ReassembleOptions& options) {
    const auto& logger = options.logger;
    Verify(fragments_dir, manifest, options);

    std::error_code ec;
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path(), ec);
        if (ec) {
            throw IoError("Failed to create directory " + output_path.parent_path().string() + ": " + ec.message());
        }
    }

    auto temp = io::TempSibling(output_path);
    std::optional<SizeMismatchError> mismatch;
    try {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IoError("Failed to open output file: " + temp.string());
        }
        std::vector<char> buffer(kReadBlock);
        std::uint64_t written = 0;
        for (std::size_t pos : ByIndex(manifest)) {
            if (options.run.cancel != nullptr && options.run.cancel->IsCancelled()) {
                throw CancelledError("Reassembly cancelled after " + std::to_string(written) + " bytes");
            }
            auto path = fragments_dir / manifest.fragments[pos].name;
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                throw IoError("Failed to open fragment: " + path.string());
            }
            while (in) {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = in.gcount();
                if (got > 0) {
                    out.write(buffer.data(), got);
                    written += static_cast<std::uint64_t>(got);
                }
            }
            if (in.bad() || !out) {
                throw IoError("Failed to copy fragment " + path.string() + " into " + output_path.string());
            }
        }
        out.close();
        if (!out) {
            throw IoError("Failed to write output file: " + temp.string());
        }
        mismatch = CheckSize(manifest, written, options);
        io::RenameInto(temp, output_path);
    } catch (const std::exception&) {
        std::filesystem::remove(temp, ec);
        throw;
    }
    logger.Info("Reassembled " + manifest.original_file + " into " + output_path.string());
    return mismatch;
}

}  // namespace vaultsplit::reassembler
