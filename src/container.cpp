#include "vaultsplit/container.hpp"

#include "vaultsplit/chunk_codec.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"
#include "vaultsplit/keyderiver.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace vaultsplit::container {

namespace {

void PutU32Be(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::uint32_t GetU32Be(const std::uint8_t* ptr) {
    return (static_cast<std::uint32_t>(ptr[0]) << 24)
           | (static_cast<std::uint32_t>(ptr[1]) << 16)
           | (static_cast<std::uint32_t>(ptr[2]) << 8)
           | static_cast<std::uint32_t>(ptr[3]);
}

std::string JoinIndices(const std::vector<std::size_t>& indices) {
    std::ostringstream out;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << indices[i];
    }
    return out.str();
}

void ThrowIfCancelled(const parallel::ExecutionReport& report, const char* operation) {
    if (report.cancelled) {
        throw CancelledError(std::string(operation) + " cancelled after "
                             + std::to_string(report.completed) + " units");
    }
}

// Padding failures are gathered into one error naming every bad chunk; any
// other failure is rethrown as-is since it is not a data problem.
void ThrowDecryptFailures(const parallel::ExecutionReport& report) {
    if (report.failures.empty()) {
        return;
    }
    std::vector<std::size_t> padding_indices;
    for (const auto& failure : report.failures) {
        try {
            std::rethrow_exception(failure.error);
        } catch (const PaddingError&) {
            padding_indices.push_back(failure.index);
        } catch (...) {
            throw;
        }
    }
    throw PaddingError("Decryption failed for chunk(s) " + JoinIndices(padding_indices)
                       + ": invalid padding (wrong password or corrupted data)",
                       padding_indices);
}

void ThrowEncryptFailures(const parallel::ExecutionReport& report) {
    if (report.failures.empty()) {
        return;
    }
    std::ostringstream message;
    message << "Encryption failed for " << report.failures.size() << " chunk(s):";
    for (const auto& failure : report.failures) {
        message << " [" << failure.index << "] " << failure.message;
    }
    throw Error(message.str());
}

std::uint32_t ResolveIterations(const ContainerOptions& options) {
    return options.kdf_iterations == 0 ? constants::KdfIterations() : options.kdf_iterations;
}

}  // namespace

ContainerLayout ParseLayout(const Bytes& container) {
    if (container.size() < constants::kSaltSize) {
        throw TruncatedContainerError("Container shorter than salt", 0, constants::kSaltSize, container.size());
    }
    ContainerLayout layout;
    layout.salt.assign(container.begin(), container.begin() + constants::kSaltSize);
    std::size_t offset = constants::kSaltSize;
    while (offset < container.size()) {
        std::size_t remaining = container.size() - offset;
        if (remaining < constants::kUnitLengthPrefix) {
            throw TruncatedContainerError("Incomplete unit length prefix", offset,
                                          constants::kUnitLengthPrefix, remaining);
        }
        std::size_t length = GetU32Be(container.data() + offset);
        offset += constants::kUnitLengthPrefix;
        remaining -= constants::kUnitLengthPrefix;
        if (length > remaining) {
            throw TruncatedContainerError("Unit " + std::to_string(layout.units.size()) + " overruns container",
                                          offset, length, remaining);
        }
        layout.units.push_back({offset, length});
        offset += length;
    }
    return layout;
}

Bytes FrameUnits(const Bytes& salt, const std::vector<Bytes>& units) {
    std::size_t total = salt.size();
    for (const auto& unit : units) {
        if (unit.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw Error("Chunk unit exceeds 4 GiB framing limit");
        }
        total += constants::kUnitLengthPrefix + unit.size();
    }
    Bytes out;
    out.reserve(total);
    out.insert(out.end(), salt.begin(), salt.end());
    for (const auto& unit : units) {
        PutU32Be(out, static_cast<std::uint32_t>(unit.size()));
        out.insert(out.end(), unit.begin(), unit.end());
    }
    return out;
}

std::vector<Bytes> SplitChunks(const Bytes& data, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
    std::vector<Bytes> chunks;
    if (data.empty()) {
        chunks.emplace_back();
        return chunks;
    }
    chunks.reserve((data.size() + chunk_size - 1) / chunk_size);
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        std::size_t end = std::min(data.size(), offset + chunk_size);
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

Bytes EncryptStream(const std::vector<Bytes>& chunks,
                    const std::string& password,
                    const ContainerOptions& options,
                    parallel::ExecutionReport* report) {
    const auto& logger = options.logger;
    auto derived = keyderiver::DeriveKey(password, std::nullopt, ResolveIterations(options));
    const Bytes& key = derived.Key();

    std::vector<Bytes> units(chunks.size());
    auto run = parallel::RunIndexed(
        chunks.size(), [&](std::size_t i) { units[i] = chunk::EncryptChunk(chunks[i], key); }, options.run);
    logger.Debug("Encrypted " + std::to_string(run.completed) + "/" + std::to_string(chunks.size()) + " chunks ("
                 + std::string(parallel::ModeName(run.mode)) + ", " + std::to_string(run.workers) + " workers)");
    if (!run.fallback_reason.empty()) {
        logger.Warn("Chunk encryption fell back: " + run.fallback_reason);
    }
    if (report) {
        *report = run;
    }
    ThrowIfCancelled(run, "Encryption");
    ThrowEncryptFailures(run);
    return FrameUnits(derived.Salt(), units);
}

std::vector<Bytes> DecryptStream(const Bytes& container,
                                 const std::string& password,
                                 const ContainerOptions& options,
                                 parallel::ExecutionReport* report) {
    const auto& logger = options.logger;
    ContainerLayout layout = ParseLayout(container);
    logger.Debug("Container holds " + std::to_string(layout.units.size()) + " units");
    auto derived = keyderiver::DeriveKey(password, layout.salt, ResolveIterations(options));
    const Bytes& key = derived.Key();

    std::vector<Bytes> chunks(layout.units.size());
    auto run = parallel::RunIndexed(
        layout.units.size(),
        [&](std::size_t i) {
            const UnitSpan& span = layout.units[i];
            chunks[i] = chunk::DecryptChunk(container.data() + span.offset, span.length, key);
        },
        options.run);
    logger.Debug("Decrypted " + std::to_string(run.completed) + "/" + std::to_string(layout.units.size())
                 + " chunks (" + std::string(parallel::ModeName(run.mode)) + ")");
    if (!run.fallback_reason.empty()) {
        logger.Warn("Chunk decryption fell back: " + run.fallback_reason);
    }
    if (report) {
        *report = run;
    }
    ThrowIfCancelled(run, "Decryption");
    if (!run.failures.empty()) {
        logger.Error("Decryption failed for " + std::to_string(run.failures.size()) + " chunk(s)");
    }
    ThrowDecryptFailures(run);
    return chunks;
}

Bytes EncryptBytes(const Bytes& plaintext, const std::string& password, const ContainerOptions& options) {
    return EncryptStream(SplitChunks(plaintext, options.chunk_size), password, options);
}

Bytes DecryptBytes(const Bytes& container, const std::string& password, const ContainerOptions& options) {
    std::vector<Bytes> chunks = DecryptStream(container, password, options);
    std::size_t total = 0;
    for (const auto& part : chunks) {
        total += part.size();
    }
    Bytes out;
    out.reserve(total);
    for (const auto& part : chunks) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

void EncryptFile(const std::filesystem::path& path_in,
                 const std::filesystem::path& path_out,
                 const std::string& password,
                 const ContainerOptions& options) {
    options.logger.Info("Encrypting " + path_in.string());
    Bytes plaintext = io::ReadFile(path_in);
    Bytes container = EncryptBytes(plaintext, password, options);
    io::WriteFileAtomic(path_out, container);
    options.logger.Info("Encrypted container written to " + path_out.string() + " ("
                        + std::to_string(container.size()) + " bytes)");
}

void DecryptFile(const std::filesystem::path& path_in,
                 const std::filesystem::path& path_out,
                 const std::string& password,
                 const ContainerOptions& options) {
    options.logger.Info("Decrypting " + path_in.string());
    Bytes container = io::ReadFile(path_in);
    Bytes plaintext = DecryptBytes(container, password, options);
    io::WriteFileAtomic(path_out, plaintext);
    options.logger.Info("Decrypted output written to " + path_out.string());
}

}  // namespace vaultsplit::container
