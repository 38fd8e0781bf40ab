#include "vaultsplit/pipeline.hpp"

#include "vaultsplit/container.hpp"
#include "vaultsplit/file_io.hpp"
#include "vaultsplit/fragmenter.hpp"
#include "vaultsplit/pack.hpp"
#include "vaultsplit/reassembler.hpp"

#include <stdexcept>
#include <system_error>

namespace vaultsplit::pipeline {

namespace {

constexpr const char* kStageCompress = "compress";
constexpr const char* kStageEncrypt = "encrypt";
constexpr const char* kStageFragment = "fragment";

bool EndsWith(const std::string& text, std::string_view suffix) {
    return text.size() > suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "x.enc" -> "x"; names without the suffix get `fallback` appended instead.
std::string StripSuffix(const std::string& name, std::string_view suffix, std::string_view fallback) {
    if (EndsWith(name, suffix)) {
        return name.substr(0, name.size() - suffix.size());
    }
    return name + std::string(fallback);
}

// Stages to undo, outermost first. A manifest stage record is authoritative;
// without one the suffixes Backup appends decide.
std::vector<std::string> StagesToUndo(std::string name, const std::optional<std::vector<std::string>>& recorded) {
    std::vector<std::string> stages;
    if (recorded) {
        stages.assign(recorded->rbegin(), recorded->rend());
        for (const auto& stage : stages) {
            if (stage != kStageCompress && stage != kStageEncrypt) {
                throw ManifestError("Unknown backup stage in manifest: " + stage);
            }
        }
        return stages;
    }
    if (EndsWith(name, constants::kEncryptedExt)) {
        stages.emplace_back(kStageEncrypt);
        name.resize(name.size() - constants::kEncryptedExt.size());
    }
    if (EndsWith(name, constants::kBackupGzipExt)) {
        stages.emplace_back(kStageCompress);
    }
    return stages;
}

container::ContainerOptions MakeContainerOptions(const PipelineOptions& options) {
    container::ContainerOptions out;
    out.chunk_size = options.chunk_size;
    out.run = options.run;
    out.logger = options.logger.WithChannel("container");
    return out;
}

}  // namespace

BackupResult Backup(const std::filesystem::path& input,
                    const std::filesystem::path& output_dir,
                    const PipelineOptions& options) {
    const auto& logger = options.logger;
    if (!options.compress && !options.encrypt && !options.fragment) {
        throw std::invalid_argument("Backup needs at least one of compress, encrypt or fragment");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input, ec)) {
        throw IoError("Input file not found: " + input.string());
    }
    if (options.encrypt && options.password.empty()) {
        logger.Warn("Encrypting with an empty password");
    }

    io::StagingDir staging(output_dir);
    BackupResult result;
    std::filesystem::path current = input;
    std::string name = input.filename().string();

    if (options.compress) {
        name += std::string(constants::kBackupGzipExt);
        auto next = staging.Path() / name;
        logger.Info("Compressing " + current.string());
        pack::CompressGzip(current, next);
        current = next;
        result.stages.emplace_back(kStageCompress);
    }
    if (options.encrypt) {
        name += std::string(constants::kEncryptedExt);
        auto next = staging.Path() / name;
        container::EncryptFile(current, next, options.password, MakeContainerOptions(options));
        current = next;
        result.stages.emplace_back(kStageEncrypt);
    }
    if (options.fragment) {
        fragmenter::FragmentOptions fragment_options;
        fragment_options.run = options.run;
        fragment_options.logger = logger.WithChannel("fragmenter");
        fragment_options.stages = result.stages;
        auto dir = output_dir / (fragmenter::FragmentStem(name) + std::string(constants::kFragmentsDirSuffix));
        result.manifest = fragmenter::FragmentFile(current, dir, options.fragment_size, fragment_options);
        result.artifact = dir;
        result.stages.emplace_back(kStageFragment);
    } else {
        result.artifact = output_dir / name;
        io::RenameInto(current, result.artifact);
    }
    logger.Info("Backup of " + input.string() + " written to " + result.artifact.string());
    return result;
}

RestoreResult Restore(const std::filesystem::path& backup,
                      const std::filesystem::path& output_dir,
                      const PipelineOptions& options) {
    const auto& logger = options.logger;
    std::error_code ec;
    bool is_dir = std::filesystem::is_directory(backup, ec);
    if (!is_dir && !std::filesystem::is_regular_file(backup, ec)) {
        throw IoError("Backup not found: " + backup.string());
    }

    io::StagingDir staging(output_dir);
    RestoreResult result;
    std::filesystem::path current = backup;
    std::string name = backup.filename().string();
    std::vector<std::string> stages;
    int step = 0;

    if (is_dir) {
        auto manifest_path = manifest::FindManifest(backup);
        if (!manifest_path) {
            throw ManifestError("No *" + std::string(constants::kManifestSuffix) + " found in " + backup.string());
        }
        auto fragment_manifest = manifest::Read(*manifest_path);
        name = std::filesystem::path(fragment_manifest.original_file).filename().string();
        if (name.empty() || name == "." || name == "..") {
            throw ManifestError("Manifest names no usable original file: " + manifest_path->string());
        }
        stages = StagesToUndo(name, fragment_manifest.stages);
        reassembler::ReassembleOptions reassemble_options;
        reassemble_options.strict_size = options.strict_size;
        reassemble_options.run = options.run;
        reassemble_options.logger = logger.WithChannel("reassembler");
        auto next = staging.Path() / (std::to_string(step++) + "-" + name);
        result.size_mismatch = reassembler::ReassembleFile(backup, fragment_manifest, next, reassemble_options);
        current = next;
        result.reassembled = true;
    } else {
        stages = StagesToUndo(name, std::nullopt);
    }

    for (const auto& stage : stages) {
        if (stage == kStageEncrypt) {
            if (options.password.empty()) {
                logger.Warn("No password given; " + name + " is left encrypted");
                break;
            }
            name = StripSuffix(name, constants::kEncryptedExt, ".dec");
            auto next = staging.Path() / (std::to_string(step++) + "-" + name);
            container::DecryptFile(current, next, options.password, MakeContainerOptions(options));
            current = next;
            result.decrypted = true;
        } else {
            if (!pack::IsGzipFile(current)) {
                throw IoError(name + " was backed up compressed but holds no gzip data");
            }
            name = StripSuffix(name, constants::kBackupGzipExt, ".out");
            auto next = staging.Path() / (std::to_string(step++) + "-" + name);
            logger.Info("Decompressing " + name);
            pack::DecompressGzip(current, next);
            current = next;
            result.decompressed = true;
        }
    }
    if (!options.password.empty() && !result.decrypted) {
        logger.Info("Backup " + backup.string() + " is not encrypted; the password is not used");
    }

    result.output = output_dir / name;
    if (current == backup) {
        std::filesystem::copy_file(backup, result.output, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw IoError("Failed to copy " + backup.string() + " to " + result.output.string() + ": " + ec.message());
        }
    } else {
        io::RenameInto(current, result.output);
    }
    logger.Info("Restored " + result.output.string());
    return result;
}

}  // namespace vaultsplit::pipeline
