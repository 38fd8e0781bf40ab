#include "vaultsplit/cli_colors.hpp"
#include "vaultsplit/constants.hpp"
#include "vaultsplit/container.hpp"
#include "vaultsplit/crypto.hpp"
#include "vaultsplit/env.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"
#include "vaultsplit/fragmenter.hpp"
#include "vaultsplit/log.hpp"
#include "vaultsplit/manifest.hpp"
#include "vaultsplit/pipeline.hpp"
#include "vaultsplit/reassembler.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

constexpr std::size_t kMinPasswordLength = 8;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << vaultsplit::cli::Cyan("Usage:") << "\n";
    std::cout << "  vaultsplit_cli encrypt <file> -p <password> [--out <path>] [--chunk-size <bytes>]\n";
    std::cout << "  vaultsplit_cli decrypt <file.enc> -p <password> [--out <path>]\n";
    std::cout << "  vaultsplit_cli fragment <file> [--out <dir>] [--fragment-size <MB> | --fragment-bytes <n>]\n";
    std::cout << "  vaultsplit_cli reassemble <dir> [--manifest <file>] [--out <path>] [--strict-size]\n";
    std::cout << "  vaultsplit_cli backup <file> -p <password> [--out <dir>] [--compress] [--no-encrypt] [--no-fragment]"
                 " [--fragment-size <MB> | --fragment-bytes <n>]\n";
    std::cout << "  vaultsplit_cli restore <dir|file> [-p <password>] [--out <dir>] [--strict-size]\n";
    std::cout << "  vaultsplit_cli inspect <file.enc|dir|manifest.json>\n";
    std::cout << "Common flags: --workers <n> --sequential -v|--verbose (repeat for trace) --log-file <path> --no-color\n";
    std::cout << "The password may also come from VAULTSPLIT_PASSWORD.\n";
}

struct CliArgs {
    std::string input;
    std::string output;
    std::string manifest;
    std::optional<std::string> password;
    std::uint64_t fragment_size =
        static_cast<std::uint64_t>(vaultsplit::constants::kDefaultFragmentSizeMb) * vaultsplit::constants::kMiB;
    std::size_t chunk_size = vaultsplit::constants::kDefaultChunkSize;
    std::size_t workers = 0;
    bool sequential = false;
    bool compress = false;
    bool encrypt = true;
    bool fragment = true;
    bool strict_size = false;
    int verbosity = 0;
    std::string log_file;
};

std::uint64_t ParseCount(const std::string& flag, const char* text) {
    std::string value(text);
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw UsageError("Invalid value for " + flag + ": " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw UsageError("Value for " + flag + " is out of range: " + value);
    }
}

const char* TakeValue(int argc, char** argv, int& idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    idx += 2;
    return argv[idx - 1];
}

CliArgs ParseArgs(int argc, char** argv, int start_index) {
    CliArgs opts;
    if (start_index >= argc) {
        throw UsageError("Missing input path");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-p" || flag == "--password") {
            opts.password = TakeValue(argc, argv, idx, flag);
        } else if (flag == "-o" || flag == "--out") {
            opts.output = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--manifest") {
            opts.manifest = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--fragment-size") {
            std::uint64_t mb = ParseCount(flag, TakeValue(argc, argv, idx, flag));
            try {
                opts.fragment_size = vaultsplit::fragmenter::FragmentSizeFromMegabytes(mb);
            } catch (const std::logic_error& exc) {
                throw UsageError("Invalid value for " + flag + ": " + exc.what());
            }
        } else if (flag == "--fragment-bytes") {
            opts.fragment_size = ParseCount(flag, TakeValue(argc, argv, idx, flag));
        } else if (flag == "--chunk-size") {
            opts.chunk_size = static_cast<std::size_t>(ParseCount(flag, TakeValue(argc, argv, idx, flag)));
        } else if (flag == "--workers") {
            opts.workers = static_cast<std::size_t>(ParseCount(flag, TakeValue(argc, argv, idx, flag)));
        } else if (flag == "--sequential") {
            opts.sequential = true;
            idx += 1;
        } else if (flag == "--compress") {
            opts.compress = true;
            idx += 1;
        } else if (flag == "--no-encrypt") {
            opts.encrypt = false;
            idx += 1;
        } else if (flag == "--no-fragment") {
            opts.fragment = false;
            idx += 1;
        } else if (flag == "--strict-size") {
            opts.strict_size = true;
            idx += 1;
        } else if (flag == "-v" || flag == "--verbose") {
            opts.verbosity += 1;
            idx += 1;
        } else if (flag == "--log-file") {
            opts.log_file = TakeValue(argc, argv, idx, flag);
        } else if (flag == "--no-color") {
            vaultsplit::cli::SetColorsEnabled(false);
            idx += 1;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    if (opts.fragment_size == 0) {
        throw UsageError("Fragment size must be positive");
    }
    if (opts.chunk_size == 0) {
        throw UsageError("Chunk size must be positive");
    }
    return opts;
}

vaultsplit::log::Logger SetupLogging(const CliArgs& opts) {
    using vaultsplit::log::Level;
    Level level = vaultsplit::log::ParseLevel(vaultsplit::env::Get(vaultsplit::constants::kEnvLogLevel), Level::Info);
    if (opts.verbosity == 1) {
        level = Level::Debug;
    } else if (opts.verbosity > 1) {
        level = Level::Trace;
    }
    vaultsplit::log::InitConsole(level);
    if (!opts.log_file.empty()) {
        vaultsplit::log::InitFile(opts.log_file, level);
    }
    vaultsplit::log::Logger logger("cli", level);
    logger.Debug("Log level " + std::string(vaultsplit::log::LevelName(level)));
    return logger;
}

std::string ResolvePassword(const CliArgs& opts, bool required, const vaultsplit::log::Logger& logger) {
    std::string password;
    if (opts.password) {
        password = *opts.password;
    } else {
        password = vaultsplit::env::Get(vaultsplit::constants::kEnvPassword);
    }
    if (password.empty()) {
        if (required) {
            throw UsageError("Password is required (use -p or " + std::string(vaultsplit::constants::kEnvPassword)
                             + ")");
        }
        return password;
    }
    if (password.size() < kMinPasswordLength) {
        logger.Warn("Password is shorter than " + std::to_string(kMinPasswordLength) + " characters");
    }
    return password;
}

vaultsplit::parallel::RunOptions MakeRunOptions(const CliArgs& opts) {
    vaultsplit::parallel::RunOptions run;
    run.workers = opts.workers;
    run.force_sequential = opts.sequential;
    return run;
}

std::string DefaultDecryptedName(const std::string& input) {
    std::string ext(vaultsplit::constants::kEncryptedExt);
    if (input.size() > ext.size() && input.compare(input.size() - ext.size(), ext.size(), ext) == 0) {
        return input.substr(0, input.size() - ext.size());
    }
    return input + ".out";
}

std::filesystem::path ResolveManifestPath(const CliArgs& opts) {
    if (!opts.manifest.empty()) {
        return opts.manifest;
    }
    auto found = vaultsplit::manifest::FindManifest(opts.input);
    if (!found) {
        throw vaultsplit::ManifestError("No *" + std::string(vaultsplit::constants::kManifestSuffix) + " found in "
                                        + opts.input);
    }
    return *found;
}

void PrintManifest(const vaultsplit::manifest::FragmentManifest& manifest) {
    std::cout << "original_file: " << manifest.original_file << "\n";
    std::cout << "file_size: " << manifest.file_size << " bytes\n";
    std::cout << "fragment_size: " << manifest.fragment_size << " bytes\n";
    std::cout << "fragment_count: " << manifest.fragment_count << "\n";
    if (!manifest.created_at.empty()) {
        std::cout << "created_at: " << manifest.created_at << "\n";
    }
    if (manifest.stages) {
        std::string stages;
        for (const auto& stage : *manifest.stages) {
            stages += (stages.empty() ? "" : ", ") + stage;
        }
        std::cout << "backup_stages: " << (stages.empty() ? "none" : stages) << "\n";
    }
    for (const auto& entry : manifest.fragments) {
        std::cout << "  [" << entry.index << "] " << entry.name << " " << entry.size << " bytes md5 "
                  << entry.checksum << "\n";
    }
}

void PrintContainer(const std::filesystem::path& path) {
    auto data = vaultsplit::io::ReadFile(path);
    auto layout = vaultsplit::container::ParseLayout(data);
    std::cout << "container_size: " << data.size() << " bytes\n";
    std::cout << "salt: " << vaultsplit::crypto::ToHex(layout.salt.data(), layout.salt.size()) << "\n";
    std::cout << "units: " << layout.units.size() << "\n";
    for (std::size_t i = 0; i < layout.units.size(); ++i) {
        std::cout << "  [" << i << "] offset " << layout.units[i].offset << " length " << layout.units[i].length
                  << " bytes\n";
    }
}

void PrintSizeMismatch(const std::optional<vaultsplit::SizeMismatchError>& mismatch) {
    if (mismatch) {
        std::cerr << vaultsplit::cli::Yellow(std::string("Warning: ") + mismatch->what(), std::cerr) << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return 0;
    }
    try {
        if (command == "encrypt" || command == "decrypt") {
            CliArgs opts = ParseArgs(argc, argv, 2);
            auto logger = SetupLogging(opts);
            std::string password = ResolvePassword(opts, true, logger);
            vaultsplit::container::ContainerOptions container_opts;
            container_opts.chunk_size = opts.chunk_size;
            container_opts.run = MakeRunOptions(opts);
            container_opts.logger = logger.WithChannel("container");
            if (command == "encrypt") {
                std::string output = opts.output.empty() ? opts.input + std::string(vaultsplit::constants::kEncryptedExt)
                                                         : opts.output;
                vaultsplit::container::EncryptFile(opts.input, output, password, container_opts);
                std::cout << output << "\n";
            } else {
                std::string output = opts.output.empty() ? DefaultDecryptedName(opts.input) : opts.output;
                vaultsplit::container::DecryptFile(opts.input, output, password, container_opts);
                std::cout << output << "\n";
            }
            return 0;
        }
        if (command == "fragment") {
            CliArgs opts = ParseArgs(argc, argv, 2);
            auto logger = SetupLogging(opts);
            std::filesystem::path input(opts.input);
            std::filesystem::path dest = opts.output;
            if (dest.empty()) {
                dest = input.parent_path()
                       / (vaultsplit::fragmenter::FragmentStem(input.filename().string())
                          + std::string(vaultsplit::constants::kFragmentsDirSuffix));
            }
            vaultsplit::fragmenter::FragmentOptions fragment_opts;
            fragment_opts.run = MakeRunOptions(opts);
            fragment_opts.logger = logger.WithChannel("fragmenter");
            auto manifest = vaultsplit::fragmenter::FragmentFile(input, dest, opts.fragment_size, fragment_opts);
            std::cout << dest.string() << " (" << manifest.fragment_count << " fragments)\n";
            return 0;
        }
        if (command == "reassemble") {
            CliArgs opts = ParseArgs(argc, argv, 2);
            auto logger = SetupLogging(opts);
            auto manifest = vaultsplit::manifest::Read(ResolveManifestPath(opts));
            std::filesystem::path output = opts.output.empty()
                                               ? std::filesystem::path(manifest.original_file).filename()
                                               : std::filesystem::path(opts.output);
            vaultsplit::reassembler::ReassembleOptions reassemble_opts;
            reassemble_opts.strict_size = opts.strict_size;
            reassemble_opts.run = MakeRunOptions(opts);
            reassemble_opts.logger = logger.WithChannel("reassembler");
            auto mismatch = vaultsplit::reassembler::ReassembleFile(opts.input, manifest, output, reassemble_opts);
            PrintSizeMismatch(mismatch);
            std::cout << output.string() << "\n";
            return 0;
        }
        if (command == "backup" || command == "restore") {
            CliArgs opts = ParseArgs(argc, argv, 2);
            auto logger = SetupLogging(opts);
            vaultsplit::pipeline::PipelineOptions pipeline_opts;
            pipeline_opts.compress = opts.compress;
            pipeline_opts.encrypt = opts.encrypt;
            pipeline_opts.fragment = opts.fragment;
            pipeline_opts.fragment_size = opts.fragment_size;
            pipeline_opts.chunk_size = opts.chunk_size;
            pipeline_opts.strict_size = opts.strict_size;
            pipeline_opts.run = MakeRunOptions(opts);
            pipeline_opts.logger = logger.WithChannel("pipeline");
            std::filesystem::path out_dir = opts.output.empty() ? std::filesystem::path(".")
                                                                : std::filesystem::path(opts.output);
            if (command == "backup") {
                pipeline_opts.password = ResolvePassword(opts, opts.encrypt, logger);
                auto result = vaultsplit::pipeline::Backup(opts.input, out_dir, pipeline_opts);
                std::cout << vaultsplit::cli::Green("Backup written: ") << result.artifact.string() << "\n";
                if (result.manifest) {
                    std::cout << "  " << result.manifest->fragment_count << " fragments of "
                              << result.manifest->fragment_size << " bytes\n";
                }
            } else {
                pipeline_opts.password = ResolvePassword(opts, false, logger);
                auto result = vaultsplit::pipeline::Restore(opts.input, out_dir, pipeline_opts);
                PrintSizeMismatch(result.size_mismatch);
                std::cout << vaultsplit::cli::Green("Restored: ") << result.output.string() << "\n";
            }
            return 0;
        }
        if (command == "inspect") {
            CliArgs opts = ParseArgs(argc, argv, 2);
            SetupLogging(opts);
            std::filesystem::path target(opts.input);
            std::string name = target.filename().string();
            std::string suffix(vaultsplit::constants::kManifestSuffix);
            bool is_manifest = name.size() > suffix.size()
                               && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
            if (std::filesystem::is_directory(target)) {
                PrintManifest(vaultsplit::manifest::Read(ResolveManifestPath(opts)));
            } else if (is_manifest) {
                PrintManifest(vaultsplit::manifest::Read(target));
            } else {
                PrintContainer(target);
            }
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << vaultsplit::cli::Red(std::string("Error: ") + exc.what(), std::cerr) << "\n";
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << vaultsplit::cli::Red(std::string("Error: ") + exc.what(), std::cerr) << "\n";
        return 1;
    }
}
