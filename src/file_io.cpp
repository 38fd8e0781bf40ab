#include "vaultsplit/file_io.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/errors.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

namespace vaultsplit::io {

namespace {

std::string RandomToken() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return std::to_string(gen());
}

}  // namespace

Bytes ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw IoError("Failed to open file: " + path.string());
    }
    Bytes data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        throw IoError("Failed to read file: " + path.string());
    }
    return data;
}

void WriteFile(const std::filesystem::path& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw IoError("Failed to open output file: " + path.string());
    }
    if (size > 0) {
        output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }
    output.flush();
    if (!output) {
        throw IoError("Failed to write output file: " + path.string());
    }
}

void WriteFile(const std::filesystem::path& path, const Bytes& data) {
    WriteFile(path, data.data(), data.size());
}

std::filesystem::path TempSibling(const std::filesystem::path& target) {
    auto parent = target.parent_path();
    std::string name = std::string(constants::kTempPrefix) + target.filename().string() + "-" + RandomToken();
    return parent.empty() ? std::filesystem::path(name) : parent / name;
}

void RenameInto(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        throw IoError("Failed to rename " + from.string() + " to " + to.string() + ": " + ec.message());
    }
}

void WriteFileAtomic(const std::filesystem::path& path, const Bytes& data) {
    auto temp = TempSibling(path);
    try {
        WriteFile(temp, data);
        RenameInto(temp, path);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        throw;
    }
}

void WriteTextAtomic(const std::filesystem::path& path, const std::string& text) {
    WriteFileAtomic(path, Bytes(text.begin(), text.end()));
}

StagingDir::StagingDir(const std::filesystem::path& parent) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw IoError("Failed to create directory " + parent.string() + ": " + ec.message());
    }
    for (int i = 0; i < 64; ++i) {
        auto candidate = parent / (std::string(constants::kTempPrefix) + RandomToken());
        if (std::filesystem::create_directory(candidate, ec)) {
            path_ = candidate;
            return;
        }
    }
    throw IoError("Failed to create staging directory under " + parent.string());
}

StagingDir::~StagingDir() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

}  // namespace vaultsplit::io
