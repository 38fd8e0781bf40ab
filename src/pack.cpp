#include "vaultsplit/pack.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/errors.hpp"

#include <array>
#include <fstream>
#include <string>

#include <zlib.h>

namespace vaultsplit::pack {

namespace {

// Closes the handle on scope exit; gzclose on a write handle flushes the
// trailer, so its result is checked explicitly in CompressGzip.
class GzHandle {
public:
    GzHandle(const std::filesystem::path& path, const std::string& mode)
        : handle_(gzopen(path.string().c_str(), mode.c_str())) {}
    ~GzHandle() {
        if (handle_ != nullptr) {
            gzclose(handle_);
        }
    }

    GzHandle(const GzHandle&) = delete;
    GzHandle& operator=(const GzHandle&) = delete;

    gzFile Get() const { return handle_; }
    int Close() {
        gzFile handle = handle_;
        handle_ = nullptr;
        return gzclose(handle);
    }

private:
    gzFile handle_;
};

}  // namespace

bool IsGzip(const Bytes& data) {
    return data.size() >= 2 && data[0] == constants::kGzipMagic[0] && data[1] == constants::kGzipMagic[1];
}

bool IsGzipFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IoError("Failed to open file: " + path.string());
    }
    Bytes magic(sizeof(constants::kGzipMagic));
    in.read(reinterpret_cast<char*>(magic.data()), static_cast<std::streamsize>(magic.size()));
    magic.resize(static_cast<std::size_t>(in.gcount()));
    return IsGzip(magic);
}

void CompressGzip(const std::filesystem::path& input,
                  const std::filesystem::path& output,
                  int level) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        throw IoError("Failed to open input for gzip: " + input.string());
    }
    GzHandle gz(output, "wb" + std::to_string(level));
    if (!gz.Get()) {
        throw IoError("Failed to open gzip output: " + output.string());
    }
    std::array<char, 1 << 16> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got > 0) {
            int written = gzwrite(gz.Get(), buffer.data(), static_cast<unsigned int>(got));
            if (written == 0) {
                throw IoError("Failed to write gzip output: " + output.string());
            }
        }
    }
    if (in.bad()) {
        throw IoError("Failed to read input for gzip: " + input.string());
    }
    if (gz.Close() != Z_OK) {
        throw IoError("Failed to finish gzip output: " + output.string());
    }
}

void DecompressGzip(const std::filesystem::path& input,
                    const std::filesystem::path& output) {
    GzHandle gz(input, "rb");
    if (!gz.Get()) {
        throw IoError("Failed to open gzip input: " + input.string());
    }
    std::ofstream out(output, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IoError("Failed to open gzip output: " + output.string());
    }
    std::array<char, 1 << 16> buffer{};
    int read_bytes = 0;
    while ((read_bytes = gzread(gz.Get(), buffer.data(), static_cast<unsigned int>(buffer.size()))) > 0) {
        out.write(buffer.data(), read_bytes);
    }
    if (read_bytes < 0) {
        int errnum = 0;
        const char* detail = gzerror(gz.Get(), &errnum);
        throw IoError("Failed to read gzip input " + input.string() + ": " + (detail ? detail : "unknown error"));
    }
    out.flush();
    if (!out) {
        throw IoError("Failed to write gzip output: " + output.string());
    }
}

}  // namespace vaultsplit::pack
