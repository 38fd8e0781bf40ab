#include "test_util.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/crypto.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"
#include "vaultsplit/fragmenter.hpp"
#include "vaultsplit/reassembler.hpp"

#include <limits>
#include <map>

using namespace vaultsplit;
using test::Check;
using test::ExpectThrows;

namespace {

bool HasStagingLeftovers(const std::filesystem::path& dir) {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (entry.path().filename().string().rfind(std::string(constants::kTempPrefix), 0) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

int main() {
    return test::RunAll({
        {"fragment sizes and count",
         [] {
             auto source = test::RandomData(2500, 1);
             auto set = fragmenter::Fragment(source, 1000, "backup.zip");
             Check(set.fragments.size() == 3 && set.manifest.fragment_count == 3, "ceil(2500 / 1000) fragments");
             Check(set.fragments[0].bytes.size() == 1000 && set.fragments[2].bytes.size() == 500, "remainder last");
             Check(set.fragments[1].name == "backup.part001", "names use the stem");
             Check(set.manifest.original_file == "backup.zip" && set.manifest.file_size == 2500, "manifest header");
             Check(set.manifest.fragments[2].checksum == crypto::Md5Hex(set.fragments[2].bytes), "md5 recorded");

             auto even = fragmenter::Fragment(test::RandomData(3000, 2), 1000, "even.bin");
             Check(even.fragments.size() == 3 && even.fragments[2].bytes.size() == 1000,
                   "exact multiple ends with a full fragment");
         }},
        {"degenerate inputs",
         [] {
             auto empty = fragmenter::Fragment({}, 10, "empty.bin");
             Check(empty.fragments.empty() && empty.manifest.fragment_count == 0, "empty source has no fragments");
             ExpectThrows<std::invalid_argument>([] { fragmenter::Fragment({1, 2, 3}, 0, "x"); }, "fragment size 0");
             Check(fragmenter::FragmentStem("archive.tar.gz") == "archive.tar", "stem drops last extension");
             Check(fragmenter::FragmentStem("README") == "README", "stem without extension");
         }},
        {"fragment size in MiB",
         [] {
             Check(fragmenter::FragmentSizeFromMegabytes(3) == 3 * constants::kMiB, "3 MiB");
             const std::uint64_t largest = std::numeric_limits<std::uint64_t>::max() / constants::kMiB;
             Check(fragmenter::FragmentSizeFromMegabytes(largest) == largest * constants::kMiB, "largest that fits");
             ExpectThrows<std::out_of_range>([&] { fragmenter::FragmentSizeFromMegabytes(largest + 1); },
                                             "one past the largest");
             ExpectThrows<std::out_of_range>(
                 [] { fragmenter::FragmentSizeFromMegabytes(std::numeric_limits<std::uint64_t>::max()); },
                 "would wrap to a small size");
             ExpectThrows<std::invalid_argument>([] { fragmenter::FragmentSizeFromMegabytes(0); }, "zero");
         }},
        {"fragmentation round trip for many sizes",
         [] {
             for (std::size_t size : {0u, 1u, 7u, 99u, 100u, 101u, 1000u}) {
                 for (std::uint64_t fragment_size : {1u, 3u, 100u, 4096u}) {
                     if (size / fragment_size > 200) {
                         continue;
                     }
                     auto source = test::RandomData(size, static_cast<std::uint32_t>(size * 31 + fragment_size));
                     auto set = fragmenter::Fragment(source, fragment_size, "f.bin");
                     std::map<std::string, reassembler::Bytes> by_name;
                     for (const auto& fragment : set.fragments) {
                         by_name[fragment.name] = fragment.bytes;
                     }
                     auto result = reassembler::Reassemble(by_name, set.manifest);
                     Check(result.data == source && !result.size_mismatch,
                           std::to_string(size) + " bytes in " + std::to_string(fragment_size) + "-byte fragments");
                 }
             }
         }},
        {"fragment file writes parts and manifest",
         [] {
             test::TempDir dir;
             auto source = test::RandomData(4500, 3);
             io::WriteFile(dir / "data.bin.enc", source);
             auto dest = dir / "data.bin_fragments";
             fragmenter::FragmentOptions options;
             options.run.workers = 3;
             auto result = fragmenter::FragmentFile(dir / "data.bin.enc", dest, 1000, options);
             Check(result.fragment_count == 5, "five fragments");
             Check(result.original_file == "data.bin.enc", "original file name recorded");
             for (const auto& entry : result.fragments) {
                 Check(io::ReadFile(dest / entry.name).size() == entry.size, entry.name + " on disk");
             }
             Check(std::filesystem::exists(dest / "data.bin.manifest.json"), "manifest beside the fragments");
             Check(test::CountEntries(dest) == 6, "five parts and a manifest, nothing else");
             Check(!HasStagingLeftovers(dest), "staging directory removed");
             auto on_disk = manifest::Read(dest / "data.bin.manifest.json");
             Check(on_disk.fragments.size() == 5 && on_disk.fragments[4].size == 500, "manifest read back");
         }},
        {"empty file yields only a manifest",
         [] {
             test::TempDir dir;
             io::WriteFile(dir / "empty.txt", fragmenter::Bytes{});
             auto result = fragmenter::FragmentFile(dir / "empty.txt", dir / "out", 64);
             Check(result.fragment_count == 0, "zero fragments");
             Check(test::CountEntries(dir / "out") == 1, "manifest only");
         }},
        {"insufficient space is reported before writing",
         [] {
             test::TempDir dir;
             io::WriteFile(dir / "big.bin", test::RandomData(5000, 4));
             fragmenter::FragmentOptions options;
             options.available_space = [](const std::filesystem::path&) { return std::uint64_t{1000}; };
             auto error = ExpectThrows<InsufficientSpaceError>(
                 [&] { fragmenter::FragmentFile(dir / "big.bin", dir / "dest", 1000, options); }, "only 1000 bytes free");
             Check(error.Required() == 5000 && error.Available() == 1000, "required and available reported");
             Check(!std::filesystem::exists(dir / "dest"), "destination untouched");
         }},
        {"cancelled fragmentation leaves nothing behind",
         [] {
             test::TempDir dir;
             io::WriteFile(dir / "c.bin", test::RandomData(8000, 5));
             parallel::CancelToken token;
             token.Cancel();
             fragmenter::FragmentOptions options;
             options.run.cancel = &token;
             ExpectThrows<CancelledError>([&] { fragmenter::FragmentFile(dir / "c.bin", dir / "dest", 1000, options); },
                                          "cancelled before any fragment");
             Check(test::CountEntries(dir / "dest") == 0, "no fragments and no staging left");
         }},
        {"missing input",
         [] {
             test::TempDir dir;
             ExpectThrows<IoError>([&] { fragmenter::FragmentFile(dir / "nope", dir / "dest", 10); }, "no such file");
         }},
    });
}
