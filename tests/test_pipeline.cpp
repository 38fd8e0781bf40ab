#include "test_util.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"
#include "vaultsplit/pack.hpp"
#include "vaultsplit/pipeline.hpp"

#include <string>

using namespace vaultsplit;
using test::Check;
using test::ExpectThrows;

namespace {

// Compressible but not trivially so.
test::Bytes TextPayload(std::size_t lines) {
    std::string text;
    for (std::size_t i = 0; i < lines; ++i) {
        text += "line " + std::to_string(i) + ": the quick brown fox jumps over the lazy dog\n";
    }
    return test::Bytes(text.begin(), text.end());
}

pipeline::PipelineOptions Options(const std::string& password) {
    pipeline::PipelineOptions options;
    options.password = password;
    options.fragment_size = 4096;
    options.chunk_size = 8192;
    return options;
}

}  // namespace

int main() {
    test::UseFastKdf();
    const std::string password = "correct-horse-battery";
    return test::RunAll({
        {"gzip stage round trip",
         [] {
             test::TempDir dir;
             auto payload = TextPayload(2000);
             io::WriteFile(dir / "notes.txt", payload);
             pack::CompressGzip(dir / "notes.txt", dir / "notes.txt.gz");
             Check(pack::IsGzipFile(dir / "notes.txt.gz"), "gzip magic present");
             Check(!pack::IsGzipFile(dir / "notes.txt"), "plain text has no magic");
             Check(std::filesystem::file_size(dir / "notes.txt.gz") < payload.size(), "output is smaller");
             pack::DecompressGzip(dir / "notes.txt.gz", dir / "back.txt");
             Check(io::ReadFile(dir / "back.txt") == payload, "inflates to the original");
             Check(pack::IsGzip(test::Bytes{0x1f, 0x8b, 0x08}) && !pack::IsGzip(test::Bytes{0x1f}), "byte check");
         }},
        {"backup with every stage and restore from fragments",
         [&] {
             test::TempDir dir;
             auto payload = TextPayload(3000);
             io::WriteFile(dir / "notes.txt", payload);
             auto options = Options(password);
             options.compress = true;
             auto backup = pipeline::Backup(dir / "notes.txt", dir / "vault", options);
             Check(backup.stages == std::vector<std::string>{"compress", "encrypt", "fragment"}, "stage order");
             Check(backup.artifact == dir / "vault" / "notes.txt.vsz_fragments", "fragments directory name");
             Check(backup.manifest && backup.manifest->original_file == "notes.txt.vsz.enc", "manifest names container");
             Check(backup.manifest->stages == std::vector<std::string>{"compress", "encrypt"}, "stages recorded");
             Check(test::CountEntries(dir / "vault") == 1, "only the fragments directory remains");

             auto restored = pipeline::Restore(backup.artifact, dir / "restored", Options(password));
             Check(restored.reassembled && restored.decrypted && restored.decompressed, "all reverse stages ran");
             Check(restored.output == dir / "restored" / "notes.txt", "original name recovered");
             Check(io::ReadFile(restored.output) == payload, "content restored");
             Check(test::CountEntries(dir / "restored") == 1, "no intermediates left");
         }},
        {"encrypt-only backup to a single file",
         [&] {
             test::TempDir dir;
             auto payload = test::RandomData(50000, 31);
             io::WriteFile(dir / "photo.raw", payload);
             auto options = Options(password);
             options.fragment = false;
             auto backup = pipeline::Backup(dir / "photo.raw", dir / "out", options);
             Check(backup.artifact == dir / "out" / "photo.raw.enc", ".enc suffix");
             Check(!backup.manifest, "no manifest without fragmenting");

             auto restored = pipeline::Restore(backup.artifact, dir / "back", Options(password));
             Check(!restored.reassembled && restored.decrypted && !restored.decompressed, "decrypt only");
             Check(io::ReadFile(restored.output) == payload, "content restored");

             auto wrong = Options("not-the-password");
             ExpectThrows<PaddingError>([&] { pipeline::Restore(backup.artifact, dir / "bad", wrong); },
                                        "wrong password");
             Check(test::CountEntries(dir / "bad") == 0, "failed restore leaves nothing");
         }},
        {"already gzipped input comes back byte for byte",
         [&] {
             test::TempDir dir;
             io::WriteFile(dir / "logs.tar", test::RandomData(5000, 35));
             pack::CompressGzip(dir / "logs.tar", dir / "logs.tar.gz");
             auto original = io::ReadFile(dir / "logs.tar.gz");
             auto options = Options(password);
             options.fragment_size = 1024;
             auto backup = pipeline::Backup(dir / "logs.tar.gz", dir / "vault", options);
             auto restored = pipeline::Restore(backup.artifact, dir / "restored", Options(password));
             Check(restored.decrypted && !restored.decompressed, "gzip input is not inflated");
             Check(restored.output == dir / "restored" / "logs.tar.gz", "name kept");
             Check(io::ReadFile(restored.output) == original, "restored bytes equal backed-up bytes");

             auto single = Options(password);
             single.fragment = false;
             auto file_backup = pipeline::Backup(dir / "logs.tar.gz", dir / "single", single);
             auto file_restored = pipeline::Restore(file_backup.artifact, dir / "single_back", Options(password));
             Check(!file_restored.decompressed && io::ReadFile(file_restored.output) == original,
                   "single-file backup keeps the gzip bytes too");

             auto both = Options(password);
             both.compress = true;
             auto double_backup = pipeline::Backup(dir / "logs.tar.gz", dir / "double", both);
             auto double_restored = pipeline::Restore(double_backup.artifact, dir / "double_back", Options(password));
             Check(double_restored.decompressed && double_restored.output.filename() == "logs.tar.gz",
                   "only the backup's own gzip layer is removed");
             Check(io::ReadFile(double_restored.output) == original, "inner gzip untouched");
         }},
        {"password is ignored for an unencrypted backup",
         [&] {
             test::TempDir dir;
             auto payload = test::RandomData(7000, 36);
             io::WriteFile(dir / "secret.enc", payload);
             pipeline::PipelineOptions options;
             options.encrypt = false;
             options.fragment_size = 2000;
             auto backup = pipeline::Backup(dir / "secret.enc", dir / "out", options);
             Check(backup.manifest->stages && backup.manifest->stages->empty(), "empty stage record");
             auto restored = pipeline::Restore(backup.artifact, dir / "back", Options(password));
             Check(!restored.decrypted && restored.output.filename() == "secret.enc", "not decrypted");
             Check(io::ReadFile(restored.output) == payload, "fragment-only backup restored with a password");
         }},
        {"unknown stage in the manifest is refused",
         [&] {
             test::TempDir dir;
             io::WriteFile(dir / "doc.txt", TextPayload(100));
             pipeline::PipelineOptions options;
             options.encrypt = false;
             options.fragment_size = 1000;
             auto backup = pipeline::Backup(dir / "doc.txt", dir / "out", options);
             auto manifest_path = manifest::ManifestPath(backup.artifact, "doc");
             auto edited = manifest::Read(manifest_path);
             edited.stages = std::vector<std::string>{"rot13"};
             manifest::Write(manifest_path, edited);
             ExpectThrows<ManifestError>([&] { pipeline::Restore(backup.artifact, dir / "back", options); },
                                         "unknown stage");
             Check(test::CountEntries(dir / "back") == 0, "nothing restored");
         }},
        {"restore without password keeps the container",
         [&] {
             test::TempDir dir;
             io::WriteFile(dir / "a.bin", test::RandomData(1000, 32));
             auto options = Options(password);
             options.fragment = false;
             auto backup = pipeline::Backup(dir / "a.bin", dir / "out", options);
             auto restored = pipeline::Restore(backup.artifact, dir / "back", Options(""));
             Check(!restored.decrypted, "not decrypted");
             Check(restored.output.filename() == "a.bin.enc", "still the container");
             Check(io::ReadFile(restored.output) == io::ReadFile(backup.artifact), "copied verbatim");
         }},
        {"fragment-only backup",
         [] {
             test::TempDir dir;
             auto payload = test::RandomData(10000, 33);
             io::WriteFile(dir / "disk.img", payload);
             pipeline::PipelineOptions options;
             options.encrypt = false;
             options.fragment_size = 3000;
             auto backup = pipeline::Backup(dir / "disk.img", dir / "out", options);
             Check(backup.manifest && backup.manifest->fragment_count == 4, "four plain fragments");
             auto restored = pipeline::Restore(backup.artifact, dir / "back", pipeline::PipelineOptions{});
             Check(io::ReadFile(restored.output) == payload, "plain reassembly");
         }},
        {"invalid requests",
         [&] {
             test::TempDir dir;
             io::WriteFile(dir / "x", test::RandomData(10, 34));
             pipeline::PipelineOptions none;
             none.encrypt = false;
             none.fragment = false;
             ExpectThrows<std::invalid_argument>([&] { pipeline::Backup(dir / "x", dir / "out", none); },
                                                 "no stage selected");
             ExpectThrows<IoError>([&] { pipeline::Backup(dir / "missing", dir / "out", Options(password)); },
                                   "missing input");
             std::filesystem::create_directories(dir / "empty_dir");
             ExpectThrows<ManifestError>([&] { pipeline::Restore(dir / "empty_dir", dir / "back", Options(password)); },
                                         "directory without manifest");
         }},
    });
}
