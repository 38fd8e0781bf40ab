#include "test_util.hpp"

#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"
#include "vaultsplit/fragmenter.hpp"
#include "vaultsplit/manifest.hpp"
#include "vaultsplit/reassembler.hpp"

#include <fstream>

using namespace vaultsplit;
using test::Check;
using test::ExpectThrows;

namespace {

struct Fixture {
    test::TempDir dir;
    reassembler::Bytes source = test::RandomData(4500, 21);
    std::filesystem::path fragments;
    manifest::FragmentManifest manifest;

    Fixture() {
        io::WriteFile(dir / "archive.enc", source);
        fragments = dir / "archive_fragments";
        manifest = fragmenter::FragmentFile(dir / "archive.enc", fragments, 1000);
    }
};

void FlipByte(const std::filesystem::path& path, std::size_t offset) {
    auto data = io::ReadFile(path);
    data[offset] ^= 0x01;
    io::WriteFile(path, data);
}

}  // namespace

int main() {
    return test::RunAll({
        {"directory round trip",
         [] {
             Fixture fx;
             auto result = reassembler::Reassemble(fx.fragments, fx.manifest);
             Check(result.data == fx.source, "bytes restored in index order");
             Check(!result.size_mismatch, "no size warning");

             reassembler::ReassembleOptions sequential;
             sequential.run.force_sequential = true;
             Check(reassembler::Reassemble(fx.fragments, fx.manifest, sequential).data == fx.source,
                   "sequential run agrees");
         }},
        {"reassemble to file",
         [] {
             Fixture fx;
             auto out = fx.dir / "restored" / "archive.enc";
             auto mismatch = reassembler::ReassembleFile(fx.fragments, fx.manifest, out);
             Check(!mismatch, "sizes agree");
             Check(io::ReadFile(out) == fx.source, "file restored");
             Check(test::CountEntries(fx.dir / "restored") == 1, "no temporary left beside the output");
         }},
        {"flipped byte is named as corrupt",
         [] {
             Fixture fx;
             FlipByte(fx.fragments / "archive.part001", 17);
             auto error = ExpectThrows<CorruptFragmentError>(
                 [&] { reassembler::Reassemble(fx.fragments, fx.manifest); }, "tampered fragment");
             Check(error.Mismatches().size() == 1, "exactly one mismatch");
             Check(error.Mismatches()[0].name == "archive.part001", "names the tampered fragment");
             Check(error.Mismatches()[0].expected == fx.manifest.fragments[1].checksum, "expected checksum");
             Check(error.Mismatches()[0].actual != error.Mismatches()[0].expected, "actual checksum differs");

             auto out = fx.dir / "out.bin";
             ExpectThrows<CorruptFragmentError>(
                 [&] { reassembler::ReassembleFile(fx.fragments, fx.manifest, out); }, "file variant refuses too");
             Check(!std::filesystem::exists(out), "no output written");
         }},
        {"every corrupt fragment is reported",
         [] {
             Fixture fx;
             FlipByte(fx.fragments / "archive.part000", 0);
             FlipByte(fx.fragments / "archive.part004", 499);
             {
                 std::ofstream grow(fx.fragments / "archive.part002", std::ios::binary | std::ios::app);
                 grow << "x";
             }
             auto error = ExpectThrows<CorruptFragmentError>([&] { reassembler::Verify(fx.fragments, fx.manifest); },
                                                             "three bad fragments");
             Check(error.Mismatches().size() == 3, "all three collected");
             Check(error.Mismatches()[1].name == "archive.part002", "resized fragment reported as corrupt");
         }},
        {"missing fragment is named",
         [] {
             Fixture fx;
             Check(fx.manifest.fragment_count == 5, "five fragments to start with");
             std::filesystem::remove(fx.fragments / "archive.part002");
             auto error = ExpectThrows<MissingFragmentsError>(
                 [&] { reassembler::Reassemble(fx.fragments, fx.manifest); }, "part002 deleted");
             Check(error.Names() == std::vector<std::string>{"archive.part002"}, "exactly that name");

             std::filesystem::remove(fx.fragments / "archive.part004");
             auto both = ExpectThrows<MissingFragmentsError>(
                 [&] { reassembler::Verify(fx.fragments, fx.manifest); }, "two deleted");
             Check(both.Names().size() == 2 && both.Names()[1] == "archive.part004", "both listed");
         }},
        {"size mismatch is a warning unless strict",
         [] {
             Fixture fx;
             auto lying = fx.manifest;
             lying.file_size += 10;
             auto result = reassembler::Reassemble(fx.fragments, lying);
             Check(result.data == fx.source, "data still returned");
             Check(result.size_mismatch.has_value(), "mismatch reported");
             Check(result.size_mismatch->Expected() == 4510 && result.size_mismatch->Actual() == 4500,
                   "expected and actual sizes");

             reassembler::ReassembleOptions strict;
             strict.strict_size = true;
             ExpectThrows<SizeMismatchError>([&] { reassembler::Reassemble(fx.fragments, lying, strict); },
                                             "strict mode throws");
             auto out = fx.dir / "strict.bin";
             ExpectThrows<SizeMismatchError>([&] { reassembler::ReassembleFile(fx.fragments, lying, out, strict); },
                                             "strict file mode throws");
             Check(!std::filesystem::exists(out), "strict failure writes nothing");
             Check(reassembler::ReassembleFile(fx.fragments, lying, out).has_value(), "lenient file mode warns");
         }},
        {"broken fragment table is rejected before reading",
         [] {
             Fixture fx;
             auto broken = fx.manifest;
             broken.fragments[3].index = 1;
             ExpectThrows<ManifestError>([&] { reassembler::Reassemble(fx.dir / "does-not-exist", broken); },
                                         "duplicate index");
         }},
    });
}
