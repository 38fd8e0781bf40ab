#include "test_util.hpp"

#include "vaultsplit/errors.hpp"
#include "vaultsplit/manifest.hpp"

using namespace vaultsplit;
using test::Check;
using test::ExpectThrows;

namespace {

manifest::FragmentManifest Sample() {
    manifest::FragmentManifest out;
    out.original_file = "backup \"2024\".zip.enc";
    out.file_size = 2500;
    out.fragment_size = 1000;
    out.fragment_count = 3;
    out.created_at = "2024-05-01T10:00:00Z";
    out.engine_version = "1.0.0";
    // Deliberately out of order: serialization sorts by index.
    out.fragments.push_back({"backup.part002", 500, "cccccccccccccccccccccccccccccccc", 2});
    out.fragments.push_back({"backup.part000", 1000, "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa", 0});
    out.fragments.push_back({"backup.part001", 1000, "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb", 1});
    return out;
}

}  // namespace

int main() {
    return test::RunAll({
        {"fragment names are zero padded to three digits",
         [] {
             Check(manifest::FragmentName("backup", 0) == "backup.part000", "index 0");
             Check(manifest::FragmentName("backup", 42) == "backup.part042", "index 42");
             Check(manifest::FragmentName("backup", 1234) == "backup.part1234", "wide index printed in full");
             Check(manifest::ManifestPath("out", "backup") == std::filesystem::path("out") / "backup.manifest.json",
                   "manifest path");
         }},
        {"json carries the documented keys",
         [] {
             std::string json = manifest::ToJson(Sample());
             Check(json.find("\"originalFile\": \"backup \\\"2024\\\".zip.enc\"") != std::string::npos,
                   "original file name escaped");
             Check(json.find("\"fileSize\": 2500") != std::string::npos, "fileSize");
             Check(json.find("\"fragmentSizeBytes\": 1000") != std::string::npos, "fragmentSizeBytes");
             Check(json.find("\"fragmentCount\": 3") != std::string::npos, "fragmentCount");
             auto first = json.find("backup.part000");
             auto second = json.find("backup.part001");
             auto third = json.find("backup.part002");
             Check(first < second && second < third, "fragments written in index order");
         }},
        {"json parses back",
         [] {
             auto parsed = manifest::FromJson(manifest::ToJson(Sample()));
             Check(parsed.original_file == "backup \"2024\".zip.enc", "original file");
             Check(parsed.file_size == 2500 && parsed.fragment_size == 1000 && parsed.fragment_count == 3, "sizes");
             Check(parsed.fragments.size() == 3, "three entries");
             Check(parsed.fragments[0].name == "backup.part000" && parsed.fragments[2].index == 2, "sorted by index");
             Check(parsed.fragments[2].size == 500 && parsed.fragments[2].checksum == "cccccccccccccccccccccccccccccccc",
                   "last entry intact");
             Check(parsed.created_at == "2024-05-01T10:00:00Z", "timestamp kept");
             Check(!parsed.stages, "no stages unless recorded");
         }},
        {"backup stages survive the manifest",
         [] {
             auto staged = Sample();
             staged.stages = std::vector<std::string>{"compress", "encrypt"};
             std::string json = manifest::ToJson(staged);
             Check(json.find("\"stages\": [\"compress\", \"encrypt\"]") != std::string::npos, "stages key");
             auto parsed = manifest::FromJson(json);
             Check(parsed.stages && *parsed.stages == std::vector<std::string>{"compress", "encrypt"}, "stage order");

             staged.stages = std::vector<std::string>{};
             parsed = manifest::FromJson(manifest::ToJson(staged));
             Check(parsed.stages && parsed.stages->empty(), "empty stage list is kept, not dropped");
         }},
        {"unicode escapes and surrogate pairs",
         [] {
             auto wrap = [](const std::string& name) {
                 return R"({"originalFile": ")" + name
                        + R"(", "fileSize": 0, "fragmentSizeBytes": 1, "fragmentCount": 0, "fragments": {}})";
             };
             Check(manifest::FromJson(wrap("\\u00e9")).original_file == "\xc3\xa9", "two-byte code point");
             Check(manifest::FromJson(wrap("\\ud83d\\ude00")).original_file == "\xf0\x9f\x98\x80",
                   "surrogate pair joins into one code point");
             ExpectThrows<ManifestError>([&] { manifest::FromJson(wrap("\\ud83d\\u0041")); },
                                         "high surrogate followed by a non-surrogate");
             ExpectThrows<ManifestError>([&] { manifest::FromJson(wrap("\\ud83dx")); }, "unpaired high surrogate");
             ExpectThrows<ManifestError>([&] { manifest::FromJson(wrap("\\ude00")); }, "lone low surrogate");
         }},
        {"hand-written manifests with extra keys are accepted",
         [] {
             std::string json = R"({
                 "originalFile": "data.bin",
                 "createdBy": {"tool": "legacy", "tags": [1, 2.5, true, null, "xé"]},
                 "fileSize": 3, "fragmentSizeBytes": 2, "fragmentCount": 2,
                 "fragments": {
                     "data.part001": {"size": 1, "checksum": "AB", "index": 1, "note": "tail"},
                     "data.part000": {"index": 0, "checksum": "cd", "size": 2}
                 }
             })";
             auto parsed = manifest::FromJson(json);
             Check(parsed.fragments.size() == 2 && parsed.fragments[0].name == "data.part000", "entries parsed");
             Check(parsed.fragments[1].checksum == "AB", "checksum kept verbatim");
             manifest::Validate(parsed);
             Check(true, "validates");
         }},
        {"malformed json is a manifest error",
         [] {
             ExpectThrows<ManifestError>([] { manifest::FromJson("{\"originalFile\": \"x\""); }, "unterminated object");
             ExpectThrows<ManifestError>([] { manifest::FromJson("[]"); }, "not an object");
             ExpectThrows<ManifestError>([] { manifest::FromJson("{\"originalFile\": \"x\"}"); }, "missing fields");
             ExpectThrows<ManifestError>(
                 [] {
                     manifest::FromJson(R"({"originalFile": "x", "fileSize": -1, "fragmentSizeBytes": 1,
                                            "fragmentCount": 0, "fragments": {}})");
                 },
                 "negative size");
             ExpectThrows<ManifestError>(
                 [] {
                     manifest::FromJson(R"({"originalFile": "x", "fileSize": 1, "fragmentSizeBytes": 1,
                                            "fragmentCount": 1, "fragments": {"x.part000": {"size": 1}}})");
                 },
                 "entry without checksum");
             ExpectThrows<ManifestError>([] { manifest::FromJson(manifest::ToJson(Sample()) + "x"); },
                                         "trailing garbage");
         }},
        {"fragment table validation",
         [] {
             auto good = Sample();
             manifest::Validate(good);
             Check(true, "sample validates");

             auto duplicate = Sample();
             duplicate.fragments[0].index = 0;
             ExpectThrows<ManifestError>([&] { manifest::Validate(duplicate); }, "duplicate index");

             auto gap = Sample();
             gap.fragments[0].index = 3;
             ExpectThrows<ManifestError>([&] { manifest::Validate(gap); }, "index out of range");

             auto count = Sample();
             count.fragment_count = 4;
             ExpectThrows<ManifestError>([&] { manifest::Validate(count); }, "count disagrees with table");

             auto escape = Sample();
             escape.fragments[1].name = "../etc/passwd";
             ExpectThrows<ManifestError>([&] { manifest::Validate(escape); }, "path in fragment name");
         }},
        {"write, read and discover",
         [] {
             test::TempDir dir;
             auto path = manifest::ManifestPath(dir.Path(), "backup");
             manifest::Write(path, Sample());
             auto loaded = manifest::Read(path);
             Check(loaded.fragments.size() == 3 && loaded.file_size == 2500, "read back from disk");
             auto found = manifest::FindManifest(dir.Path());
             Check(found && *found == path, "manifest discovered in directory");
             Check(!manifest::FindManifest(dir / "missing"), "missing directory has no manifest");
             manifest::Write(manifest::ManifestPath(dir.Path(), "other"), Sample());
             auto error = ExpectThrows<ManifestError>([&] { manifest::FindManifest(dir.Path()); },
                                                      "two manifests in one directory");
             std::string what = error.what();
             Check(what.find("backup.manifest.json") != std::string::npos
                       && what.find("other.manifest.json") != std::string::npos,
                   "both candidates listed");
             Check(manifest::UtcTimestamp().size() == 20, "timestamp is YYYY-MM-DDTHH:MM:SSZ");
         }},
    });
}
