#include "vaultsplit/manifest.hpp"

#include "vaultsplit/constants.hpp"
#include "vaultsplit/errors.hpp"
#include "vaultsplit/file_io.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <limits>
#include <set>
#include <sstream>

namespace vaultsplit::manifest {

namespace {

std::string EscapeJson(const std::string& input) {
    std::string out;
    out.reserve(input.size() + 2);
    for (char ch : input) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Minimal pull reader over the subset of JSON the manifest uses; unknown
// members are skipped whatever their type.
class JsonReader {
public:
    explicit JsonReader(const std::string& text) : text_(text) {}

    void Expect(char ch) {
        SkipWs();
        if (pos_ >= text_.size() || text_[pos_] != ch) {
            Fail(std::string("expected '") + ch + "'");
        }
        ++pos_;
    }

    bool Consume(char ch) {
        SkipWs();
        if (pos_ < text_.size() && text_[pos_] == ch) {
            ++pos_;
            return true;
        }
        return false;
    }

    // Iterates object members: call after '{' has been consumed.
    bool NextMember(std::string& key, bool& first) {
        if (Consume('}')) {
            return false;
        }
        if (!first) {
            Expect(',');
        }
        first = false;
        key = ReadString();
        Expect(':');
        return true;
    }

    std::string ReadString() {
        Expect('"');
        std::string out;
        while (pos_ < text_.size()) {
            char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                break;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(esc);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u': {
                    std::uint32_t cp = ReadHex4();
                    if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        Fail("invalid surrogate pair");
                    }
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (pos_ + 1 >= text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
                            Fail("invalid surrogate pair");
                        }
                        pos_ += 2;
                        std::uint32_t low = ReadHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            Fail("invalid surrogate pair");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    Fail("invalid escape sequence");
            }
        }
        Fail("unterminated string");
        return {};
    }

    std::uint64_t ReadUnsigned() {
        SkipWs();
        std::size_t start = pos_;
        std::uint64_t value = 0;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            std::uint64_t digit = static_cast<std::uint64_t>(text_[pos_] - '0');
            if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
                Fail("integer overflow");
            }
            value = value * 10 + digit;
            ++pos_;
        }
        if (pos_ == start) {
            Fail("expected non-negative integer");
        }
        if (pos_ < text_.size() && (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            Fail("expected integer, got fractional number");
        }
        return value;
    }

    std::vector<std::string> ReadStringArray() {
        std::vector<std::string> out;
        Expect('[');
        if (Consume(']')) {
            return out;
        }
        do {
            out.push_back(ReadString());
        } while (Consume(','));
        Expect(']');
        return out;
    }

    void SkipValue() {
        SkipWs();
        if (pos_ >= text_.size()) {
            Fail("unexpected end of input");
        }
        char ch = text_[pos_];
        if (ch == '"') {
            ReadString();
        } else if (ch == '{') {
            ++pos_;
            std::string key;
            bool first = true;
            while (NextMember(key, first)) {
                SkipValue();
            }
        } else if (ch == '[') {
            ++pos_;
            if (Consume(']')) {
                return;
            }
            do {
                SkipValue();
            } while (Consume(','));
            Expect(']');
        } else if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            ++pos_;
            while (pos_ < text_.size()
                   && (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.'
                       || text_[pos_] == 'e' || text_[pos_] == 'E' || text_[pos_] == '+' || text_[pos_] == '-')) {
                ++pos_;
            }
        } else if (!ConsumeLiteral("true") && !ConsumeLiteral("false") && !ConsumeLiteral("null")) {
            Fail("unexpected token");
        }
    }

    void ExpectEnd() {
        SkipWs();
        if (pos_ != text_.size()) {
            Fail("trailing characters after document");
        }
    }

private:
    void SkipWs() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool ConsumeLiteral(const char* literal) {
        std::string lit(literal);
        if (text_.compare(pos_, lit.size(), lit) == 0) {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    std::uint32_t ReadHex4() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated unicode escape");
        }
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = text_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<std::uint32_t>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<std::uint32_t>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<std::uint32_t>(ch - 'A' + 10);
            } else {
                Fail("invalid unicode escape");
            }
        }
        return value;
    }

    [[noreturn]] void Fail(const std::string& what) const {
        throw ManifestError("Malformed manifest JSON at offset " + std::to_string(pos_) + ": " + what);
    }

    const std::string& text_;
    std::size_t pos_ = 0;
};

FragmentEntry ReadEntry(JsonReader& reader, const std::string& name) {
    FragmentEntry entry;
    entry.name = name;
    bool has_size = false;
    bool has_checksum = false;
    bool has_index = false;
    reader.Expect('{');
    std::string key;
    bool first = true;
    while (reader.NextMember(key, first)) {
        if (key == "size") {
            entry.size = reader.ReadUnsigned();
            has_size = true;
        } else if (key == "checksum") {
            entry.checksum = reader.ReadString();
            has_checksum = true;
        } else if (key == "index") {
            entry.index = static_cast<std::size_t>(reader.ReadUnsigned());
            has_index = true;
        } else {
            reader.SkipValue();
        }
    }
    if (!has_size || !has_checksum || !has_index) {
        throw ManifestError("Fragment entry " + name + " lacks size, checksum or index");
    }
    return entry;
}

bool IsPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

}  // namespace

std::string FragmentName(const std::string& stem, std::size_t index) {
    char digits[32];
    std::snprintf(digits, sizeof(digits), "%0*zu", constants::kFragmentIndexWidth, index);
    return stem + std::string(constants::kFragmentInfix) + digits;
}

std::filesystem::path ManifestPath(const std::filesystem::path& dir, const std::string& stem) {
    return dir / (stem + std::string(constants::kManifestSuffix));
}

std::optional<std::filesystem::path> FindManifest(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::nullopt;
    }
    std::vector<std::filesystem::path> found;
    const std::string suffix(constants::kManifestSuffix);
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (entry.is_regular_file() && name.size() > suffix.size()
            && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            found.push_back(entry.path());
        }
    }
    if (found.empty()) {
        return std::nullopt;
    }
    if (found.size() > 1) {
        std::sort(found.begin(), found.end());
        std::string names;
        for (const auto& path : found) {
            names += (names.empty() ? "" : ", ") + path.filename().string();
        }
        throw ManifestError("Several manifests in " + dir.string() + " (" + names + "); name one explicitly");
    }
    return found.front();
}

std::string UtcTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
        return {};
    }
    return std::string(buffer);
}

std::string ToJson(const FragmentManifest& manifest) {
    std::vector<const FragmentEntry*> ordered;
    ordered.reserve(manifest.fragments.size());
    for (const auto& entry : manifest.fragments) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const FragmentEntry* a, const FragmentEntry* b) { return a->index < b->index; });

    std::ostringstream json;
    json << "{\n";
    json << "  \"originalFile\": \"" << EscapeJson(manifest.original_file) << "\",\n";
    json << "  \"fileSize\": " << manifest.file_size << ",\n";
    json << "  \"fragmentSizeBytes\": " << manifest.fragment_size << ",\n";
    json << "  \"fragmentCount\": " << manifest.fragment_count << ",\n";
    if (!manifest.created_at.empty()) {
        json << "  \"createdAt\": \"" << EscapeJson(manifest.created_at) << "\",\n";
    }
    if (!manifest.engine_version.empty()) {
        json << "  \"engineVersion\": \"" << EscapeJson(manifest.engine_version) << "\",\n";
    }
    if (manifest.stages) {
        json << "  \"stages\": [";
        for (std::size_t i = 0; i < manifest.stages->size(); ++i) {
            json << (i == 0 ? "\"" : ", \"") << EscapeJson((*manifest.stages)[i]) << "\"";
        }
        json << "],\n";
    }
    json << "  \"fragments\": {";
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const FragmentEntry& entry = *ordered[i];
        json << (i == 0 ? "\n" : ",\n");
        json << "    \"" << EscapeJson(entry.name) << "\": {\"size\": " << entry.size << ", \"checksum\": \""
             << EscapeJson(entry.checksum) << "\", \"index\": " << entry.index << "}";
    }
    json << (ordered.empty() ? "}\n" : "\n  }\n");
    json << "}\n";
    return json.str();
}

FragmentManifest FromJson(const std::string& json) {
    FragmentManifest manifest;
    JsonReader reader(json);
    bool has_original = false;
    bool has_size = false;
    bool has_fragment_size = false;
    bool has_count = false;
    bool has_fragments = false;

    reader.Expect('{');
    std::string key;
    bool first = true;
    while (reader.NextMember(key, first)) {
        if (key == "originalFile") {
            manifest.original_file = reader.ReadString();
            has_original = true;
        } else if (key == "fileSize") {
            manifest.file_size = reader.ReadUnsigned();
            has_size = true;
        } else if (key == "fragmentSizeBytes") {
            manifest.fragment_size = reader.ReadUnsigned();
            has_fragment_size = true;
        } else if (key == "fragmentCount") {
            manifest.fragment_count = static_cast<std::size_t>(reader.ReadUnsigned());
            has_count = true;
        } else if (key == "createdAt") {
            manifest.created_at = reader.ReadString();
        } else if (key == "engineVersion") {
            manifest.engine_version = reader.ReadString();
        } else if (key == "stages") {
            manifest.stages = reader.ReadStringArray();
        } else if (key == "fragments") {
            reader.Expect('{');
            std::string name;
            bool first_fragment = true;
            while (reader.NextMember(name, first_fragment)) {
                manifest.fragments.push_back(ReadEntry(reader, name));
            }
            has_fragments = true;
        } else {
            reader.SkipValue();
        }
    }
    reader.ExpectEnd();

    if (!has_original || !has_size || !has_fragment_size || !has_count || !has_fragments) {
        throw ManifestError("Manifest lacks one of originalFile, fileSize, fragmentSizeBytes, fragmentCount, fragments");
    }
    std::sort(manifest.fragments.begin(), manifest.fragments.end(),
              [](const FragmentEntry& a, const FragmentEntry& b) { return a.index < b.index; });
    return manifest;
}

void Validate(const FragmentManifest& manifest) {
    if (manifest.fragment_count != manifest.fragments.size()) {
        throw ManifestError("Manifest declares " + std::to_string(manifest.fragment_count) + " fragments but lists "
                            + std::to_string(manifest.fragments.size()));
    }
    std::vector<bool> seen(manifest.fragments.size(), false);
    std::set<std::string> names;
    for (const auto& entry : manifest.fragments) {
        if (!IsPlainFileName(entry.name)) {
            throw ManifestError("Fragment name is not a plain file name: " + entry.name);
        }
        if (!names.insert(entry.name).second) {
            throw ManifestError("Duplicate fragment name: " + entry.name);
        }
        if (entry.index >= seen.size()) {
            throw ManifestError("Fragment " + entry.name + " has out-of-range index " + std::to_string(entry.index));
        }
        if (seen[entry.index]) {
            throw ManifestError("Duplicate fragment index " + std::to_string(entry.index));
        }
        seen[entry.index] = true;
    }
}

void Write(const std::filesystem::path& path, const FragmentManifest& manifest) {
    io::WriteTextAtomic(path, ToJson(manifest));
}

FragmentManifest Read(const std::filesystem::path& path) {
    auto data = io::ReadFile(path);
    return FromJson(std::string(data.begin(), data.end()));
}

}  // namespace vaultsplit::manifest
