#pragma once

#include <imgkit/digest.hpp>
#include <imgkit/manifest.hpp>
#include <imgkit/platform.hpp>
#include <imgkit/registry.hpp>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

namespace imgkit::testing {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("imgkit_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string operator/(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    return read_file(path).value_or("");
}

inline unsigned int file_mode(const std::string& path) {
    return static_cast<unsigned int>(fs::status(path).permissions() & fs::perms::mask);
}

// Valid, distinct sha256 digests for fixtures
inline std::string fake_digest(const std::string& seed) {
    return digest_of_bytes(seed).digest;
}

// Logger writing bare messages into a string
class CapturedLog {
public:
    CapturedLog() {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
        logger_ = std::make_shared<spdlog::logger>("test", sink);
        logger_->set_pattern("%v");
        logger_->set_level(spdlog::level::debug);
    }

    spdlog::logger& logger() { return *logger_; }
    std::string text() const { return out_.str(); }
    bool contains(const std::string& needle) const { return out_.str().find(needle) != std::string::npos; }

    std::vector<std::string> lines() const {
        std::vector<std::string> result;
        std::istringstream in(out_.str());
        std::string line;
        while (std::getline(in, line)) {
            result.push_back(line);
        }
        return result;
    }

private:
    std::ostringstream out_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Raw tar records for reader tests
// ============================================================================

inline std::string raw_tar_header(const std::string& name, char typeflag, size_t size,
                                  const std::string& linkname = "") {
    std::string header(512, '\0');
    std::memcpy(&header[0], name.data(), std::min<size_t>(name.size(), 100));
    std::snprintf(&header[100], 8, "%07o", 0644u);
    std::snprintf(&header[108], 8, "%07o", 0u);
    std::snprintf(&header[116], 8, "%07o", 0u);
    std::snprintf(&header[124], 12, "%011lo", static_cast<unsigned long>(size));
    std::snprintf(&header[136], 12, "%011o", 0u);
    header[156] = typeflag;
    std::memcpy(&header[157], linkname.data(), std::min<size_t>(linkname.size(), 100));
    std::memcpy(&header[257], "ustar", 5);
    header[263] = '0';
    header[264] = '0';

    std::memset(&header[148], ' ', 8);
    unsigned int sum = 0;
    for (unsigned char c : header) sum += c;
    char chksum[8];
    std::snprintf(chksum, sizeof(chksum), "%06o", sum);
    std::memcpy(&header[148], chksum, 6);
    header[154] = '\0';
    header[155] = ' ';
    return header;
}

inline std::string raw_tar_data(const std::string& data) {
    std::string padded = data;
    padded.append((512 - data.size() % 512) % 512, '\0');
    return padded;
}

inline std::string raw_tar_end() {
    return std::string(1024, '\0');
}

// ============================================================================
// In-memory registry
// ============================================================================

class FakeRegistry : public ImagesMetadata, public ImagesWriter {
public:
    std::map<std::string, std::string> blobs;       // digest -> bytes
    std::map<std::string, std::string> manifests;   // "<context>@<digest>" -> raw
    std::map<std::string, std::string> tags;        // "<context>:<tag>" -> digest
    std::set<std::string> present;                  // Extra digest refs exists() reports
    std::set<std::string> failing;                  // Digest refs whose lookup errors

    int manifest_calls = 0;
    int exists_calls = 0;
    int fetch_calls = 0;
    int push_calls = 0;
    std::vector<std::string> exists_queries;

    int total_calls() const { return manifest_calls + exists_calls + fetch_calls + push_calls; }

    ManifestResult manifest(const Reference& reference) override {
        ++manifest_calls;
        ManifestResult result;

        std::string digest = reference.digest;
        if (!reference.is_digest()) {
            auto tag = tags.find(reference.context_name() + ":" + reference.tag);
            if (tag == tags.end()) {
                result.kind = ErrorKind::Registry;
                result.error = "MANIFEST_UNKNOWN: " + reference.name();
                return result;
            }
            digest = tag->second;
        }

        auto raw = manifests.find(reference.context_name() + "@" + digest);
        if (raw == manifests.end()) {
            result.kind = ErrorKind::Registry;
            result.error = "MANIFEST_UNKNOWN: " + reference.name();
            return result;
        }

        auto parsed = parse_manifest(raw->second);
        if (!parsed.ok) {
            result.kind = parsed.kind;
            result.error = parsed.error;
            return result;
        }
        result.manifest = parsed.manifest;
        result.manifest.digest = digest;
        result.ok = true;
        return result;
    }

    DigestResult resolve(const Reference& reference) override {
        auto fetched = manifest(reference);
        DigestResult result;
        result.ok = fetched.ok;
        result.kind = fetched.kind;
        result.error = fetched.error;
        result.digest = fetched.manifest.digest;
        return result;
    }

    ExistsResult exists(const Reference& reference) override {
        ++exists_calls;
        exists_queries.push_back(reference.name());

        ExistsResult result;
        if (failing.count(reference.name())) {
            result.kind = ErrorKind::Registry;
            result.error = "connection refused";
            return result;
        }
        result.found = present.count(reference.name()) > 0 || manifests.count(reference.name()) > 0;
        result.ok = true;
        return result;
    }

    BlobResult fetch_blob(const Reference& /*reference*/, const Descriptor& blob,
                          const std::string& dest_path) override {
        ++fetch_calls;
        BlobResult result;
        auto it = blobs.find(blob.digest);
        if (it == blobs.end()) {
            result.kind = ErrorKind::Registry;
            result.error = "BLOB_UNKNOWN: " + blob.digest;
            return result;
        }
        std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
        out << it->second;
        result.path = dest_path;
        result.ok = true;
        return result;
    }

    PushResult push_blob(const Reference& /*reference*/, const Descriptor& blob,
                         const std::string& path) override {
        ++push_calls;
        PushResult result;
        auto content = read_file(path);
        if (!content) {
            result.kind = ErrorKind::Io;
            result.error = "failed to read " + path;
            return result;
        }
        blobs[blob.digest] = *content;
        result.digest = blob.digest;
        result.ok = true;
        return result;
    }

    PushResult push_manifest(const Reference& reference, const std::string& /*media_type*/,
                             const std::string& content) override {
        ++push_calls;
        PushResult result;
        std::string digest = digest_of_bytes(content).digest;
        manifests[reference.context_name() + "@" + digest] = content;
        if (!reference.is_digest()) {
            tags[reference.context_name() + ":" + reference.tag] = digest;
        }
        result.digest = digest;
        result.ok = true;
        return result;
    }

    void reset_counters() {
        manifest_calls = 0;
        exists_calls = 0;
        fetch_calls = 0;
        push_calls = 0;
        exists_queries.clear();
    }
};

} // namespace imgkit::testing
