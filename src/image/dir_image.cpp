#include "imgkit/dir_image.hpp"
#include "imgkit/gzip.hpp"
#include "imgkit/platform.hpp"
#include "imgkit/tar.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace imgkit {

// ============================================================================
// Safe Extraction
// ============================================================================

PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root) {
    PathValidation result;

    if (entry_path.empty()) {
        result.error = "empty path not allowed";
        return result;
    }

    // Reject absolute paths
    if (entry_path[0] == '/' || entry_path[0] == '\\') {
        result.error = "absolute path not allowed: " + entry_path;
        return result;
    }

    // Normalize path and check for traversal
    fs::path path(entry_path);
    fs::path normalized;

    for (const auto& component : path) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + entry_path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    if (normalized.empty()) {
        result.error = "path names the extraction root: " + entry_path;
        return result;
    }

    // Verify the path stays within extraction root, symlinks included
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(extraction_root, ec);
    if (ec) {
        result.error = "resolving extraction root '" + extraction_root + "': " + ec.message();
        return result;
    }
    fs::path canonical_full = fs::weakly_canonical(fs::path(extraction_root) / normalized, ec);
    if (ec) {
        result.error = "resolving '" + entry_path + "': " + ec.message();
        return result;
    }

    auto root_it = canonical_root.begin();
    auto full_it = canonical_full.begin();
    for (; root_it != canonical_root.end(); ++root_it, ++full_it) {
        if (root_it->empty()) continue;
        if (full_it == canonical_full.end() || *full_it != *root_it) {
            result.error = "path escapes extraction root: " + entry_path;
            return result;
        }
    }

    result.safe = true;
    result.normalized_path = normalized.generic_string();
    return result;
}

namespace {

ExtractResult extract_error(ErrorKind kind, const std::string& message) {
    ExtractResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

fs::perms to_perms(uint32_t mode) {
    return static_cast<fs::perms>(mode & 0777);
}

} // namespace

ExtractResult extract_tar_stream(std::istream& in, const std::string& dest_dir,
                                 spdlog::logger& ui) {
    TarReader reader(in);
    std::vector<std::pair<fs::path, uint32_t>> dir_modes;
    size_t entries = 0;

    for (;;) {
        auto next = reader.next();
        if (!next.ok) {
            return extract_error(next.kind, next.error);
        }
        if (next.end) {
            break;
        }

        const TarEntry& entry = next.entry;

        // "./" records the extraction root itself
        if (entry.type == TarEntryType::Directory && (entry.path.empty() || entry.path == ".")) {
            continue;
        }

        auto validation = validate_extraction_path(entry.path, dest_dir);
        if (!validation.safe) {
            return extract_error(ErrorKind::Structural, validation.error);
        }

        if (entry.type == TarEntryType::Symlink || entry.type == TarEntryType::Hardlink) {
            return extract_error(ErrorKind::Structural,
                                 "symlinks and hardlinks not permitted: " + entry.path);
        }
        if (entry.type == TarEntryType::Other) {
            return extract_error(ErrorKind::Structural, "unsupported entry type: " + entry.path);
        }

        fs::path target = fs::path(dest_dir) / validation.normalized_path;
        std::error_code ec;

        if (entry.type == TarEntryType::Directory) {
            ui.info("dir: {}", validation.normalized_path);
            fs::create_directories(target, ec);
            if (ec) {
                return extract_error(ErrorKind::Io,
                                     "creating directory '" + target.string() + "': " + ec.message());
            }
            dir_modes.emplace_back(target, entry.mode);
            ++entries;
            continue;
        }

        ui.info("file: {}", validation.normalized_path);

        // Archives are not required to list parent directories first
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return extract_error(ErrorKind::Io,
                                 "creating directory '" + target.parent_path().string() + "': " + ec.message());
        }

        {
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out) {
                return extract_error(ErrorKind::Io, "creating file '" + target.string() + "'");
            }
            auto copied = reader.copy_data(out);
            if (!copied.ok) {
                return extract_error(copied.kind, copied.error + ": " + target.string());
            }
            out.close();
            if (out.fail()) {
                return extract_error(ErrorKind::Io, "writing file '" + target.string() + "'");
            }
        }

        fs::permissions(target, to_perms(entry.mode), fs::perm_options::replace, ec);
        if (ec) {
            return extract_error(ErrorKind::Io, "chmod '" + target.string() + "': " + ec.message());
        }
        ++entries;
    }

    // Deepest first so a read-only parent never blocks its children
    std::sort(dir_modes.begin(), dir_modes.end(),
              [](const auto& a, const auto& b) { return a.first.string() > b.first.string(); });
    for (const auto& [dir, mode] : dir_modes) {
        std::error_code ec;
        fs::permissions(dir, to_perms(mode), fs::perm_options::replace, ec);
        if (ec) {
            return extract_error(ErrorKind::Io, "chmod '" + dir.string() + "': " + ec.message());
        }
    }

    ExtractResult result;
    result.entries = entries;
    result.ok = true;
    return result;
}

// ============================================================================
// DirImage
// ============================================================================

DirImage::DirImage(std::string output_path, Reference reference, Manifest manifest,
                   ImagesMetadata& metadata, spdlog::logger& ui)
    : output_path_(std::move(output_path)),
      reference_(std::move(reference)),
      manifest_(std::move(manifest)),
      metadata_(metadata),
      ui_(ui) {}

ExtractResult DirImage::as_directory() {
    auto work = create_temp_directory("imgkit-layers");
    if (!work.ok) {
        return extract_error(ErrorKind::Io, work.error);
    }

    ExtractResult total;
    total.ok = true;
    for (const auto& layer : manifest_.layers) {
        auto extracted = extract_layer(layer, work.path);
        if (!extracted.ok) {
            total = extracted;
            break;
        }
        total.entries += extracted.entries;
    }

    remove_directory(work.path);
    return total;
}

ExtractResult DirImage::extract_layer(const Descriptor& layer, const std::string& work_dir) {
    std::string blob_path = join_path(work_dir, "blob");
    std::string tar_path = join_path(work_dir, "layer.tar");

    auto fetched = metadata_.fetch_blob(reference_, layer, blob_path);
    if (!fetched.ok) {
        return extract_error(fetched.kind, fetched.error);
    }

    std::string source = blob_path;
    if (is_gzip_layer_media_type(layer.media_type) || has_gzip_magic(blob_path)) {
        auto inflated = gzip_decompress_file(blob_path, tar_path);
        remove_file(blob_path);
        if (!inflated.ok) {
            remove_file(tar_path);
            return extract_error(inflated.kind, "decompressing layer " + layer.digest + ": " + inflated.error);
        }
        source = tar_path;
    }

    ExtractResult result;
    {
        std::ifstream in(source, std::ios::binary);
        if (!in) {
            remove_file(source);
            return extract_error(ErrorKind::Io, "opening layer '" + source + "'");
        }
        result = extract_tar_stream(in, output_path_, ui_);
    }

    remove_file(source);
    if (!result.ok) {
        result.error = "layer " + layer.digest + ": " + result.error;
    }
    return result;
}

} // namespace imgkit
