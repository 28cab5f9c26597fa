#include "imgkit/tar_image.hpp"
#include "imgkit/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace imgkit {

// ============================================================================
// Tree Walking
// ============================================================================

namespace {

WalkEntryKind kind_of(const fs::file_status& status) {
    if (fs::is_directory(status)) return WalkEntryKind::Directory;
    if (fs::is_regular_file(status)) return WalkEntryKind::RegularFile;
    return WalkEntryKind::Other;
}

WalkResult walk_error(ErrorKind kind, const std::string& message) {
    WalkResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

// Visit one entry; descends when it is a directory the visitor did not prune
WalkResult visit(const fs::path& full_path, const std::string& rel_path, const WalkVisitor& visitor);

WalkResult walk_children(const fs::path& dir, const std::string& rel_prefix, const WalkVisitor& visitor) {
    std::vector<std::string> names;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return walk_error(ErrorKind::Io, "reading directory '" + dir.string() + "': " + ec.message());
    }
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        return walk_error(ErrorKind::Io, "reading directory '" + dir.string() + "': " + ec.message());
    }

    // Raw iteration order depends on the filesystem; sort for reproducibility
    std::sort(names.begin(), names.end());

    for (const auto& name : names) {
        std::string rel = rel_prefix.empty() ? name : rel_prefix + "/" + name;
        auto result = visit(dir / name, rel, visitor);
        if (!result.ok) return result;
    }

    WalkResult result;
    result.ok = true;
    return result;
}

WalkResult visit(const fs::path& full_path, const std::string& rel_path, const WalkVisitor& visitor) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(full_path, ec);
    if (ec) {
        return walk_error(ErrorKind::Io, "lstat '" + full_path.string() + "': " + ec.message());
    }

    WalkEntry entry;
    entry.full_path = full_path.string();
    entry.rel_path = rel_path;
    entry.kind = kind_of(status);

    if (entry.kind == WalkEntryKind::RegularFile) {
        entry.size = fs::file_size(full_path, ec);
        if (ec) {
            return walk_error(ErrorKind::Io, "stat '" + entry.full_path + "': " + ec.message());
        }
    }

    WalkStep step = visitor(entry);
    if (step.action == WalkAction::Abort) {
        return walk_error(step.kind == ErrorKind::None ? ErrorKind::Io : step.kind, step.error);
    }

    if (entry.kind == WalkEntryKind::Directory && step.action == WalkAction::Continue) {
        return walk_children(full_path, rel_path == "." ? "" : rel_path, visitor);
    }

    WalkResult result;
    result.ok = true;
    return result;
}

} // namespace

WalkResult walk_tree(const std::string& root, const WalkVisitor& visitor) {
    return visit(fs::path(root), ".", visitor);
}

// ============================================================================
// FileImage
// ============================================================================

FileImage::FileImage(std::string tar_path, bool bundle)
    : path_(std::move(tar_path)), bundle_(bundle) {}

FileImage::~FileImage() {
    if (!path_.empty()) {
        remove_file(path_);
    }
}

// ============================================================================
// TarImage
// ============================================================================

TarImage::TarImage(std::vector<std::string> files,
                   std::vector<std::string> exclude_paths,
                   spdlog::logger& info_log)
    : files_(std::move(files)), exclude_paths_(std::move(exclude_paths)), info_log_(info_log) {}

FileImageResult TarImage::as_file_bundle() {
    return package(true);
}

FileImageResult TarImage::as_file_image() {
    return package(false);
}

FileImageResult TarImage::package(bool bundle) {
    FileImageResult result;

    auto temp = create_temp_file("imgkit-tar-image");
    if (!temp.ok) {
        result.kind = ErrorKind::Io;
        result.error = temp.error;
        return result;
    }

    std::ofstream out(temp.path, std::ios::binary | std::ios::trunc);
    if (!out) {
        remove_file(temp.path);
        result.kind = ErrorKind::Io;
        result.error = "opening '" + temp.path + "': " + std::strerror(errno);
        return result;
    }

    auto status = write_tarball(out);
    out.close();

    if (status.ok && out.fail()) {
        status.ok = false;
        status.kind = ErrorKind::Io;
        status.error = "closing '" + temp.path + "'";
    }

    if (!status.ok) {
        remove_file(temp.path);
        result.kind = status.kind;
        result.error = status.error;
        return result;
    }

    result.image = std::make_unique<FileImage>(temp.path, bundle);
    result.ok = true;
    return result;
}

TarStatus TarImage::write_tarball(std::ostream& out) {
    TarWriter writer(out);

    for (const auto& path : files_) {
        std::error_code ec;
        fs::file_status status = fs::status(path, ec);
        if (ec) {
            TarStatus failed;
            failed.kind = ErrorKind::Io;
            failed.error = "stat '" + path + "': " + ec.message();
            return failed;
        }

        if (fs::is_directory(status)) {
            TarStatus step_status;
            auto walked = walk_tree(path, [&](const WalkEntry& entry) {
                WalkStep step;

                if (entry.kind == WalkEntryKind::Directory) {
                    if (is_excluded(entry.rel_path)) {
                        step.action = WalkAction::SkipSubtree;
                        return step;
                    }
                    if (entry.rel_path == ".") {
                        return step;
                    }
                    step_status = add_dir(writer, entry.rel_path);
                } else if (entry.kind == WalkEntryKind::RegularFile) {
                    step_status = add_file(writer, entry.full_path, entry.rel_path, entry.size);
                } else {
                    step_status.ok = false;
                    step_status.kind = ErrorKind::Structural;
                    step_status.error = "Expected file '" + entry.full_path + "' to be a regular file";
                }

                if (!step_status.ok) {
                    step.action = WalkAction::Abort;
                    step.kind = step_status.kind;
                    step.error = step_status.error;
                }
                return step;
            });

            if (!walked.ok) {
                TarStatus failed;
                failed.kind = walked.kind;
                failed.error = "Adding file '" + path + "' to tar: " + walked.error;
                return failed;
            }
            continue;
        }

        if (!fs::is_regular_file(status)) {
            TarStatus failed;
            failed.kind = ErrorKind::Structural;
            failed.error = "Expected file '" + path + "' to be a regular file";
            return failed;
        }

        uint64_t size = fs::file_size(path, ec);
        if (ec) {
            TarStatus failed;
            failed.kind = ErrorKind::Io;
            failed.error = "stat '" + path + "': " + ec.message();
            return failed;
        }

        auto added = add_file(writer, path, get_filename(path), size);
        if (!added.ok) return added;
    }

    return writer.finish();
}

TarStatus TarImage::add_dir(TarWriter& writer, const std::string& rel_path) {
    info_log_.info("dir: {}", rel_path);
    return writer.write_directory(rel_path);
}

TarStatus TarImage::add_file(TarWriter& writer, const std::string& full_path,
                             const std::string& rel_path, uint64_t size) {
    if (is_excluded(rel_path)) {
        TarStatus skipped;
        skipped.ok = true;
        return skipped;
    }

    info_log_.info("file: {}", rel_path);

    std::ifstream file(full_path, std::ios::binary);
    if (!file) {
        TarStatus failed;
        failed.kind = ErrorKind::Io;
        failed.error = "open '" + full_path + "': " + std::strerror(errno);
        return failed;
    }

    auto status = writer.write_file(rel_path, size, file);
    if (!status.ok && status.kind == ErrorKind::Io && file.bad()) {
        status.error = "read '" + full_path + "': " + std::strerror(errno);
    }
    return status;
}

bool TarImage::is_excluded(const std::string& rel_path) const {
    return std::find(exclude_paths_.begin(), exclude_paths_.end(), rel_path) != exclude_paths_.end();
}

} // namespace imgkit
