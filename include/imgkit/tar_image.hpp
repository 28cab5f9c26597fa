#pragma once

#include "imgkit/tar.hpp"
#include "imgkit/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// Tree Walking
// ============================================================================

enum class WalkEntryKind {
    Directory,
    RegularFile,
    Other       // symlink, device, socket, fifo
};

struct WalkEntry {
    std::string full_path;
    std::string rel_path;       // "." for the root, forward slashes below it
    WalkEntryKind kind = WalkEntryKind::Other;
    uint64_t size = 0;          // Regular files only
};

enum class WalkAction {
    Continue,
    SkipSubtree,    // Do not list this directory
    Abort
};

struct WalkStep {
    WalkAction action = WalkAction::Continue;
    ErrorKind kind = ErrorKind::None;  // Set when action is Abort
    std::string error;
};

using WalkVisitor = std::function<WalkStep(const WalkEntry&)>;

struct WalkResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

// Depth-first pre-order walk. The root is visited first (rel_path "."), then
// each directory's children sorted by name. Entries are classified without
// following symlinks. A visitor returning SkipSubtree on a directory prevents
// that directory from ever being listed.
WalkResult walk_tree(const std::string& root, const WalkVisitor& visitor);

// ============================================================================
// Packaged Artifacts
// ============================================================================

// A tar stream on disk plus the bundle flag. Owns the backing file and
// deletes it on destruction.
class FileImage {
public:
    FileImage(std::string tar_path, bool bundle);
    ~FileImage();

    FileImage(const FileImage&) = delete;
    FileImage& operator=(const FileImage&) = delete;

    const std::string& path() const { return path_; }
    bool is_bundle() const { return bundle_; }

private:
    std::string path_;
    bool bundle_;
};

struct FileImageResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    std::unique_ptr<FileImage> image;
};

// ============================================================================
// Deterministic Archiver
// ============================================================================

// Packages an ordered list of files and directories into one canonical tar
// stream (see tar.hpp for the normalized metadata). Exclusions are exact
// matches against entry paths relative to their input directory (or the base
// name for bare file inputs); an excluded directory drops its whole subtree.
class TarImage {
public:
    TarImage(std::vector<std::string> files,
             std::vector<std::string> exclude_paths,
             spdlog::logger& info_log);

    FileImageResult as_file_bundle();
    FileImageResult as_file_image();

    // Write the archive to `out`. On failure the stream contents are partial.
    TarStatus write_tarball(std::ostream& out);

private:
    FileImageResult package(bool bundle);
    TarStatus add_dir(TarWriter& writer, const std::string& rel_path);
    TarStatus add_file(TarWriter& writer, const std::string& full_path,
                       const std::string& rel_path, uint64_t size);
    bool is_excluded(const std::string& rel_path) const;

    std::vector<std::string> files_;
    std::vector<std::string> exclude_paths_;
    spdlog::logger& info_log_;
};

} // namespace imgkit
