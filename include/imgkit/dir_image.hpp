#pragma once

#include "imgkit/manifest.hpp"
#include "imgkit/reference.hpp"
#include "imgkit/registry.hpp"
#include "imgkit/types.hpp"

#include <istream>
#include <string>

#include <spdlog/logger.h>

namespace imgkit {

// ============================================================================
// Safe Extraction
// ============================================================================

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;
};

// Reject absolute entry paths and anything that would resolve outside
// `extraction_root`.
PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root);

struct ExtractResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string error;
    size_t entries = 0;         // Directories and files written
};

// Unpack a tar stream into the existing directory `dest_dir`. Only directories
// and regular files are accepted; their permissions come from the header mode
// (& 0777). Directory permissions are applied once all entries are written.
ExtractResult extract_tar_stream(std::istream& in, const std::string& dest_dir,
                                 spdlog::logger& ui);

// ============================================================================
// Directory Materializer
// ============================================================================

// Writes every layer of an already fetched manifest into `output_path`, in
// manifest order. Layer blobs are downloaded to a private temporary directory
// and deleted afterwards whether or not extraction succeeded.
class DirImage {
public:
    DirImage(std::string output_path, Reference reference, Manifest manifest,
             ImagesMetadata& metadata, spdlog::logger& ui);

    ExtractResult as_directory();

private:
    ExtractResult extract_layer(const Descriptor& layer, const std::string& work_dir);

    std::string output_path_;
    Reference reference_;
    Manifest manifest_;
    ImagesMetadata& metadata_;
    spdlog::logger& ui_;
};

} // namespace imgkit
