#include "imgkit/image_lock.hpp"
#include "imgkit/platform.hpp"

#include <yaml-cpp/yaml.h>

namespace imgkit {

namespace {

constexpr unsigned int LOCK_FILE_MODE = 0600;

// Helper to safely get a scalar from a YAML map
std::string get_string(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (value && value.IsScalar()) {
        return value.as<std::string>();
    }
    return "";
}

// apiVersion/kind are checked only when present
bool check_header(const YAML::Node& root, const char* expected_kind,
                  std::string& api_version, std::string& kind, std::string& error) {
    if (!root.IsMap()) {
        error = "expected a YAML mapping at document root";
        return false;
    }

    std::string found_api = get_string(root, "apiVersion");
    std::string found_kind = get_string(root, "kind");
    if (!found_kind.empty() && found_kind != expected_kind) {
        error = "expected kind " + std::string(expected_kind) + ", found " + found_kind;
        return false;
    }
    if (!found_api.empty()) api_version = found_api;
    if (!found_kind.empty()) kind = found_kind;
    return true;
}

// Scalars are kept as their value; mappings and sequences as YAML text
void read_metadata(const YAML::Node& item, ImageDesc& desc) {
    const YAML::Node value = item["metadata"];
    if (!value || value.IsNull()) {
        return;
    }
    if (value.IsScalar()) {
        desc.metadata = value.as<std::string>();
        return;
    }
    YAML::Emitter out;
    out << value;
    desc.metadata = std::string(out.c_str(), out.size());
    desc.metadata_is_yaml = true;
}

void write_metadata(YAML::Emitter& out, const ImageDesc& desc) {
    if (desc.metadata_is_yaml) {
        try {
            out << YAML::Load(desc.metadata);
            return;
        } catch (const YAML::Exception&) {
            // Not valid YAML text; falls through to a plain string
        }
    }
    out << desc.metadata;
}

std::string emit(const YAML::Emitter& out) {
    std::string text(out.c_str(), out.size());
    if (text.empty() || text.back() != '\n') {
        text += '\n';
    }
    return text;
}

} // namespace

// ============================================================================
// ImagesLock
// ============================================================================

ImagesLockResult parse_images_lock(const std::string& yaml_str) {
    ImagesLockResult result;

    try {
        YAML::Node root = YAML::Load(yaml_str);

        // An empty document is a lock with no images
        if (!root || root.IsNull()) {
            result.ok = true;
            return result;
        }

        std::string error;
        if (!check_header(root, IMAGES_LOCK_KIND, result.lock.api_version, result.lock.kind, error)) {
            result.kind = ErrorKind::Structural;
            result.error = error;
            return result;
        }

        const YAML::Node images = root["spec"] ? root["spec"]["images"] : YAML::Node();
        if (images && !images.IsNull()) {
            if (!images.IsSequence()) {
                result.kind = ErrorKind::Structural;
                result.error = "spec.images must be a list";
                return result;
            }
            for (const auto& item : images) {
                if (!item.IsMap()) {
                    result.kind = ErrorKind::Structural;
                    result.error = "spec.images entries must be mappings";
                    return result;
                }
                ImageDesc desc;
                desc.image = get_string(item, "image");
                desc.tag = get_string(item, "tag");
                desc.name = get_string(item, "name");
                read_metadata(item, desc);
                result.lock.images.push_back(std::move(desc));
            }
        }
    } catch (const YAML::Exception& e) {
        result.kind = ErrorKind::Structural;
        result.error = std::string("invalid YAML: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

ImagesLockResult read_images_lock(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        ImagesLockResult result;
        result.kind = ErrorKind::Io;
        result.error = "failed to read " + path;
        return result;
    }
    return parse_images_lock(*content);
}

std::string serialize_images_lock(const ImagesLock& lock) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "apiVersion" << YAML::Value << lock.api_version;
    out << YAML::Key << "kind" << YAML::Value << lock.kind;
    out << YAML::Key << "spec" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "images" << YAML::Value << YAML::BeginSeq;
    for (const auto& image : lock.images) {
        out << YAML::BeginMap;
        out << YAML::Key << "image" << YAML::Value << image.image;
        out << YAML::Key << "tag" << YAML::Value << image.tag;
        out << YAML::Key << "name" << YAML::Value << image.name;
        out << YAML::Key << "metadata" << YAML::Value;
        write_metadata(out, image);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    out << YAML::EndMap;
    return emit(out);
}

// ============================================================================
// BundleLock
// ============================================================================

BundleLockResult parse_bundle_lock(const std::string& yaml_str) {
    BundleLockResult result;

    try {
        YAML::Node root = YAML::Load(yaml_str);

        std::string error;
        if (!root || !check_header(root, BUNDLE_LOCK_KIND, result.lock.api_version, result.lock.kind, error)) {
            result.kind = ErrorKind::Structural;
            result.error = error.empty() ? "empty bundle lock document" : error;
            return result;
        }

        const YAML::Node image = root["spec"] ? root["spec"]["image"] : YAML::Node();
        if (!image || !image.IsMap()) {
            result.kind = ErrorKind::Structural;
            result.error = "spec.image missing";
            return result;
        }

        result.lock.url = get_string(image, "url");
        result.lock.tag = get_string(image, "tag");
        if (result.lock.url.empty()) {
            result.kind = ErrorKind::Structural;
            result.error = "spec.image.url missing";
            return result;
        }
    } catch (const YAML::Exception& e) {
        result.kind = ErrorKind::Structural;
        result.error = std::string("invalid YAML: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

BundleLockResult read_bundle_lock(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        BundleLockResult result;
        result.kind = ErrorKind::Io;
        result.error = "failed to read " + path;
        return result;
    }
    return parse_bundle_lock(*content);
}

std::string serialize_bundle_lock(const BundleLock& lock) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "apiVersion" << YAML::Value << lock.api_version;
    out << YAML::Key << "kind" << YAML::Value << lock.kind;
    out << YAML::Key << "spec" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "image" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "url" << YAML::Value << lock.url;
    out << YAML::Key << "tag" << YAML::Value << lock.tag;
    out << YAML::EndMap;
    out << YAML::EndMap;
    out << YAML::EndMap;
    return emit(out);
}

LockWriteResult write_lock_file(const std::string& path, const std::string& content) {
    LockWriteResult result;
    auto written = atomic_write_file(path, content, LOCK_FILE_MODE);
    if (!written.ok) {
        result.kind = ErrorKind::Io;
        result.error = written.error;
        return result;
    }
    result.ok = true;
    return result;
}

} // namespace imgkit
