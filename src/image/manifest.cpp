#include "imgkit/manifest.hpp"

#include <nlohmann/json.hpp>

namespace imgkit {

namespace {

// Helper to safely get a string from JSON
std::string get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

std::map<std::string, std::string> get_string_map(const nlohmann::json& j, const std::string& key) {
    std::map<std::string, std::string> result;
    if (j.contains(key) && j[key].is_object()) {
        for (auto it = j[key].begin(); it != j[key].end(); ++it) {
            if (it.value().is_string()) {
                result[it.key()] = it.value().get<std::string>();
            }
        }
    }
    return result;
}

bool parse_descriptor(const nlohmann::json& j, Descriptor& out, std::string& error) {
    if (!j.is_object()) {
        error = "descriptor must be an object";
        return false;
    }
    out.media_type = get_string(j, "mediaType");
    out.digest = get_string(j, "digest");
    if (out.digest.empty()) {
        error = "descriptor digest missing";
        return false;
    }
    if (j.contains("size") && j["size"].is_number_integer()) {
        out.size = j["size"].get<int64_t>();
    }
    out.annotations = get_string_map(j, "annotations");
    return true;
}

nlohmann::json descriptor_to_json(const Descriptor& descriptor) {
    nlohmann::json j;
    j["mediaType"] = descriptor.media_type;
    j["digest"] = descriptor.digest;
    j["size"] = descriptor.size;
    if (!descriptor.annotations.empty()) {
        j["annotations"] = descriptor.annotations;
    }
    return j;
}

} // namespace

bool Manifest::is_bundle() const {
    auto it = annotations.find(BUNDLE_ANNOTATION);
    return it != annotations.end() && it->second == "true";
}

bool is_index_media_type(const std::string& media_type) {
    return media_type == MEDIA_TYPE_OCI_INDEX || media_type == MEDIA_TYPE_DOCKER_MANIFEST_LIST;
}

bool is_gzip_layer_media_type(const std::string& media_type) {
    return media_type == MEDIA_TYPE_OCI_LAYER_GZIP || media_type == MEDIA_TYPE_DOCKER_LAYER_GZIP;
}

ManifestParseResult parse_manifest(const std::string& json_str, const std::string& content_type) {
    ManifestParseResult result;
    result.manifest.raw = json_str;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.kind = ErrorKind::Structural;
            result.error = "manifest must be a JSON object";
            return result;
        }

        Manifest& manifest = result.manifest;
        manifest.media_type = get_string(j, "mediaType");
        if (manifest.media_type.empty()) {
            manifest.media_type = content_type;
        }

        if (is_index_media_type(manifest.media_type) || j.contains("manifests")) {
            result.kind = ErrorKind::Structural;
            result.error = "multi-platform image indexes are not supported";
            return result;
        }

        if (j.contains("schemaVersion") && j["schemaVersion"].is_number_integer()) {
            manifest.schema_version = j["schemaVersion"].get<int>();
        }
        if (manifest.schema_version != 2) {
            result.kind = ErrorKind::Structural;
            result.error = "unsupported manifest schemaVersion " + std::to_string(manifest.schema_version);
            return result;
        }

        std::string error;
        if (!j.contains("config") || !parse_descriptor(j["config"], manifest.config, error)) {
            result.kind = ErrorKind::Structural;
            result.error = "manifest config: " + (error.empty() ? std::string("missing") : error);
            return result;
        }

        if (j.contains("layers") && j["layers"].is_array()) {
            for (const auto& layer_json : j["layers"]) {
                Descriptor layer;
                if (!parse_descriptor(layer_json, layer, error)) {
                    result.kind = ErrorKind::Structural;
                    result.error = "manifest layer: " + error;
                    return result;
                }
                manifest.layers.push_back(std::move(layer));
            }
        }

        manifest.annotations = get_string_map(j, "annotations");
    } catch (const nlohmann::json::exception& e) {
        result.kind = ErrorKind::Structural;
        result.error = std::string("invalid manifest JSON: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

std::string serialize_manifest(const Manifest& manifest) {
    nlohmann::json j;
    j["schemaVersion"] = manifest.schema_version;
    j["mediaType"] = manifest.media_type;
    j["config"] = descriptor_to_json(manifest.config);

    j["layers"] = nlohmann::json::array();
    for (const auto& layer : manifest.layers) {
        j["layers"].push_back(descriptor_to_json(layer));
    }

    if (!manifest.annotations.empty()) {
        j["annotations"] = manifest.annotations;
    }

    return j.dump();
}

std::string make_image_config(const std::vector<std::string>& diff_ids) {
    nlohmann::json j;
    j["architecture"] = "";
    j["os"] = "";
    j["config"] = nlohmann::json::object();
    j["rootfs"]["type"] = "layers";
    j["rootfs"]["diff_ids"] = diff_ids;
    return j.dump();
}

} // namespace imgkit
