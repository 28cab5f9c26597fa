#include "imgkit/registry.hpp"
#include "imgkit/digest.hpp"
#include "imgkit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace imgkit {

// ============================================================================
// Configuration
// ============================================================================

namespace {

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes") return true;
    if (lower == "0" || lower == "false" || lower == "no") return false;
    return std::nullopt;
}

std::string flag_or_env(const std::optional<std::string>& flag, const char* env_name) {
    if (flag && !flag->empty()) {
        return *flag;
    }
    return get_env(env_name).value_or("");
}

bool flag_or_env(const std::optional<bool>& flag, const char* env_name, bool fallback) {
    if (flag) {
        return *flag;
    }
    if (auto env = get_env(env_name)) {
        if (auto parsed = parse_bool(*env)) {
            return *parsed;
        }
    }
    return fallback;
}

} // namespace

RegistryOptions resolve_registry_options(const RegistryFlags& flags) {
    RegistryOptions options;
    options.username = flag_or_env(flags.username, "IMGKIT_USERNAME");
    options.password = flag_or_env(flags.password, "IMGKIT_PASSWORD");
    options.token = flag_or_env(flags.token, "IMGKIT_TOKEN");
    options.ca_cert_path = flag_or_env(flags.ca_cert_path, "IMGKIT_REGISTRY_CA_CERT_PATH");
    options.verify_certs = flag_or_env(flags.verify_certs, "IMGKIT_REGISTRY_VERIFY_CERTS", true);
    options.insecure = flag_or_env(flags.insecure, "IMGKIT_REGISTRY_INSECURE", false);
    return options;
}

// ============================================================================
// HTTP Transport with libcurl
// ============================================================================

namespace {

constexpr const char* MANIFEST_ACCEPT =
    "Accept: application/vnd.oci.image.manifest.v1+json, "
    "application/vnd.docker.distribution.manifest.v2+json, "
    "application/vnd.oci.image.index.v1+json, "
    "application/vnd.docker.distribution.manifest.list.v2+json";

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a curl header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void add(const std::string& header) { list_ = curl_slist_append(list_, header.c_str()); }
    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

size_t write_to_string(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* file = static_cast<std::ofstream*>(userdata);
    size_t total = size * nmemb;
    file->write(ptr, static_cast<std::streamsize>(total));
    return *file ? total : 0;
}

size_t read_from_file(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* file = static_cast<std::ifstream*>(userdata);
    file->read(buffer, static_cast<std::streamsize>(size * nitems));
    if (file->bad()) {
        return CURL_READFUNC_ABORT;
    }
    return static_cast<size_t>(file->gcount());
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

size_t capture_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);

    // A new status line starts a new response (redirects, 100-continue)
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*headers)[name] = trim(line.substr(colon + 1));
    }
    return total;
}

HttpResponse perform(const RegistryOptions& options, const HttpRequest& request) {
    HttpResponse response;

    get_curl_init();

    CurlHandle curl;
    if (!curl) {
        response.error = "failed to initialize CURL";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};
    CurlHeaders headers;
    for (const auto& header : request.headers) {
        headers.add(header);
    }

    std::ofstream download;
    if (!request.download_path.empty()) {
        download.open(request.download_path, std::ios::binary | std::ios::trunc);
        if (!download) {
            response.error = "failed to create " + request.download_path;
            return response;
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &download);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    }

    std::ifstream upload;
    if (request.method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (request.method == "PUT" && !request.upload_path.empty()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(request.upload_path, ec);
        upload.open(request.upload_path, std::ios::binary);
        if (ec || !upload) {
            response.error = "failed to open " + request.upload_path;
            return response;
        }
        curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_from_file);
        curl_easy_setopt(curl.get(), CURLOPT_READDATA, &upload);
        curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    } else if (request.method == "POST" || request.method == "PUT") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body.size()));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, capture_header);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);

    // Blob downloads are redirected to storage backends
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, request.method == "GET" ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options.verify_certs ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options.verify_certs ? 2L : 0L);
    if (!options.ca_cert_path.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, options.ca_cert_path.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "imgkit/" IMGKIT_VERSION);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = std::string("HTTP request failed: ") +
                         (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (download.is_open()) {
        download.close();
        if (download.fail()) {
            response.error = "failed to write " + request.download_path;
            return response;
        }
    }

    response.ok = true;
    return response;
}

std::string base64_encode(const std::string& input) {
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                              static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::string url_escape(const std::string& value) {
    get_curl_init();
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

// Parse `Scheme key="value",key2="value2"`
struct Challenge {
    std::string scheme;
    std::map<std::string, std::string> params;
};

Challenge parse_challenge(const std::string& header) {
    Challenge challenge;

    size_t space = header.find(' ');
    challenge.scheme = header.substr(0, space);
    std::transform(challenge.scheme.begin(), challenge.scheme.end(), challenge.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (space == std::string::npos) {
        return challenge;
    }

    size_t pos = space + 1;
    while (pos < header.size()) {
        size_t eq = header.find('=', pos);
        if (eq == std::string::npos) break;
        std::string key = trim(header.substr(pos, eq - pos));

        std::string value;
        size_t next;
        if (eq + 1 < header.size() && header[eq + 1] == '"') {
            size_t close = header.find('"', eq + 2);
            if (close == std::string::npos) close = header.size();
            value = header.substr(eq + 2, close - eq - 2);
            next = header.find(',', close);
        } else {
            next = header.find(',', eq + 1);
            value = trim(header.substr(eq + 1, next == std::string::npos ? std::string::npos : next - eq - 1));
        }

        challenge.params[key] = value;
        if (next == std::string::npos) break;
        pos = next + 1;
    }

    return challenge;
}

std::string header_value(const HttpResponse& response, const std::string& name) {
    auto it = response.headers.find(name);
    return it == response.headers.end() ? "" : it->second;
}

std::string status_error(const std::string& what, const HttpResponse& response) {
    std::string message = what + ": HTTP " + std::to_string(response.status);
    if (!response.body.empty() && response.body.size() < 512) {
        message += ": " + trim(response.body);
    }
    return message;
}

template <typename Result>
Result registry_error(const std::string& message) {
    Result result;
    result.kind = ErrorKind::Registry;
    result.error = message;
    return result;
}

} // namespace

// ============================================================================
// Registry
// ============================================================================

Registry::Registry(RegistryOptions options, spdlog::logger& log)
    : options_(std::move(options)), log_(log) {}

std::string Registry::base_url(const Reference& reference) const {
    bool plain_http = options_.insecure ||
                      reference.registry.rfind("localhost", 0) == 0 ||
                      reference.registry.rfind("127.0.0.1", 0) == 0;
    return std::string(plain_http ? "http" : "https") + "://" + reference.registry +
           "/v2/" + reference.repository;
}

std::optional<std::string> Registry::fetch_token(const std::string& challenge_header,
                                                 const std::string& scope,
                                                 std::string& error) {
    Challenge challenge = parse_challenge(challenge_header);

    auto realm = challenge.params.find("realm");
    if (realm == challenge.params.end() || realm->second.empty()) {
        error = "auth challenge without realm: " + challenge_header;
        return std::nullopt;
    }

    std::string url = realm->second;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    auto service = challenge.params.find("service");
    if (service != challenge.params.end()) {
        url += separator;
        url += "service=" + url_escape(service->second);
        separator = '&';
    }
    auto challenge_scope = challenge.params.find("scope");
    url += separator;
    url += "scope=" + url_escape(challenge_scope != challenge.params.end() ? challenge_scope->second : scope);

    HttpRequest request;
    request.url = url;
    if (!options_.username.empty()) {
        request.headers.push_back("Authorization: Basic " +
                                  base64_encode(options_.username + ":" + options_.password));
    }

    log_.debug("requesting token from {}", realm->second);
    HttpResponse response = perform(options_, request);
    if (!response.ok) {
        error = response.error;
        return std::nullopt;
    }
    if (response.status != 200) {
        error = status_error("fetching token", response);
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        if (j.contains("token") && j["token"].is_string()) {
            return j["token"].get<std::string>();
        }
        if (j.contains("access_token") && j["access_token"].is_string()) {
            return j["access_token"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid token response: ") + e.what();
        return std::nullopt;
    }

    error = "token response contains no token";
    return std::nullopt;
}

HttpResponse Registry::send(const Reference& reference, const std::string& actions, HttpRequest request) {
    std::string scope = "repository:" + reference.repository + ":" + actions;
    std::string cache_key = reference.registry + " " + scope;

    std::vector<std::string> base_headers = request.headers;
    auto cached = tokens_.find(cache_key);
    if (cached != tokens_.end()) {
        request.headers.push_back("Authorization: Bearer " + cached->second);
    } else if (!options_.token.empty()) {
        request.headers.push_back("Authorization: Bearer " + options_.token);
    }

    log_.debug("{} {}", request.method, request.url);
    HttpResponse response = perform(options_, request);
    if (!response.ok || response.status != 401) {
        return response;
    }

    std::string challenge_header = header_value(response, "www-authenticate");
    Challenge challenge = parse_challenge(challenge_header);
    log_.debug("auth challenge: {}", challenge_header);

    request.headers = base_headers;
    if (challenge.scheme == "bearer") {
        std::string error;
        auto token = fetch_token(challenge_header, scope, error);
        if (!token) {
            HttpResponse failed;
            failed.error = "authenticating to " + reference.registry + ": " + error;
            return failed;
        }
        tokens_[cache_key] = *token;
        request.headers.push_back("Authorization: Bearer " + *token);
    } else if (challenge.scheme == "basic" && !options_.username.empty()) {
        request.headers.push_back("Authorization: Basic " +
                                  base64_encode(options_.username + ":" + options_.password));
    } else {
        return response;
    }

    return perform(options_, request);
}

ManifestResult Registry::manifest(const Reference& reference) {
    HttpRequest request;
    request.url = base_url(reference) + "/manifests/" + reference.identifier();
    request.headers.push_back(MANIFEST_ACCEPT);

    HttpResponse response = send(reference, "pull", request);
    if (!response.ok) {
        return registry_error<ManifestResult>("fetching manifest " + reference.name() + ": " + response.error);
    }
    if (response.status != 200) {
        return registry_error<ManifestResult>(status_error("fetching manifest " + reference.name(), response));
    }

    auto parsed = parse_manifest(response.body, header_value(response, "content-type"));
    if (!parsed.ok) {
        ManifestResult result;
        result.kind = parsed.kind;
        result.error = parsed.error;
        return result;
    }

    auto hashed = digest_of_bytes(response.body);
    if (!hashed.ok) {
        return registry_error<ManifestResult>(hashed.error);
    }
    if (reference.is_digest() && hashed.digest != reference.digest) {
        return registry_error<ManifestResult>("manifest digest mismatch for " + reference.name() +
                                              ": got " + hashed.digest);
    }

    ManifestResult result;
    result.manifest = std::move(parsed.manifest);
    result.manifest.digest = hashed.digest;
    result.ok = true;
    return result;
}

DigestResult Registry::resolve(const Reference& reference) {
    if (reference.is_digest()) {
        DigestResult result;
        result.digest = reference.digest;
        result.ok = true;
        return result;
    }

    HttpRequest request;
    request.method = "HEAD";
    request.url = base_url(reference) + "/manifests/" + reference.identifier();
    request.headers.push_back(MANIFEST_ACCEPT);

    HttpResponse response = send(reference, "pull", request);
    if (response.ok && response.status == 200) {
        std::string digest = header_value(response, "docker-content-digest");
        if (is_valid_digest(digest)) {
            DigestResult result;
            result.digest = digest;
            result.ok = true;
            return result;
        }
    }

    // Registries are not required to send Docker-Content-Digest
    auto fetched = manifest(reference);
    DigestResult result;
    if (!fetched.ok) {
        result.kind = fetched.kind;
        result.error = fetched.error;
        return result;
    }
    result.digest = fetched.manifest.digest;
    result.ok = true;
    return result;
}

ExistsResult Registry::exists(const Reference& reference) {
    HttpRequest request;
    request.method = "HEAD";
    request.url = base_url(reference) + "/manifests/" + reference.identifier();
    request.headers.push_back(MANIFEST_ACCEPT);

    HttpResponse response = send(reference, "pull", request);
    if (!response.ok) {
        return registry_error<ExistsResult>("checking " + reference.name() + ": " + response.error);
    }

    ExistsResult result;
    if (response.status == 200) {
        result.found = true;
    } else if (response.status != 404) {
        return registry_error<ExistsResult>(status_error("checking " + reference.name(), response));
    }
    result.ok = true;
    return result;
}

BlobResult Registry::fetch_blob(const Reference& reference, const Descriptor& blob,
                                const std::string& dest_path) {
    HttpRequest request;
    request.url = base_url(reference) + "/blobs/" + blob.digest;
    request.download_path = dest_path;

    HttpResponse response = send(reference, "pull", request);
    if (!response.ok) {
        remove_file(dest_path);
        return registry_error<BlobResult>("fetching blob " + blob.digest + ": " + response.error);
    }
    if (response.status != 200) {
        remove_file(dest_path);
        return registry_error<BlobResult>("fetching blob " + blob.digest + ": HTTP " +
                                          std::to_string(response.status));
    }

    auto hashed = digest_of_file(dest_path);
    if (!hashed.ok) {
        remove_file(dest_path);
        BlobResult result;
        result.kind = hashed.kind;
        result.error = hashed.error;
        return result;
    }
    if (hashed.digest != blob.digest) {
        remove_file(dest_path);
        return registry_error<BlobResult>("blob digest mismatch: expected " + blob.digest +
                                          ", got " + hashed.digest);
    }

    BlobResult result;
    result.path = dest_path;
    result.ok = true;
    return result;
}

PushResult Registry::push_blob(const Reference& reference, const Descriptor& blob,
                               const std::string& path) {
    HttpRequest head;
    head.method = "HEAD";
    head.url = base_url(reference) + "/blobs/" + blob.digest;

    HttpResponse existing = send(reference, "pull,push", head);
    if (existing.ok && existing.status == 200) {
        log_.debug("blob {} already present", blob.digest);
        PushResult result;
        result.digest = blob.digest;
        result.ok = true;
        return result;
    }

    HttpRequest start;
    start.method = "POST";
    start.url = base_url(reference) + "/blobs/uploads/";

    HttpResponse started = send(reference, "pull,push", start);
    if (!started.ok) {
        return registry_error<PushResult>("starting upload of " + blob.digest + ": " + started.error);
    }
    if (started.status != 202) {
        return registry_error<PushResult>(status_error("starting upload of " + blob.digest, started));
    }

    std::string location = header_value(started, "location");
    if (location.empty()) {
        return registry_error<PushResult>("upload of " + blob.digest + " returned no location");
    }
    if (location.rfind("http://", 0) != 0 && location.rfind("https://", 0) != 0) {
        std::string base = base_url(reference);
        location = base.substr(0, base.find("/v2/")) + location;
    }
    location += location.find('?') == std::string::npos ? '?' : '&';
    location += "digest=" + url_escape(blob.digest);

    HttpRequest upload;
    upload.method = "PUT";
    upload.url = location;
    upload.upload_path = path;
    upload.headers.push_back("Content-Type: application/octet-stream");

    HttpResponse uploaded = send(reference, "pull,push", upload);
    if (!uploaded.ok) {
        return registry_error<PushResult>("uploading " + blob.digest + ": " + uploaded.error);
    }
    if (uploaded.status != 201) {
        return registry_error<PushResult>(status_error("uploading " + blob.digest, uploaded));
    }

    PushResult result;
    result.digest = blob.digest;
    result.ok = true;
    return result;
}

PushResult Registry::push_manifest(const Reference& reference, const std::string& media_type,
                                   const std::string& content) {
    auto hashed = digest_of_bytes(content);
    if (!hashed.ok) {
        return registry_error<PushResult>(hashed.error);
    }

    HttpRequest request;
    request.method = "PUT";
    request.url = base_url(reference) + "/manifests/" + reference.identifier();
    request.body = content;
    request.headers.push_back("Content-Type: " + media_type);

    HttpResponse response = send(reference, "pull,push", request);
    if (!response.ok) {
        return registry_error<PushResult>("pushing manifest " + reference.name() + ": " + response.error);
    }
    if (response.status != 201 && response.status != 200) {
        return registry_error<PushResult>(status_error("pushing manifest " + reference.name(), response));
    }

    PushResult result;
    result.digest = hashed.digest;
    result.ok = true;
    return result;
}

} // namespace imgkit
