#include "imgkit/reference.hpp"
#include "imgkit/digest.hpp"

#include <cctype>
#include <vector>

namespace imgkit {

namespace {

constexpr size_t MAX_TAG_LENGTH = 128;

bool is_lower_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

// One repository path component:
//   [a-z0-9]+ ( ("." | "_" | "__" | "-"+) [a-z0-9]+ )*
bool is_valid_path_component(const std::string& component) {
    size_t i = 0;
    size_t n = component.size();

    auto alnum_run = [&]() {
        size_t start = i;
        while (i < n && is_lower_alnum(component[i])) ++i;
        return i > start;
    };

    if (!alnum_run()) return false;

    while (i < n) {
        char c = component[i];
        if (c == '.') {
            ++i;
        } else if (c == '_') {
            ++i;
            if (i < n && component[i] == '_') ++i;
        } else if (c == '-') {
            while (i < n && component[i] == '-') ++i;
        } else {
            return false;
        }
        if (!alnum_run()) return false;
    }
    return true;
}

bool is_valid_repository(const std::string& repository) {
    if (repository.empty() || repository.size() > 255) return false;

    size_t start = 0;
    for (;;) {
        size_t slash = repository.find('/', start);
        std::string component = repository.substr(start, slash == std::string::npos
                                                             ? std::string::npos
                                                             : slash - start);
        if (!is_valid_path_component(component)) return false;
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return true;
}

bool is_valid_tag(const std::string& tag) {
    if (tag.empty() || tag.size() > MAX_TAG_LENGTH) return false;

    auto word = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    if (!word(tag[0])) return false;
    for (char c : tag) {
        if (!word(c) && c != '.' && c != '-') return false;
    }
    return true;
}

bool is_valid_registry(const std::string& registry) {
    if (registry.empty()) return false;
    for (char c : registry) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' ||
                  c == ':' || c == '[' || c == ']';
        if (!ok) return false;
    }
    return true;
}

ReferenceResult reference_error(const std::string& message) {
    ReferenceResult result;
    result.kind = ErrorKind::Usage;
    result.error = message;
    return result;
}

// Parse "[registry/]repository" into `out`
bool parse_repository(const std::string& name, ReferenceValidation validation,
                      Reference& out, std::string& error) {
    if (name.empty()) {
        error = "a repository name must be specified";
        return false;
    }

    std::string registry;
    std::string repository = name;

    size_t slash = name.find('/');
    if (slash != std::string::npos) {
        std::string first = name.substr(0, slash);
        if (first.find('.') != std::string::npos || first.find(':') != std::string::npos ||
            first == "localhost") {
            registry = first;
            repository = name.substr(slash + 1);
        }
    }

    if (!is_valid_repository(repository)) {
        error = "repository can only contain the characters `abcdefghijklmnopqrstuvwxyz0123456789_-./`: " +
                repository;
        return false;
    }

    if (registry.empty()) {
        if (validation == ReferenceValidation::Strict) {
            error = "strict validation requires the registry to be explicitly defined";
            return false;
        }
        registry = DEFAULT_REGISTRY;
    } else if (registry == "docker.io") {
        registry = DEFAULT_REGISTRY;
    }

    if (!is_valid_registry(registry)) {
        error = "registries must be valid RFC 3986 URI authorities: " + registry;
        return false;
    }

    if (registry == DEFAULT_REGISTRY && repository.find('/') == std::string::npos) {
        if (validation == ReferenceValidation::Strict) {
            error = "strict validation requires the full repository path (missing 'library')";
            return false;
        }
        repository = "library/" + repository;
    }

    out.registry = registry;
    out.repository = repository;
    return true;
}

// Split "name[:tag]" where the tag separator must follow the last '/'
void split_tag(const std::string& text, std::string& name, std::string& tag) {
    size_t colon = text.rfind(':');
    size_t slash = text.rfind('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
        name = text.substr(0, colon);
        tag = text.substr(colon + 1);
    } else {
        name = text;
        tag.clear();
    }
}

} // namespace

std::string Reference::context_name() const {
    return registry + "/" + repository;
}

std::string Reference::identifier() const {
    return is_digest() ? digest : tag;
}

std::string Reference::name() const {
    if (is_digest()) {
        return context_name() + "@" + digest;
    }
    return context_name() + ":" + tag;
}

ReferenceResult parse_digest_reference(const std::string& text, ReferenceValidation validation) {
    size_t at = text.find('@');
    if (at == std::string::npos || text.find('@', at + 1) != std::string::npos) {
        return reference_error("a digest must contain exactly one '@' separator (e.g. registry/repository@digest): " + text);
    }

    std::string base = text.substr(0, at);
    std::string digest = text.substr(at + 1);

    if (!is_valid_digest(digest)) {
        return reference_error("unsupported digest (expected sha256:<64 hex>): " + digest);
    }

    // A tag alongside the digest is accepted and dropped
    std::string name;
    std::string tag;
    split_tag(base, name, tag);
    if (!tag.empty() && !is_valid_tag(tag)) {
        name = base;
    }

    ReferenceResult result;
    std::string error;
    if (!parse_repository(name, validation, result.reference, error)) {
        return reference_error(error);
    }

    result.reference.digest = digest;
    result.ok = true;
    return result;
}

ReferenceResult parse_reference(const std::string& text, ReferenceValidation validation) {
    if (text.empty()) {
        return reference_error("could not parse reference: empty");
    }

    if (text.find('@') != std::string::npos) {
        auto result = parse_digest_reference(text, validation);
        if (!result.ok) {
            result.error = "could not parse reference: " + text + ": " + result.error;
        }
        return result;
    }

    std::string name;
    std::string tag;
    split_tag(text, name, tag);

    if (tag.empty()) {
        if (validation == ReferenceValidation::Strict) {
            return reference_error("could not parse reference: " + text +
                                   ": strict validation requires an explicit tag");
        }
        tag = DEFAULT_TAG;
    } else if (!is_valid_tag(tag)) {
        return reference_error("could not parse reference: " + text +
                               ": tag can only contain the characters `abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-.`: " + tag);
    }

    ReferenceResult result;
    std::string error;
    if (!parse_repository(name, validation, result.reference, error)) {
        return reference_error("could not parse reference: " + text + ": " + error);
    }

    result.reference.tag = tag;
    result.ok = true;
    return result;
}

Reference with_digest(const Reference& reference, const std::string& digest) {
    Reference copy = reference;
    copy.tag.clear();
    copy.digest = digest;
    return copy;
}

RelocateResult image_with_repository(const std::string& digest_ref, const std::string& repository) {
    RelocateResult result;

    size_t at = digest_ref.find('@');
    if (at == std::string::npos || digest_ref.find('@', at + 1) != std::string::npos) {
        result.kind = ErrorKind::Structural;
        result.error = "Parsing image URL: " + digest_ref;
        return result;
    }

    result.reference = repository + "@" + digest_ref.substr(at + 1);
    result.ok = true;
    return result;
}

} // namespace imgkit
