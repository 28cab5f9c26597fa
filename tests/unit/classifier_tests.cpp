#include <doctest/doctest.h>
#include <imgkit/classifier.hpp>

using namespace imgkit;

namespace {

Manifest with_annotation(const char* value) {
    Manifest manifest;
    if (value) {
        manifest.annotations[BUNDLE_ANNOTATION] = value;
    }
    return manifest;
}

} // namespace

TEST_CASE("bundles are accepted only with bundle intent") {
    Manifest bundle = with_annotation("true");

    CHECK(check_artifact_kind(bundle, PullIntent::Bundle).ok);

    auto result = check_artifact_kind(bundle, PullIntent::Image);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Usage);
    CHECK(result.error == "Expected bundle flag when pulling a bundle, please use -b instead of --image");
}

TEST_CASE("plain images are accepted only with image intent") {
    Manifest image = with_annotation(nullptr);

    CHECK(check_artifact_kind(image, PullIntent::Image).ok);

    auto result = check_artifact_kind(image, PullIntent::Bundle);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Usage);
    CHECK(result.error == "Expected image flag when pulling an image or index, please use --image instead of -b");
}

TEST_CASE("annotation values other than true mean a plain image") {
    for (const char* value : {"false", "", "True", "yes"}) {
        CAPTURE(value);
        Manifest manifest = with_annotation(value);
        CHECK(check_artifact_kind(manifest, PullIntent::Image).ok);
        CHECK_FALSE(check_artifact_kind(manifest, PullIntent::Bundle).ok);
    }
}
