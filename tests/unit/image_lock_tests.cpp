#include <doctest/doctest.h>
#include <imgkit/image_lock.hpp>

#include "test_support.hpp"

using namespace imgkit;
using namespace imgkit::testing;

TEST_CASE("parse_images_lock reads every image field") {
    std::string yaml =
        "apiVersion: imgpkg.k14s.io/v1alpha1\n"
        "kind: ImagesLock\n"
        "spec:\n"
        "  images:\n"
        "  - image: index.docker.io/other/app@" + fake_digest("a") + "\n"
        "    tag: v1.0\n"
        "    name: app\n"
        "    metadata: '{\"k\": \"v\"}'\n"
        "  - image: index.docker.io/other/db@" + fake_digest("b") + "\n";

    auto result = parse_images_lock(yaml);
    REQUIRE(result.ok);
    CHECK(result.lock.api_version == LOCK_API_VERSION);
    CHECK(result.lock.kind == IMAGES_LOCK_KIND);
    REQUIRE(result.lock.images.size() == 2);
    CHECK(result.lock.images[0].image == "index.docker.io/other/app@" + fake_digest("a"));
    CHECK(result.lock.images[0].tag == "v1.0");
    CHECK(result.lock.images[0].name == "app");
    CHECK(result.lock.images[0].metadata == "{\"k\": \"v\"}");
    CHECK(result.lock.images[1].tag.empty());
}

TEST_CASE("parse_images_lock accepts documents without images") {
    CHECK(parse_images_lock("").lock.images.empty());
    CHECK(parse_images_lock("").ok);

    auto no_list = parse_images_lock("apiVersion: imgpkg.k14s.io/v1alpha1\nkind: ImagesLock\nspec: {}\n");
    REQUIRE(no_list.ok);
    CHECK(no_list.lock.images.empty());

    auto empty_list = parse_images_lock("kind: ImagesLock\nspec:\n  images: []\n");
    REQUIRE(empty_list.ok);
    CHECK(empty_list.lock.images.empty());
}

TEST_CASE("parse_images_lock rejects malformed documents") {
    auto bad_yaml = parse_images_lock("spec: [unclosed");
    CHECK_FALSE(bad_yaml.ok);
    CHECK(bad_yaml.kind == ErrorKind::Structural);

    CHECK_FALSE(parse_images_lock("- just\n- a list\n").ok);
    CHECK_FALSE(parse_images_lock("kind: BundleLock\n").ok);
    CHECK_FALSE(parse_images_lock("spec:\n  images: nope\n").ok);
    CHECK_FALSE(parse_images_lock("spec:\n  images:\n  - plain string\n").ok);
}

TEST_CASE("parse_images_lock keeps mapping metadata as YAML") {
    std::string yaml =
        "kind: ImagesLock\n"
        "spec:\n"
        "  images:\n"
        "  - image: index.docker.io/other/app@" + fake_digest("a") + "\n"
        "    metadata:\n"
        "      owner: team-a\n"
        "      build: 42\n"
        "  - image: index.docker.io/other/db@" + fake_digest("b") + "\n"
        "    metadata: plain\n";

    auto parsed = parse_images_lock(yaml);
    REQUIRE(parsed.ok);
    REQUIRE(parsed.lock.images.size() == 2);
    CHECK(parsed.lock.images[0].metadata_is_yaml);
    CHECK(parsed.lock.images[0].metadata.find("owner: team-a") != std::string::npos);
    CHECK_FALSE(parsed.lock.images[1].metadata_is_yaml);
    CHECK(parsed.lock.images[1].metadata == "plain");

    auto again = parse_images_lock(serialize_images_lock(parsed.lock));
    REQUIRE(again.ok);
    CHECK(again.lock.images[0].metadata_is_yaml);
    CHECK(again.lock.images[0].metadata == parsed.lock.images[0].metadata);
    CHECK(again.lock.images[1].metadata == "plain");
}

TEST_CASE("serialize_images_lock output parses back unchanged") {
    ImagesLock lock;
    lock.images.push_back({"registry.example.com/team/bundle@" + fake_digest("a"), "v1", "app", "x: 1"});
    lock.images.push_back({"registry.example.com/team/bundle@" + fake_digest("b"), "", "", ""});

    std::string yaml = serialize_images_lock(lock);
    CHECK(yaml.find("apiVersion: imgpkg.k14s.io/v1alpha1") != std::string::npos);
    CHECK(yaml.find("kind: ImagesLock") != std::string::npos);
    CHECK(yaml == serialize_images_lock(lock));

    auto parsed = parse_images_lock(yaml);
    REQUIRE(parsed.ok);
    REQUIRE(parsed.lock.images.size() == 2);
    CHECK(parsed.lock.images[0].image == lock.images[0].image);
    CHECK(parsed.lock.images[0].tag == "v1");
    CHECK(parsed.lock.images[0].name == "app");
    CHECK(parsed.lock.images[0].metadata == "x: 1");
}

TEST_CASE("BundleLock parse and serialize") {
    std::string yaml =
        "apiVersion: imgpkg.k14s.io/v1alpha1\n"
        "kind: BundleLock\n"
        "spec:\n"
        "  image:\n"
        "    url: registry.example.com/team/bundle@" + fake_digest("bundle") + "\n"
        "    tag: v2\n";

    auto parsed = parse_bundle_lock(yaml);
    REQUIRE(parsed.ok);
    CHECK(parsed.lock.url == "registry.example.com/team/bundle@" + fake_digest("bundle"));
    CHECK(parsed.lock.tag == "v2");

    auto again = parse_bundle_lock(serialize_bundle_lock(parsed.lock));
    REQUIRE(again.ok);
    CHECK(again.lock.url == parsed.lock.url);
    CHECK(again.lock.tag == "v2");
    CHECK(again.lock.kind == BUNDLE_LOCK_KIND);
}

TEST_CASE("parse_bundle_lock requires spec.image.url") {
    CHECK_FALSE(parse_bundle_lock("").ok);
    CHECK_FALSE(parse_bundle_lock("kind: BundleLock\nspec: {}\n").ok);
    CHECK_FALSE(parse_bundle_lock("kind: BundleLock\nspec:\n  image:\n    tag: v1\n").ok);
    CHECK_FALSE(parse_bundle_lock("kind: ImagesLock\nspec:\n  image:\n    url: a@b\n").ok);
}

TEST_CASE("read helpers report missing files as I/O errors") {
    TempDir temp;
    auto images = read_images_lock(temp / "missing.yml");
    CHECK_FALSE(images.ok);
    CHECK(images.kind == ErrorKind::Io);

    auto bundle = read_bundle_lock(temp / "missing.yml");
    CHECK_FALSE(bundle.ok);
    CHECK(bundle.kind == ErrorKind::Io);
}

TEST_CASE("write_lock_file writes owner read/write only") {
    TempDir temp;
    std::string path = temp / "lock.yml";
    write_text(path, "old");
    fs::permissions(path, fs::perms::all, fs::perm_options::replace);

    auto written = write_lock_file(path, "new contents\n");
    REQUIRE(written.ok);
    CHECK(read_text(path) == "new contents\n");
    // Octal 0600 on purpose; a decimal 600 would be mode 01130
    CHECK_MESSAGE(file_mode(path) == 0600, "lock files are owner read/write, not decimal 600");
}
