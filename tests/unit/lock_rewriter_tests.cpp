#include <doctest/doctest.h>
#include <imgkit/image_lock.hpp>
#include <imgkit/lock_rewriter.hpp>

#include <yaml-cpp/yaml.h>

#include "test_support.hpp"

using namespace imgkit;
using namespace imgkit::testing;

namespace {

constexpr const char* BUNDLE_REPO = "registry.example.com/team/bundle";

Reference bundle_reference() {
    auto parsed = parse_reference(std::string(BUNDLE_REPO) + ":v1");
    REQUIRE(parsed.ok);
    return parsed.reference;
}

std::string lock_path(const TempDir& temp) {
    return temp / ".imgpkg/images.yml";
}

// Lock listing `count` images from another repository
ImagesLock sample_lock(size_t count) {
    ImagesLock lock;
    for (size_t i = 0; i < count; ++i) {
        ImageDesc desc;
        desc.image = "index.docker.io/other/app" + std::to_string(i) + "@" + fake_digest("img" + std::to_string(i));
        desc.tag = "v" + std::to_string(i);
        desc.name = "app" + std::to_string(i);
        desc.metadata = "meta-" + std::to_string(i);
        lock.images.push_back(desc);
    }
    return lock;
}

std::string relocated(size_t i) {
    return std::string(BUNDLE_REPO) + "@" + fake_digest("img" + std::to_string(i));
}

} // namespace

TEST_CASE("rewrite relocates every image when all exist in the bundle repository") {
    TempDir temp;
    write_text(lock_path(temp), serialize_images_lock(sample_lock(3)));
    FakeRegistry registry;
    for (size_t i = 0; i < 3; ++i) registry.present.insert(relocated(i));
    CapturedLog log;

    auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());

    REQUIRE(result.ok);
    CHECK(result.outcome == RewriteOutcome::Rewritten);
    CHECK(registry.exists_calls == 3);
    CHECK(log.contains("All images found in bundle repo. Updating lock file"));

    auto reread = read_images_lock(lock_path(temp));
    REQUIRE(reread.ok);
    REQUIRE(reread.lock.images.size() == 3);
    for (size_t i = 0; i < 3; ++i) {
        CAPTURE(i);
        CHECK(reread.lock.images[i].image == relocated(i));
        CHECK(reread.lock.images[i].tag == "v" + std::to_string(i));
        CHECK(reread.lock.images[i].name == "app" + std::to_string(i));
        CHECK(reread.lock.images[i].metadata == "meta-" + std::to_string(i));
    }
    CHECK(file_mode(lock_path(temp)) == 0600);
}

TEST_CASE("rewrite keeps structured metadata") {
    TempDir temp;
    write_text(lock_path(temp),
               "apiVersion: imgpkg.k14s.io/v1alpha1\n"
               "kind: ImagesLock\n"
               "spec:\n"
               "  images:\n"
               "  - image: index.docker.io/other/app0@" + fake_digest("img0") + "\n"
               "    tag: v0\n"
               "    metadata:\n"
               "      owner: team-a\n"
               "      build: 42\n"
               "  - image: index.docker.io/other/app1@" + fake_digest("img1") + "\n"
               "    metadata: [one, two]\n");
    FakeRegistry registry;
    registry.present.insert(relocated(0));
    registry.present.insert(relocated(1));
    CapturedLog log;

    auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());
    REQUIRE(result.ok);
    REQUIRE(result.outcome == RewriteOutcome::Rewritten);

    YAML::Node images = YAML::LoadFile(lock_path(temp))["spec"]["images"];
    REQUIRE(images.size() == 2);
    CHECK(images[0]["image"].as<std::string>() == relocated(0));
    REQUIRE(images[0]["metadata"].IsMap());
    CHECK(images[0]["metadata"]["owner"].as<std::string>() == "team-a");
    CHECK(images[0]["metadata"]["build"].as<int>() == 42);
    REQUIRE(images[1]["metadata"].IsSequence());
    REQUIRE(images[1]["metadata"].size() == 2);
    CHECK(images[1]["metadata"][0].as<std::string>() == "one");
    CHECK(images[1]["metadata"][1].as<std::string>() == "two");
}

TEST_CASE("rewrite is all-or-nothing whichever image is missing") {
    const size_t count = 4;
    for (size_t missing = 0; missing < count; ++missing) {
        CAPTURE(missing);

        TempDir temp;
        std::string original = serialize_images_lock(sample_lock(count));
        write_text(lock_path(temp), original);
        fs::permissions(lock_path(temp), fs::perms::owner_read | fs::perms::owner_write |
                                             fs::perms::group_read | fs::perms::others_read,
                        fs::perm_options::replace);

        FakeRegistry registry;
        for (size_t i = 0; i < count; ++i) {
            if (i != missing) registry.present.insert(relocated(i));
        }
        CapturedLog log;

        auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());

        REQUIRE(result.ok);
        CHECK(result.outcome == RewriteOutcome::Skipped);
        CHECK(read_text(lock_path(temp)) == original);
        CHECK(file_mode(lock_path(temp)) == 0644);
        CHECK(registry.exists_calls == static_cast<int>(missing + 1));
        CHECK(log.contains("One or more images not found in bundle repo. Skipping lock file update"));
        CHECK_FALSE(log.contains("Updating lock file"));
    }
}

TEST_CASE("rewrite treats a failed lookup as a missing image") {
    TempDir temp;
    std::string original = serialize_images_lock(sample_lock(2));
    write_text(lock_path(temp), original);
    FakeRegistry registry;
    registry.present.insert(relocated(0));
    registry.failing.insert(relocated(1));
    CapturedLog log;

    auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());

    REQUIRE(result.ok);
    CHECK(result.outcome == RewriteOutcome::Skipped);
    CHECK(read_text(lock_path(temp)) == original);
}

TEST_CASE("rewrite checks candidates in the bundle repository in lock order") {
    TempDir temp;
    write_text(lock_path(temp), serialize_images_lock(sample_lock(3)));
    FakeRegistry registry;
    for (size_t i = 0; i < 3; ++i) registry.present.insert(relocated(i));
    CapturedLog log;

    REQUIRE(rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger()).ok);

    std::vector<std::string> expected = {relocated(0), relocated(1), relocated(2)};
    CHECK(registry.exists_queries == expected);
}

TEST_CASE("rewrite of a lock without images touches nothing") {
    TempDir temp;
    std::string original = "apiVersion: imgpkg.k14s.io/v1alpha1\nkind: ImagesLock\nspec:\n  images: []\n";
    write_text(lock_path(temp), original);
    FakeRegistry registry;
    CapturedLog log;

    auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());

    REQUIRE(result.ok);
    CHECK(result.outcome == RewriteOutcome::NoImages);
    CHECK(registry.total_calls() == 0);
    CHECK(read_text(lock_path(temp)) == original);
    CHECK(log.text().empty());
}

TEST_CASE("rewrite reports a missing or unreadable lock file") {
    TempDir temp;
    FakeRegistry registry;
    CapturedLog log;

    auto missing = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());
    CHECK_FALSE(missing.ok);
    CHECK(missing.kind == ErrorKind::Io);
    CHECK(missing.error.rfind("Reading image lock file: ", 0) == 0);

    write_text(lock_path(temp), "spec: [broken");
    auto malformed = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());
    CHECK_FALSE(malformed.ok);
    CHECK(malformed.kind == ErrorKind::Structural);
    CHECK(malformed.error.rfind("Reading image lock file: ", 0) == 0);
    CHECK(registry.total_calls() == 0);
}

TEST_CASE("rewrite rejects entries that are not digest references") {
    TempDir temp;
    ImagesLock lock = sample_lock(2);
    lock.images[1].image = "index.docker.io/other/app:latest";
    std::string original = serialize_images_lock(lock);
    write_text(lock_path(temp), original);
    FakeRegistry registry;
    registry.present.insert(relocated(0));
    CapturedLog log;

    auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());

    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Structural);
    CHECK(result.error == "Parsing image URL: index.docker.io/other/app:latest");
    CHECK(read_text(lock_path(temp)) == original);
}

TEST_CASE("rewrite reports an invalid relocated reference as an invariant failure") {
    TempDir temp;
    ImagesLock lock = sample_lock(1);
    lock.images[0].image = "index.docker.io/other/app@sha256:abc";
    write_text(lock_path(temp), serialize_images_lock(lock));
    FakeRegistry registry;
    CapturedLog log;

    auto result = rewrite_image_lock(temp.path(), bundle_reference(), registry, log.logger());

    CHECK_FALSE(result.ok);
    CHECK(result.kind == ErrorKind::Invariant);
    CHECK(registry.exists_calls == 0);
}
