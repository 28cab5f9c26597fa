#include <doctest/doctest.h>
#include <imgkit/digest.hpp>

#include "test_support.hpp"

using namespace imgkit;
using namespace imgkit::testing;

TEST_CASE("digest_of_bytes produces prefixed lowercase sha256") {
    auto result = digest_of_bytes("abc");
    REQUIRE(result.ok);
    CHECK(result.digest == "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(result.size == 3);

    auto empty = digest_of_bytes("");
    REQUIRE(empty.ok);
    CHECK(empty.digest == "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("digest_of_file matches digest_of_bytes") {
    TempDir temp;
    std::string content(100000, 'q');
    write_text(temp / "blob", content);

    auto from_file = digest_of_file(temp / "blob");
    REQUIRE(from_file.ok);
    CHECK(from_file.digest == digest_of_bytes(content).digest);
    CHECK(from_file.size == content.size());

    auto missing = digest_of_file(temp / "missing");
    CHECK_FALSE(missing.ok);
    CHECK(missing.kind == ErrorKind::Io);
}

TEST_CASE("is_valid_digest") {
    CHECK(is_valid_digest(fake_digest("x")));
    CHECK_FALSE(is_valid_digest("sha256:abc"));
    CHECK_FALSE(is_valid_digest("sha512:" + std::string(64, 'a')));
    CHECK_FALSE(is_valid_digest("sha256:" + std::string(64, 'A')));
    CHECK_FALSE(is_valid_digest(""));
}
