#include <doctest/doctest.h>
#include <imgkit/tar.hpp>

#include "test_support.hpp"

#include <sstream>

using namespace imgkit;
using namespace imgkit::testing;

namespace {

std::string field(const std::string& archive, size_t offset, size_t size) {
    std::string raw = archive.substr(offset, size);
    return raw.substr(0, raw.find('\0'));
}

} // namespace

TEST_CASE("TarWriter directory record carries normalized metadata") {
    std::ostringstream out;
    TarWriter writer(out);

    REQUIRE(writer.write_directory("config").ok);
    REQUIRE(writer.finish().ok);

    std::string archive = out.str();
    REQUIRE(archive.size() == 512 + 1024);

    CHECK(field(archive, 0, 100) == "config/");
    CHECK(field(archive, 100, 8) == "0000700");
    CHECK(field(archive, 108, 8) == "0000000");
    CHECK(field(archive, 116, 8) == "0000000");
    CHECK(field(archive, 124, 12) == "00000000000");
    CHECK(field(archive, 136, 12) == "00000000000");
    CHECK(archive[156] == '5');
    CHECK(field(archive, 257, 6) == "ustar");
    CHECK(field(archive, 265, 32).empty());
    CHECK(field(archive, 297, 32).empty());
}

TEST_CASE("TarWriter file record is padded to a block boundary") {
    std::ostringstream out;
    TarWriter writer(out);

    std::istringstream content("hello");
    REQUIRE(writer.write_file("a/b.txt", 5, content).ok);
    REQUIRE(writer.finish().ok);

    std::string archive = out.str();
    REQUIRE(archive.size() == 512 + 512 + 1024);

    CHECK(field(archive, 0, 100) == "a/b.txt");
    CHECK(field(archive, 100, 8) == "0000600");
    CHECK(field(archive, 124, 12) == "00000000005");
    CHECK(archive[156] == '0');
    CHECK(archive.substr(512, 5) == "hello");
    CHECK(archive.substr(517, 507) == std::string(507, '\0'));
    CHECK(archive.substr(1024) == std::string(1024, '\0'));
}

TEST_CASE("TarWriter output does not depend on anything but the entries") {
    auto build = []() {
        std::ostringstream out;
        TarWriter writer(out);
        std::istringstream content("same bytes");
        writer.write_directory("dir");
        writer.write_file("dir/file", 10, content);
        writer.finish();
        return out.str();
    };

    CHECK(build() == build());
}

TEST_CASE("TarWriter fails when content is shorter than the declared size") {
    std::ostringstream out;
    TarWriter writer(out);

    std::istringstream content("abc");
    auto status = writer.write_file("short.txt", 10, content);
    CHECK_FALSE(status.ok);
    CHECK(status.kind == ErrorKind::Io);
    CHECK(status.error.find("short.txt") != std::string::npos);
}

TEST_CASE("TarWriter fails when content grew past the declared size") {
    std::ostringstream out;
    TarWriter writer(out);

    std::istringstream content("abcdef");
    auto status = writer.write_file("grown.txt", 3, content);
    CHECK_FALSE(status.ok);
    CHECK(status.kind == ErrorKind::Io);
    CHECK(status.error.find("grown.txt") != std::string::npos);
}

TEST_CASE("TarWriter splits long names into ustar prefix and name") {
    std::string dir(80, 'd');
    std::string name = dir + "/" + std::string(60, 'f');

    std::ostringstream out;
    TarWriter writer(out);
    std::istringstream content("");
    REQUIRE(writer.write_file(name, 0, content).ok);
    REQUIRE(writer.finish().ok);

    std::string archive = out.str();
    CHECK(archive[156] == '0');
    CHECK(field(archive, 345, 155) == dir);
    CHECK(field(archive, 0, 100) == std::string(60, 'f'));

    std::istringstream in(archive);
    TarReader reader(in);
    auto entry = reader.next();
    REQUIRE(entry.ok);
    CHECK(entry.entry.path == name);
}

TEST_CASE("TarWriter carries names without a usable split in a PAX header") {
    std::string name(150, 'x');

    std::ostringstream out;
    TarWriter writer(out);
    std::istringstream content("data");
    REQUIRE(writer.write_file(name, 4, content).ok);
    REQUIRE(writer.finish().ok);

    std::string archive = out.str();
    CHECK(field(archive, 0, 100) == "././@PaxHeader");
    CHECK(archive[156] == 'x');
    CHECK(field(archive, 100, 8) == "0000600");
    CHECK(field(archive, 136, 12) == "00000000000");

    std::istringstream in(archive);
    TarReader reader(in);
    auto entry = reader.next();
    REQUIRE(entry.ok);
    CHECK(entry.entry.path == name);
    CHECK(entry.entry.type == TarEntryType::RegularFile);
    CHECK(entry.entry.size == 4);

    std::ostringstream data;
    REQUIRE(reader.copy_data(data).ok);
    CHECK(data.str() == "data");

    auto end = reader.next();
    REQUIRE(end.ok);
    CHECK(end.end);
}

TEST_CASE("TarReader reads back what TarWriter wrote") {
    std::ostringstream out;
    TarWriter writer(out);
    std::istringstream one("first file");
    std::istringstream two("second");
    writer.write_directory("docs");
    writer.write_file("docs/one.txt", 10, one);
    writer.write_file("two.txt", 6, two);
    writer.finish();

    std::istringstream in(out.str());
    TarReader reader(in);

    auto dir = reader.next();
    REQUIRE(dir.ok);
    CHECK(dir.entry.path == "docs");
    CHECK(dir.entry.type == TarEntryType::Directory);
    CHECK(dir.entry.mode == 0700);

    auto first = reader.next();
    REQUIRE(first.ok);
    CHECK(first.entry.path == "docs/one.txt");
    CHECK(first.entry.mode == 0600);
    CHECK(first.entry.mtime == 0);

    // Unread data is skipped by next()
    auto second = reader.next();
    REQUIRE(second.ok);
    CHECK(second.entry.path == "two.txt");
    std::ostringstream data;
    REQUIRE(reader.copy_data(data).ok);
    CHECK(data.str() == "second");

    auto end = reader.next();
    REQUIRE(end.ok);
    CHECK(end.end);
}

TEST_CASE("TarReader rejects a corrupted header checksum") {
    std::string archive = raw_tar_header("file.txt", '0', 0) + raw_tar_end();
    archive[0] = 'F';

    std::istringstream in(archive);
    TarReader reader(in);
    auto entry = reader.next();
    CHECK_FALSE(entry.ok);
    CHECK(entry.kind == ErrorKind::Structural);
    CHECK(entry.error.find("checksum") != std::string::npos);
}

TEST_CASE("TarReader reports truncated data") {
    std::string archive = raw_tar_header("file.txt", '0', 100) + std::string(10, 'a');

    std::istringstream in(archive);
    TarReader reader(in);
    auto entry = reader.next();
    REQUIRE(entry.ok);

    std::ostringstream data;
    auto copied = reader.copy_data(data);
    CHECK_FALSE(copied.ok);
    CHECK(copied.kind == ErrorKind::Structural);
}

TEST_CASE("TarReader classifies links and strips leading ./") {
    std::string archive = raw_tar_header("./link", '2', 0, "target") +
                          raw_tar_header("hard", '1', 0, "link") +
                          raw_tar_header("./dir/", '5', 0) +
                          raw_tar_end();

    std::istringstream in(archive);
    TarReader reader(in);

    auto symlink = reader.next();
    REQUIRE(symlink.ok);
    CHECK(symlink.entry.path == "link");
    CHECK(symlink.entry.type == TarEntryType::Symlink);
    CHECK(symlink.entry.link_target == "target");

    auto hardlink = reader.next();
    REQUIRE(hardlink.ok);
    CHECK(hardlink.entry.type == TarEntryType::Hardlink);

    auto dir = reader.next();
    REQUIRE(dir.ok);
    CHECK(dir.entry.path == "dir");
    CHECK(dir.entry.type == TarEntryType::Directory);
}

TEST_CASE("TarReader applies GNU long names and skips PAX global headers") {
    std::string long_name = std::string(120, 'n') + ".txt";
    std::string global_record = "15 comment=abc\n";

    std::string archive = raw_tar_header("pax_global_header", 'g', global_record.size()) +
                          raw_tar_data(global_record) +
                          raw_tar_header("././@LongLink", 'L', long_name.size() + 1) +
                          raw_tar_data(long_name + std::string(1, '\0')) +
                          raw_tar_header("truncated", '0', 3) +
                          raw_tar_data("abc") +
                          raw_tar_end();

    std::istringstream in(archive);
    TarReader reader(in);

    auto entry = reader.next();
    REQUIRE(entry.ok);
    CHECK(entry.entry.path == long_name);
    std::ostringstream data;
    REQUIRE(reader.copy_data(data).ok);
    CHECK(data.str() == "abc");

    auto end = reader.next();
    REQUIRE(end.ok);
    CHECK(end.end);
}
