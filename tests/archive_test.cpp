#include <gtest/gtest.h>
#include "docker/archive.hpp"
#include "docker/errors.hpp"

using namespace sandkit::docker;

// NOLINTNEXTLINE
TEST(archive, writer_output_reads_back_in_order) {
    TarWriter tar;
    tar.add_parents("a/b/c.txt");
    tar.add_file("a/b/c.txt", "hello\n", 0600);
    tar.add_directory("a/empty", 0777);
    auto entries = read_tar(tar.finish());

    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].path, "a/");
    EXPECT_EQ(entries[0].type, EntryType::DIRECTORY);
    EXPECT_EQ(entries[1].path, "a/b/");
    EXPECT_EQ(entries[2].path, "a/b/c.txt");
    EXPECT_EQ(entries[2].type, EntryType::FILE);
    EXPECT_EQ(entries[2].content, "hello\n");
    EXPECT_EQ(entries[2].mode, 0600u);
    EXPECT_EQ(entries[3].path, "a/empty/");
    EXPECT_EQ(entries[3].mode, 0777u);
}

// NOLINTNEXTLINE
TEST(archive, binary_and_empty_content_survive) {
    std::string binary;
    for (int i = 0; i < 256; i++) binary.push_back(static_cast<char>(i));
    binary += std::string(3 * 1024 * 1024, '\0');

    TarWriter tar;
    tar.add_file("blob.bin", binary);
    tar.add_file("empty.txt", "");
    auto entries = read_tar(tar.finish());

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].content, binary);
    EXPECT_EQ(entries[1].content, "");
    EXPECT_EQ(entries[1].type, EntryType::FILE);
}

// NOLINTNEXTLINE
TEST(archive, pack_file_adds_parent_directories) {
    auto entries = read_tar(pack_file("x/y.py", "print(1)"));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].type, EntryType::DIRECTORY);
    EXPECT_EQ(entries[1].path, "x/y.py");
}

// NOLINTNEXTLINE
TEST(archive, long_paths_are_preserved) {
    std::string deep;
    for (int i = 0; i < 30; i++) deep += "directory" + std::to_string(i) + "/";
    deep += "file.txt";

    TarWriter tar;
    tar.add_file(deep, "x");
    auto entries = read_tar(tar.finish());
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].path, deep);
}

// NOLINTNEXTLINE
TEST(archive, finished_writer_is_unusable) {
    TarWriter tar;
    tar.add_file("a", "b");
    tar.finish();
    EXPECT_THROW(tar.add_file("c", "d"), ArchiveError);
    EXPECT_THROW(tar.finish(), ArchiveError);
}

// NOLINTNEXTLINE
TEST(archive, read_tar_handles_empty_and_garbage) {
    EXPECT_TRUE(read_tar("").empty());
    EXPECT_THROW(read_tar(std::string(1024, 'x')), ArchiveError);
}
