#include <gtest/gtest.h>
#include "fs.h"
#include "test_helpers.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <string>

#ifndef _WIN32
#include <unistd.h>
#endif

using namespace qtm;

class FSTest : public test::TempDirTest {};

TEST_F(FSTest, BasicFileOperations) {
    std::string path = path_of("test_file.txt");

    EXPECT_FALSE(file_exists(path));
    EXPECT_TRUE(create_file(path, "Hello, World!"));
    EXPECT_TRUE(file_exists(path));
    EXPECT_TRUE(is_file(path));
    EXPECT_FALSE(is_directory(path));
    EXPECT_EQ(get_file_size(path), 13);
    EXPECT_EQ(read_file_text_cpp(path), "Hello, World!");

    EXPECT_TRUE(delete_file(path));
    EXPECT_FALSE(file_exists(path));
}

TEST_F(FSTest, BinaryFileOperations) {
    std::string path = path_of("test_binary.bin");
    const uint8_t data[] = {0x00, 0x01, 0xFF, 0x00, 0x7F};

    ASSERT_TRUE(create_file_binary(path.c_str(), data, sizeof(data)));

    std::vector<uint8_t> read_back;
    ASSERT_TRUE(read_file_bytes(path, read_back));
    EXPECT_EQ(read_back, std::vector<uint8_t>(data, data + sizeof(data)));
}

TEST_F(FSTest, ReadMissingFileFails) {
    std::vector<uint8_t> out = {1, 2, 3};
    EXPECT_FALSE(read_file_bytes(path_of("missing.bin"), out));
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(get_file_size(path_of("missing.bin")), -1);
}

TEST_F(FSTest, DirectoryOperations) {
    std::string nested = path_of("a/b/c");
    EXPECT_TRUE(create_directories(nested));
    EXPECT_TRUE(directory_exists(nested));
    EXPECT_TRUE(is_directory(nested));

    create_test_file("a/b/c/file.txt", "x");
    EXPECT_TRUE(delete_directory_recursive(path_of("a")));
    EXPECT_FALSE(directory_exists(path_of("a")));
}

TEST_F(FSTest, CreateDirectoriesIsIdempotent) {
    std::string nested = path_of("x/y");
    ASSERT_TRUE(create_directories(nested));
    EXPECT_TRUE(create_directories(nested));
    EXPECT_TRUE(create_directories(path_of("x")));

    // A regular file in the way cannot become a directory
    create_test_file("blocker", "data");
    EXPECT_FALSE(create_directories(path_of("blocker/sub")));
}

TEST_F(FSTest, DeleteDirectoryRecursiveClearsSiblings) {
    create_test_file("tree/one.txt", "1");
    create_test_file("tree/sub/two.txt", "2");
    create_test_file("tree/sub/deeper/three.txt", "3");
    ASSERT_TRUE(create_directories(path_of("tree/empty")));

    EXPECT_TRUE(delete_directory_recursive(path_of("tree")));
    EXPECT_FALSE(directory_exists(path_of("tree")));
    EXPECT_FALSE(delete_directory_recursive(path_of("tree")));
}

TEST_F(FSTest, DirectoryListingOperations) {
    create_test_file("file1.txt", "one");
    create_test_file("file2.bin", std::string(100, 'x'));
    create_directories(path_of("subdir"));

    std::vector<DirectoryEntry> entries;
    ASSERT_TRUE(list_directory(test_dir_, entries));
    ASSERT_EQ(entries.size(), 3);

    std::sort(entries.begin(), entries.end(),
        [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });

    EXPECT_EQ(entries[0].name, "file1.txt");
    EXPECT_TRUE(entries[0].is_regular);
    EXPECT_EQ(entries[0].size, 3);
    EXPECT_EQ(entries[0].path, path_of("file1.txt"));

    EXPECT_EQ(entries[1].name, "file2.bin");
    EXPECT_EQ(entries[1].size, 100);

    EXPECT_EQ(entries[2].name, "subdir");
    EXPECT_TRUE(entries[2].is_directory);
    EXPECT_FALSE(entries[2].is_regular);
}

TEST_F(FSTest, ListMissingDirectoryFails) {
    std::vector<DirectoryEntry> entries;
    EXPECT_FALSE(list_directory(path_of("nope"), entries));
}

#ifndef _WIN32
TEST_F(FSTest, SymlinksAreReportedNotFollowed) {
    create_test_file("target.txt", "data");
    ASSERT_EQ(symlink("target.txt", path_of("link.txt").c_str()), 0);

    EXPECT_TRUE(is_symlink(path_of("link.txt")));
    EXPECT_FALSE(is_symlink(path_of("target.txt")));

    std::vector<DirectoryEntry> entries;
    ASSERT_TRUE(list_directory(test_dir_, entries));
    auto it = std::find_if(entries.begin(), entries.end(),
        [](const DirectoryEntry& e) { return e.name == "link.txt"; });
    ASSERT_NE(it, entries.end());
    EXPECT_TRUE(it->is_symlink);
    EXPECT_FALSE(it->is_regular);
}
#endif

TEST_F(FSTest, RenameReplacesExistingTarget) {
    std::string from = create_test_file("old.txt", "new content");
    std::string to = create_test_file("new.txt", "old content");

    EXPECT_TRUE(rename_file(from, to));
    EXPECT_FALSE(file_exists(from));
    EXPECT_EQ(read_file_text_cpp(to), "new content");
}

#ifndef _WIN32
TEST_F(FSTest, RenameFailureKeepsErrno) {
    // The failure is logged; errno must still describe the rename
    errno = 0;
    EXPECT_FALSE(rename_file(path_of("missing.txt"), path_of("target.txt")));
    EXPECT_EQ(errno, ENOENT);
    EXPECT_FALSE(file_exists(path_of("target.txt")));
}
#endif

TEST_F(FSTest, FlushFileToDisk) {
    std::string path = path_of("flushed.bin");
    FILE* file = fopen(path.c_str(), "wb");
    ASSERT_NE(file, nullptr);
    fputs("abc", file);
    EXPECT_TRUE(flush_file_to_disk(file));
    fclose(file);
    EXPECT_EQ(get_file_size(path), 3);

    EXPECT_FALSE(flush_file_to_disk(nullptr));
}

TEST_F(FSTest, PathUtilities) {
    EXPECT_EQ(get_filename_from_path("dir/sub/file.txt"), "file.txt");
    EXPECT_EQ(get_filename_from_path("dir/sub/"), "sub");
    EXPECT_EQ(get_filename_from_path("file.txt"), "file.txt");

    EXPECT_EQ(get_parent_directory("dir/sub/file.txt"), "dir/sub");
    EXPECT_EQ(get_parent_directory("/file.txt"), "/");
    EXPECT_EQ(get_parent_directory("file.txt"), "");

    EXPECT_EQ(combine_paths("dir", "file"), "dir/file");
    EXPECT_EQ(combine_paths("dir/", "file"), "dir/file");
    EXPECT_EQ(combine_paths("", "file"), "file");
    EXPECT_EQ(combine_paths("dir", ""), "dir");
}

TEST_F(FSTest, AbsolutePath) {
    create_test_file("abs.txt", "x");
    std::string resolved = absolute_path(path_of("abs.txt"));
    EXPECT_FALSE(resolved.empty());
    EXPECT_EQ(get_filename_from_path(resolved), "abs.txt");
    EXPECT_TRUE(absolute_path(path_of("does/not/exist")).empty());
}

TEST_F(FSTest, TempPathsAreUniqueSiblings) {
    std::string target = path_of("out.torrent");
    std::string a = make_temp_path(target);
    std::string b = make_temp_path(target);

    EXPECT_NE(a, b);
    EXPECT_EQ(a.compare(0, target.size(), target), 0);
    EXPECT_EQ(a.substr(a.size() - 4), ".tmp");
    EXPECT_EQ(get_parent_directory(a), get_parent_directory(target));
}
