#include <gtest/gtest.h>
#include "metafile_writer.h"
#include "test_helpers.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#include <unistd.h>
#endif

using namespace qtm;

class MetafileWriterTest : public test::TempDirTest {
protected:
    // Names in the scratch directory other than @p keep
    std::vector<std::string> stray_entries(const std::string& keep) {
        std::vector<DirectoryEntry> entries;
        list_directory(test_dir_, entries);
        std::vector<std::string> names;
        for (const auto& entry : entries) {
            if (entry.name != keep) names.push_back(entry.name);
        }
        return names;
    }
};

TEST_F(MetafileWriterTest, WritesExactBytes) {
    std::string target = path_of("out.torrent");
    std::vector<uint8_t> data = {'d', '4', ':', 'i', 'n', 'f', 'o', 'i', '1', 'e', 'e'};

    TorrentCreateError error;
    ASSERT_TRUE(write_metafile(target, data, &error)) << error.message;

    std::vector<uint8_t> read_back;
    ASSERT_TRUE(read_file_bytes(target, read_back));
    EXPECT_EQ(read_back, data);
    EXPECT_TRUE(stray_entries("out.torrent").empty());
}

TEST_F(MetafileWriterTest, ReplacesExistingFile) {
    std::string target = create_test_file("out.torrent", "previous contents that are longer");
    std::vector<uint8_t> data = {'n', 'e', 'w'};

    ASSERT_TRUE(write_metafile(target, data));
    EXPECT_EQ(read_file_text_cpp(target), "new");
    EXPECT_TRUE(stray_entries("out.torrent").empty());
}

TEST_F(MetafileWriterTest, EmptyTargetIsIoError) {
    TorrentCreateError error;
    EXPECT_FALSE(write_metafile("", {'x'}, &error));
    EXPECT_EQ(error.code, TorrentCreateErrorCode::IoError);
}

TEST_F(MetafileWriterTest, DirectoryTargetIsIoError) {
    ASSERT_TRUE(create_directories(path_of("dir.torrent")));

    TorrentCreateError error;
    EXPECT_FALSE(write_metafile(path_of("dir.torrent"), {'x'}, &error));
    EXPECT_EQ(error.code, TorrentCreateErrorCode::IoError);
    EXPECT_EQ(error.path, path_of("dir.torrent"));
    EXPECT_TRUE(is_directory(path_of("dir.torrent")));
}

TEST_F(MetafileWriterTest, MissingParentDirectoryIsIoError) {
    std::string target = path_of("no/such/dir/out.torrent");

    TorrentCreateError error;
    EXPECT_FALSE(write_metafile(target, {'x'}, &error));
    EXPECT_EQ(error.code, TorrentCreateErrorCode::IoError);
    EXPECT_EQ(error.path, target);
    EXPECT_NE(error.message.find(strerror(ENOENT)), std::string::npos) << error.message;
    EXPECT_FALSE(file_exists(target));
}

#ifndef _WIN32
TEST_F(MetafileWriterTest, ReadOnlyDirectoryLeavesNothingBehind) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }

    ASSERT_TRUE(create_directories(path_of("locked")));
    ASSERT_EQ(chmod(path_of("locked").c_str(), 0555), 0);

    TorrentCreateError error;
    bool ok = write_metafile(path_of("locked/out.torrent"), {'x'}, &error);

    std::vector<DirectoryEntry> entries;
    list_directory(path_of("locked"), entries);
    chmod(path_of("locked").c_str(), 0755);

    EXPECT_FALSE(ok);
    EXPECT_EQ(error.code, TorrentCreateErrorCode::IoError);
    EXPECT_TRUE(entries.empty());
}
#endif

TEST_F(MetafileWriterTest, FormatSize) {
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(512), "512 B");
    EXPECT_EQ(format_size(1023), "1023 B");
    EXPECT_EQ(format_size(1024), "1.00 KiB");
    EXPECT_EQ(format_size(1536 * 1024), "1.50 MiB");
    EXPECT_EQ(format_size(static_cast<int64_t>(3) * 1024 * 1024 * 1024), "3.00 GiB");
    EXPECT_EQ(format_size(static_cast<int64_t>(2) * 1024 * 1024 * 1024 * 1024 * 1024), "2048.00 TiB");
}

TEST_F(MetafileWriterTest, DefaultOutputName) {
    EXPECT_EQ(default_output_name(1700000000), "qtm-1700000000.torrent");
    EXPECT_EQ(default_output_name(0), "qtm-0.torrent");
}

TEST_F(MetafileWriterTest, SummaryFromInfo) {
    InfoDictionary info;
    info.name = "album";
    info.piece_length = 16384;
    info.files.emplace_back(std::vector<std::string>{"a"}, 20000, 0);
    info.files.emplace_back(std::vector<std::string>{"b"}, 1000, 20000);
    info.pieces.assign(40, 'x');

    InfoHash hash = hex_to_info_hash("a9993e364706816aba3e25717850c26c9cd0d89d");
    TorrentSummary summary = make_summary(info, hash, "/tmp/album.torrent");

    EXPECT_EQ(summary.name, "album");
    EXPECT_EQ(summary.info_hash, hash);
    EXPECT_EQ(summary.info_hash_hex, "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(summary.info_hash_base32, "VGMT4NSHA2AWVOR6EVYXQUGCNSONBWE5");
    EXPECT_EQ(summary.total_length, 21000);
    EXPECT_EQ(summary.piece_length, 16384);
    EXPECT_EQ(summary.piece_count, 2);
    EXPECT_EQ(summary.file_count, 2);

    std::string text = summary.to_string();
    EXPECT_NE(text.find("Name:         album"), std::string::npos);
    EXPECT_NE(text.find("a9993e364706816aba3e25717850c26c9cd0d89d"), std::string::npos);
    EXPECT_NE(text.find("VGMT4NSHA2AWVOR6EVYXQUGCNSONBWE5"), std::string::npos);
    EXPECT_NE(text.find("2 x 16.00 KiB"), std::string::npos);
    EXPECT_NE(text.find("Written to:   /tmp/album.torrent"), std::string::npos);

    summary.output_path.clear();
    EXPECT_EQ(summary.to_string().find("Written to:"), std::string::npos);
}
