#include <gtest/gtest.h>
#include "torrent_creator.h"
#include "bencode.h"
#include "sha1.h"
#include "test_helpers.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace qtm;

//=============================================================================
// Test Fixture
//=============================================================================

class TorrentCreatorTest : public test::TempDirTest {
protected:
    // Config with fixed metadata so outputs are reproducible
    static TorrentCreatorConfig fixed_config() {
        TorrentCreatorConfig config;
        config.creation_date = 1700000000;
        config.created_by = "qtm test";
        config.comment.clear();
        return config;
    }

    BencodeValue decode_file(const std::string& path) {
        std::vector<uint8_t> bytes;
        EXPECT_TRUE(read_file_bytes(path, bytes));
        return bencode::decode(bytes);
    }

    std::vector<std::string> dir_names() {
        std::vector<DirectoryEntry> entries;
        list_directory(test_dir_, entries);
        std::vector<std::string> names;
        for (const auto& entry : entries) names.push_back(entry.name);
        return names;
    }
};

//=============================================================================
// Defaults
//=============================================================================

TEST_F(TorrentCreatorTest, DefaultConfig) {
    TorrentCreatorConfig config;
    EXPECT_EQ(config.piece_size, 0);
    EXPECT_FALSE(config.is_private);
    EXPECT_TRUE(config.include_hidden_files);
    EXPECT_EQ(config.encoding, "UTF-8");
    EXPECT_NE(config.creation_date, 0);
    EXPECT_EQ(config.created_by, default_created_by());
    EXPECT_EQ(config.comment, "This torrent was created by " + default_created_by());
    EXPECT_NE(default_created_by().find("Quick Torrent Maker"), std::string::npos);
}

//=============================================================================
// Basic Tests
//=============================================================================

TEST_F(TorrentCreatorTest, CreateFromSingleFile) {
    std::string file_path = create_test_file("single_file.txt", 10000);

    TorrentCreator creator(file_path, fixed_config());
    EXPECT_EQ(creator.name(), "single_file.txt");

    TorrentCreateError error;
    ASSERT_TRUE(creator.set_piece_hashes(nullptr, nullptr, &error)) << error.message;
    EXPECT_EQ(creator.num_files(), 1);
    EXPECT_EQ(creator.total_size(), 10000);
    EXPECT_EQ(creator.num_pieces(), 1);
    EXPECT_EQ(creator.piece_hashes().size(), 20);

    std::vector<uint8_t> data = creator.generate(&error);
    ASSERT_FALSE(data.empty()) << error.message;

    BencodeValue dict = bencode::decode(data);
    const BencodeValue& info = dict["info"];
    EXPECT_EQ(info["name"].as_string(), "single_file.txt");
    EXPECT_EQ(info["length"].as_integer(), 10000);
    EXPECT_EQ(info["piece length"].as_integer(), 16384);
    EXPECT_FALSE(info.has_key("files"));

    std::string content = pattern(10000);
    PieceDigest digest = SHA1::digest(reinterpret_cast<const uint8_t*>(content.data()), content.size());
    EXPECT_EQ(info["pieces"].as_string(), std::string(digest.begin(), digest.end()));
}

TEST_F(TorrentCreatorTest, CreateFromDirectory) {
    create_test_file("content/b.txt", 3000, 1);
    create_test_file("content/a/x.bin", 20000, 2);
    create_test_file("content/empty.txt", "");

    TorrentCreator creator(path_of("content"), fixed_config());
    TorrentCreateError error;
    ASSERT_TRUE(creator.set_piece_hashes(nullptr, nullptr, &error)) << error.message;

    BencodeValue dict = bencode::decode(creator.generate());
    const BencodeValue& info = dict["info"];
    EXPECT_EQ(info["name"].as_string(), "content");
    EXPECT_FALSE(info.has_key("length"));

    const BencodeList& files = info["files"].as_list();
    ASSERT_EQ(files.size(), 3);
    EXPECT_EQ(files[0]["path"].as_list()[0].as_string(), "a");
    EXPECT_EQ(files[0]["path"].as_list()[1].as_string(), "x.bin");
    EXPECT_EQ(files[1]["path"].as_list()[0].as_string(), "b.txt");
    EXPECT_EQ(files[2]["path"].as_list()[0].as_string(), "empty.txt");
    EXPECT_EQ(files[2]["length"].as_integer(), 0);

    // Stream is a/x.bin then b.txt; 23000 bytes in two 16 KiB pieces
    std::string stream = pattern(20000, 2) + pattern(3000, 1);
    std::string expected;
    for (size_t pos = 0; pos < stream.size(); pos += 16384) {
        size_t len = (std::min)(static_cast<size_t>(16384), stream.size() - pos);
        PieceDigest d = SHA1::digest(reinterpret_cast<const uint8_t*>(stream.data() + pos), len);
        expected.append(d.begin(), d.end());
    }
    EXPECT_EQ(info["pieces"].as_string(), expected);
}

TEST_F(TorrentCreatorTest, CreateWritesFileAndSummary) {
    create_test_file("content/file.bin", 50000);
    std::string output = path_of("out.torrent");

    TorrentCreatorConfig config = fixed_config();
    config.announce = std::string("http://tracker.example/announce");

    std::vector<HashProgress> progress;
    TorrentCreateError error;
    auto summary = create_torrent(path_of("content"), output, config,
        [&](const HashProgress& p) { progress.push_back(p); }, nullptr, &error);
    ASSERT_TRUE(summary.has_value()) << error.message;

    EXPECT_EQ(summary->name, "content");
    EXPECT_EQ(summary->total_length, 50000);
    EXPECT_EQ(summary->piece_count, 4);
    EXPECT_EQ(summary->file_count, 1);
    EXPECT_EQ(summary->output_path, output);
    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.back().pieces_done, 4);

    BencodeValue dict = decode_file(output);
    EXPECT_EQ(dict["announce"].as_string(), "http://tracker.example/announce");
    EXPECT_EQ(dict["creation date"].as_integer(), 1700000000);
    EXPECT_EQ(dict["created by"].as_string(), "qtm test");
    EXPECT_FALSE(dict.has_key("comment"));
    EXPECT_EQ(SHA1::digest(dict["info"].encode()), summary->info_hash);
}

TEST_F(TorrentCreatorTest, SameContentSameInfoHash) {
    create_test_file("one/data/f1", 30000, 5);
    create_test_file("one/data/f2", 70000, 6);
    create_test_file("two/data/f1", 30000, 5);
    create_test_file("two/data/f2", 70000, 6);

    TorrentCreatorConfig a = fixed_config();
    a.num_threads = 1;
    TorrentCreatorConfig b = fixed_config();
    b.num_threads = 4;
    b.comment = "outer fields do not matter";
    b.creation_date = 42;

    TorrentCreator first(path_of("one/data"), a);
    TorrentCreator second(path_of("two/data"), b);
    ASSERT_TRUE(first.set_piece_hashes());
    ASSERT_TRUE(second.set_piece_hashes());

    EXPECT_EQ(first.info_hash(), second.info_hash());
    EXPECT_FALSE(is_zero_hash(first.info_hash()));
    EXPECT_EQ(first.info_hash_hex(), info_hash_to_hex(first.info_hash()));
}

TEST_F(TorrentCreatorTest, GenerateIsDeterministic) {
    create_test_file("content/a", 40000);

    TorrentCreator creator(path_of("content"), fixed_config());
    ASSERT_TRUE(creator.set_piece_hashes());
    EXPECT_EQ(creator.generate(), creator.generate());
}

TEST_F(TorrentCreatorTest, PrivateFlagChangesInfoHash) {
    create_test_file("content/a", 40000);

    TorrentCreator creator(path_of("content"), fixed_config());
    ASSERT_TRUE(creator.set_piece_hashes());
    InfoHash public_hash = creator.info_hash();

    creator.set_private(true);
    InfoHash private_hash = creator.info_hash();
    EXPECT_NE(public_hash, private_hash);

    BencodeValue dict = bencode::decode(creator.generate());
    EXPECT_EQ(dict["info"]["private"].as_integer(), 1);
}

TEST_F(TorrentCreatorTest, ManualPieceSize) {
    create_test_file("content/a", 100000);

    TorrentCreatorConfig config = fixed_config();
    config.piece_size = 32768;

    TorrentCreator creator(path_of("content"), config);
    ASSERT_TRUE(creator.set_piece_hashes());
    EXPECT_EQ(creator.files().piece_length(), 32768);
    EXPECT_EQ(creator.num_pieces(), 4);
}

TEST_F(TorrentCreatorTest, InvalidPieceSizeIsRejected) {
    create_test_file("content/a", 100000);

    TorrentCreator creator(path_of("content"), fixed_config());
    creator.set_piece_size(100000);

    TorrentCreateError error;
    EXPECT_FALSE(creator.set_piece_hashes(nullptr, nullptr, &error));
    EXPECT_EQ(error.code, TorrentCreateErrorCode::InvalidSize);
    EXPECT_FALSE(creator.has_piece_hashes());
}

TEST_F(TorrentCreatorTest, ZeroByteContentIsInvalidSize) {
    create_test_file("content/empty1", "");
    create_test_file("content/empty2", "");

    TorrentCreateError error;
    auto summary = create_torrent(path_of("content"), path_of("out.torrent"), fixed_config(),
                                  nullptr, nullptr, &error);
    EXPECT_FALSE(summary.has_value());
    EXPECT_EQ(error.code, TorrentCreateErrorCode::InvalidSize);
    EXPECT_FALSE(file_exists(path_of("out.torrent")));
}

TEST_F(TorrentCreatorTest, EmptyDirectoryIsEmptyInput) {
    ASSERT_TRUE(create_directories(path_of("content")));

    TorrentCreateError error;
    EXPECT_TRUE(create_torrent_data(path_of("content"), fixed_config(), nullptr, nullptr, &error).empty());
    EXPECT_EQ(error.code, TorrentCreateErrorCode::EmptyInput);
}

TEST_F(TorrentCreatorTest, MissingPathIsIoError) {
    TorrentCreateError error;
    EXPECT_TRUE(create_torrent_data(path_of("missing"), fixed_config(), nullptr, nullptr, &error).empty());
    EXPECT_EQ(error.code, TorrentCreateErrorCode::IoError);
}

TEST_F(TorrentCreatorTest, CancelLeavesNoOutput) {
    create_test_file("content/a", 200000);
    std::string output = path_of("out.torrent");

    CancellationToken cancel;
    TorrentCreateError error;
    auto summary = create_torrent(path_of("content"), output, fixed_config(),
        [&](const HashProgress&) { cancel.cancel(); }, &cancel, &error);

    // The token is checked once more before writing, so even a run whose
    // hashing finished first must not produce a file
    EXPECT_FALSE(summary.has_value());
    EXPECT_EQ(error.code, TorrentCreateErrorCode::Cancelled);
    EXPECT_EQ(dir_names(), std::vector<std::string>{"content"});
}

TEST_F(TorrentCreatorTest, ParallelCancelDuringHashingLeavesNoOutput) {
    create_test_file("content/big.bin", 64 * 1024 * 1024, 5);
    std::string output = path_of("out.torrent");

    TorrentCreatorConfig config = fixed_config();
    config.piece_size = 16 * 1024;
    config.num_threads = 4;

    const int descriptors_before = open_descriptor_count();

    CancellationToken cancel;
    HashProgress last;
    TorrentCreateError error;
    auto summary = create_torrent(path_of("content"), output, config,
        [&](const HashProgress& p) {
            last = p;
            if (p.pieces_done >= 10) cancel.cancel();
        }, &cancel, &error);

    EXPECT_FALSE(summary.has_value());
    EXPECT_EQ(error.code, TorrentCreateErrorCode::Cancelled);
    EXPECT_EQ(last.total_pieces, 4096u);
    EXPECT_LT(last.pieces_done, last.total_pieces);

    // Neither the target nor a leftover temp file
    EXPECT_EQ(dir_names(), std::vector<std::string>{"content"});
    if (descriptors_before >= 0) {
        EXPECT_EQ(open_descriptor_count(), descriptors_before);
    }
}

TEST_F(TorrentCreatorTest, ThirtyTwoMiBAtOneMiBPieces) {
    const size_t size = 32 * 1024 * 1024;
    const uint32_t piece_length = 1024 * 1024;
    create_test_file("big.iso", size, 3);
    const std::string stream = pattern(size, 3);

    TorrentCreatorConfig config = fixed_config();
    config.piece_size = piece_length;
    config.num_threads = 4;

    TorrentCreateError error;
    std::vector<uint8_t> data = create_torrent_data(path_of("big.iso"), config, nullptr, nullptr, &error);
    ASSERT_FALSE(data.empty()) << error.message;

    BencodeValue torrent = bencode::decode(data);
    const BencodeValue& info = torrent["info"];
    EXPECT_EQ(info["name"].as_string(), "big.iso");
    EXPECT_EQ(info["length"].as_integer(), static_cast<int64_t>(size));
    EXPECT_EQ(info["piece length"].as_integer(), 1048576);

    const std::string& pieces = info["pieces"].as_string();
    ASSERT_EQ(pieces.size(), 640u);

    for (size_t i = 0; i < 32; ++i) {
        PieceDigest expected = SHA1::digest(
            reinterpret_cast<const uint8_t*>(stream.data() + i * piece_length), piece_length);
        EXPECT_EQ(pieces.compare(i * QTM_DIGEST_SIZE, QTM_DIGEST_SIZE,
                                 reinterpret_cast<const char*>(expected.data()), QTM_DIGEST_SIZE), 0)
            << "piece " << i;
    }
}

TEST_F(TorrentCreatorTest, GenerateBeforeHashingFails) {
    create_test_file("content/a", 100);

    TorrentCreator creator(path_of("content"), fixed_config());
    TorrentCreateError error;
    EXPECT_TRUE(creator.generate(&error).empty());
    EXPECT_EQ(error.code, TorrentCreateErrorCode::Encoding);
    EXPECT_TRUE(is_zero_hash(creator.info_hash()));
    EXPECT_FALSE(creator.summary().has_value());
}

//=============================================================================
// Trackers and Seeds
//=============================================================================

TEST_F(TorrentCreatorTest, TrackersAccumulateInOrder) {
    create_test_file("content/a", 100);

    TorrentCreator creator(path_of("content"), fixed_config());
    creator.add_tracker("http://one.example/announce");
    EXPECT_TRUE(std::holds_alternative<std::string>(creator.announce()));

    creator.add_tracker("udp://two.example:6969");
    creator.add_tracker("http://one.example/announce");
    creator.add_tracker("");
    EXPECT_EQ(creator.trackers(),
              (std::vector<std::string>{"http://one.example/announce", "udp://two.example:6969"}));

    ASSERT_TRUE(creator.set_piece_hashes());
    BencodeValue dict = bencode::decode(creator.generate());
    EXPECT_EQ(dict["announce"].as_string(), "http://one.example/announce");
    ASSERT_EQ(dict["announce-list"].size(), 2);
    EXPECT_EQ(dict["announce-list"].as_list()[1].as_list()[0].as_string(), "udp://two.example:6969");

    creator.clear_trackers();
    EXPECT_TRUE(creator.trackers().empty());
    dict = bencode::decode(creator.generate());
    EXPECT_FALSE(dict.has_key("announce"));
}

TEST_F(TorrentCreatorTest, WebSeeds) {
    create_test_file("content/a", 100);

    TorrentCreatorConfig config = fixed_config();
    config.web_seeds = {"http://seed.example/", "http://seed.example/", "http://mirror.example/"};

    TorrentCreator creator(path_of("content"), config);
    EXPECT_EQ(creator.url_seeds().size(), 2);

    ASSERT_TRUE(creator.set_piece_hashes());
    BencodeValue dict = bencode::decode(creator.generate());
    ASSERT_TRUE(dict["url-list"].is_list());
    EXPECT_EQ(dict["url-list"].as_list()[0].as_string(), "http://seed.example/");
}

//=============================================================================
// Scanning
//=============================================================================

TEST_F(TorrentCreatorTest, ExcludeHiddenFiles) {
    create_test_file("content/.secret", 100);
    create_test_file("content/visible", 100);

    TorrentCreatorConfig config = fixed_config();
    config.include_hidden_files = false;

    TorrentCreator creator(path_of("content"), config);
    ASSERT_TRUE(creator.scan_files());
    ASSERT_EQ(creator.num_files(), 1);
    EXPECT_EQ(creator.files().file_at(0).path_string(), "visible");
}

TEST_F(TorrentCreatorTest, ScanWithFilterKeepsName) {
    create_test_file("content/keep.txt", 100);
    create_test_file("content/skip.tmp", 100);

    TorrentCreator creator(path_of("content"), fixed_config());
    creator.set_name("renamed");

    ASSERT_TRUE(creator.scan_files([](const std::string& path) {
        return path.find(".tmp") == std::string::npos;
    }));
    EXPECT_EQ(creator.name(), "renamed");
    EXPECT_EQ(creator.num_files(), 1);

    // Pre-scanned files are not walked again
    ASSERT_TRUE(creator.set_piece_hashes());
    EXPECT_EQ(creator.num_files(), 1);

    BencodeValue dict = bencode::decode(creator.generate());
    EXPECT_EQ(dict["info"]["name"].as_string(), "renamed");
}

TEST_F(TorrentCreatorTest, CustomStorage) {
    create_test_file("content/a.bin", 5000, 1);
    create_test_file("content/b.bin", 5000, 2);
    create_test_file("content/c.bin", 5000, 3);

    FileStorage storage;
    storage.set_name("picked");
    storage.add_file("c.bin", 5000);
    storage.add_file("a.bin", 5000);

    TorrentCreator creator(std::move(storage), path_of("content"), fixed_config());
    TorrentCreateError error;
    ASSERT_TRUE(creator.set_piece_hashes(nullptr, nullptr, &error)) << error.message;
    EXPECT_EQ(creator.name(), "picked");
    EXPECT_EQ(creator.total_size(), 10000);

    std::string stream = pattern(5000, 3) + pattern(5000, 1);
    PieceDigest digest = SHA1::digest(reinterpret_cast<const uint8_t*>(stream.data()), stream.size());
    EXPECT_EQ(creator.piece_hashes(), std::string(digest.begin(), digest.end()));
}

TEST_F(TorrentCreatorTest, SaveToFileReplacesAtomically) {
    create_test_file("content/a", 1000);
    std::string output = create_test_file("out.torrent", "old");

    TorrentCreator creator(path_of("content"), fixed_config());
    ASSERT_TRUE(creator.set_piece_hashes());
    ASSERT_TRUE(creator.save_to_file(output));

    std::vector<uint8_t> bytes;
    ASSERT_TRUE(read_file_bytes(output, bytes));
    EXPECT_EQ(bytes, creator.generate());

    auto names = dir_names();
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"content", "out.torrent"}));
}
