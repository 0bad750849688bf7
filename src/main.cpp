#include "torrent_creator.h"
#include "creator_config.h"
#include "metafile_writer.h"
#include "bencode.h"
#include "sha1.h"
#include "fs.h"
#include "version.h"
#include "logger.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_CANCELLED = 130;

std::atomic<bool>* g_cancel_flag = nullptr;

void handle_interrupt(int) {
    if (g_cancel_flag) {
        g_cancel_flag->store(true);
    }
}

struct CommandLine {
    std::string content_path;
    std::string output_path;
    std::string config_path;
    std::vector<std::string> announce;
    std::vector<std::string> web_seeds;
    std::optional<std::string> comment;
    std::optional<std::string> created_by;
    std::optional<uint32_t> piece_size;
    std::optional<unsigned> threads;
    std::optional<std::string> log_level;
    bool is_private = false;
    bool exclude_hidden = false;
    bool no_date = false;
    bool verify = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <file or directory>\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -a, --announce <url>     Tracker URL (repeat for several, tried in order)\n";
    std::cout << "  -w, --web-seed <url>     Web seed URL (repeatable)\n";
    std::cout << "  -o, --output <file>      Output path (default: qtm-<timestamp>.torrent)\n";
    std::cout << "  -p, --private            Set the private flag\n";
    std::cout << "  -c, --comment <text>     Comment (default: \"This torrent was created by ...\")\n";
    std::cout << "      --created-by <text>  Creator string\n";
    std::cout << "      --no-date            Omit the creation date\n";
    std::cout << "  -l, --piece-size <size>  Piece size, e.g. 262144, 256K, 1M (default: automatic)\n";
    std::cout << "  -t, --threads <n>        Hashing threads (default: all cores)\n";
    std::cout << "      --exclude-hidden     Skip files and directories starting with '.'\n";
    std::cout << "      --config <file>      JSON settings file; options given here override it\n";
    std::cout << "      --verify             Re-read the output and check its info hash\n";
    std::cout << "      --log-level <level>  debug, info, warn or error\n";
    std::cout << "  -q, --quiet              No progress output\n";
    std::cout << "  -V, --version            Show version\n";
    std::cout << "  -h, --help               Show this help\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " -a http://tracker.example/announce -p -o album.torrent ./album\n";
}

bool parse_command_line(int argc, char* argv[], CommandLine& cmd) {
    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + flag);
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                cmd.show_help = true;
            } else if (arg == "-V" || arg == "--version") {
                cmd.show_version = true;
            } else if (arg == "-a" || arg == "--announce") {
                cmd.announce.push_back(next_value(i, arg));
            } else if (arg == "-w" || arg == "--web-seed") {
                cmd.web_seeds.push_back(next_value(i, arg));
            } else if (arg == "-o" || arg == "--output") {
                cmd.output_path = next_value(i, arg);
            } else if (arg == "-p" || arg == "--private") {
                cmd.is_private = true;
            } else if (arg == "-c" || arg == "--comment") {
                cmd.comment = next_value(i, arg);
            } else if (arg == "--created-by") {
                cmd.created_by = next_value(i, arg);
            } else if (arg == "--no-date") {
                cmd.no_date = true;
            } else if (arg == "-l" || arg == "--piece-size") {
                uint32_t size = 0;
                qtm::TorrentCreateError error;
                if (!qtm::parse_size_argument(next_value(i, arg), size, &error)) {
                    throw std::invalid_argument(error.message);
                }
                cmd.piece_size = size;
            } else if (arg == "-t" || arg == "--threads") {
                unsigned threads = 0;
                qtm::TorrentCreateError error;
                if (!qtm::parse_thread_argument(next_value(i, arg), threads, &error)) {
                    throw std::invalid_argument(error.message);
                }
                cmd.threads = threads;
            } else if (arg == "--exclude-hidden") {
                cmd.exclude_hidden = true;
            } else if (arg == "--config") {
                cmd.config_path = next_value(i, arg);
            } else if (arg == "--verify") {
                cmd.verify = true;
            } else if (arg == "--log-level") {
                cmd.log_level = next_value(i, arg);
            } else if (arg == "-q" || arg == "--quiet") {
                cmd.quiet = true;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            } else if (cmd.content_path.empty()) {
                cmd.content_path = arg;
            } else {
                std::cerr << "Unexpected argument: " << arg << "\n";
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n";
        return false;
    }

    return true;
}

/**
 * Decode the written file and check that it is canonical and that its
 * info dictionary hashes to the expected info hash.
 */
bool verify_output(const std::string& path, const qtm::InfoHash& expected) {
    std::vector<uint8_t> data;
    if (!qtm::read_file_bytes(path, data)) {
        LOG_MAIN_ERROR("Verify: cannot read " << path);
        return false;
    }

    try {
        qtm::BencodeValue torrent = qtm::bencode::decode(data);
        if (!torrent.is_dict() || !torrent.has_key("info")) {
            LOG_MAIN_ERROR("Verify: no info dictionary in " << path);
            return false;
        }

        qtm::InfoHash actual = qtm::SHA1::digest(torrent["info"].encode());
        if (actual != expected) {
            LOG_MAIN_ERROR("Verify: info hash mismatch, file has " << qtm::info_hash_to_hex(actual));
            return false;
        }
    } catch (const std::runtime_error& e) {
        LOG_MAIN_ERROR("Verify: " << path << " is not valid canonical bencode: " << e.what());
        return false;
    }

    LOG_MAIN_INFO("Verified " << path);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (cmd.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd.show_version) {
        qtm::version::print_version_info();
        return 0;
    }

    if (cmd.content_path.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // Settings file first, command line on top
    qtm::CreatorSettings settings;
    if (!cmd.config_path.empty()) {
        qtm::TorrentCreateError error;
        if (!qtm::load_creator_settings(cmd.config_path, settings, &error)) {
            std::cerr << "Error: " << error.message << "\n";
            return EXIT_USAGE;
        }
    }

    std::string level_name = cmd.log_level ? *cmd.log_level : settings.log_level;
    qtm::LogLevel level;
    if (!qtm::parse_log_level(level_name, level)) {
        std::cerr << "Unknown log level: " << level_name << "\n";
        return EXIT_USAGE;
    }
    qtm::Logger::getInstance().set_log_level(level);

    if (!cmd.announce.empty()) {
        if (cmd.announce.size() == 1) {
            settings.announce = cmd.announce.front();
        } else {
            settings.announce = cmd.announce;
        }
    }
    if (!cmd.web_seeds.empty()) settings.web_seeds = cmd.web_seeds;
    if (cmd.comment) settings.comment = cmd.comment;
    if (cmd.created_by) settings.created_by = cmd.created_by;
    if (cmd.piece_size) settings.piece_size = *cmd.piece_size;
    if (cmd.threads) settings.threads = *cmd.threads;
    if (cmd.is_private) settings.is_private = true;
    if (cmd.exclude_hidden) settings.include_hidden = false;

    qtm::TorrentCreatorConfig config = qtm::to_creator_config(settings);
    if (cmd.no_date) {
        config.creation_date = 0;
    }

    std::string output_path = cmd.output_path;
    if (output_path.empty()) {
        output_path = qtm::default_output_name(std::time(nullptr));
    }

    if (!cmd.quiet && level <= qtm::LogLevel::INFO) {
        qtm::version::print_header();
    }

    qtm::CancellationToken cancel;
    g_cancel_flag = &cancel.flag();
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    qtm::PieceHashProgressCallback progress;
    if (!cmd.quiet) {
        progress = [](const qtm::HashProgress& p) {
            int percent = p.total_pieces ? static_cast<int>(100ULL * p.pieces_done / p.total_pieces) : 100;
            std::cerr << "\rHashing: " << p.pieces_done << "/" << p.total_pieces << " pieces ("
                      << percent << "%)" << std::flush;
            if (p.pieces_done == p.total_pieces) {
                std::cerr << "\n";
            }
        };
    }

    LOG_MAIN_DEBUG("Creating torrent for " << cmd.content_path << " -> " << output_path);

    qtm::TorrentCreateError error;
    auto summary = qtm::create_torrent(cmd.content_path, output_path, config, progress, &cancel, &error);

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel_flag = nullptr;

    if (!summary) {
        if (!cmd.quiet) std::cerr << "\n";
        if (error.is_cancelled()) {
            std::cerr << "Cancelled, nothing was written\n";
            return EXIT_CANCELLED;
        }
        std::cerr << "Error (" << qtm::error_code_name(error.code) << "): " << error.message << "\n";
        return EXIT_FAILURE;
    }

    std::cout << summary->to_string();

    if (cmd.verify && !verify_output(output_path, summary->info_hash)) {
        return EXIT_FAILURE;
    }

    return 0;
}
