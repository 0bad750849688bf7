/**
 * @file hash_benchmark.cpp
 * @brief Benchmark: sequential vs parallel piece hashing of a path
 *
 * Walks a file or directory, plans the piece layout and hashes it once on
 * the calling thread and once with the worker pool, then prints both
 * timings and checks that the digests agree.
 *
 * Usage:
 *   hash_benchmark <path> [threads]
 *
 * Example:
 *   hash_benchmark ~/Videos 8
 */

#include "file_walker.h"
#include "piece_planner.h"
#include "piece_hasher.h"
#include "metafile_writer.h"
#include "logger.h"

#include <iostream>
#include <string>
#include <chrono>
#include <atomic>
#include <csignal>
#include <cstdlib>

using namespace qtm;

// Global flag for graceful shutdown
static std::atomic<bool>* g_cancel = nullptr;

static void signal_handler(int) {
    if (g_cancel) g_cancel->store(true);
}

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <path> [threads]\n"
              << "\n"
              << "  path     File or directory to hash\n"
              << "  threads  Worker threads for the parallel run (default: all cores)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string path = argv[1];
    const unsigned threads = argc == 3 ? static_cast<unsigned>(std::atoi(argv[2])) : 0;

    Logger::getInstance().set_log_level(LogLevel::WARN);

    TorrentCreateError error;
    FileStorage storage;
    if (!walk_path(path, storage, WalkOptions(), &error)) {
        std::cerr << "Error: " << error.message << "\n";
        return 1;
    }

    auto layout = plan_pieces(storage.total_size(), &error);
    if (!layout) {
        std::cerr << "Error: " << error.message << "\n";
        return 1;
    }
    storage.set_piece_length(layout->piece_length);
    storage.finalize();

    std::cout << storage.num_files() << " files, " << format_size(storage.total_size())
              << ", " << layout->piece_count << " pieces of " << format_size(layout->piece_length) << "\n";

    // Register signal handler for Ctrl-C
    CancellationToken cancel;
    g_cancel = &cancel.flag();
    std::signal(SIGINT, signal_handler);

    HashOptions options;
    options.cancel = &cancel;

    auto start = std::chrono::steady_clock::now();
    auto sequential = hash_pieces_sequential(storage, path, options, &error);
    auto sequential_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (!sequential) {
        std::cerr << "Sequential run failed: " << error.message << "\n";
        return 1;
    }

    options.num_threads = threads;
    start = std::chrono::steady_clock::now();
    auto parallel = hash_pieces(storage, path, options, &error);
    auto parallel_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    if (!parallel) {
        std::cerr << "Parallel run failed: " << error.message << "\n";
        return 1;
    }

    std::cout << "sequential: " << sequential_ms << " ms\n";
    std::cout << "parallel:   " << parallel_ms << " ms\n";

    if (*sequential != *parallel) {
        std::cerr << "MISMATCH between sequential and parallel digests\n";
        return 1;
    }
    std::cout << "digests match\n";
    return 0;
}
