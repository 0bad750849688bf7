#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <string>
#include <functional>

namespace qtm {

/**
 * Base for objects that run a fixed group of worker threads.
 *
 * Workers are started with spawn_worker() and report completion with
 * mark_worker_finished(). The owner waits on state_cv_ under state_mutex_
 * and always joins; threads are never detached.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Start a worker thread
     * @param name Descriptive name for logging purposes
     * @param body Function run on the new thread
     * @throws std::system_error if the thread cannot be created
     */
    void spawn_worker(const std::string& name, std::function<void()> body);

    /**
     * Ask every worker to stop at its next check and wake the owner
     */
    void request_stop();

    bool stop_requested() const { return stop_requested_.load(); }

    /**
     * Join all spawned workers. Safe to call more than once.
     */
    void join_workers();

    size_t worker_count() const;

protected:
    // Wakes the owner whenever a worker makes progress or finishes
    std::condition_variable state_cv_;
    std::mutex state_mutex_;

    void mark_worker_finished();
    // Caller must hold state_mutex_
    size_t finished_workers_locked() const { return finished_workers_; }
    void reset_worker_state();

private:
    std::atomic<bool> stop_requested_;
    size_t finished_workers_;

    std::vector<std::thread> workers_;
    mutable std::mutex workers_mutex_;

    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace qtm
