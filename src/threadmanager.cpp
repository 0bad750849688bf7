#include "threadmanager.h"

#include <system_error>

#define LOG_POOL_DEBUG(message) LOG_DEBUG("pool", message)
#define LOG_POOL_ERROR(message) LOG_ERROR("pool", message)

namespace qtm {

ThreadManager::ThreadManager() : stop_requested_(false), finished_workers_(0) {
}

ThreadManager::~ThreadManager() {
    // A joinable std::thread at destruction would terminate()
    request_stop();
    join_workers();
}

void ThreadManager::spawn_worker(const std::string& name, std::function<void()> body) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.emplace_back(std::move(body));
    LOG_POOL_DEBUG("Started " << name << " (" << workers_.size() << " running)");
}

void ThreadManager::request_stop() {
    stop_requested_.store(true);
    state_cv_.notify_all();
}

void ThreadManager::mark_worker_finished() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++finished_workers_;
    }
    state_cv_.notify_all();
}

void ThreadManager::reset_worker_state() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_workers_ = 0;
    stop_requested_.store(false);
}

void ThreadManager::join_workers() {
    std::vector<std::thread> to_join;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (workers_.empty()) {
            return;
        }
        to_join.swap(workers_);
    }

    for (auto& t : to_join) {
        if (!t.joinable()) {
            continue;
        }
        try {
            t.join();
        } catch (const std::system_error& e) {
            LOG_POOL_ERROR("Failed to join worker: " << e.what());
        }
    }
    LOG_POOL_DEBUG("Joined " << to_join.size() << " workers");
}

size_t ThreadManager::worker_count() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

} // namespace qtm
