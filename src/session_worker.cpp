#include "../include/session_worker.hpp"
#include "../include/logger.hpp"
#include <exception>

SessionWorker::SessionWorker() {
    thread_ = std::thread(&SessionWorker::run, this);
}

SessionWorker::~SessionWorker() { stop(); }

void SessionWorker::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void SessionWorker::postDelayed(uint32_t delay_ms, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        timers_.emplace(Clock::now() + std::chrono::milliseconds(delay_ms), std::move(task));
    }
    cv_.notify_one();
}

bool SessionWorker::isWorkerThread() const {
    return std::this_thread::get_id() == thread_.get_id();
}

void SessionWorker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && !isWorkerThread()) {
        thread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty() || !timers_.empty()) {
        Logger::debug("[Worker] Dropped %u pending tasks on stop",
                      (unsigned)(queue_.size() + timers_.size()));
    }
    queue_.clear();
    timers_.clear();
}

void SessionWorker::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        // Move due timers behind already queued work
        auto now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first <= now) {
            queue_.push_back(std::move(timers_.begin()->second));
            timers_.erase(timers_.begin());
        }

        if (queue_.empty()) {
            if (timers_.empty()) {
                cv_.wait(lock);
            } else {
                cv_.wait_until(lock, timers_.begin()->first);
            }
            continue;
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error("[Worker] Task failed: %s", e.what());
        }
        lock.lock();
    }
}
