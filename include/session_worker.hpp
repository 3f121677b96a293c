#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

/**
 * @brief Single dedicated thread that owns all transport calls and session state.
 *
 * Tasks run one at a time in FIFO order; delayed tasks are merged in once due.
 * Any thread may post. Futures returned by submit() must not be waited on from
 * inside a task, since the worker would block on itself.
 */
class SessionWorker {
public:
    using Task = std::function<void()>;

    SessionWorker();
    ~SessionWorker();

    void post(Task task);
    void postDelayed(uint32_t delay_ms, Task task);

    template <typename F>
    auto submit(F fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto job = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = job->get_future();
        post([job]() { (*job)(); });
        return result;
    }

    bool isWorkerThread() const;
    // Drops pending work and joins; idempotent
    void stop();

private:
    using Clock = std::chrono::steady_clock;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::multimap<Clock::time_point, Task> timers_;
    bool stopping_ = false;

    void run();
};
