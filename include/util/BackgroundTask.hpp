#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

// Count of worker threads still alive across all BackgroundTasks. Detached
// workers may outlive their task; main() waits here before returning so
// none of them is still logging while statics are destroyed.
class BackgroundWorkers {
public:
    static void enter() {
        std::lock_guard<std::mutex> lock(mutex_);
        count_++;
    }

    // Notifies under the lock: once waitIdle() sees zero, no worker
    // touches these statics again.
    static void leave() {
        std::lock_guard<std::mutex> lock(mutex_);
        count_--;
        idle_.notify_all();
    }

    static int running() {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    // True if every worker finished within the timeout.
    static bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_.wait_for(lock, timeout, [] { return count_ == 0; });
    }

private:
    static inline std::mutex              mutex_;
    static inline std::condition_variable idle_;
    static inline int                     count_ = 0;
};

// One unit of blocking work run off the loop thread. The loop polls it
// each frame instead of waiting on it, so rendering never stalls.
//
// The worker thread is detached and owns its share of the state; an
// abandoned task (cancelled, or replaced after a watchdog timeout) is
// allowed to finish in the background without blocking the owner.
template <typename T>
class BackgroundTask {
public:
    using Work = std::function<T(const std::atomic<bool>& cancel)>;

    BackgroundTask() = default;
    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;
    BackgroundTask(BackgroundTask&&) = default;
    BackgroundTask& operator=(BackgroundTask&&) = default;

    ~BackgroundTask() { cancel(); }

    void start(Work work) {
        cancel();
        cancel_  = std::make_shared<std::atomic<bool>>(false);
        started_ = std::chrono::steady_clock::now();

        std::promise<T> promise;
        future_ = promise.get_future();

        BackgroundWorkers::enter();
        try {
            std::thread([work = std::move(work), flag = cancel_,
                         p = std::move(promise)]() mutable {
                {
                    // Captures are released here, before the worker
                    // counts as finished
                    auto w = std::move(work);
                    auto f = std::move(flag);
                    auto promise = std::move(p);
                    try {
                        promise.set_value(w(*f));
                    } catch (...) {
                        promise.set_exception(std::current_exception());
                    }
                }
                BackgroundWorkers::leave();
            }).detach();
        } catch (const std::system_error&) {
            BackgroundWorkers::leave();
            throw;
        }
    }

    bool active() const { return future_.valid(); }

    bool ready() const {
        return future_.valid() &&
               future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    // Returns the value once, when finished. Rethrows whatever the work threw.
    std::optional<T> poll() {
        if (!ready()) return std::nullopt;
        return future_.get();
    }

    // Signals the worker and forgets about it.
    void cancel() {
        if (cancel_) cancel_->store(true);
        future_ = std::future<T>();
    }

    // Signals the worker but keeps waiting for its result.
    void requestStop() {
        if (cancel_) cancel_->store(true);
    }

    long long elapsedMs() const {
        if (!future_.valid()) return 0;
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_).count();
    }

private:
    std::future<T> future_;
    std::shared_ptr<std::atomic<bool>> cancel_;
    std::chrono::steady_clock::time_point started_{};
};
