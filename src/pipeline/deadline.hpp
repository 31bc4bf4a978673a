// File: src/pipeline/deadline.hpp
#pragma once

#include "core/errors.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace careledger {

/// Runs collaborator calls on worker threads with a deadline
///
/// A call that finishes in time has its worker joined before Call()
/// returns. A call that misses its deadline keeps running on a pending
/// worker; its result is discarded. At most `max_pending` late workers
/// exist at once: while that many are still running, further calls fail
/// immediately instead of starting another thread. The destructor joins
/// every pending worker, so no worker outlives its executor.
///
/// `fn` must own everything it touches (capture by value, shared_ptr for
/// collaborators). Thread-safe.
class DeadlineExecutor {
public:
    static constexpr size_t kDefaultMaxPending = 8;

    explicit DeadlineExecutor(size_t max_pending = kDefaultMaxPending);

    /// Waits for every late worker to finish
    ~DeadlineExecutor();

    DeadlineExecutor(const DeadlineExecutor&) = delete;
    DeadlineExecutor& operator=(const DeadlineExecutor&) = delete;

    /// Run `fn` and wait at most `timeout` for its result
    ///
    /// @return fn()'s result
    /// @throws CollaboratorTimeoutError if fn does not finish in time, or if
    ///         `max_pending` earlier calls are still running late
    /// @throws whatever fn throws, rethrown on the calling thread
    template <typename Fn>
    auto Call(const std::string& name, std::chrono::milliseconds timeout, Fn fn)
        -> decltype(fn());

    /// Late workers that have not finished yet
    size_t PendingCount() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    size_t max_pending_;
    mutable std::mutex mutex_;
    std::list<Worker> pending_;

    /// Join workers that finished since they were parked. Caller holds mutex_.
    void ReapFinishedLocked();

    /// Park a worker that missed its deadline
    void Park(Worker worker);
};

template <typename Fn>
auto DeadlineExecutor::Call(const std::string& name, std::chrono::milliseconds timeout, Fn fn)
    -> decltype(fn()) {
    using Result = decltype(fn());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ReapFinishedLocked();
        if (pending_.size() >= max_pending_) {
            throw CollaboratorTimeoutError(name, static_cast<long long>(timeout.count()));
        }
    }

    auto promise = std::make_shared<std::promise<Result>>();
    std::future<Result> future = promise->get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread worker([promise, done, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            // Forwarded to the caller through the future
            promise->set_exception(std::current_exception());
        }
        done->store(true, std::memory_order_release);
    });

    if (future.wait_for(timeout) != std::future_status::ready) {
        Park(Worker{std::move(worker), std::move(done)});
        throw CollaboratorTimeoutError(name, static_cast<long long>(timeout.count()));
    }

    worker.join();
    return future.get();
}

} // namespace careledger
