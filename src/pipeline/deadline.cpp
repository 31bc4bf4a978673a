// File: src/pipeline/deadline.cpp
#include "pipeline/deadline.hpp"
#include "core/logging.hpp"

namespace careledger {

DeadlineExecutor::DeadlineExecutor(size_t max_pending)
    : max_pending_(max_pending) {
    if (max_pending_ == 0) {
        throw std::invalid_argument("DeadlineExecutor needs room for at least one late call");
    }
}

DeadlineExecutor::~DeadlineExecutor() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(pending_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

size_t DeadlineExecutor::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t running = 0;
    for (const auto& worker : pending_) {
        if (!worker.done->load(std::memory_order_acquire)) {
            ++running;
        }
    }
    return running;
}

void DeadlineExecutor::ReapFinishedLocked() {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            it->thread.join();
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
}

void DeadlineExecutor::Park(Worker worker) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(worker));
    GetLogger()->debug("{} late collaborator call(s) still running", pending_.size());
}

} // namespace careledger
