// File: src/pipeline/cancellation.hpp
#pragma once

#include <atomic>
#include <memory>

namespace careledger {

/// Cooperative cancellation flag shared between a caller and a running query
///
/// Copies share the same flag. The pipeline checks it at every state
/// boundary; work already committed (reinforcement) is not rolled back.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { flag_->store(true, std::memory_order_release); }

    bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace careledger
