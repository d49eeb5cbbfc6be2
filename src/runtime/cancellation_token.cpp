#include "runtime/cancellation_token.hpp"

namespace sandkit::runtime {

bool CancellationToken::cancel() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) {
            return false;
        }
        cancelled_ = true;
        callbacks.swap(callbacks_);
    }
    // Outside the lock: callbacks may block (killing a remote process)
    for (auto& cb : callbacks) {
        cb();
    }
    return true;
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationToken::on_cancel(Callback cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            callbacks_.push_back(std::move(cb));
            return;
        }
    }
    cb();
}

} // namespace sandkit::runtime
