/**
 * Cancellation signal shared between a blocking invocation and the task
 * racing it. Callbacks registered by the invocation run exactly once, on
 * the thread that cancels.
 */
#pragma once
#include <functional>
#include <mutex>
#include <vector>

namespace sandkit::runtime {

class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;

    // Non-copyable
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Returns false if already cancelled (callbacks ran earlier)
    bool cancel();

    bool is_cancelled() const;

    // Runs cb immediately (on this thread) if already cancelled
    void on_cancel(Callback cb);

private:
    mutable std::mutex mutex_;
    bool cancelled_ = false;
    std::vector<Callback> callbacks_;
};

} // namespace sandkit::runtime
