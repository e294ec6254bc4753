#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace relaysave::core {

// Shared flag handed to long running operations. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true); }
    bool is_cancelled() const { return cancelled_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

// Cancels a token on SIGINT while alive; the previous handler comes back on
// destruction. One guard at a time.
class InterruptGuard {
public:
    explicit InterruptGuard(CancellationToken token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    using Handler = void (*)(int);

    static void handle_interrupt(int signal);
    static std::atomic<CancellationToken*> active_token_;

    CancellationToken token_;
    Handler previous_handler_;
};

}
