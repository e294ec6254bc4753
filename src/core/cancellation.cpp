#include "relaysave/core/cancellation.hpp"
#include <csignal>

namespace relaysave::core {

std::atomic<CancellationToken*> InterruptGuard::active_token_{nullptr};

InterruptGuard::InterruptGuard(CancellationToken token)
    : token_(std::move(token)) {
    active_token_.store(&token_);
    previous_handler_ = std::signal(SIGINT, &InterruptGuard::handle_interrupt);
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, previous_handler_ == SIG_ERR ? SIG_DFL : previous_handler_);
    active_token_.store(nullptr);
}

void InterruptGuard::handle_interrupt(int) {
    if (auto* token = active_token_.load()) {
        token->cancel();
    }
}

}
