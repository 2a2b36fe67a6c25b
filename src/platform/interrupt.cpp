#include "interrupt.hpp"
#include <csignal>

namespace platform {

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void on_sigint(int) {
    g_interrupted = 1;
}
} // namespace

struct InterruptGuard::Impl {
    struct sigaction old_action;
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    struct sigaction sa = {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: blocking poll()/sleep wake up on ^C
    sigaction(SIGINT, &sa, &impl_->old_action);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &impl_->old_action, nullptr);
    delete impl_;
}

bool interrupted() {
    return g_interrupted != 0;
}

void request_interrupt() {
    g_interrupted = 1;
}

void clear_interrupt() {
    g_interrupted = 0;
}

} // namespace platform
