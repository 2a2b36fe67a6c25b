#pragma once

namespace platform {

// RAII guard that installs a SIGINT handler for its lifetime.
// The handler only records the interrupt; poll loops check interrupted()
// between sleep slices and exit in an orderly way. The previous handler is
// restored on destruction. Guards may nest.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// True once SIGINT was received under a guard (or request_interrupt() called).
bool interrupted();

// Set the flag programmatically (tests, cancel paths).
void request_interrupt();

// Clear the flag.
void clear_interrupt();

} // namespace platform
