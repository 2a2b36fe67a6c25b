#pragma once

#include <chrono>
#include <functional>
#include <thread>

// Time source for poll loops. Tests substitute a fake that advances a
// virtual clock in sleep().
struct PollClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static PollClock system() {
        return {
            [] { return std::chrono::steady_clock::now(); },
            [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); },
        };
    }
};
