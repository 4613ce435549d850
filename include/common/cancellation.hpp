#pragma once

#include <atomic>

// Process-wide interrupt flag set from SIGINT/SIGTERM.
class Cancellation {
public:
    static void installSignalHandlers();
    static void request() { requested_.store(true); }
    static bool isRequested() { return requested_.load(); }
    static void reset() { requested_.store(false); }

private:
    static std::atomic<bool> requested_;
};
