#include "common/cancellation.hpp"
#include <signal.h>

std::atomic<bool> Cancellation::requested_{false};

static void handleInterrupt(int) {
    Cancellation::request();
}

void Cancellation::installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = handleInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}
