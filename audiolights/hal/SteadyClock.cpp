#include "SteadyClock.h"
#include <thread>

void SteadyClock::delay(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
