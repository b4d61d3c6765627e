#include "clock.h"

#include <chrono>
#include <thread>

namespace Tollgate {

int64_t SystemClock::NowMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void SystemClock::SleepForMs(int64_t ms) {
    if (ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}

SystemClock& SystemClock::Instance() {
    static SystemClock instance;
    return instance;
}

void ManualClock::SleepForMs(int64_t ms) {
    {
        std::lock_guard<std::mutex> lock(sleeps_mutex_);
        sleeps_.push_back(ms);
    }
    if (ms > 0) {
        now_ms_ += ms;
    }
}

std::vector<int64_t> ManualClock::Sleeps() const {
    std::lock_guard<std::mutex> lock(sleeps_mutex_);
    return sleeps_;
}

} // namespace Tollgate
