#include "clock.hpp"

#include <chrono>
#include <thread>

namespace utils {
    std::chrono::steady_clock::time_point SystemClock::now() const { return std::chrono::steady_clock::now(); }

    void SystemClock::sleep_for(std::chrono::milliseconds duration) {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }

    long elapsed_ms(const IClock& clock, std::chrono::steady_clock::time_point since) {
        return static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(clock.now() - since).count());
    }
}  // namespace utils
