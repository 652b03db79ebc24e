#ifndef SPARQL_GUARD_CLOCK_HPP
#define SPARQL_GUARD_CLOCK_HPP

#include <chrono>

namespace utils {
    class IClock {
       public:
        IClock() = default;
        virtual ~IClock() = default;
        IClock(const IClock&) = delete;
        IClock& operator=(const IClock&) = delete;
        IClock(IClock&&) = delete;
        IClock& operator=(IClock&&) = delete;

        [[nodiscard]] virtual std::chrono::steady_clock::time_point now() const = 0;
        virtual void sleep_for(std::chrono::milliseconds duration) = 0;
    };

    class SystemClock : public IClock {
       public:
        [[nodiscard]] std::chrono::steady_clock::time_point now() const override;
        void sleep_for(std::chrono::milliseconds duration) override;
    };

    [[nodiscard]] long elapsed_ms(const IClock& clock, std::chrono::steady_clock::time_point since);
}  // namespace utils

#endif
