/**
 * @file i_clock.h
 * @brief Interface for wall-clock time sources
 *
 * Every component that samples "now" goes through an IClock so tests can
 * drive time deterministically.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace snapfetch {

/**
 * @brief Milliseconds since the Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Interface for time sources
 *
 * Thread Safety:
 * - now_ms() must be callable from any thread
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Current time
     * @return Milliseconds since the Unix epoch
     */
    virtual Timestamp now_ms() const = 0;
};

/**
 * @brief IClock backed by std::chrono::system_clock
 */
class SystemClock : public IClock {
public:
    Timestamp now_ms() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

    /**
     * @brief Process-wide instance for hosts that don't inject a clock
     */
    static SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

} // namespace snapfetch
