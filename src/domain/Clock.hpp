/**
 * @file Clock.hpp
 * @brief Time source injected into the registry for default timestamps.
 */

#pragma once

#include <chrono>

namespace fleetkeeper::domain {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Truncates a timestamp to the millisecond resolution kept by the registry.
 */
inline Timestamp TruncateToMillis(Timestamp ts) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(ts);
}

/**
 * @class Clock
 * @brief Abstract time source.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /** @brief Current point in time. */
    virtual Timestamp now() const = 0;
};

/**
 * @class SystemClock
 * @brief Wall clock backed by std::chrono::system_clock.
 */
class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace fleetkeeper::domain
