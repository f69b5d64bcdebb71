/**
 * @file clock.cpp
 * @brief Implements the wall-clock time source.
 */

#include "core/clock.hpp"

#include <chrono>

namespace core {

Timestamp LiveClock::timeNow() const {
    return static_cast<Timestamp>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count());
}

}
