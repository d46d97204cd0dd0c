#pragma once

#include <chrono>
#include <functional>

namespace ferry::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Injectable wall clock; tests substitute a manual one.
using Clock = std::function<TimePoint()>;

inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace ferry::core
