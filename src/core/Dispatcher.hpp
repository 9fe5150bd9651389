#pragma once

/**
 * Dispatcher.hpp
 *
 * Serial execution context with timers. Everything posted to one
 * dispatcher runs one task at a time, in order of due time.
 */

#include <chrono>
#include <functional>

namespace kitzi::core {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

class Dispatcher {
public:
    using Task = std::function<void()>;

    virtual ~Dispatcher() = default;

    /**
     * Run a task as soon as possible
     */
    virtual void post(Task task) = 0;

    /**
     * Run a task after a delay
     * @param delay Minimum delay before running
     * @param task Task to run
     */
    virtual void postDelayed(Millis delay, Task task) = 0;

    /**
     * Current time on the dispatcher's clock
     */
    virtual TimePoint now() const = 0;
};

} // namespace kitzi::core
