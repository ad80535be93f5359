#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <cstdint>

// Timed waits that a shutdown request can interrupt. Used for the settle
// delay after sensor activation, the reconnect pause and the pause between
// acquisition cycles.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Returns false if cancelled before or during the wait.
    virtual bool sleepFor(uint32_t ms) = 0;

    virtual void cancel() = 0;
    virtual bool isCancelled() const = 0;
};

#endif // SCHEDULER_HPP
