#pragma once

#include <atomic>
#include <chrono>
#include <thread>

/**
 * Set from a signal handler, waited on by the main thread. Setting it is a single
 * lock-free atomic store, so request() is safe to call inside a handler.
 */
class ShutdownFlag
{
    std::atomic_bool p_requested = false;

public:
    static_assert(std::atomic_bool::is_always_lock_free, "the shutdown flag is set from a signal handler");

    ShutdownFlag() = default;

    inline void request() noexcept { p_requested.store(true); }
    [[nodiscard]] inline bool requested() const noexcept { return p_requested.load(); }

    /**
     * Blocks until request() has been called, checking every `poll`.
     */
    void wait(std::chrono::milliseconds poll = std::chrono::milliseconds(250)) const
    {
        while (!requested())
            std::this_thread::sleep_for(poll);
    }
};
