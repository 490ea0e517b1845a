#pragma once

#include <chrono>

// Compile-time threading mode selection
// Define TEMPO_MULTI_THREADED when controllers are shared between threads
// Otherwise defaults to single-threaded mode (no locking overhead)
#ifdef TEMPO_MULTI_THREADED
    #include <mutex>
    #define TEMPO_LOCK_GUARD std::lock_guard<std::mutex> lock(mutex_)
#else
    #define TEMPO_LOCK_GUARD
#endif

namespace tempo
{

using clock_type = std::chrono::steady_clock;
using duration = clock_type::duration;

// ============================================================================
// Throttle Configuration
// ============================================================================

struct throttle_config
{
    // Cooldown window used when a call does not name one
    duration default_window{std::chrono::seconds(1)};

    // Async timeout used when a call does not name one (zero = no timeout)
    duration default_timeout{duration::zero()};

    bool is_valid() const
    {
        return default_window >= duration::zero() &&
               default_timeout >= duration::zero();
    }
};

// ============================================================================
// Debounce Configuration
// ============================================================================

struct debounce_config
{
    // Quiet period used when a call does not name one
    duration default_delay{std::chrono::seconds(1)};

    bool is_valid() const
    {
        return default_delay >= duration::zero();
    }
};

} // namespace tempo
