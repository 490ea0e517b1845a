#pragma once

#include <cstdint>
#include <ostream>

namespace tempo
{

// ============================================================================
// Outcome of one dispatched operation
// ============================================================================

enum class outcome_kind : uint8_t
{
    null,
    empty,
    success,
    error,
    timeout,
    waiting
};

const char* to_string(outcome_kind kind);

inline std::ostream& operator<<(std::ostream& os, outcome_kind kind)
{
    return os << to_string(kind);
}

// ============================================================================
// Result of a throttled call
// ============================================================================

enum class throttle_status : uint8_t
{
    accepted,
    throttled
};

const char* to_string(throttle_status status);

inline std::ostream& operator<<(std::ostream& os, throttle_status status)
{
    return os << to_string(status);
}

} // namespace tempo
