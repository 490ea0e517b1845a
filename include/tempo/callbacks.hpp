#pragma once

#include <tempo/outcome.hpp>

#include <exception>
#include <functional>

namespace tempo
{

/// Operation that produces its result immediately.
template<typename T>
using sync_operation = std::function<T()>;

/// Completion handler handed to an async operation. A non-null error
/// means failure; the value is ignored in that case.
template<typename T>
using async_handler = std::function<void(std::exception_ptr error, T value)>;

/// Operation that starts its work and calls the handler once when done.
template<typename T>
using async_operation = std::function<void(async_handler<T>)>;

/// Called once an async dispatch has settled.
using settle_handler = std::function<void(outcome_kind)>;

/// Per-call handlers. Every member except on_success may be left empty,
/// in which case that outcome is silently ignored.
template<typename T>
struct callback_set
{
    std::function<void()> on_throttle;
    std::function<void(std::exception_ptr)> on_error;
    std::function<void()> on_waiting;
    std::function<void()> on_null;
    std::function<void()> on_empty;
    std::function<void(T)> on_success;
    std::function<void()> on_timeout;
};

} // namespace tempo
