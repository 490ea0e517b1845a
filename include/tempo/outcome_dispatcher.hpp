#pragma once

#include <tempo/callbacks.hpp>
#include <tempo/config.hpp>
#include <tempo/detail/classify.hpp>
#include <tempo/error.hpp>
#include <tempo/logger.hpp>
#include <tempo/outcome.hpp>

#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <atomic>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

namespace tempo
{

namespace detail
{

// State shared by an async operation's completion and its timeout timer
template<typename T>
struct async_call
{
    callback_set<T> callbacks;
    settle_handler on_settled;
    boost::asio::steady_timer timer;
    std::atomic<bool> settled{false};

    async_call(const boost::asio::any_io_executor& executor,
               callback_set<T> cbs,
               settle_handler settled_handler)
      : callbacks(std::move(cbs))
      , on_settled(std::move(settled_handler))
      , timer(executor)
    {
    }

    // First caller wins, later completions are dropped
    bool try_settle()
    {
        return !settled.exchange(true);
    }

    void finish(outcome_kind kind)
    {
        if (on_settled)
            on_settled(kind);
    }
};

} // namespace detail

/**
 * @brief Runs an operation once and routes its outcome to one callback
 *
 * Failures of the operation are captured and handed to on_error (or
 * dropped when it is empty). Exceptions thrown by the callbacks
 * themselves are not caught: they leave run() directly, or leave
 * io_context::run() for async completions.
 *
 * Async completions and timeouts are delivered on the dispatcher's
 * executor, a strand when built with TEMPO_MULTI_THREADED.
 */
class outcome_dispatcher
{
  public:
    explicit outcome_dispatcher(boost::asio::io_context* io_context_ptr)
#ifdef TEMPO_MULTI_THREADED
      : executor_(boost::asio::make_strand(*io_context_ptr))
#else
      : executor_(io_context_ptr->get_executor())
#endif
    {
    }

    template<typename T>
    outcome_kind run(const sync_operation<T>& operation, const callback_set<T>& callbacks) const
    {
        std::optional<T> result;
        std::exception_ptr error;

        try
        {
            result.emplace(operation());
        }
        catch (...)
        {
            error = std::current_exception();
        }

        return deliver(error, std::move(result), callbacks);
    }

    /// Start operation; on_waiting fires right away, then exactly one of
    /// the terminal callbacks once it completes or the timeout elapses.
    /// A zero timeout waits forever.
    template<typename T>
    void run_async(const async_operation<T>& operation,
                   callback_set<T> callbacks,
                   duration timeout,
                   settle_handler on_settled = nullptr) const
    {
        auto call = std::make_shared<detail::async_call<T>>(
            executor_, std::move(callbacks), std::move(on_settled));

        if (call->callbacks.on_waiting)
            call->callbacks.on_waiting();

        if (timeout > duration::zero())
        {
            call->timer.expires_after(timeout);
            call->timer.async_wait([call](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted)
                    return;

                if (ec)
                {
                    // Without a working timer the call can only end by completing
                    Logger::instance().error("timeout timer failed: {}", ec.message());
                    return;
                }

                if (!call->try_settle())
                    return;

                if (call->callbacks.on_timeout)
                    call->callbacks.on_timeout();
                call->finish(outcome_kind::timeout);
            });
        }

        async_handler<T> handler = [call, executor = executor_](std::exception_ptr error, T value) {
            complete(executor, call, error, error ? std::optional<T>{} : std::optional<T>{std::move(value)});
        };

        try
        {
            operation(std::move(handler));
        }
        catch (...)
        {
            complete(executor_, call, std::current_exception(), std::optional<T>{});
        }
    }

  private:
    template<typename T>
    static void complete(const boost::asio::any_io_executor& executor,
                         const std::shared_ptr<detail::async_call<T>>& call,
                         std::exception_ptr error,
                         std::optional<T> result)
    {
        boost::asio::post(executor, [call, error, result = std::move(result)]() mutable {
            if (!call->try_settle())
            {
                Logger::instance().debug("late completion ignored");
                return;
            }

            call->timer.cancel();
            call->finish(deliver(error, std::move(result), call->callbacks));
        });
    }

    template<typename T>
    static outcome_kind deliver(std::exception_ptr error,
                                std::optional<T> result,
                                const callback_set<T>& callbacks)
    {
        if (error)
        {
            if (callbacks.on_error)
                callbacks.on_error(error);
            else
                Logger::instance().debug("unhandled operation failure: {}", describe(error));
            return outcome_kind::error;
        }

        outcome_kind kind = detail::classify(*result);
        switch (kind)
        {
            case outcome_kind::null:
                if (callbacks.on_null)
                    callbacks.on_null();
                break;
            case outcome_kind::empty:
                if (callbacks.on_empty)
                    callbacks.on_empty();
                break;
            case outcome_kind::success:
                if (callbacks.on_success)
                    callbacks.on_success(std::move(*result));
                break;
            case outcome_kind::error:
            case outcome_kind::timeout:
            case outcome_kind::waiting:
                // Never produced by classify()
                break;
        }
        return kind;
    }

    boost::asio::any_io_executor executor_;
};

} // namespace tempo
