#pragma once

#include <tempo/callbacks.hpp>
#include <tempo/config.hpp>
#include <tempo/detail/validate.hpp>
#include <tempo/error.hpp>
#include <tempo/logger.hpp>
#include <tempo/observer.hpp>
#include <tempo/outcome.hpp>
#include <tempo/outcome_dispatcher.hpp>
#include <tempo/timer_table.hpp>

#include <boost/asio.hpp>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace tempo
{

/**
 * @brief Leading-edge throttle keyed by call id
 *
 * An accepted call runs its operation immediately and opens a cooldown
 * window for its key, measured from the call. Calls for the same key
 * made while the window is open get on_throttle and are dropped, never
 * queued. Windows of different keys are independent.
 *
 * The window does not wait for an async operation: once it closes, a new
 * call is accepted even if the previous operation is still running.
 *
 * @tparam Key Call id type (must be hashable)
 */
template<typename Key = std::string>
class throttle_controller
{
  public:
    using key_type = Key;

  private:
    using window_table = timer_table<Key, std::monostate>;

    throttle_config config_;
    outcome_dispatcher dispatcher_;
    std::shared_ptr<controller_observer> observer_;
    std::shared_ptr<window_table> windows_;

  public:
    explicit throttle_controller(boost::asio::io_context* io_context_ptr,
                                 throttle_config config = {},
                                 std::shared_ptr<controller_observer> observer = nullptr)
      : config_(config)
      , dispatcher_(io_context_ptr)
      , observer_(std::move(observer))
    {
        if (!config_.is_valid())
            throw configuration_error("throttle_config durations must not be negative");

        windows_ = std::make_shared<window_table>(
            io_context_ptr,
            [this](Key key, std::monostate) { on_window_closed(key); },
            [](const boost::system::error_code& ec) {
                Logger::instance().error("throttle timer failed: {}", ec.message());
            });
    }

    throttle_controller(const throttle_controller&) = delete;
    throttle_controller& operator=(const throttle_controller&) = delete;
    throttle_controller(throttle_controller&&) = delete;
    throttle_controller& operator=(throttle_controller&&) = delete;

    ~throttle_controller()
    {
        windows_->stop();
    }

    template<typename T>
    throttle_status run_sync(const Key& key,
                             std::type_identity_t<sync_operation<T>> operation,
                             const callback_set<T>& callbacks)
    {
        return run_sync<T>(key, std::move(operation), callbacks, config_.default_window);
    }

    template<typename T>
    throttle_status run_sync(const Key& key,
                             std::type_identity_t<sync_operation<T>> operation,
                             const callback_set<T>& callbacks,
                             duration window)
    {
        detail::validate_call(operation, callbacks);
        detail::validate_duration(window, "throttle window");

        if (!admit(key, window))
        {
            if (callbacks.on_throttle)
                callbacks.on_throttle();
            return throttle_status::throttled;
        }

        outcome_kind kind = dispatcher_.run(operation, callbacks);
        if (observer_)
            observer_->on_outcome(detail::key_label(key), kind);
        return throttle_status::accepted;
    }

    template<typename T>
    throttle_status run_async(const Key& key,
                              std::type_identity_t<async_operation<T>> operation,
                              callback_set<T> callbacks)
    {
        return run_async<T>(key, std::move(operation), std::move(callbacks),
                            config_.default_window, config_.default_timeout);
    }

    template<typename T>
    throttle_status run_async(const Key& key,
                              std::type_identity_t<async_operation<T>> operation,
                              callback_set<T> callbacks,
                              duration window)
    {
        return run_async<T>(key, std::move(operation), std::move(callbacks),
                            window, config_.default_timeout);
    }

    /// @param timeout zero waits for the operation forever
    /// @param done called with the outcome once an accepted call settles;
    ///        not called for throttled calls
    template<typename T>
    throttle_status run_async(const Key& key,
                              std::type_identity_t<async_operation<T>> operation,
                              callback_set<T> callbacks,
                              duration window,
                              duration timeout,
                              settle_handler done = nullptr)
    {
        detail::validate_call(operation, callbacks);
        detail::validate_duration(window, "throttle window");
        detail::validate_duration(timeout, "throttle timeout");

        if (!admit(key, window))
        {
            if (callbacks.on_throttle)
                callbacks.on_throttle();
            return throttle_status::throttled;
        }

        dispatcher_.run_async<T>(
            operation,
            std::move(callbacks),
            timeout,
            [observer = observer_, label = detail::key_label(key), done = std::move(done)](outcome_kind kind) {
                if (observer)
                    observer->on_outcome(label, kind);
                if (done)
                    done(kind);
            });

        return throttle_status::accepted;
    }

    /// True while key's window is open.
    bool is_throttled(const Key& key) const
    {
        return windows_->is_active(key);
    }

    /// Time left in key's window, if one is open.
    std::optional<duration> remaining(const Key& key) const
    {
        auto handle = windows_->find(key);
        if (!handle || !handle->active)
            return {};
        return windows_->get_remaining_time(key);
    }

    std::optional<timer_handle<Key>> find(const Key& key) const
    {
        return windows_->find(key);
    }

    /// Close key's window early.
    bool reset(const Key& key)
    {
        return windows_->remove(key);
    }

    void clear()
    {
        windows_->clear();
    }

    size_t size() const
    {
        return windows_->size();
    }

    const throttle_config& config() const
    {
        return config_;
    }

  private:
    bool admit(const Key& key, duration window)
    {
        bool admitted = windows_->add(key, window);

        if (observer_)
        {
            auto label = detail::key_label(key);
            if (admitted)
            {
                observer_->on_accepted(label);
                observer_->on_active_timers(windows_->size());
            }
            else
            {
                observer_->on_throttled(label);
            }
        }

        return admitted;
    }

    void on_window_closed(const Key& key)
    {
        Logger::instance().debug("throttle window closed for '{}'", detail::key_label(key));

        if (observer_)
            observer_->on_active_timers(windows_->size());
    }
};

} // namespace tempo
