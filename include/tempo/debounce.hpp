#pragma once

#include <tempo/call_token.hpp>
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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace tempo
{

namespace detail
{

// Token of the latest call per key, from scheduling until it finishes
template<typename Key>
class call_registry
{
  public:
    /// Make token the latest call for key.
    /// @return token of the call it replaces, if any
    std::shared_ptr<call_token> exchange(const Key& key, std::shared_ptr<call_token> token)
    {
        TEMPO_LOCK_GUARD;
        auto& slot = calls_[key];
        std::swap(slot, token);
        return token;
    }

    std::shared_ptr<call_token> take(const Key& key)
    {
        TEMPO_LOCK_GUARD;
        auto it = calls_.find(key);
        if (it == calls_.end())
            return nullptr;

        auto token = std::move(it->second);
        calls_.erase(it);
        return token;
    }

    // Erase key only if it still belongs to token
    bool release(const Key& key, const std::shared_ptr<call_token>& token)
    {
        TEMPO_LOCK_GUARD;
        auto it = calls_.find(key);
        if (it == calls_.end() || it->second != token)
            return false;

        calls_.erase(it);
        return true;
    }

    bool contains(const Key& key) const
    {
        TEMPO_LOCK_GUARD;
        return calls_.find(key) != calls_.end();
    }

    size_t size() const
    {
        TEMPO_LOCK_GUARD;
        return calls_.size();
    }

    void cancel_all()
    {
        TEMPO_LOCK_GUARD;
        for (auto& [key, token] : calls_)
            token->cancel();
        calls_.clear();
    }

  private:
    std::unordered_map<Key, std::shared_ptr<call_token>> calls_;

#ifdef TEMPO_MULTI_THREADED
    mutable std::mutex mutex_;
#endif
};

} // namespace detail

/**
 * @brief Trailing-edge debounce keyed by call id
 *
 * Each call schedules its operation to run once the key has been quiet
 * for the call's delay. A newer call for the same key cancels the
 * scheduled one, which then never runs and never reports. The same
 * applies to an async operation that already fired and is still running:
 * it is not interrupted, but its callbacks are suppressed.
 *
 * The latest call of every key stays registered from scheduling until it
 * finishes, so a newer call always finds the one it replaces, including
 * one whose timer fired but whose operation has not started yet.
 *
 * @tparam Key Call id type (must be hashable)
 */
template<typename Key = std::string>
class debounce_controller
{
  public:
    using key_type = Key;

  private:
    struct pending_call
    {
        std::shared_ptr<call_token> token;
        std::function<void(const Key&)> fire;
    };

    using call_table = timer_table<Key, pending_call>;

    debounce_config config_;
    outcome_dispatcher dispatcher_;
    std::shared_ptr<controller_observer> observer_;
    std::shared_ptr<detail::call_registry<Key>> live_;
    std::shared_ptr<call_table> calls_;

#ifdef TEMPO_MULTI_THREADED
    // Serializes schedule, cancel and clear
    mutable std::mutex mutex_;
#endif

  public:
    explicit debounce_controller(boost::asio::io_context* io_context_ptr,
                                 debounce_config config = {},
                                 std::shared_ptr<controller_observer> observer = nullptr)
      : config_(config)
      , dispatcher_(io_context_ptr)
      , observer_(std::move(observer))
      , live_(std::make_shared<detail::call_registry<Key>>())
    {
        if (!config_.is_valid())
            throw configuration_error("debounce_config delay must not be negative");

        calls_ = std::make_shared<call_table>(
            io_context_ptr,
            [](Key key, pending_call call) { call.fire(key); },
            [](const boost::system::error_code& ec) {
                Logger::instance().error("debounce timer failed: {}", ec.message());
            });
    }

    debounce_controller(const debounce_controller&) = delete;
    debounce_controller& operator=(const debounce_controller&) = delete;
    debounce_controller(debounce_controller&&) = delete;
    debounce_controller& operator=(debounce_controller&&) = delete;

    ~debounce_controller()
    {
        calls_->stop();
        live_->cancel_all();
    }

    template<typename T>
    bool run_sync(const Key& key,
                  std::type_identity_t<sync_operation<T>> operation,
                  callback_set<T> callbacks)
    {
        return run_sync<T>(key, std::move(operation), std::move(callbacks), config_.default_delay);
    }

    /// Schedule operation to run after delay unless superseded.
    /// @return true if a pending or running call for key was superseded
    template<typename T>
    bool run_sync(const Key& key,
                  std::type_identity_t<sync_operation<T>> operation,
                  callback_set<T> callbacks,
                  duration delay)
    {
        detail::validate_call(operation, callbacks);
        detail::validate_duration(delay, "debounce delay");

        auto token = std::make_shared<call_token>();
        auto fire = [this, token, operation = std::move(operation), callbacks = std::move(callbacks)](const Key& k) {
            if (token->cancelled())
                return;

            // A sync call that started runs to the end
            live_->release(k, token);

            report_fired(k);
            outcome_kind kind = dispatcher_.run(operation, callbacks);
            if (observer_)
                observer_->on_outcome(detail::key_label(k), kind);
        };

        return schedule(key, delay, pending_call{std::move(token), std::move(fire)});
    }

    template<typename T>
    bool run_async(const Key& key,
                   std::type_identity_t<async_operation<T>> operation,
                   callback_set<T> callbacks)
    {
        return run_async<T>(key, std::move(operation), std::move(callbacks), config_.default_delay);
    }

    /// Schedule operation to start after delay unless superseded.
    /// @return true if a pending or running call for key was superseded
    template<typename T>
    bool run_async(const Key& key,
                   std::type_identity_t<async_operation<T>> operation,
                   callback_set<T> callbacks,
                   duration delay)
    {
        detail::validate_call(operation, callbacks);
        detail::validate_duration(delay, "debounce delay");

        auto token = std::make_shared<call_token>();
        auto fire = [this, token, operation = std::move(operation), callbacks = std::move(callbacks)](const Key& k) {
            if (token->cancelled())
                return;

            report_fired(k);

            callback_set<T> guarded_callbacks{
                guarded(callbacks.on_throttle, token),
                guarded(callbacks.on_error, token),
                guarded(callbacks.on_waiting, token),
                guarded(callbacks.on_null, token),
                guarded(callbacks.on_empty, token),
                guarded(callbacks.on_success, token),
                guarded(callbacks.on_timeout, token)};

            try
            {
                dispatcher_.run_async<T>(
                    operation,
                    std::move(guarded_callbacks),
                    duration::zero(),
                    [registry = std::weak_ptr<detail::call_registry<Key>>(live_),
                     observer = observer_,
                     token,
                     k](outcome_kind kind) {
                        if (auto live = registry.lock())
                            live->release(k, token);

                        if (observer && !token->cancelled())
                            observer->on_outcome(detail::key_label(k), kind);
                    });
            }
            catch (...)
            {
                // on_waiting threw, the call will never settle
                live_->release(k, token);
                throw;
            }
        };

        return schedule(key, delay, pending_call{std::move(token), std::move(fire)});
    }

    /// Drop key's pending or running call without replacing it.
    bool cancel(const Key& key)
    {
        TEMPO_LOCK_GUARD;
        calls_->remove(key);

        auto token = live_->take(key);
        if (!token)
            return false;

        token->cancel();
        Logger::instance().debug("debounced call '{}' cancelled", detail::key_label(key));
        return true;
    }

    /// Run key's scheduled call now instead of at the end of its delay.
    bool flush(const Key& key)
    {
        auto call = calls_->take(key);
        if (!call)
            return false;

        call->fire(key);
        return true;
    }

    /// True while key has a scheduled call or a running async operation.
    bool is_pending(const Key& key) const
    {
        return live_->contains(key);
    }

    std::optional<timer_handle<Key>> find(const Key& key) const
    {
        return calls_->find(key);
    }

    void clear()
    {
        TEMPO_LOCK_GUARD;
        calls_->clear();
        live_->cancel_all();
    }

    size_t size() const
    {
        return live_->size();
    }

    const debounce_config& config() const
    {
        return config_;
    }

  private:
    bool schedule(const Key& key, duration delay, pending_call call)
    {
        bool superseded = false;
        {
            TEMPO_LOCK_GUARD;

            if (auto previous = live_->exchange(key, call.token))
            {
                previous->cancel();
                superseded = true;
            }

            calls_->replace(key, delay, std::move(call));
        }

        if (superseded)
            Logger::instance().debug("debounced call '{}' superseded", detail::key_label(key));

        if (observer_)
        {
            auto label = detail::key_label(key);
            if (superseded)
                observer_->on_superseded(label);
            observer_->on_accepted(label);
            observer_->on_active_timers(calls_->size());
        }

        return superseded;
    }

    void report_fired(const Key& key)
    {
        if (observer_)
        {
            observer_->on_fired(detail::key_label(key));
            observer_->on_active_timers(calls_->size());
        }
    }
};

} // namespace tempo
