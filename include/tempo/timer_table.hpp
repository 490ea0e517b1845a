#pragma once

#include <tempo/config.hpp>

#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace tempo
{

// Defined by the test suite to drive on_timer() directly
struct timer_table_access;

/// Snapshot of one scheduled timer.
template<typename Tkey>
struct timer_handle
{
    Tkey key;
    clock_type::time_point fires_at;
    bool active;
};

/**
 * @brief Keyed timer table driven by a single steady_timer
 *
 * Holds at most one timer per key. Entries are erased when they fire
 * (the expiry handler receives the key and its info) or when they are
 * removed explicitly. An entry whose expiry already passed but whose
 * notification has not run yet is reported as inactive and is purged by
 * the next add() for that key.
 *
 * Must be owned by a std::shared_ptr: pending waits keep the table alive.
 *
 * @tparam Tkey Type of the key (must be hashable)
 * @tparam Tinfo Payload carried by each timer
 */
template<typename Tkey, typename Tinfo>
class timer_table : public std::enable_shared_from_this<timer_table<Tkey, Tinfo>>
{
  public:
    using expiry_handler = std::function<void(Tkey, Tinfo)>;
    using error_handler = std::function<void(const boost::system::error_code&)>;
    using time_point = clock_type::time_point;
    using duration = clock_type::duration;

  private:
    using queue_type = std::multimap<time_point, Tkey>;

    struct entry_data
    {
        time_point expiry;
        Tinfo info;
        typename queue_type::iterator queue_iter;
    };

    boost::asio::steady_timer timer_;
    std::unordered_map<Tkey, entry_data> entries_;
    queue_type expiry_queue_;
    const expiry_handler expiry_handler_;
    const error_handler error_handler_;
    bool running_{false};

#ifdef TEMPO_MULTI_THREADED
    mutable std::mutex mutex_;
#endif

  public:
    timer_table(boost::asio::io_context* io_context_ptr,
                expiry_handler handler,
                error_handler err_handler = nullptr)
      : timer_(*io_context_ptr)
      , expiry_handler_(std::move(handler))
      , error_handler_(std::move(err_handler))
    {
        if (!expiry_handler_)
            throw std::invalid_argument("expiry_handler cannot be null");
    }

    timer_table(const timer_table&) = delete;
    timer_table& operator=(const timer_table&) = delete;
    timer_table(timer_table&&) = delete;
    timer_table& operator=(timer_table&&) = delete;

    ~timer_table()
    {
        stop();
    }

    void start()
    {
        TEMPO_LOCK_GUARD;
        if (!running_ && !expiry_queue_.empty())
        {
            running_ = true;
            schedule_next();
        }
    }

    void stop()
    {
        TEMPO_LOCK_GUARD;
        if (running_)
        {
            running_ = false;
            timer_.cancel();
        }
    }

    /// Register a timer for key unless an active one exists.
    /// @return false if key already has a timer that has not elapsed
    bool add(Tkey key, duration expiration_duration, Tinfo info = Tinfo{})
    {
        TEMPO_LOCK_GUARD;
        time_point now = clock_type::now();

        auto entry_it = entries_.find(key);
        if (entry_it != entries_.end())
        {
            if (entry_it->second.expiry > now)
                return false;

            // Elapsed but not yet notified
            erase_entry(entry_it);
        }

        insert_entry(std::move(key), now + expiration_duration, std::move(info));
        return true;
    }

    /// Register a timer for key, discarding any existing one.
    /// @return info of the discarded timer, if there was one
    std::optional<Tinfo> replace(Tkey key, duration expiration_duration, Tinfo info = Tinfo{})
    {
        TEMPO_LOCK_GUARD;
        std::optional<Tinfo> previous;

        auto entry_it = entries_.find(key);
        if (entry_it != entries_.end())
        {
            previous = std::move(entry_it->second.info);
            erase_entry(entry_it);
        }

        insert_entry(std::move(key), clock_type::now() + expiration_duration, std::move(info));
        return previous;
    }

    /// Remove key's timer without notifying and hand back its info.
    std::optional<Tinfo> take(const Tkey& key)
    {
        TEMPO_LOCK_GUARD;
        auto entry_it = entries_.find(key);
        if (entry_it == entries_.end())
            return {};

        std::optional<Tinfo> info{std::move(entry_it->second.info)};
        erase_entry(entry_it);
        return info;
    }

    bool remove(const Tkey& key)
    {
        return take(key).has_value();
    }

    std::optional<timer_handle<Tkey>> find(const Tkey& key) const
    {
        TEMPO_LOCK_GUARD;
        auto it = entries_.find(key);
        if (it == entries_.end())
            return {};

        return timer_handle<Tkey>{it->first, it->second.expiry, it->second.expiry > clock_type::now()};
    }

    std::optional<Tinfo> get_info(const Tkey& key) const
    {
        TEMPO_LOCK_GUARD;
        auto it = entries_.find(key);
        if (it != entries_.end())
            return it->second.info;
        return {};
    }

    std::optional<duration> get_remaining_time(const Tkey& key) const
    {
        TEMPO_LOCK_GUARD;
        auto it = entries_.find(key);
        if (it != entries_.end())
        {
            auto remaining = it->second.expiry - clock_type::now();
            return remaining > duration::zero() ? remaining : duration::zero();
        }
        return {};
    }

    /// True if key has a timer, elapsed or not.
    bool contains(const Tkey& key) const
    {
        TEMPO_LOCK_GUARD;
        return entries_.find(key) != entries_.end();
    }

    /// True if key has a timer that has not elapsed yet.
    bool is_active(const Tkey& key) const
    {
        TEMPO_LOCK_GUARD;
        auto it = entries_.find(key);
        return it != entries_.end() && it->second.expiry > clock_type::now();
    }

    void clear()
    {
        TEMPO_LOCK_GUARD;
        entries_.clear();
        expiry_queue_.clear();

        if (running_)
        {
            timer_.cancel();
            running_ = false;
        }
    }

    size_t size() const
    {
        TEMPO_LOCK_GUARD;
        return entries_.size();
    }

    bool empty() const
    {
        TEMPO_LOCK_GUARD;
        return entries_.empty();
    }

    bool is_running() const
    {
        TEMPO_LOCK_GUARD;
        return running_;
    }

  private:
    friend struct timer_table_access;

    // Re-arms the timer when leaving on_timer, also when a handler throws
    struct reschedule_guard
    {
        timer_table* table;

        ~reschedule_guard()
        {
            table->reschedule();
        }
    };

    void insert_entry(Tkey key, time_point expiry, Tinfo info)
    {
        auto queue_iter = expiry_queue_.emplace(expiry, key);
        entries_.emplace(std::move(key), entry_data{expiry, std::move(info), queue_iter});

        // If this is now the earliest expiry, reschedule timer
        if (running_ && queue_iter == expiry_queue_.begin())
        {
            timer_.cancel();
            schedule_next();
        }
        else if (!running_)
        {
            running_ = true;
            schedule_next();
        }
    }

    void erase_entry(typename std::unordered_map<Tkey, entry_data>::iterator entry_it)
    {
        expiry_queue_.erase(entry_it->second.queue_iter);
        entries_.erase(entry_it);
    }

    void schedule_next()
    {
        if (expiry_queue_.empty())
        {
            running_ = false;
            return;
        }

        timer_.expires_at(expiry_queue_.begin()->first);

        timer_.async_wait([self = this->shared_from_this()](const boost::system::error_code& ec) {
            self->on_timer(ec);
        });
    }

    void reschedule()
    {
        TEMPO_LOCK_GUARD;
        if (running_)
            schedule_next();
    }

    void on_timer(const boost::system::error_code& ec)
    {
        // Timer was cancelled (normal during reschedule or stop)
        if (ec == boost::asio::error::operation_aborted)
            return;

        {
            TEMPO_LOCK_GUARD;
            if (!running_)
                return;
        }

        // Re-arm for the remaining entries on every way out
        reschedule_guard guard{this};

        if (ec)
        {
            if (error_handler_)
                error_handler_(ec);
            return;
        }

        // Entries registered by the handlers below wait for the next wakeup
        time_point now = clock_type::now();

        while (auto expired = pop_expired(now))
        {
            expiry_handler_(std::move(expired->first), std::move(expired->second));
        }
    }

    std::optional<std::pair<Tkey, Tinfo>> pop_expired(time_point now)
    {
        TEMPO_LOCK_GUARD;
        auto it = expiry_queue_.begin();
        if (it == expiry_queue_.end() || it->first > now)
            return {};

        auto entry_it = entries_.find(it->second);
        std::pair<Tkey, Tinfo> expired{entry_it->first, std::move(entry_it->second.info)};
        erase_entry(entry_it);
        return expired;
    }
};

} // namespace tempo
