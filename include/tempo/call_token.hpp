#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <utility>

namespace tempo
{

/// Cancellation handle of one scheduled call. Once cancelled, the call's
/// operation is not started and its callbacks are not delivered.
class call_token
{
  public:
    void cancel()
    {
        cancelled_.store(true, std::memory_order_release);
    }

    bool cancelled() const
    {
        return cancelled_.load(std::memory_order_acquire);
    }

  private:
    std::atomic<bool> cancelled_{false};
};

/// Wrap fn so that it becomes a no-op once token is cancelled.
template<typename... Args>
std::function<void(Args...)> guarded(std::function<void(Args...)> fn, std::shared_ptr<call_token> token)
{
    if (!fn)
        return fn;

    return [fn = std::move(fn), token = std::move(token)](Args... args) {
        if (!token->cancelled())
            fn(std::forward<Args>(args)...);
    };
}

} // namespace tempo
