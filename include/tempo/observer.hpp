#pragma once

#include <tempo/logger.hpp>
#include <tempo/outcome.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace tempo
{

// ============================================================================
// Controller Observer Interface
// ============================================================================

/// Receives controller events. Implementations must not call back into
/// the controller that reports to them.
class controller_observer
{
  public:
    virtual ~controller_observer() = default;

    /// Call admitted (throttle) or registered (debounce)
    virtual void on_accepted(const std::string& key) = 0;
    virtual void on_throttled(const std::string& key) = 0;
    virtual void on_superseded(const std::string& key) = 0;
    /// Debounce timer fired and the operation is being dispatched
    virtual void on_fired(const std::string& key) = 0;
    virtual void on_outcome(const std::string& key, outcome_kind kind) = 0;
    virtual void on_active_timers(size_t count) = 0;
};

// ============================================================================
// Built-in Implementations
// ============================================================================

class silent_observer : public controller_observer
{
  public:
    void on_accepted(const std::string&) override {}
    void on_throttled(const std::string&) override {}
    void on_superseded(const std::string&) override {}
    void on_fired(const std::string&) override {}
    void on_outcome(const std::string&, outcome_kind) override {}
    void on_active_timers(size_t) override {}
};

class logging_observer : public controller_observer
{
  public:
    explicit logging_observer(std::string controller_name)
      : name_(std::move(controller_name))
    {
    }

    void on_accepted(const std::string& key) override
    {
        Logger::instance().debug("{} accepted call '{}'", name_, key);
    }

    void on_throttled(const std::string& key) override
    {
        Logger::instance().debug("{} throttled call '{}'", name_, key);
    }

    void on_superseded(const std::string& key) override
    {
        Logger::instance().debug("{} superseded pending call '{}'", name_, key);
    }

    void on_fired(const std::string& key) override
    {
        Logger::instance().debug("{} fired '{}'", name_, key);
    }

    void on_outcome(const std::string& key, outcome_kind kind) override
    {
        Logger::instance().debug("{} call '{}' finished: {}", name_, key, to_string(kind));
    }

    void on_active_timers(size_t count) override
    {
        Logger::instance().debug("{} active timers: {}", name_, count);
    }

  private:
    std::string name_;
};

} // namespace tempo
