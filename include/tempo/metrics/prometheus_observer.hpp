// ============================================================================
// Prometheus export of controller events
// ============================================================================
#pragma once

#include <tempo/observer.hpp>
#include <tempo/outcome.hpp>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include <array>
#include <memory>
#include <string>

namespace tempo::metrics
{

/// Counts controller events in a prometheus registry:
///   tempo_calls_total{controller, event}     accepted/throttled/superseded/fired
///   tempo_outcomes_total{controller, outcome}
///   tempo_active_timers{controller}
/// Keys are not exported as labels.
class prometheus_observer : public controller_observer
{
  public:
    /// @throws std::invalid_argument if registry is null or the name is empty
    prometheus_observer(std::shared_ptr<prometheus::Registry> registry, std::string controller_name);

    void on_accepted(const std::string& key) override;
    void on_throttled(const std::string& key) override;
    void on_superseded(const std::string& key) override;
    void on_fired(const std::string& key) override;
    void on_outcome(const std::string& key, outcome_kind kind) override;
    void on_active_timers(size_t count) override;

    [[nodiscard]] const std::string& controller_name() const { return name_; }

  private:
    static constexpr size_t outcome_count = 6;

    std::shared_ptr<prometheus::Registry> registry_;
    std::string name_;

    prometheus::Counter* accepted_{nullptr};
    prometheus::Counter* throttled_{nullptr};
    prometheus::Counter* superseded_{nullptr};
    prometheus::Counter* fired_{nullptr};
    std::array<prometheus::Counter*, outcome_count> outcomes_{};
    prometheus::Gauge* active_timers_{nullptr};
};

} // namespace tempo::metrics
