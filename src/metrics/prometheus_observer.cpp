#include <tempo/metrics/prometheus_observer.hpp>

#include <stdexcept>

namespace tempo::metrics
{

    prometheus_observer::prometheus_observer(
      std::shared_ptr<prometheus::Registry> registry,
      std::string controller_name
    )
      : registry_(std::move(registry))
      , name_(std::move(controller_name))
    {
        if (!registry_)
        {
            throw std::invalid_argument("Registry cannot be null");
        }
        if (name_.empty())
        {
            throw std::invalid_argument("Controller name cannot be empty");
        }

        // Families are shared by every controller exporting to this registry
        auto& fam_calls = prometheus::BuildCounter()
                            .Name("tempo_calls_total")
                            .Help("Calls seen by tempo controllers, by event")
                            .Register(*registry_);
        auto& fam_outcomes = prometheus::BuildCounter()
                               .Name("tempo_outcomes_total")
                               .Help("Dispatched operations, by outcome")
                               .Register(*registry_);
        auto& fam_active = prometheus::BuildGauge()
                             .Name("tempo_active_timers")
                             .Help("Timers currently held by a controller")
                             .Register(*registry_);

        accepted_   = &fam_calls.Add({
          {"controller", name_     },
          {"event",      "accepted"}
        });
        throttled_  = &fam_calls.Add({
          {"controller", name_      },
          {"event",      "throttled"}
        });
        superseded_ = &fam_calls.Add({
          {"controller", name_       },
          {"event",      "superseded"}
        });
        fired_      = &fam_calls.Add({
          {"controller", name_  },
          {"event",      "fired"}
        });

        for (size_t i = 0; i < outcome_count; ++i)
        {
            outcomes_[i] = &fam_outcomes.Add({
              {"controller", name_                                      },
              {"outcome",    to_string(static_cast<outcome_kind>(i))}
            });
        }

        active_timers_ = &fam_active.Add({
          {"controller", name_}
        });
    }

    void prometheus_observer::on_accepted(const std::string&)
    {
        accepted_->Increment();
    }

    void prometheus_observer::on_throttled(const std::string&)
    {
        throttled_->Increment();
    }

    void prometheus_observer::on_superseded(const std::string&)
    {
        superseded_->Increment();
    }

    void prometheus_observer::on_fired(const std::string&)
    {
        fired_->Increment();
    }

    void prometheus_observer::on_outcome(const std::string&, outcome_kind kind)
    {
        auto index = static_cast<size_t>(kind);
        if (index < outcome_count)
        {
            outcomes_[index]->Increment();
        }
    }

    void prometheus_observer::on_active_timers(size_t count)
    {
        active_timers_->Set(static_cast<double>(count));
    }

} // namespace tempo::metrics
