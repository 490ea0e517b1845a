#include <tempo/metrics/prometheus_observer.hpp>
#include <tempo/debounce.hpp>
#include <tempo/throttle.hpp>
#include <gtest/gtest.h>
#include <prometheus/registry.h>
#include <chrono>
#include <map>
#include <memory>
#include <string>

using namespace std::chrono_literals;

namespace {

// Value of the sample in family name whose labels include all of labels
double sample(prometheus::Registry& registry, const std::string& name,
              const std::map<std::string, std::string>& labels) {
    for (const auto& family : registry.Collect()) {
        if (family.name != name)
            continue;

        for (const auto& metric : family.metric) {
            size_t matched = 0;
            for (const auto& label : metric.label) {
                auto it = labels.find(label.name);
                if (it != labels.end() && it->second == label.value)
                    ++matched;
            }
            if (matched == labels.size())
                return family.type == prometheus::MetricType::Gauge ? metric.gauge.value : metric.counter.value;
        }
    }
    return -1.0;
}

} // namespace

class PrometheusObserverTest : public ::testing::Test {
protected:
    boost::asio::io_context io_context;
    std::shared_ptr<prometheus::Registry> registry = std::make_shared<prometheus::Registry>();
};

TEST_F(PrometheusObserverTest, InvalidArguments) {
    EXPECT_THROW(tempo::metrics::prometheus_observer(nullptr, "throttle"), std::invalid_argument);
    EXPECT_THROW(tempo::metrics::prometheus_observer(registry, ""), std::invalid_argument);
}

TEST_F(PrometheusObserverTest, CountsThrottleDecisions) {
    auto observer = std::make_shared<tempo::metrics::prometheus_observer>(registry, "throttle");
    tempo::throttle_controller<> throttle{&io_context, tempo::throttle_config{}, observer};

    tempo::callback_set<int> cbs;
    cbs.on_success = [](int) {};

    throttle.run_sync<int>("key", [] { return 1; }, cbs, 10s);
    throttle.run_sync<int>("key", [] { return 1; }, cbs, 10s);
    throttle.run_sync<int>("other", [] { return 1; }, cbs, 10s);

    EXPECT_EQ(sample(*registry, "tempo_calls_total", {{"controller", "throttle"}, {"event", "accepted"}}), 2.0);
    EXPECT_EQ(sample(*registry, "tempo_calls_total", {{"controller", "throttle"}, {"event", "throttled"}}), 1.0);
    EXPECT_EQ(sample(*registry, "tempo_outcomes_total", {{"controller", "throttle"}, {"outcome", "success"}}), 2.0);
    EXPECT_EQ(sample(*registry, "tempo_active_timers", {{"controller", "throttle"}}), 2.0);
}

TEST_F(PrometheusObserverTest, ControllersShareRegistry) {
    auto throttle_observer = std::make_shared<tempo::metrics::prometheus_observer>(registry, "throttle");
    auto debounce_observer = std::make_shared<tempo::metrics::prometheus_observer>(registry, "debounce");
    tempo::debounce_controller<> debounce{&io_context, tempo::debounce_config{}, debounce_observer};

    tempo::callback_set<int> cbs;
    cbs.on_success = [](int) {};

    debounce.run_sync<int>("key", [] { return 1; }, cbs, 20ms);
    debounce.run_sync<int>("key", [] { return 2; }, cbs, 20ms);
    io_context.run();

    EXPECT_EQ(sample(*registry, "tempo_calls_total", {{"controller", "debounce"}, {"event", "superseded"}}), 1.0);
    EXPECT_EQ(sample(*registry, "tempo_calls_total", {{"controller", "debounce"}, {"event", "fired"}}), 1.0);
    EXPECT_EQ(sample(*registry, "tempo_outcomes_total", {{"controller", "debounce"}, {"outcome", "success"}}), 1.0);
    EXPECT_EQ(sample(*registry, "tempo_calls_total", {{"controller", "throttle"}, {"event", "accepted"}}), 0.0);
    EXPECT_EQ(sample(*registry, "tempo_active_timers", {{"controller", "debounce"}}), 0.0);
}
