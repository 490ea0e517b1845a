#include <tempo/metrics/prometheus_observer.hpp>
#include <tempo/tempo.hpp>

#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>

#include <chrono>
#include <iostream>
#include <memory>

using namespace std::chrono_literals;

int main()
{
    boost::asio::io_context io_context;
    auto registry = std::make_shared<prometheus::Registry>();

    tempo::throttle_controller<> throttle{
        &io_context, tempo::throttle_config{}, std::make_shared<tempo::metrics::prometheus_observer>(registry, "throttle")};
    tempo::debounce_controller<> debounce{
        &io_context, tempo::debounce_config{}, std::make_shared<tempo::metrics::prometheus_observer>(registry, "debounce")};

    tempo::callback_set<int> callbacks;
    callbacks.on_success = [](int) {};

    for (int i = 0; i < 10; ++i)
    {
        throttle.run_sync<int>("poll", [i] { return i; }, callbacks, 100ms);
        debounce.run_sync<int>("save", [i] { return i; }, callbacks, 100ms);
        io_context.run_for(30ms);
    }

    io_context.run();

    prometheus::TextSerializer serializer;
    std::cout << serializer.Serialize(registry->Collect());
    return 0;
}
