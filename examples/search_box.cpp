#include <tempo/tempo.hpp>

#include <fmt/core.h>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

// Simulated lookup that answers after 30ms on the io_context
tempo::async_operation<std::vector<std::string>> lookup(boost::asio::io_context& io, std::string query)
{
    return [&io, query](tempo::async_handler<std::vector<std::string>> done) {
        auto timer = std::make_shared<boost::asio::steady_timer>(io, 30ms);
        timer->async_wait([timer, done, query](const boost::system::error_code& ec) {
            if (ec)
            {
                done(std::make_exception_ptr(boost::system::system_error(ec)), {});
                return;
            }

            std::vector<std::string> hits;
            if (query.size() >= 3)
                hits = {query + "o", query + "porary"};
            done(nullptr, std::move(hits));
        });
    };
}

int main()
{
    boost::asio::io_context io_context;

    tempo::Logger::instance().set_level(tempo::LogLevel::Debug);

    tempo::debounce_controller<> typing{&io_context, tempo::debounce_config{200ms}};
    tempo::throttle_controller<> submit{&io_context, tempo::throttle_config{500ms}};

    tempo::callback_set<std::vector<std::string>> search_callbacks;
    search_callbacks.on_waiting = [] { fmt::print("searching...\n"); };
    search_callbacks.on_empty = [] { fmt::print("no results\n"); };
    search_callbacks.on_error = [](std::exception_ptr e) { fmt::print("search failed: {}\n", tempo::describe(e)); };
    search_callbacks.on_success = [](std::vector<std::string> hits) {
        for (const auto& hit : hits)
            fmt::print("  hit: {}\n", hit);
    };

    // Keystrokes 50ms apart: only the last query reaches the lookup
    for (const char* text : {"t", "te", "tem", "temp"})
    {
        fmt::print("typed '{}'\n", text);
        typing.run_async<std::vector<std::string>>("search", lookup(io_context, text), search_callbacks);
        io_context.run_for(50ms);
    }

    tempo::callback_set<int> submit_callbacks;
    submit_callbacks.on_throttle = [] { fmt::print("submit ignored, still cooling down\n"); };
    submit_callbacks.on_success = [](int status) { fmt::print("submitted, status {}\n", status); };

    submit.run_sync<int>("submit", [] { return 200; }, submit_callbacks);
    submit.run_sync<int>("submit", [] { return 200; }, submit_callbacks);

    io_context.run();

    fmt::print("{}\n", tempo::version_full());
    return 0;
}
