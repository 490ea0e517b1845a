#include <tempo/timer_table.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace tempo {

struct timer_table_access {
    template<typename Tkey, typename Tinfo>
    static void on_timer(timer_table<Tkey, Tinfo>& table, const boost::system::error_code& ec) {
        table.on_timer(ec);
    }
};

} // namespace tempo

class TimerTableTest : public ::testing::Test {
protected:
    boost::asio::io_context io_context;
    int expired_count{0};
    std::vector<std::string> expired_keys;

    std::shared_ptr<tempo::timer_table<std::string, int>> make_table() {
        return std::make_shared<tempo::timer_table<std::string, int>>(
            &io_context,
            [this](std::string key, int) {
                expired_count++;
                expired_keys.push_back(std::move(key));
            }
        );
    }
};

TEST_F(TimerTableTest, NullHandlerRejected) {
    using table = tempo::timer_table<std::string, int>;
    EXPECT_THROW(std::make_shared<table>(&io_context, nullptr), std::invalid_argument);
}

TEST_F(TimerTableTest, BasicAddAndExpire) {
    auto table = make_table();

    EXPECT_TRUE(table->add("a", 30ms, 1));
    EXPECT_TRUE(table->add("b", 60ms, 2));

    EXPECT_EQ(table->size(), 2);
    EXPECT_TRUE(table->contains("a"));
    EXPECT_TRUE(table->is_active("b"));
    EXPECT_TRUE(table->is_running());

    io_context.run();

    EXPECT_EQ(expired_count, 2);
    EXPECT_EQ(table->size(), 0);
    EXPECT_FALSE(table->contains("a"));
    EXPECT_FALSE(table->is_running());
}

TEST_F(TimerTableTest, ExpirationOrder) {
    auto table = make_table();

    // Add in reverse order, should expire in correct order
    table->add("third", 90ms, 3);
    table->add("second", 60ms, 2);
    table->add("first", 30ms, 1);

    io_context.run();

    ASSERT_EQ(expired_keys.size(), 3);
    EXPECT_EQ(expired_keys[0], "first");
    EXPECT_EQ(expired_keys[1], "second");
    EXPECT_EQ(expired_keys[2], "third");
}

TEST_F(TimerTableTest, AddRejectsActiveKey) {
    auto table = make_table();

    EXPECT_TRUE(table->add("key", 10s, 1));
    EXPECT_FALSE(table->add("key", 10s, 2));

    EXPECT_EQ(table->size(), 1);
    EXPECT_EQ(table->get_info("key"), 1);
}

TEST_F(TimerTableTest, AddPurgesElapsedEntry) {
    auto table = make_table();

    table->add("key", 5ms, 1);
    std::this_thread::sleep_for(20ms);

    // Elapsed, but the loop never ran to deliver the notification
    EXPECT_TRUE(table->contains("key"));
    EXPECT_FALSE(table->is_active("key"));

    EXPECT_TRUE(table->add("key", 10s, 2));
    EXPECT_EQ(table->size(), 1);
    EXPECT_EQ(table->get_info("key"), 2);
    EXPECT_TRUE(table->is_active("key"));
}

TEST_F(TimerTableTest, ReplaceReturnsPrevious) {
    auto table = make_table();

    EXPECT_FALSE(table->replace("key", 10s, 1).has_value());

    auto previous = table->replace("key", 10s, 2);
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, 1);
    EXPECT_EQ(table->size(), 1);
    EXPECT_EQ(table->get_info("key"), 2);
}

TEST_F(TimerTableTest, ReplacedEntryNeverExpires) {
    std::vector<int> infos;
    auto table = std::make_shared<tempo::timer_table<std::string, int>>(
        &io_context,
        [&infos](std::string, int info) { infos.push_back(info); }
    );

    table->replace("key", 20ms, 1);
    table->replace("key", 60ms, 2);

    io_context.run();

    ASSERT_EQ(infos.size(), 1);
    EXPECT_EQ(infos[0], 2);
}

TEST_F(TimerTableTest, RemoveBeforeExpiry) {
    auto table = make_table();

    table->add("a", 10s, 1);
    table->add("b", 10s, 2);

    EXPECT_TRUE(table->remove("a"));
    EXPECT_FALSE(table->remove("a"));
    EXPECT_FALSE(table->contains("a"));
    EXPECT_TRUE(table->contains("b"));
    EXPECT_EQ(table->size(), 1);

    auto info = table->take("b");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(*info, 2);
    EXPECT_TRUE(table->empty());
}

TEST_F(TimerTableTest, FindReportsHandle) {
    auto table = make_table();

    EXPECT_FALSE(table->find("key").has_value());

    auto before = tempo::clock_type::now();
    table->add("key", 500ms, 1);

    auto handle = table->find("key");
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->key, "key");
    EXPECT_TRUE(handle->active);
    EXPECT_GE(handle->fires_at, before + 500ms);
}

TEST_F(TimerTableTest, RemainingTime) {
    auto table = make_table();

    table->add("key", 1s, 1);

    auto remaining = table->get_remaining_time("key");
    ASSERT_TRUE(remaining.has_value());
    EXPECT_GT(*remaining, 900ms);
    EXPECT_LE(*remaining, 1s);

    EXPECT_FALSE(table->get_remaining_time("missing").has_value());
}

TEST_F(TimerTableTest, ClearStopsTimer) {
    auto table = make_table();

    table->add("a", 20ms, 1);
    table->add("b", 40ms, 2);
    table->clear();

    EXPECT_TRUE(table->empty());
    EXPECT_FALSE(table->is_running());

    io_context.run();
    EXPECT_EQ(expired_count, 0);
}

TEST_F(TimerTableTest, EarlierEntryReschedules) {
    auto table = make_table();

    table->add("late", 200ms, 1);
    table->add("early", 20ms, 2);

    io_context.run_for(100ms);

    ASSERT_EQ(expired_keys.size(), 1);
    EXPECT_EQ(expired_keys[0], "early");
    EXPECT_TRUE(table->contains("late"));
}

TEST_F(TimerTableTest, HandlerMayRegisterNewTimer) {
    std::vector<std::string> fired;
    std::shared_ptr<tempo::timer_table<std::string, int>> table;

    table = std::make_shared<tempo::timer_table<std::string, int>>(
        &io_context,
        [&](std::string key, int round) {
            fired.push_back(key);
            if (round < 3)
                table->add(key, 10ms, round + 1);
        }
    );

    table->add("loop", 10ms, 1);
    io_context.run();

    EXPECT_EQ(fired.size(), 3);
    EXPECT_TRUE(table->empty());
}

TEST_F(TimerTableTest, ThrowingHandlerKeepsOtherEntries) {
    std::vector<std::string> fired;

    auto table = std::make_shared<tempo::timer_table<std::string, int>>(
        &io_context,
        [&](std::string key, int) {
            fired.push_back(key);
            if (key == "bad")
                throw std::runtime_error("handler failure");
        }
    );

    table->add("bad", 10ms, 1);
    table->add("good", 60ms, 2);

    EXPECT_THROW(io_context.run(), std::runtime_error);
    EXPECT_TRUE(table->contains("good"));

    io_context.restart();
    io_context.run();

    ASSERT_EQ(fired.size(), 2);
    EXPECT_EQ(fired[1], "good");
    EXPECT_TRUE(table->empty());
}

TEST_F(TimerTableTest, StopAndRestart) {
    auto table = make_table();

    table->add("key", 20ms, 1);
    table->stop();
    EXPECT_FALSE(table->is_running());

    io_context.run();
    EXPECT_EQ(expired_count, 0);
    EXPECT_TRUE(table->contains("key"));

    io_context.restart();
    table->start();
    io_context.run();
    EXPECT_EQ(expired_count, 1);
}

TEST_F(TimerTableTest, WaitErrorKeepsOtherEntriesFiring) {
    std::vector<boost::system::error_code> errors;
    auto table = std::make_shared<tempo::timer_table<std::string, int>>(
        &io_context,
        [this](std::string key, int) {
            expired_count++;
            expired_keys.push_back(std::move(key));
        },
        [&errors](const boost::system::error_code& ec) { errors.push_back(ec); }
    );

    table->add("a", 50ms, 1);
    table->add("b", 100ms, 2);

    tempo::timer_table_access::on_timer(*table, boost::asio::error::make_error_code(boost::asio::error::connection_reset));

    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0], boost::asio::error::connection_reset);
    EXPECT_TRUE(table->is_running());
    EXPECT_EQ(table->size(), 2);

    io_context.run();

    EXPECT_EQ(expired_count, 2);
    EXPECT_EQ(expired_keys, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(table->empty());
}
