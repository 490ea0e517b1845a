#pragma once

#include <fmt/core.h>

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace tempo
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

class Logger
{
  public:
    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    void set_level(LogLevel level)
    {
        level_.store(level, std::memory_order_relaxed);
    }

    LogLevel level() const
    {
        return level_.load(std::memory_order_relaxed);
    }

    bool enabled(LogLevel level) const
    {
        return level >= this->level();
    }

    void set_stream(std::ostream& out)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = &out;
    }

    void log(LogLevel level, const std::string& message)
    {
        if (!enabled(level))
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::string prefix;
        switch (level)
        {
            case LogLevel::Debug:
                prefix = "[DEBUG] ";
                break;
            case LogLevel::Info:
                prefix = "[INFO] ";
                break;
            case LogLevel::Warning:
                prefix = "[WARN] ";
                break;
            case LogLevel::Error:
                prefix = "[ERROR] ";
                break;
        }
        *out_ << "[tempo] " << prefix << message << std::endl;
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args)
    {
        if (enabled(LogLevel::Debug))
            log(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args)
    {
        if (enabled(LogLevel::Info))
            log(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warning(fmt::format_string<Args...> format, Args&&... args)
    {
        if (enabled(LogLevel::Warning))
            log(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args)
    {
        if (enabled(LogLevel::Error))
            log(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

  private:
    Logger() = default;

    std::mutex mutex_;
    std::ostream* out_{&std::clog};
    std::atomic<LogLevel> level_{LogLevel::Warning};
};

} // namespace tempo
