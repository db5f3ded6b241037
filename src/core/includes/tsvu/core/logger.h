#pragma once

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

#ifndef PROJECT_ROOT
#define PROJECT_ROOT ""
#define PROJECT_ROOT_LENGTH 0
#endif

#define TSVU_RELATIVE_FILEPATH                                 \
    (strncmp(__FILE__, PROJECT_ROOT, PROJECT_ROOT_LENGTH) == 0 \
         ? &(__FILE__[PROJECT_ROOT_LENGTH])                    \
         : __FILE__)

enum class LogLevel {
    NONE = -2,     // Special level to disable all logging
    INHERIT = -1,  // Special level for partitions to inherit global level
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

/**
 * Process-wide diagnostic logger.
 *
 * Every level goes to standard error unless redirected: tsv utilities keep
 * standard output free for data. Both streams can be swapped out (tests do
 * this to capture messages).
 */
class Logger
{
private:
    static LogLevel current_level_;
    static std::mutex log_mutex_;
    static std::ostream* output_stream_;
    static std::ostream* error_stream_;

    static bool
    should_log(LogLevel level);

    static std::string
    format_timestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
            1000;

        std::tm tm_now;
        localtime_r(&time_t_now, &tm_now);

        std::ostringstream oss;
        oss << "[" << std::setfill('0') << std::setw(2) << tm_now.tm_hour << ":"
            << std::setw(2) << tm_now.tm_min << ":" << std::setw(2)
            << tm_now.tm_sec << "." << std::setw(3) << ms.count() << "] ";

        return oss.str();
    }

    static const char*
    level_tag(LogLevel level)
    {
        switch (level)
        {
            case LogLevel::ERROR:
                return "[ERROR] ";
            case LogLevel::WARNING:
                return "[WARN]  ";
            case LogLevel::INFO:
                return "[INFO]  ";
            case LogLevel::DEBUG:
                return "[DEBUG] ";
            case LogLevel::NONE:
            case LogLevel::INHERIT:
                break;
        }
        return "";
    }

    static std::ostream&
    stream_for(LogLevel level)
    {
        if (level <= LogLevel::WARNING)
            return error_stream_ ? *error_stream_ : std::cerr;
        return output_stream_ ? *output_stream_ : std::cerr;
    }

public:
    static void
    set_level(LogLevel level);

    static bool
    set_level(const std::string& level);

    static LogLevel
    get_level();

    // Redirect INFO/DEBUG output. nullptr restores standard error.
    static void
    set_output_stream(std::ostream* output_stream);

    // Redirect ERROR/WARNING output. nullptr restores standard error.
    static void
    set_error_stream(std::ostream* error_stream);

    static void
    reset_streams();

    template <typename... Args>
    static void
    log(LogLevel level, const Args&... args)
    {
        if (!should_log(level))
            return;
        emit(level, args...);
    }

    // Writes unconditionally; partitions apply their own level first.
    template <typename... Args>
    static void
    emit(LogLevel level, const Args&... args)
    {
        // Format before taking the lock
        std::ostringstream oss;
        oss << format_timestamp() << level_tag(level);
        (oss << ... << args);

        std::lock_guard<std::mutex> lock(log_mutex_);
        stream_for(level) << oss.str() << std::endl;
    }
};

namespace logger_detail {
template <typename T>
class has_log_partition
{
    template <typename C>
    static constexpr auto
    test(int) -> decltype(C::get_log_partition(), bool())
    {
        return true;
    }

    template <typename>
    static constexpr bool
    test(...)
    {
        return false;
    }

public:
    static constexpr bool value = test<T>(0);
};
}  // namespace logger_detail

/**
 * Named log channel with its own level. A class opts in by exposing
 * `static LogPartition& get_log_partition()`; the OLOGx macros then tag its
 * messages with the partition name and honour the partition level.
 */
class LogPartition
{
public:
    LogPartition(const std::string& name, LogLevel level = LogLevel::INHERIT)
        : name_(name), level_(level)
    {
    }

    const std::string&
    name() const
    {
        return name_;
    }

    LogLevel
    level() const
    {
        return (level_ == LogLevel::INHERIT) ? Logger::get_level() : level_;
    }

    void
    set_level(LogLevel level)
    {
        level_ = level;
    }

    bool
    should_log(LogLevel message_level) const
    {
        LogLevel effective_level = level();
        return effective_level != LogLevel::NONE &&
            message_level <= effective_level;
    }

private:
    std::string name_;
    LogLevel level_;
};

namespace logger_detail {
template <typename T, typename... Args>
inline void
log_with_partition_check(
    LogLevel level,
    const char* file,
    int line,
    const T*,
    const Args&... args)
{
    if constexpr (has_log_partition<T>::value)
    {
        auto& partition = T::get_log_partition();
        if (partition.should_log(level))
        {
            // Partition level may be more verbose than the global one
            Logger::emit(
                level,
                "[",
                partition.name(),
                "] ",
                args...,
                " (",
                file,
                ":",
                line,
                ")");
        }
    }
    else
    {
        if (Logger::get_level() >= level)
        {
            Logger::log(level, args..., " (", file, ":", line, ")");
        }
    }
}
}  // namespace logger_detail

#define OLOGE(...)                                    \
    ::logger_detail::log_with_partition_check(        \
        LogLevel::ERROR,                              \
        TSVU_RELATIVE_FILEPATH,                       \
        __LINE__,                                     \
        this,                                         \
        __VA_ARGS__)
#define OLOGW(...)                                    \
    ::logger_detail::log_with_partition_check(        \
        LogLevel::WARNING,                            \
        TSVU_RELATIVE_FILEPATH,                       \
        __LINE__,                                     \
        this,                                         \
        __VA_ARGS__)
#define OLOGI(...)                                    \
    ::logger_detail::log_with_partition_check(        \
        LogLevel::INFO,                               \
        TSVU_RELATIVE_FILEPATH,                       \
        __LINE__,                                     \
        this,                                         \
        __VA_ARGS__)
#define OLOGD(...)                                    \
    ::logger_detail::log_with_partition_check(        \
        LogLevel::DEBUG,                              \
        TSVU_RELATIVE_FILEPATH,                       \
        __LINE__,                                     \
        this,                                         \
        __VA_ARGS__)

#define LOGE(...)               \
    Logger::log(                \
        LogLevel::ERROR,        \
        __VA_ARGS__,            \
        " (",                   \
        TSVU_RELATIVE_FILEPATH, \
        ":",                    \
        __LINE__,               \
        ")")
#define LOGW(...)                                 \
    if (Logger::get_level() >= LogLevel::WARNING) \
    Logger::log(                                  \
        LogLevel::WARNING,                        \
        __VA_ARGS__,                              \
        " (",                                     \
        TSVU_RELATIVE_FILEPATH,                   \
        ":",                                      \
        __LINE__,                                 \
        ")")
#define LOGI(...)                              \
    if (Logger::get_level() >= LogLevel::INFO) \
    Logger::log(                               \
        LogLevel::INFO,                        \
        __VA_ARGS__,                           \
        " (",                                  \
        TSVU_RELATIVE_FILEPATH,                \
        ":",                                   \
        __LINE__,                              \
        ")")
#define LOGD(...)                               \
    if (Logger::get_level() >= LogLevel::DEBUG) \
    Logger::log(                                \
        LogLevel::DEBUG,                        \
        __VA_ARGS__,                            \
        " (",                                   \
        TSVU_RELATIVE_FILEPATH,                 \
        ":",                                    \
        __LINE__,                               \
        ")")
