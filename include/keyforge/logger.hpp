#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace keyforge
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

// Process-wide log router. The engine itself holds no global state; logging is
// the one shared facility so hosts can route engine diagnostics to their own
// console or file.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;

    void add_sink(LogSink sink);
    void clear_sinks();
    size_t sink_count() const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string                level_to_string(LogLevel level);
    static std::optional<LogLevel>    parse_level(std::string_view name);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }

    // Substitutes each "{}" in order; surplus arguments are dropped.
    static std::string format_message(std::string_view format, auto&&... args)
    {
        std::string result(format);
        size_t      cursor = 0;
        auto        replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos == std::string::npos)
                return;
            std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            cursor = pos + text.size();
        };
        (replace_next(std::forward<decltype(args)>(args)), ...);
        return result;
    }
};

template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    if (!is_enabled(level))
        return;
    log(level, category, format_message(format, std::forward<Args>(args)...));
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
Logger::LogSink null_sink();
}   // namespace sinks

#define KEYFORGE_LOG_AT(lvl, category, ...)                                              \
    do                                                                                   \
    {                                                                                    \
        if (::keyforge::Logger::instance().is_enabled(lvl))                              \
        {                                                                                \
            ::keyforge::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);    \
        }                                                                                \
    } while (0)

#define KEYFORGE_LOG_TRACE(category, ...) \
    KEYFORGE_LOG_AT(::keyforge::LogLevel::Trace, category, __VA_ARGS__)
#define KEYFORGE_LOG_DEBUG(category, ...) \
    KEYFORGE_LOG_AT(::keyforge::LogLevel::Debug, category, __VA_ARGS__)
#define KEYFORGE_LOG_INFO(category, ...) \
    KEYFORGE_LOG_AT(::keyforge::LogLevel::Info, category, __VA_ARGS__)
#define KEYFORGE_LOG_WARN(category, ...) \
    KEYFORGE_LOG_AT(::keyforge::LogLevel::Warning, category, __VA_ARGS__)
#define KEYFORGE_LOG_ERROR(category, ...) \
    KEYFORGE_LOG_AT(::keyforge::LogLevel::Error, category, __VA_ARGS__)
#define KEYFORGE_LOG_CRITICAL(category, ...) \
    KEYFORGE_LOG_AT(::keyforge::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace keyforge
