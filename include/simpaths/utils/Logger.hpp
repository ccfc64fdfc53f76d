/*******************************************************************************
 * @file Logger.hpp
 * @brief Asynchronous, thread-safe logging utility for simpaths.
 *
 * **Command-Queue Pattern**
 * 1.  Calls from request threads (e.g. `LOGGER_INFO(...)`) format the message
 *     on the calling thread and push a command onto a queue. Registry
 *     operations never wait on log I/O while holding a user's lock.
 * 2.  A single worker thread is the sole consumer of the queue. It performs
 *     all writes and owns the active sink.
 * 3.  Sinks: `ConsoleSink` (stderr, default) and `FileSink` (append-only,
 *     optionally serialized across processes with flock()).
 * 4.  `flush()` blocks until everything queued before the call is written.
 *     `shutdown()` drains the queue and joins the worker; it is idempotent.
 *
 * **Usage**
 * ```cpp
 * #include "simpaths/utils/Logger.hpp"
 * LOGGER_INFO("reconciled {} pending record(s) for '{}'", n, user);
 *
 * Logger &logger = Logger::instance();
 * logger.set_logfile("/var/log/simpaths.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.shutdown(); // before main() returns
 * ```
 ******************************************************************************/

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "simpaths/platform.hpp"

// Default initial reserve for the buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (256u)
#endif

namespace simpaths::utils
{

struct LoggerImpl;

class SIMPATHS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    // Singleton accessor
    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink changes are commands executed in order by the worker thread.

    /// Switch logging to stderr. Non-blocking.
    void set_console();

    /**
     * @brief Switch logging to a file. Non-blocking.
     * @param utf8_path Path to the log file; opened for append, created if missing.
     * @param use_flock If true, hold an advisory flock() around each write so
     *        several processes can share one log file.
     * @return false if the file could not be opened (the current sink is kept).
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = false);

    /// Drains the queue and stops the worker thread. Safe to call twice.
    void shutdown();

    /// Blocks until all messages queued before the call are written.
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /// Parses "trace", "debug", "info", "warn"/"warning", "error", "system".
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    /// Runs on the callback thread when a sink write throws; without one the error goes to stderr.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

  private:
    Logger();

    std::unique_ptr<LoggerImpl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
        catch (...)
        {
            enqueue_log(lvl, "[UNKNOWN FORMAT ERROR]");
        }
    }
}

} // namespace simpaths::utils

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::simpaths::utils::Logger::instance().log_fmt<::simpaths::utils::Logger::Level::L_TRACE>(      \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::simpaths::utils::Logger::instance().log_fmt<::simpaths::utils::Logger::Level::L_DEBUG>(      \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::simpaths::utils::Logger::instance().log_fmt<::simpaths::utils::Logger::Level::L_INFO>(       \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::simpaths::utils::Logger::instance().log_fmt<::simpaths::utils::Logger::Level::L_WARNING>(    \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::simpaths::utils::Logger::instance().log_fmt<::simpaths::utils::Logger::Level::L_ERROR>(      \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::simpaths::utils::Logger::instance().log_fmt<::simpaths::utils::Logger::Level::L_SYSTEM>(     \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
