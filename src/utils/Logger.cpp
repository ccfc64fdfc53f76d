/*******************************************************************************
 * @file Logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/simpaths/utils/Logger.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Commands**: `Command` is a `std::variant` of a `LogMessage`, a sink
 *     switch, a flush request (carrying a promise) and an error-callback
 *     update. Public API functions are producers.
 *
 * 2.  **Worker (`worker_loop`)**: sleeps on a condition variable, swaps the
 *     whole queue into a local vector under the lock, then processes the
 *     batch without holding the lock.
 *
 * 3.  **Error callback**: user callbacks run on a separate `CallbackDispatcher`
 *     thread so a callback that logs cannot deadlock the worker.
 ******************************************************************************/

#include "simpaths/utils/Logger.hpp"
#include "simpaths/format_tools.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#if defined(SIMPATHS_PLATFORM_LINUX)
#include <sys/syscall.h>
#elif defined(SIMPATHS_PLATFORM_APPLE)
#include <pthread.h>
#endif

namespace simpaths::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user callbacks on a dedicated thread, decoupled from the worker.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
        {
            return;
        }
        cv_.notify_one();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                {
                    return;
                }
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[simpaths::Logger] error callback threw: {}\n", e.what());
            }
            catch (...)
            {
                fmt::print(stderr, "[simpaths::Logger] error callback threw an unknown exception\n");
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// ============================================================================
// Internal Command and Sink Definitions
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief A log destination. Only ever called from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

static const char *level_to_string(Logger::Level lvl)
{
    switch (lvl)
    {
    case Logger::Level::L_TRACE: return "TRACE";
    case Logger::Level::L_DEBUG: return "DEBUG";
    case Logger::Level::L_INFO: return "INFO";
    case Logger::Level::L_WARNING: return "WARN";
    case Logger::Level::L_ERROR: return "ERROR";
    case Logger::Level::L_SYSTEM: return "SYSTEM";
    default: return "UNK";
    }
}

static uint64_t get_native_thread_id() noexcept
{
#if defined(SIMPATHS_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#elif defined(SIMPATHS_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

static std::string format_message(const LogMessage &msg)
{
    std::string time_str = simpaths::format_tools::formatted_time(msg.timestamp);
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", time_str, level_to_string(msg.level),
                       msg.thread_id, msg.body);
}

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    FileSink(const std::string &path, bool use_flock) : path_(path), use_flock_(use_flock)
    {
        int flags = O_WRONLY | O_APPEND | O_CREAT;
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        fd_ = ::open(path.c_str(), flags, 0644);
        if (fd_ == -1)
        {
            throw std::runtime_error("Failed to open log file: " + path);
        }
    }

    ~FileSink() override
    {
        if (fd_ != -1)
            ::close(fd_);
    }

    void write(const LogMessage &msg) override
    {
        auto line = format_message(msg);
        if (use_flock_)
            ::flock(fd_, LOCK_EX);
        const char *buf = line.data();
        size_t remaining = line.size();
        while (remaining > 0)
        {
            ssize_t w = ::write(fd_, buf, remaining);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                int errnum = errno;
                if (use_flock_)
                    ::flock(fd_, LOCK_UN);
                throw std::runtime_error(fmt::format("write to '{}' failed: {}", path_,
                                                     std::strerror(errnum)));
            }
            buf += w;
            remaining -= static_cast<size_t>(w);
        }
        if (use_flock_)
            ::flock(fd_, LOCK_UN);
    }

    void flush() override { ::fsync(fd_); }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    bool use_flock_;
    int fd_ = -1;
};

struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<void>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
};

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

// ============================================================================
// Logger Pimpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void shutdown();
    void process(Command &cmd);

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::once_flag shutdown_once_;

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Owned by the worker thread.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

LoggerImpl::LoggerImpl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    shutdown();
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }
    // After shutdown, messages go straight to stderr instead of being lost.
    if (std::holds_alternative<LogMessage>(cmd))
    {
        fmt::print(stderr, "[simpaths::Logger-fallback] {}", format_message(std::get<LogMessage>(cmd)));
    }
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
    {
        flush->promise->set_value();
    }
}

void LoggerImpl::process(Command &cmd)
{
    std::visit(
        [this](auto &&arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, LogMessage>)
            {
                if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                    sink_->write(arg);
            }
            else if constexpr (std::is_same_v<T, SetSinkCommand>)
            {
                std::string old_desc = sink_ ? sink_->description() : "null";
                if (sink_)
                    sink_->flush();
                sink_ = std::move(arg.new_sink);
                if (sink_)
                {
                    sink_->write({Logger::Level::L_SYSTEM, std::chrono::system_clock::now(),
                                  get_native_thread_id(), "Log sink switched from: " + old_desc});
                }
            }
            else if constexpr (std::is_same_v<T, FlushCommand>)
            {
                if (sink_)
                    sink_->flush();
                arg.promise->set_value();
            }
            else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
            {
                error_callback_ = std::move(arg.callback);
            }
        },
        cmd);
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool stop = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            stop = shutdown_requested_.load() && queue_.empty();
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                process(cmd);
            }
            catch (const std::exception &e)
            {
                auto msg = fmt::format("Logger worker error: {}", e.what());
                if (error_callback_)
                {
                    auto cb = error_callback_;
                    callback_dispatcher_.post([cb, msg]() { cb(msg); });
                }
                else
                {
                    fmt::print(stderr, "[simpaths::Logger] {}\n", msg);
                }
            }
        }
        local_queue.clear();

        if (stop)
        {
            if (sink_)
                sink_->flush();
            break;
        }
    }
}

void LoggerImpl::shutdown()
{
    std::call_once(shutdown_once_, [this] {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            shutdown_requested_.store(true, std::memory_order_release);
        }
        cv_.notify_one();
        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }
        callback_dispatcher_.shutdown();
    });
}

// --- Logger Public API ---

namespace
{
std::unique_ptr<Logger> g_instance;
std::mutex g_instance_mutex;
} // namespace

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    std::lock_guard<std::mutex> lock(g_instance_mutex);
    if (!g_instance)
    {
        g_instance.reset(new Logger());
    }
    return *g_instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock)});
        return true;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Failed to create FileSink: {}", e.what());
        return false;
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    if (name == "trace")
        return Level::L_TRACE;
    if (name == "debug")
        return Level::L_DEBUG;
    if (name == "info")
        return Level::L_INFO;
    if (name == "warn" || name == "warning")
        return Level::L_WARNING;
    if (name == "error")
        return Level::L_ERROR;
    if (name == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

bool Logger::should_log(Level lvl) const noexcept
{
    return static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    try
    {
        pImpl->enqueue_command(
            LogMessage{lvl, std::chrono::system_clock::now(), get_native_thread_id(), std::move(body)});
    }
    catch (...)
    {
        // Allocation failure while queueing; the message is dropped.
    }
}

} // namespace simpaths::utils
