/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see src/include/utils/logger.hpp
 *
 * 1.  **Commands**: `Command` is a `std::variant` of a `LogMessage` to write,
 *     a `SetSinkCommand`, a `FlushCommand` carrying a promise, and so on.
 *     Public API calls are producers that push commands onto `queue_`.
 *
 * 2.  **Worker**: `worker_loop` waits on the condition variable, swaps the
 *     whole queue into a local vector under the lock, then processes the
 *     batch unlocked via `std::visit`.
 *
 * 3.  **Error callback**: the user callback runs on `CallbackDispatcher`'s
 *     own thread. A callback that logs cannot deadlock the worker.
 ******************************************************************************/

#include "utils/logger.hpp"
#include "utils/format_tools.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fcntl.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace ljdaq::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided error callbacks on a dedicated thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() { worker_ = std::thread([this] { run(); }); }

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
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
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
                if (queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[ljdaq::Logger] error callback threw: {}\n", e.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_{false};
};

// ============================================================================
// Messages and sinks
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/// Sinks are only ever touched by the worker thread.
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
#if defined(__linux__)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

static std::string format_message(const LogMessage &msg)
{
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", format_tools::formatted_time(msg.timestamp),
                       level_to_string(msg.level), msg.thread_id, msg.body);
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
    explicit FileSink(const std::string &path) : path_(path)
    {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ == -1)
            throw std::runtime_error("Failed to open log file: " + path);
    }

    ~FileSink() override
    {
        if (fd_ != -1)
            ::close(fd_);
    }

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const std::string line = format_message(msg);
        const char *p = line.data();
        std::size_t left = line.size();
        while (left > 0)
        {
            ssize_t n = ::write(fd_, p, left);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error("write() failed on log file: " + path_);
            }
            p += n;
            left -= static_cast<std::size_t>(n);
        }
    }

    void flush() override { ::fsync(fd_); }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

// --- Commands ---
struct SetSinkCommand { std::unique_ptr<Sink> new_sink; };
struct SinkCreationErrorCommand { std::string error_message; };
struct FlushCommand { std::shared_ptr<std::promise<void>> promise; };
struct SetErrorCallbackCommand { std::function<void(const std::string &)> callback; };

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// ============================================================================
// LoggerImpl
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void shutdown();
    void report_error(const std::string &message);

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::once_flag shutdown_once_;

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Worker-thread state.
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

static void print_fallback(const Command &cmd)
{
    if (const auto *msg = std::get_if<LogMessage>(&cmd))
        fmt::print(stderr, "[ljdaq::Logger-fallback] {}", format_message(*msg));
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        print_fallback(cmd);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // Shutdown may have been requested between the check above and the lock.
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            print_fallback(cmd);
            return;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
}

void LoggerImpl::report_error(const std::string &message)
{
    if (!error_callback_)
        return;
    auto cb = error_callback_;
    callback_dispatcher_.post([cb, message]() { cb(message); });
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    for (;;)
    {
        bool exit_after_batch = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            exit_after_batch = shutdown_requested_.load();
            local_queue.swap(queue_);
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                std::visit(
                    [this](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, LogMessage>)
                        {
                            if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                                sink_->write(arg);
                        }
                        else if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write({Logger::Level::L_SYSTEM,
                                              std::chrono::system_clock::now(),
                                              get_native_thread_id(),
                                              "Switching log sink to: " + new_desc});
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write({Logger::Level::L_SYSTEM,
                                              std::chrono::system_clock::now(),
                                              get_native_thread_id(),
                                              "Log sink switched from: " + old_desc});
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
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
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                // A FlushCommand whose sink threw must still release its waiter.
                if (auto *flush = std::get_if<FlushCommand>(&cmd))
                {
                    try
                    {
                        flush->promise->set_value();
                    }
                    catch (const std::future_error &)
                    {
                    }
                }
            }
        }
        local_queue.clear();

        if (exit_after_batch)
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty())
                break;
        }
    }

    if (sink_)
        sink_->flush();
}

void LoggerImpl::shutdown()
{
    std::call_once(shutdown_once_,
                   [this]
                   {
                       {
                           std::lock_guard<std::mutex> lock(queue_mutex_);
                           shutdown_requested_.store(true, std::memory_order_release);
                       }
                       cv_.notify_one();
                       if (worker_thread_.joinable())
                           worker_thread_.join();
                       callback_dispatcher_.shutdown();
                   });
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<LoggerImpl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &path)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(path)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
}

void Logger::shutdown()
{
    pImpl->shutdown();
}

void Logger::flush()
{
    if (pImpl->shutdown_requested_.load())
        return;

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    // The command is dropped if shutdown raced with us; the worker drains
    // everything queued before exiting, so waiting would otherwise hang.
    if (pImpl->shutdown_requested_.load())
        return;
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
        pImpl->enqueue_command(LogMessage{lvl, std::chrono::system_clock::now(),
                                          get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[ljdaq::Logger] dropped message: {}\n", e.what());
    }
}

} // namespace ljdaq::utils
