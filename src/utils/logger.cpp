/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/utils/logger.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Command Processing**: `Command` is a `std::variant` holding a
 *     `LogMessage`, a `SetSinkCommand`, a `FlushCommand` or a
 *     `SetErrorCallbackCommand`. Public API functions produce commands and push
 *     them onto the queue.
 *
 * 2.  **The Worker Thread (`worker_loop`)**: sleeps on a condition variable
 *     until the queue is non-empty or shutdown is requested, swaps the whole
 *     queue into a local vector under the lock, then processes the batch
 *     without holding it.
 *
 * 3.  **Fork handling**: the worker thread does not exist in a forked child.
 *     The owning pid is recorded at construction; a child writes its messages
 *     straight to stderr instead of enqueueing them.
 ******************************************************************************/

#include "utils/logger.hpp"

#include "phb_platform.hpp"
#include "utils/format_tools.hpp"

#include <condition_variable>
#include <cstdio>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#if defined(PUBHUB_IS_POSIX)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace pubhub::utils
{

// ============================================================================
// Internal Command and Sink Definitions
// ============================================================================

/** @struct LogMessage @brief Represents a single, formatted log entry. */
struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief The abstract base class for all log destinations.
 *
 * All methods of a Sink are called only from the Logger's worker thread.
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

static std::string format_message(const LogMessage &msg)
{
    std::string time_str = format_tools::formatted_time(msg.timestamp);
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", time_str, level_to_string(msg.level),
                       msg.thread_id, msg.body);
}

/** @brief A sink that writes log messages to the standard error console. */
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { fflush(stderr); }
    std::string description() const override { return "Console"; }
};

/** @brief A sink that appends log messages to a file. */
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : path_(path)
    {
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
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

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override
    {
        const auto line = format_message(msg);
        const ssize_t written = ::write(fd_, line.data(), line.size());
        if (written < 0 || static_cast<size_t>(written) != line.size())
        {
            throw std::runtime_error("Short write to log file: " + path_);
        }
    }

    void flush() override { ::fsync(fd_); }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
    int fd_ = -1;
};

// --- Command Definitions ---
struct SetSinkCommand { std::unique_ptr<Sink> new_sink; };
struct FlushCommand { std::shared_ptr<std::promise<void>> promise; };
struct SetErrorCallbackCommand { std::function<void(const std::string &)> callback; };

using Command = std::variant<LogMessage, SetSinkCommand, FlushCommand, SetErrorCallbackCommand>;

// ============================================================================
// Logger Pimpl and Implementation
// ============================================================================

struct LoggerImpl
{
    LoggerImpl();
    ~LoggerImpl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void shutdown();
    bool in_forked_child() const noexcept { return platform::get_pid() != owner_pid_; }

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    const uint64_t owner_pid_;

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Owned by the worker thread.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
};

LoggerImpl::LoggerImpl() : owner_pid_(platform::get_pid()), sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&LoggerImpl::worker_loop, this);
}

LoggerImpl::~LoggerImpl()
{
    if (!in_forked_child())
    {
        shutdown();
    }
    else if (worker_thread_.joinable())
    {
        // The thread object was copied by fork() but the thread itself does not exist here.
        worker_thread_.detach();
    }
}

void LoggerImpl::enqueue_command(Command &&cmd)
{
    const bool fallback = shutdown_requested_.load(std::memory_order_acquire) || in_forked_child();
    if (fallback)
    {
        // Write critical messages directly to stderr rather than lose them.
        if (std::holds_alternative<LogMessage>(cmd))
        {
            fmt::print(stderr, "[pubhub::Logger-fallback] {}", format_message(std::get<LogMessage>(cmd)));
        }
        else if (std::holds_alternative<FlushCommand>(cmd))
        {
            std::get<FlushCommand>(cmd).promise->set_value();
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            if (std::holds_alternative<LogMessage>(cmd))
            {
                fmt::print(stderr, "[pubhub::Logger-fallback] {}",
                           format_message(std::get<LogMessage>(cmd)));
            }
            else if (std::holds_alternative<FlushCommand>(cmd))
            {
                std::get<FlushCommand>(cmd).promise->set_value();
            }
            return;
        }
        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
}

void LoggerImpl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool do_final_flush_and_break = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });

            if (shutdown_requested_.load() && queue_.empty())
            {
                do_final_flush_and_break = true;
            }
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
                            if (sink_)
                                sink_->flush();
                            sink_ = std::move(arg.new_sink);
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
                if (error_callback_)
                {
                    error_callback_(fmt::format("Logger worker error: {}", e.what()));
                }
            }
        }
        local_queue.clear();

        if (do_final_flush_and_break)
        {
            if (sink_)
                sink_->flush();
            break;
        }
    }
}

void LoggerImpl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }

    {
        // Taking the lock orders the flag store with the worker's predicate check.
        std::lock_guard<std::mutex> lock(queue_mutex_);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    shutdown_completed_.store(true);
}

// --- Logger Public API Implementation ---

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

bool Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path)});
        return true;
    }
    catch (const std::runtime_error &e)
    {
        error_fmt("Logger: {}", e.what());
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
                                          platform::get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "[pubhub::Logger] dropped message: {}\n", e.what());
    }
}

} // namespace pubhub::utils
