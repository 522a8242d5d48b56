/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous command-queue logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "sfx_base.hpp"

#include "utils/logger.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

using scenefix::format_tools::make_buffer;

namespace scenefix::utils
{

/**
 * @class CallbackDispatcher
 * @brief Executes user-provided callbacks on a dedicated thread.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    CallbackDispatcher(const CallbackDispatcher &) = delete;
    CallbackDispatcher &operator=(const CallbackDispatcher &) = delete;

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
                fmt::print(stderr, "[SFX] write-error callback threw: {}\n", e.what());
            }
            catch (...)
            {
                std::fputs("[SFX] write-error callback threw a non-standard exception\n",
                           stderr);
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetErrorCallbackCommand
{
    std::function<void(const std::string &)> callback;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetLogSinkMessagesCommand
{
    bool enabled;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand, SetLogSinkMessagesCommand>;

namespace
{
template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &)
    {
        // Already satisfied: the command was rejected earlier.
    }
}

LogMessage make_record(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = scenefix::platform::get_pid(),
                      .thread_id = scenefix::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // namespace

struct Logger::Impl
{
    Impl();
    ~Impl();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(std::string msg);
    bool install_sink(std::unique_ptr<Sink> sink);
    void sink_creation_failed(std::string msg);
    void shutdown();

    std::function<void(const std::string &)> error_callback_;
    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    std::mutex shutdown_mutex_;
    CallbackDispatcher callback_dispatcher_;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_log_sink_messages_enabled_{true};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};
    std::atomic<size_t> m_total_dropped_since_sink_switch{0};
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
}

Logger::Impl::~Impl()
{
    shutdown();
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

void Logger::Impl::report_error(std::string msg)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(msg)]() { cb(msg); });
    }
    else
    {
        SFX_DEBUG("Logger error with no write-error callback installed: {}", msg);
    }
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = queue_.size();
        const size_t max_queue_size_soft = m_max_queue_size;
        const size_t max_queue_size_hard = m_max_queue_size * 2;
        const bool is_message = std::holds_alternative<LogMessage>(cmd);

        // Log messages are dropped at the soft limit; control commands only at the hard one.
        if (current_queue_size >= max_queue_size_hard ||
            (is_message && current_queue_size >= max_queue_size_soft))
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;
        bool stopping = false;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);
            stopping = shutdown_requested_.load() && local_queue.empty();

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                if (dropped_count > 0)
                {
                    dropping_duration_s =
                        std::chrono::duration_cast<std::chrono::duration<double>>(
                            std::chrono::system_clock::now() - m_dropping_since)
                            .count();
                }
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_record(Logger::Level::L_WARNING,
                                             make_buffer("Overflow detected when processing the "
                                                         "queue. Messages may have been dropped "
                                                         "in the following batch.")));
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
        }

        // Only the last sink change of a batch takes effect.
        std::ptrdiff_t last_set_sink_idx = -1;
        for (std::ptrdiff_t i = static_cast<std::ptrdiff_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[i]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(local_queue.size()); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg);
                    }
                    continue;
                }

                std::visit(
                    [&, this, i](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            if (i != last_set_sink_idx)
                            {
                                promise_set_safe(arg.promise, false);
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            {
                                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                                if (sink_)
                                {
                                    sink_->flush();
                                }
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetLogSinkMessagesCommand>)
                        {
                            m_log_sink_messages_enabled_.store(arg.enabled,
                                                               std::memory_order_relaxed);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
                // A failed flush still completes the request.
                if (auto *flush = std::get_if<FlushCommand>(&local_queue[i]))
                {
                    promise_set_safe(flush->promise, false);
                }
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_record(Logger::Level::L_WARNING,
                                             make_buffer("Summary: the Logger dropped {} messages "
                                                         "over {:.2f}s due to full queue.",
                                                         dropped_count, dropping_duration_s)));
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
        }

        if (last_set_sink_idx != -1)
        {
            if (auto *sink_cmd = std::get_if<SetSinkCommand>(&local_queue[last_set_sink_idx]))
            {
                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                try
                {
                    if (m_log_sink_messages_enabled_.load(std::memory_order_relaxed))
                    {
                        const std::string old_desc = sink_ ? sink_->description() : "null";
                        const std::string new_desc =
                            sink_cmd->new_sink ? sink_cmd->new_sink->description() : "null";
                        if (sink_)
                        {
                            sink_->write(make_record(Logger::Level::L_SYSTEM,
                                                     make_buffer("Switching log sink to: {}",
                                                                 new_desc)));
                            sink_->flush();
                        }
                        sink_ = std::move(sink_cmd->new_sink);
                        if (sink_)
                        {
                            sink_->write(make_record(Logger::Level::L_SYSTEM,
                                                     make_buffer("Log sink switched from: {}",
                                                                 old_desc)));
                        }
                    }
                    else
                    {
                        sink_ = std::move(sink_cmd->new_sink);
                    }
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                    if (sink_cmd->new_sink)
                    {
                        sink_ = std::move(sink_cmd->new_sink);
                    }
                }
                m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
                promise_set_safe(sink_cmd->promise, true);
            }
        }

        local_queue.clear();

        if (stopping)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_record(Logger::Level::L_SYSTEM,
                                             make_buffer("Logger is shutting down.")));
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger worker error: {}", e.what()));
                }
            }
            break;
        }
    }
}

bool Logger::Impl::install_sink(std::unique_ptr<Sink> sink)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    enqueue_command(SetSinkCommand{std::move(sink), promise});
    return future.get();
}

void Logger::Impl::sink_creation_failed(std::string msg)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    enqueue_command(SinkCreationErrorCommand{std::move(msg), promise});
    (void)future.get(); // wait until the error has been dispatched
}

void Logger::Impl::shutdown()
{
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    if (shutdown_completed_.load())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> qlock(queue_mutex_);
        shutdown_requested_.store(true, std::memory_order_release);
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// Logger Public API Implementation
Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger()
{
    shutdown();
}

bool Logger::set_console()
{
    try
    {
        return pImpl->install_sink(std::make_unique<ConsoleSink>());
    }
    catch (const std::exception &e)
    {
        pImpl->sink_creation_failed(fmt::format("Failed to create ConsoleSink: {}", e.what()));
    }
    return false;
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    try
    {
        return pImpl->install_sink(std::make_unique<FileSink>(utf8_path, use_flock));
    }
    catch (const std::exception &e)
    {
        pImpl->sink_creation_failed(fmt::format("Failed to create FileSink: {}", e.what()));
    }
    return false;
}

void Logger::shutdown()
{
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    // A flush enqueued after shutdown would never be answered.
    if (pImpl->shutdown_requested_.load())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb), promise});
    (void)future.get();
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetLogSinkMessagesCommand{enabled, promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    return pImpl && !pImpl->shutdown_requested_.load(std::memory_order_relaxed) &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    if (!pImpl)
        return false;
    try
    {
        return pImpl->enqueue_command(make_record(lvl, make_buffer("{}", body)));
    }
    catch (const std::exception &)
    {
        // Out of memory while building the record; the message is lost.
        pImpl->m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
}

std::optional<Logger::Level> level_from_string(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return Logger::Level::L_TRACE;
    if (lower == "debug")
        return Logger::Level::L_DEBUG;
    if (lower == "info")
        return Logger::Level::L_INFO;
    if (lower == "warning" || lower == "warn")
        return Logger::Level::L_WARNING;
    if (lower == "error")
        return Logger::Level::L_ERROR;
    if (lower == "system")
        return Logger::Level::L_SYSTEM;
    return std::nullopt;
}

const char *level_to_string(Logger::Level lvl) noexcept
{
    return Sink::level_to_string_internal(static_cast<int>(lvl));
}

} // namespace scenefix::utils
