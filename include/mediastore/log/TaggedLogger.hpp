#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace MS {

/**
 * LogSink: the logging dependency injected into Queue and Store.
 *
 * Implementations must be safe to call from the thread that drives the
 * EventLoop. TaggedLogger is the asynchronous, filterable implementation;
 * ErrorLogSink writes synchronously and never filters.
 */
struct LogSink {
    virtual ~LogSink() = default;

    virtual void log(std::string const& message, std::set<std::string> const& tags, std::source_location const& location) = 0;
};

class TaggedLogger : public LogSink {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    // Reads MEDIASTORE_LOG_ENABLED / MEDIASTORE_LOG, MEDIASTORE_LOG_CLEAR_DEFAULT_SKIPS,
    // MEDIASTORE_LOG_ENABLE_TAGS and MEDIASTORE_LOG_SKIP_TAGS.
    TaggedLogger();
    ~TaggedLogger() override;

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    void log(std::string const& message, std::set<std::string> const& tags, std::source_location const& location) override;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;

    // Blocks until every queued message has been written.
    auto waitIdle() -> void;

    static std::mutex coutMutex;

private:
    auto enqueue(LogMessage message) -> void;
    auto processQueue() -> void;
    auto writeToStderr(const LogMessage& msg) const -> void;
    auto getThreadName(const std::thread::id& id) -> std::string;

    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable idleCv;
    bool                    writing = false;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       enabled;
    std::set<std::string>   skipTags{"INFO", "Queue", "State"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;
};

// Unconditional synchronous sink. Used when a store has no onError hook so that
// errors reach stderr even with tagged logging switched off.
class ErrorLogSink : public LogSink {
public:
    void log(std::string const& message, std::set<std::string> const& tags, std::source_location const& location) override;
};

TaggedLogger& logger();
auto defaultErrorSink() -> std::shared_ptr<LogSink>;

auto formatLogLine(TaggedLogger::LogMessage const& msg) -> std::string;

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled)
        return;

    auto logMessage = LogMessage{.timestamp = std::chrono::system_clock::now(), .tags = {std::string(std::forward<Tags>(tags))...}, .message = message, .threadName = getThreadName(std::this_thread::get_id()), .location = location};
    this->enqueue(std::move(logMessage));
}

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace MS

#ifdef MS_LOG_DEBUG
#define ms_log(message, ...) ::MS::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)
#else
#define ms_log(message, ...) ((void)0)
#endif // MS_LOG_DEBUG
