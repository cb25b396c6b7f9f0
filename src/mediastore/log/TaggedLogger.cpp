#include <mediastore/log/TaggedLogger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string_view>

namespace MS {

namespace {

auto readEnv(char const* name) -> std::optional<std::string> {
    if (char const* value = std::getenv(name))
        return std::string{value};
    return std::nullopt;
}

auto isTruthy(std::string value) -> bool {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "on" || value == "yes";
}

auto splitTags(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    std::size_t           start = 0;
    while (start <= text.size()) {
        auto end  = text.find(',', start);
        auto item = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front())))
            item.remove_prefix(1);
        while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back())))
            item.remove_suffix(1);
        if (!item.empty())
            tags.emplace(item);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return tags;
}

auto getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

auto defaultErrorSink() -> std::shared_ptr<LogSink> {
    static auto sink = std::make_shared<ErrorLogSink>();
    return sink;
}

auto formatLogLine(TaggedLogger::LogMessage const& msg) -> std::string {
    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm     nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        if (!first)
            oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] ";

    oss << "[" << msg.threadName << "] ";
    if (msg.location.file_name() && *msg.location.file_name())
        oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';
    return oss.str();
}

TaggedLogger::TaggedLogger() : running(true), enabled(false), nextThreadNumber(0) {
    auto enabledFlag = readEnv("MEDIASTORE_LOG_ENABLED");
    if (!enabledFlag)
        enabledFlag = readEnv("MEDIASTORE_LOG");
    if (enabledFlag)
        this->enabled = isTruthy(*enabledFlag);

    if (auto clear = readEnv("MEDIASTORE_LOG_CLEAR_DEFAULT_SKIPS"); clear && isTruthy(*clear))
        this->skipTags.clear();
    if (auto extra = readEnv("MEDIASTORE_LOG_SKIP_TAGS")) {
        auto tags = splitTags(*extra);
        this->skipTags.insert(tags.begin(), tags.end());
    }
    if (auto only = readEnv("MEDIASTORE_LOG_ENABLE_TAGS"))
        this->enabledTags = splitTags(*only);

    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

void TaggedLogger::log(std::string const& message, std::set<std::string> const& tags, std::source_location const& location) {
    if (!enabled)
        return;
    this->enqueue(LogMessage{.timestamp = std::chrono::system_clock::now(), .tags = tags, .message = message, .threadName = getThreadName(std::this_thread::get_id()), .location = location});
}

auto TaggedLogger::enqueue(LogMessage message) -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(message));
    this->cv.notify_one();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    enabled.store(value, std::memory_order_relaxed);
}

auto TaggedLogger::loggingEnabled() const -> bool {
    return enabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::waitIdle() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->idleCv.wait(lock, [this] { return this->messageQueue.empty() && !this->writing; });
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            this->idleCv.notify_all();
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            this->writing = true;
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
            this->writing = false;
        }
        this->idleCv.notify_all();
    }
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    if (!this->enabledTags.empty())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return;
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return;

    auto line = formatLogLine(msg);
    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    } else {
        std::string name = "Thread " + std::to_string(nextThreadNumber++);
        threadNames[id]  = name;
        return name;
    }
}

void ErrorLogSink::log(std::string const& message, std::set<std::string> const& tags, std::source_location const& location) {
    TaggedLogger::LogMessage msg{.timestamp = std::chrono::system_clock::now(), .tags = tags, .message = message, .threadName = "main", .location = location};
    auto line = formatLogLine(msg);
    std::lock_guard<std::mutex> lock(TaggedLogger::coutMutex);
    std::cerr << line << std::flush;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace MS
