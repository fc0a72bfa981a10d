#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <ostream>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace TP {

// Tags used by the library. A message carries every tag it was logged with.
namespace LogTag {
inline constexpr char const* Protocol  = "Protocol";
inline constexpr char const* Templates = "Templates";
inline constexpr char const* Runtime   = "Runtime";
inline constexpr char const* Bridge    = "Bridge";
inline constexpr char const* Error     = "Error";
// One line per applied record; skipped unless the skip set is cleared.
inline constexpr char const* Trace     = "Trace";
} // namespace LogTag

/**
 * Asynchronous tagged logger.
 *
 * tp_log() queues a message with its tags, thread name and call site; a
 * worker thread formats and writes it to the output stream (stderr unless
 * replaced). Logging starts disabled; RuntimeOptions::logging_enabled and
 * TREEPATCH_LOG switch it on. When enabled tags are set, a message is
 * written only if all of its tags are enabled. A message carrying any skip
 * tag is dropped.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    [[nodiscard]] auto enabled() const -> bool { return this->loggingEnabled.load(std::memory_order_relaxed); }

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setEnabledTags(std::set<std::string> tags) -> void;
    auto setSkipTags(std::set<std::string> tags) -> void;
    // nullptr restores stderr. The stream must outlive its use by the logger.
    auto setOutput(std::ostream* stream) -> void;
    // Blocks until every queued message has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::size_t             inFlight = 0;
    std::thread             workerThread;
    bool                    running = true;
    std::atomic<bool>       loggingEnabled{false};

    std::set<std::string> skipTags{LogTag::Trace};
    std::set<std::string> enabledTags{};
    std::ostream*         output = nullptr;
    mutable std::mutex    tagsMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    int                                              nextThreadNumber = 0;

    auto        processQueue() -> void;
    auto        write(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled())
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    std::lock_guard<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(logMessage));
    ++this->inFlight;
    this->cv.notify_one();
}

// The message expression is only evaluated while logging is enabled.
#define tp_log(message, ...)                                                                           \
    do {                                                                                               \
        if (::TP::logger().enabled())                                                                  \
            ::TP::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__);          \
    } while (0)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace TP
