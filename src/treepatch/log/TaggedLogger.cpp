#include "TaggedLogger.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace TP {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    this->enabledTags = std::move(tags);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(this->tagsMutex);
    this->skipTags = std::move(tags);
}

auto TaggedLogger::setOutput(std::ostream* stream) -> void {
    this->flush();
    std::lock_guard<std::mutex> lock(coutMutex);
    this->output = stream;
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->inFlight == 0; });
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (!this->running && this->messageQueue.empty()) {
            return;
        }
        while (!this->messageQueue.empty()) {
            auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->write(msg);
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        return (p.parent_path().filename() / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::write(const LogMessage& msg) const -> void {
    {
        std::lock_guard<std::mutex> lock(this->tagsMutex);
        if (!this->enabledTags.empty()) {
            for (auto const& tag : msg.tags) {
                if (!this->enabledTags.contains(tag))
                    return;
            }
        }
        for (auto const& tag : this->skipTags) {
            if (msg.tags.contains(tag))
                return;
        }
    }

    const auto  millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    const auto  timeT  = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm     local{};
    localtime_r(&timeT, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : msg.tags) {
        oss << '[' << tag << ']';
    }
    oss << " [" << msg.threadName << "] [" << getShortPath(msg.location.file_name()) << ':' << msg.location.line()
        << "] " << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    auto& out = this->output != nullptr ? *this->output : std::cerr;
    out << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(this->nextThreadNumber++);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace TP
