#ifdef RW_LOG_DEBUG
#include <renderweave/log/TaggedLogger.hpp>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace RW {

namespace {

auto env_flag(char const* name) -> bool {
    char const* value = std::getenv(name);
    if (value == nullptr) {
        return false;
    }
    std::string_view text{value};
    return !(text == "0" || text == "false" || text == "off" || text == "no");
}

auto split_tags(char const* value) -> std::set<std::string> {
    std::set<std::string> tags;
    if (value == nullptr) {
        return tags;
    }
    std::string_view text{value};
    while (!text.empty()) {
        auto const comma = text.find(',');
        auto token = text.substr(0, comma);
        while (!token.empty() && (token.front() == ' ' || token.front() == '\t'))
            token.remove_prefix(1);
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t'))
            token.remove_suffix(1);
        if (!token.empty())
            tags.emplace(token);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

// parent/file.cpp, or file.cpp when there is no parent.
auto short_path(char const* file) -> std::string {
    std::filesystem::path path{file};
    if (path.has_parent_path()) {
        return (path.parent_path().filename() / path.filename()).string();
    }
    return path.filename().string();
}

} // namespace

auto default_skip_tags() -> std::set<std::string> {
    return {"INFO", "Sync", "Transform"};
}

auto LogFilter::accepts(std::set<std::string> const& tags) const -> bool {
    for (auto const& tag : tags) {
        if (skip_tags.contains(tag)) {
            return false;
        }
        if (!enabled_tags.empty() && !enabled_tags.contains(tag)) {
            return false;
        }
    }
    return true;
}

auto LogFilter::from_environment() -> LogFilter {
    LogFilter filter;
    if (env_flag("RENDERWEAVE_LOG_CLEAR_DEFAULT_SKIPS")) {
        filter.skip_tags.clear();
    }
    filter.skip_tags.merge(split_tags(std::getenv("RENDERWEAVE_LOG_SKIP_TAGS")));
    filter.enabled_tags = split_tags(std::getenv("RENDERWEAVE_LOG_ENABLE_TAGS"));
    return filter;
}

auto logging_enabled_in_environment() -> bool {
    return env_flag("RENDERWEAVE_LOG_ENABLED") || env_flag("RENDERWEAVE_LOG");
}

std::mutex TaggedLogger::output_mutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : TaggedLogger(LogFilter::from_environment(), logging_enabled_in_environment()) {}

TaggedLogger::TaggedLogger(LogFilter filter, bool enabled) : filter_(std::move(filter)), enabled_(enabled) {
    worker_ = std::thread(&TaggedLogger::run_worker, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    wake_.notify_one();
    if (worker_.joinable()) {
        worker_.join();
    }
}

auto TaggedLogger::set_thread_name(std::string const& name) -> void {
    std::lock_guard<std::mutex> lock(thread_names_mutex_);
    thread_names_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::set_logging_enabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::enqueue(Entry entry) -> void {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(entry));
    }
    wake_.notify_one();
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_.wait(lock, [this] { return queue_.empty() && in_flight_ == 0; });
}

auto TaggedLogger::run_worker() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        wake_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty()) {
            // Stopping with nothing left to write.
            drained_.notify_all();
            return;
        }
        auto entry = std::move(queue_.front());
        queue_.pop();
        ++in_flight_;
        lock.unlock();
        write(entry);
        lock.lock();
        --in_flight_;
        if (queue_.empty()) {
            drained_.notify_all();
        }
    }
}

auto TaggedLogger::write(Entry const& entry) const -> void {
    if (!filter_.accepts(entry.tags)) {
        return;
    }
    auto const millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(entry.timestamp.time_since_epoch()) % 1000;
    auto const seconds = std::chrono::system_clock::to_time_t(entry.timestamp);

    std::ostringstream line;
    line << std::put_time(std::localtime(&seconds), "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
         << std::setw(3) << millis.count() << ' ';
    for (auto const& tag : entry.tags) {
        line << '[' << tag << ']';
    }
    line << " [" << entry.thread_name << "] [" << short_path(entry.location.file_name()) << ':'
         << entry.location.line() << "] " << entry.message << '\n';

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::thread_name(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(thread_names_mutex_);
    auto [it, inserted] = thread_names_.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(next_thread_number_++);
    }
    return it->second;
}

void set_thread_name(std::string const& name) {
    logger().set_thread_name(name);
}

void set_logging_enabled(bool enabled) {
    logger().set_logging_enabled(enabled);
}

} // namespace RW
#endif // RW_LOG_DEBUG
