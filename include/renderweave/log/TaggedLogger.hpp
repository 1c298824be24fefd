#ifdef RW_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace RW {

// Tags used by the engine:
//   Sync, Transform   per-frame tree sync chatter, skipped by default
//   Stitch, Blocks    list repair and block partition summaries
//   Display           frame summaries and painter misuse
//   Consistency       escalations and rejected intervals or regions
//   Capability        nodes left without a usable renderer
//   Error             added to anything that aborts or degrades a frame
[[nodiscard]] auto default_skip_tags() -> std::set<std::string>;

// Decides which messages reach stderr. A message is dropped when one of its
// tags is skipped, or when an enable list is set and a tag is missing from it.
struct LogFilter {
    std::set<std::string> skip_tags = default_skip_tags();
    std::set<std::string> enabled_tags{};

    [[nodiscard]] auto accepts(std::set<std::string> const& tags) const -> bool;

    // RENDERWEAVE_LOG_CLEAR_DEFAULT_SKIPS  start from an empty skip list
    // RENDERWEAVE_LOG_SKIP_TAGS            comma separated tags to add to it
    // RENDERWEAVE_LOG_ENABLE_TAGS          comma separated enable list
    [[nodiscard]] static auto from_environment() -> LogFilter;
};

// RENDERWEAVE_LOG_ENABLED or RENDERWEAVE_LOG set to anything but 0/false/off/no.
[[nodiscard]] auto logging_enabled_in_environment() -> bool;

// Queues messages and writes them from a worker thread.
class TaggedLogger {
public:
    struct Entry {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           thread_name;
        std::source_location                  location;
    };

    // Filter and enabled state come from the environment.
    TaggedLogger();
    TaggedLogger(LogFilter filter, bool enabled);
    ~TaggedLogger();

    TaggedLogger(TaggedLogger const&)            = delete;
    TaggedLogger& operator=(TaggedLogger const&) = delete;

    template <typename... Tags>
    auto log_impl(std::string const& message, std::source_location const& location, Tags&&... tags) -> void;

    auto set_thread_name(std::string const& name) -> void;
    auto set_logging_enabled(bool enabled) -> void;
    // Returns once every message queued before the call has been written.
    auto flush() -> void;

    [[nodiscard]] auto filter() const -> LogFilter const& { return filter_; }
    [[nodiscard]] auto enabled() const -> bool { return enabled_.load(std::memory_order_relaxed); }

    // Held while writing a line; test reporters share it.
    static std::mutex output_mutex;

private:
    auto run_worker() -> void;
    auto write(Entry const& entry) const -> void;
    auto thread_name(std::thread::id id) -> std::string;
    auto enqueue(Entry entry) -> void;

    LogFilter               filter_;
    std::atomic<bool>       enabled_;
    std::queue<Entry>       queue_;
    std::size_t             in_flight_ = 0;
    bool                    stopping_ = false;
    std::mutex              queue_mutex_;
    std::condition_variable wake_;
    std::condition_variable drained_;
    std::thread             worker_;

    std::unordered_map<std::thread::id, std::string> thread_names_;
    std::mutex                                       thread_names_mutex_;
    int                                              next_thread_number_ = 0;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(std::string const& message, std::source_location const& location, Tags&&... tags)
    -> void {
    if (!enabled()) {
        return;
    }
    enqueue(Entry{.timestamp = std::chrono::system_clock::now(),
                  .tags = {std::string(std::forward<Tags>(tags))...},
                  .message = message,
                  .thread_name = thread_name(std::this_thread::get_id()),
                  .location = location});
}

#define rw_log(message, ...) ::RW::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(std::string const& name);
void set_logging_enabled(bool enabled);

} // namespace RW

#else
#define rw_log(message, ...) ((void)0)
#endif // RW_LOG_DEBUG
