#pragma once

#include "tsync/events/event_bus.hpp"
#include "tsync/events/event_queue.hpp"
#include "tsync/schedule/job.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tsync::events {

inline constexpr std::size_t kOutputPreviewChars = 2000;
inline constexpr std::size_t kErrorPreviewChars = 1000;

/**
 * @brief Flat key/value view of one finished run for notification templates
 *
 * Always present: task_name, task_type, status, exit_code, output*,
 * error*, timing fields, hostname, username and one "var_<KEY>" per custom
 * variable. Sync runs add endpoint descriptions, counters, sync_message,
 * summary and capped file lists.
 */
nlohmann::json build_notification_payload(const schedule::Job& job, const schedule::ExecutionResult& result);

/// "12.3s", "2m 5s", "1h 3m"
std::string format_duration(std::chrono::milliseconds duration);

/// First `max_chars` UTF-8 code points of `text`, never splitting a sequence.
std::string utf8_prefix(const std::string& text, std::size_t max_chars);

/**
 * Serialize a payload. Command output is arbitrary bytes, so invalid UTF-8
 * is written as U+FFFD instead of failing the whole document.
 */
std::string dump_payload(const nlohmann::json& payload, int indent = -1);

/**
 * @brief Hands finished-run payloads to external dispatchers
 *
 * Subscribes to JobFinishedEvent, builds the payload on the emitting thread
 * and queues it. One background thread delivers each payload to every sink
 * in registration order. Delivery is best effort: a sink that throws is
 * logged and counted, nothing is retried. Payloads still queued at
 * destruction are delivered before the thread exits.
 */
class NotificationRelay {
public:
    using Sink = std::function<void(const nlohmann::json&)>;

    explicit NotificationRelay(EventBus& bus);
    ~NotificationRelay();

    NotificationRelay(const NotificationRelay&) = delete;
    NotificationRelay& operator=(const NotificationRelay&) = delete;

    void add_sink(std::string name, Sink sink);

    [[nodiscard]] std::size_t delivered() const noexcept { return delivered_.load(); }
    [[nodiscard]] std::size_t failed() const noexcept { return failed_.load(); }

private:
    void worker();

    EventBus& bus_;
    EventBus::HandlerId subscription_ = 0;
    ThreadSafeQueue<nlohmann::json> queue_;
    std::mutex sinks_mutex_;
    std::vector<std::pair<std::string, Sink>> sinks_;
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
    std::thread thread_;
};

/// Sink appending one JSON document per line to `path`.
NotificationRelay::Sink make_json_lines_sink(std::string path);

} // namespace tsync::events
