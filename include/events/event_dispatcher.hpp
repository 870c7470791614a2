#ifndef DLR_EVENT_DISPATCHER_HPP
#define DLR_EVENT_DISPATCHER_HPP

#include <asio.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "progress_throttle.hpp"
#include "../common/channel.hpp"
#include "../executor/executor.hpp"

// Observer callback: (task id, status, progress percent)
using DownloadCallback = std::function<void(const std::string&, DownloadTaskStatus, int)>;

// Applied to every executor event before throttling. Returning false drops it.
using EventFilter = std::function<bool(TaskEvent&)>;

/**
 * @brief Moves task events from producer threads to the observer's context.
 *
 * Events are pushed into a bounded channel and consumed by a single dispatcher
 * thread, so events of one task are handled in submission order. Accepted
 * updates are posted to the observer's io_context; by default the dispatcher
 * runs its own observer context on a dedicated thread.
 */
class EventDispatcher {
public:
    explicit EventDispatcher(size_t queue_capacity, int step = ProgressThrottle::DEFAULT_STEP);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Must be set before the first submit
    void set_filter(EventFilter filter);

    /**
     * @brief Replaces the active observer and resets throttle state.
     * @param callback Invoked on the observer context for every delivered update.
     * @param step Throttling step, 0..100.
     * @param context Context the callback runs on; the dispatcher's own when omitted.
     * @throws ValidationError if step is out of range or callback is empty.
     */
    void register_callback(DownloadCallback callback, int step);
    void register_callback(DownloadCallback callback, int step, asio::io_context& context);
    void unregister_callback();

    // Blocks while the channel is full. Returns false after shutdown.
    bool submit(TaskEvent event);

    // Drains the inbound channel, then the dispatcher's observer context
    void shutdown();

    size_t pending() const { return inbound_.size(); }

private:
    void run();
    void dispatch(TaskEvent event);

    BoundedChannel<TaskEvent> inbound_;
    EventFilter filter_;

    asio::io_context observer_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> observer_guard_;
    std::thread observer_thread_;

    std::mutex registration_mutex_;
    DownloadCallback callback_;
    asio::io_context* target_context_;
    ProgressThrottle throttle_;

    std::thread worker_;
    std::once_flag shutdown_flag_;
};

#endif // DLR_EVENT_DISPATCHER_HPP
