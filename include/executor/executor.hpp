#ifndef DLR_EXECUTOR_HPP
#define DLR_EXECUTOR_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "../tasks/download_task.hpp"

// Who produced an event. Controller notifications bypass the reducer.
enum class EventOrigin {
    Executor,
    Controller
};

// Immutable status/progress report for one task.
struct TaskEvent {
    std::string task_id;
    DownloadTaskStatus status = DownloadTaskStatus::UNDEFINED;
    int64_t bytes_downloaded = 0;
    int64_t bytes_total = UNKNOWN_TOTAL_BYTES;
    std::string error;
    EventOrigin origin = EventOrigin::Executor;
    // Set by the reducer or by the controller; -1 while not yet known
    int progress = -1;
};

using EventSink = std::function<void(TaskEvent)>;

// The transfer engine. Implementations report every state change through the
// event sink and must acknowledge pause() with PAUSED (or a terminal event)
// and cancel() with CANCELED.
class Executor {
public:
    virtual ~Executor() = default;

    virtual void set_event_sink(EventSink sink) = 0;

    // A task with bytes_downloaded > 0 and a partial file continues from that offset.
    virtual void start(const DownloadTask& task) = 0;
    virtual void pause(const std::string& task_id) = 0;
    // Stops the transfer and discards the partial artifact
    virtual void cancel(const std::string& task_id) = 0;

    // Pauses running jobs and joins the workers. No events are emitted afterwards.
    virtual void shutdown() = 0;
};

#endif // DLR_EXECUTOR_HPP
