#ifndef DLR_TASK_CONTROLLER_HPP
#define DLR_TASK_CONTROLLER_HPP

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "download_task.hpp"
#include "task_locks.hpp"
#include "../common/config.hpp"
#include "../executor/executor.hpp"
#include "../files/file_system.hpp"
#include "../storage/task_store.hpp"

/**
 * @brief The task state machine and its command surface.
 *
 * Commands validate and persist under the task's lock, then publish
 * notifications and call the executor with no lock held. Executor events come
 * back through apply_event(), called by the dispatcher thread. This is the
 * only writer of the TaskStore.
 */
class TaskController {
public:
    using Publisher = std::function<void(TaskEvent)>;
    using IdSource = std::function<std::string()>;

    // The ack watchdog timer runs on io_context
    TaskController(TaskStore& store, Executor& executor, FileSystem& file_system,
                   const DownloaderConfig& config, asio::io_context& io_context);
    ~TaskController();

    TaskController(const TaskController&) = delete;
    TaskController& operator=(const TaskController&) = delete;

    // Receives controller-originated notifications (enqueued, resumed, forced terminals)
    void set_publisher(Publisher publisher);
    // Draws candidate task ids; IdGenerator::new_task_id by default
    void set_id_source(IdSource id_source);

    std::string enqueue(const EnqueueRequest& request);
    void pause(const std::string& task_id);
    std::string resume(const std::string& task_id, bool requires_storage_not_low = true);
    std::string retry(const std::string& task_id, bool requires_storage_not_low = true);
    void cancel(const std::string& task_id);
    void cancel_all();
    void remove(const std::string& task_id, bool should_delete_content = false);
    bool open(const std::string& task_id);

    std::vector<DownloadTask> load_tasks();
    std::vector<DownloadTask> load_tasks_with_raw_query(const std::string& sql);
    std::vector<DownloadTask> query_tasks(const TaskQuery& query);

    /**
     * @brief Applies one executor event to the stored record.
     * @param event Updated in place with the resulting progress percent.
     * @return false if the event is stale or not valid for the record's
     *         status; such events are not delivered to the observer.
     */
    bool apply_event(TaskEvent& event);

    // Settles records interrupted by a previous process and restarts ENQUEUED ones
    void recover();

    void start_watchdog();
    void stop_watchdog();
    // Forces every pause/cancel acknowledgement overdue at `now`
    void check_pending_acks(std::chrono::steady_clock::time_point now);

    size_t pending_acks() const;
    size_t lock_entries() const { return locks_.size(); }

private:
    enum class AckKind {
        Pause,
        Cancel
    };

    struct PendingAck {
        AckKind kind;
        std::chrono::steady_clock::time_point deadline;
    };

    // Reducer body; sets settled when the record is gone or ended in a terminal state
    bool reduce(TaskEvent& event, bool& settled);

    DownloadTask require_task(const std::string& task_id);
    std::string issue_task_id();
    void check_partial_available(const std::string& partial_file, const std::string& allowed_owner);

    void expect_ack(const std::string& task_id, AckKind kind);
    bool take_ack(const std::string& task_id, AckKind kind);

    void release_partial(DownloadTask& task);
    void publish(const DownloadTask& task);
    void schedule_watchdog();

    TaskStore& store_;
    Executor& executor_;
    FileSystem& file_system_;
    DownloaderConfig config_;

    TaskLockTable locks_;
    // Serializes the partial ownership check with the insert that claims it
    std::mutex ownership_mutex_;

    std::map<std::string, PendingAck> pending_;
    mutable std::mutex pending_mutex_;

    Publisher publisher_;
    IdSource id_source_;

    asio::steady_timer watchdog_timer_;
    bool watchdog_running_ = false;
    std::mutex watchdog_mutex_;
};

#endif // DLR_TASK_CONTROLLER_HPP
