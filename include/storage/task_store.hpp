#ifndef DLR_TASK_STORE_HPP
#define DLR_TASK_STORE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../tasks/download_task.hpp"

// Forward declarations for SQLite types
struct sqlite3;
struct sqlite3_stmt;

// Relational selection over the task table. Empty members do not constrain.
struct TaskQuery {
    std::vector<DownloadTaskStatus> statuses;
    std::optional<int64_t> created_from;  // inclusive, ms since epoch
    std::optional<int64_t> created_until; // exclusive, ms since epoch
    std::optional<std::string> url;
    std::optional<std::string> saved_dir;
    bool include_superseded = true;
    size_t limit = 0; // 0 = no limit
};

// Durable task records in SQLite. Every mutating call is committed before it
// returns; failures throw PersistenceError and leave the database unchanged.
class TaskStore {
public:
    static constexpr const char* TABLE_NAME = "task";

    explicit TaskStore(const std::string& db_path);
    ~TaskStore();

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    const std::string& path() const { return db_path_; }

    // Records a newly issued id. Returns false if the id was ever issued before.
    bool reserve_task_id(const std::string& task_id);

    // Upsert keyed by task_id
    void save_task(const DownloadTask& task);
    // Upserts all records in one transaction; nothing is written on failure
    void save_tasks(const std::vector<DownloadTask>& tasks);

    std::optional<DownloadTask> get_task(const std::string& task_id);
    std::vector<DownloadTask> get_all_tasks();
    std::vector<DownloadTask> query_tasks(const TaskQuery& query);

    /**
     * @brief Runs a caller-supplied read-only SQL statement over the task table.
     * @param sql A single SELECT returning every task column, e.g.
     *            "SELECT * FROM task WHERE status=3".
     * @throws ValidationError if the statement is not a single read-only
     *         statement or a task column is missing from the result.
     */
    std::vector<DownloadTask> query_tasks_raw(const std::string& sql);

    std::optional<DownloadTask> find_partial_owner(const std::string& partial_file);

    // Returns false if no record had that id
    bool delete_task(const std::string& task_id);

private:
    void open();
    void close();
    void create_tables();

    void execute_sql(const std::string& sql);
    void save_task_locked(const DownloadTask& task);
    std::vector<DownloadTask> fetch_tasks(sqlite3_stmt* stmt);

    std::string db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};

#endif // DLR_TASK_STORE_HPP
