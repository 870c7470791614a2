#include "storage/task_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <sqlite3.h>
#include <cctype>
#include <map>
#include <sstream>

namespace {

// Helper deleter
struct StatementDeleter { void operator()(sqlite3_stmt* s) { sqlite3_finalize(s); } };
using statement_ptr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

const char* const TASK_COLUMNS[] = {
    "task_id", "status", "progress", "url", "file_name", "saved_dir", "headers",
    "resumable", "show_notification", "open_file_from_notification",
    "requires_storage_not_low", "save_in_public_storage", "time_created",
    "bytes_downloaded", "bytes_total", "partial_file", "superseded_by", "error_message"
};

std::string select_columns() {
    std::string columns;
    for (const char* column : TASK_COLUMNS) {
        if (!columns.empty()) columns += ", ";
        columns += column;
    }
    return columns;
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

} // namespace

TaskStore::TaskStore(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {
    open();
    try {
        create_tables();
    } catch (const PersistenceError&) {
        close();
        throw;
    }
}

TaskStore::~TaskStore() {
    close();
}

void TaskStore::open() {
    int rc = sqlite3_open_v2(db_path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        LOG_ERR("Can't open database ", db_path_, ": ", message);
        close();
        throw PersistenceError("Can't open database " + db_path_ + ": " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("Opened database successfully: ", db_path_);
}

void TaskStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_DEBUG("Closed database: ", db_path_);
    }
}

void TaskStore::execute_sql(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        LOG_ERR("SQL error: ", message);
        throw PersistenceError("SQL error: " + message);
    }
}

void TaskStore::create_tables() {
    // Each commit is fsynced before the call returns
    execute_sql("PRAGMA journal_mode=WAL;");
    execute_sql("PRAGMA synchronous=FULL;");

    std::string create_task_sql = R"(
        CREATE TABLE IF NOT EXISTS task (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            task_id TEXT UNIQUE NOT NULL,
            status INTEGER NOT NULL DEFAULT 0 CHECK (status BETWEEN 0 AND 6),
            progress INTEGER NOT NULL DEFAULT 0 CHECK (progress BETWEEN 0 AND 100),
            url TEXT NOT NULL,
            file_name TEXT NOT NULL DEFAULT '',
            saved_dir TEXT NOT NULL,
            headers TEXT NOT NULL DEFAULT '{}',
            resumable INTEGER NOT NULL DEFAULT 0,
            show_notification INTEGER NOT NULL DEFAULT 0,
            open_file_from_notification INTEGER NOT NULL DEFAULT 0,
            requires_storage_not_low INTEGER NOT NULL DEFAULT 1,
            save_in_public_storage INTEGER NOT NULL DEFAULT 0,
            time_created INTEGER NOT NULL DEFAULT 0,
            bytes_downloaded INTEGER NOT NULL DEFAULT 0,
            bytes_total INTEGER NOT NULL DEFAULT -1,
            partial_file TEXT NOT NULL DEFAULT '',
            superseded_by TEXT NOT NULL DEFAULT '',
            error_message TEXT NOT NULL DEFAULT ''
        );
    )";

    // Every id ever handed out, so removed ids are never issued again
    std::string create_issued_sql = R"(
        CREATE TABLE IF NOT EXISTS issued_task_id (
            task_id TEXT PRIMARY KEY NOT NULL,
            issued_at INTEGER NOT NULL
        );
    )";

    execute_sql(create_task_sql);
    execute_sql(create_issued_sql);
    execute_sql("CREATE INDEX IF NOT EXISTS idx_task_status ON task(status);");
    execute_sql("CREATE INDEX IF NOT EXISTS idx_task_time_created ON task(time_created);");
    execute_sql("CREATE INDEX IF NOT EXISTS idx_task_partial_file ON task(partial_file);");
}

bool TaskStore::reserve_task_id(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "INSERT OR IGNORE INTO issued_task_id (task_id, issued_at) VALUES (?, ?);";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }

    bind_text(stmt.get(), 1, task_id);
    sqlite3_bind_int64(stmt.get(), 2, now_millis());

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to reserve task id: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) == 1;
}

void TaskStore::save_task(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(mutex_);
    save_task_locked(task);
}

void TaskStore::save_tasks(const std::vector<DownloadTask>& tasks) {
    std::lock_guard<std::mutex> lock(mutex_);
    execute_sql("BEGIN IMMEDIATE;");
    try {
        for (const auto& task : tasks) {
            save_task_locked(task);
        }
        execute_sql("COMMIT;");
    } catch (const PersistenceError&) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            LOG_ERR("Rollback failed: ", err_msg ? err_msg : "unknown error");
        }
        sqlite3_free(err_msg);
        throw;
    }
}

void TaskStore::save_task_locked(const DownloadTask& task) {
    std::string sql = R"(
        INSERT INTO task (task_id, status, progress, url, file_name, saved_dir, headers,
                          resumable, show_notification, open_file_from_notification,
                          requires_storage_not_low, save_in_public_storage, time_created,
                          bytes_downloaded, bytes_total, partial_file, superseded_by, error_message)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(task_id) DO UPDATE SET
            status = excluded.status,
            progress = excluded.progress,
            url = excluded.url,
            file_name = excluded.file_name,
            saved_dir = excluded.saved_dir,
            headers = excluded.headers,
            resumable = excluded.resumable,
            show_notification = excluded.show_notification,
            open_file_from_notification = excluded.open_file_from_notification,
            requires_storage_not_low = excluded.requires_storage_not_low,
            save_in_public_storage = excluded.save_in_public_storage,
            time_created = excluded.time_created,
            bytes_downloaded = excluded.bytes_downloaded,
            bytes_total = excluded.bytes_total,
            partial_file = excluded.partial_file,
            superseded_by = excluded.superseded_by,
            error_message = excluded.error_message;
    )";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }

    bind_text(stmt.get(), 1, task.task_id);
    sqlite3_bind_int(stmt.get(), 2, static_cast<int>(task.status));
    sqlite3_bind_int(stmt.get(), 3, task.progress);
    bind_text(stmt.get(), 4, task.url);
    bind_text(stmt.get(), 5, task.file_name);
    bind_text(stmt.get(), 6, task.saved_dir);
    bind_text(stmt.get(), 7, headers_to_json(task.headers));
    sqlite3_bind_int(stmt.get(), 8, task.resumable ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 9, task.show_notification ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 10, task.open_file_from_notification ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 11, task.requires_storage_not_low ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 12, task.save_in_public_storage ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 13, task.time_created);
    sqlite3_bind_int64(stmt.get(), 14, task.bytes_downloaded);
    sqlite3_bind_int64(stmt.get(), 15, task.bytes_total);
    bind_text(stmt.get(), 16, task.partial_file);
    bind_text(stmt.get(), 17, task.superseded_by);
    bind_text(stmt.get(), 18, task.error_message);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to save task ", task.task_id, ": ", sqlite3_errmsg(db_));
        throw PersistenceError("Failed to save task " + task.task_id + ": " + sqlite3_errmsg(db_));
    }
}

std::vector<DownloadTask> TaskStore::fetch_tasks(sqlite3_stmt* stmt) {
    std::map<std::string, int> column_index;
    int column_count = sqlite3_column_count(stmt);
    for (int i = 0; i < column_count; ++i) {
        column_index.emplace(sqlite3_column_name(stmt, i), i);
    }
    for (const char* column : TASK_COLUMNS) {
        if (column_index.find(column) == column_index.end()) {
            throw ValidationError(std::string("Query result is missing task column '") + column +
                                  "'; select all fields (SELECT *)");
        }
    }
    auto col = [&column_index](const char* name) { return column_index.at(name); };

    std::vector<DownloadTask> tasks;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        DownloadTask task;
        task.task_id = column_text(stmt, col("task_id"));
        int status_code = sqlite3_column_int(stmt, col("status"));
        task.status = status_from_int(status_code).value_or(DownloadTaskStatus::UNDEFINED);
        task.progress = sqlite3_column_int(stmt, col("progress"));
        task.url = column_text(stmt, col("url"));
        task.file_name = column_text(stmt, col("file_name"));
        task.saved_dir = column_text(stmt, col("saved_dir"));
        task.headers = headers_from_json(column_text(stmt, col("headers")));
        task.resumable = sqlite3_column_int(stmt, col("resumable")) != 0;
        task.show_notification = sqlite3_column_int(stmt, col("show_notification")) != 0;
        task.open_file_from_notification = sqlite3_column_int(stmt, col("open_file_from_notification")) != 0;
        task.requires_storage_not_low = sqlite3_column_int(stmt, col("requires_storage_not_low")) != 0;
        task.save_in_public_storage = sqlite3_column_int(stmt, col("save_in_public_storage")) != 0;
        task.time_created = sqlite3_column_int64(stmt, col("time_created"));
        task.bytes_downloaded = sqlite3_column_int64(stmt, col("bytes_downloaded"));
        task.bytes_total = sqlite3_column_int64(stmt, col("bytes_total"));
        task.partial_file = column_text(stmt, col("partial_file"));
        task.superseded_by = column_text(stmt, col("superseded_by"));
        task.error_message = column_text(stmt, col("error_message"));
        tasks.push_back(std::move(task));
    }
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to execute statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to read tasks: ") + sqlite3_errmsg(db_));
    }
    return tasks;
}

std::optional<DownloadTask> TaskStore::get_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT " + select_columns() + " FROM task WHERE task_id = ?;";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    bind_text(stmt.get(), 1, task_id);

    auto tasks = fetch_tasks(stmt.get());
    if (tasks.empty()) {
        return std::nullopt;
    }
    return tasks.front();
}

std::vector<DownloadTask> TaskStore::get_all_tasks() {
    return query_tasks(TaskQuery{});
}

std::vector<DownloadTask> TaskStore::query_tasks(const TaskQuery& query) {
    std::vector<std::string> clauses;
    if (!query.statuses.empty()) {
        std::string in = "status IN (";
        for (size_t i = 0; i < query.statuses.size(); ++i) {
            in += i == 0 ? "?" : ", ?";
        }
        clauses.push_back(in + ")");
    }
    if (query.created_from) clauses.push_back("time_created >= ?");
    if (query.created_until) clauses.push_back("time_created < ?");
    if (query.url) clauses.push_back("url = ?");
    if (query.saved_dir) clauses.push_back("saved_dir = ?");
    if (!query.include_superseded) clauses.push_back("superseded_by = ''");

    std::stringstream sql;
    sql << "SELECT " << select_columns() << " FROM task";
    for (size_t i = 0; i < clauses.size(); ++i) {
        sql << (i == 0 ? " WHERE " : " AND ") << clauses[i];
    }
    sql << " ORDER BY time_created, id";
    if (query.limit > 0) {
        sql << " LIMIT " << query.limit;
    }
    sql << ";";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }

    int index = 1;
    for (auto status : query.statuses) {
        sqlite3_bind_int(stmt.get(), index++, static_cast<int>(status));
    }
    if (query.created_from) sqlite3_bind_int64(stmt.get(), index++, *query.created_from);
    if (query.created_until) sqlite3_bind_int64(stmt.get(), index++, *query.created_until);
    if (query.url) bind_text(stmt.get(), index++, *query.url);
    if (query.saved_dir) bind_text(stmt.get(), index++, *query.saved_dir);

    return fetch_tasks(stmt.get());
}

std::vector<DownloadTask> TaskStore::query_tasks_raw(const std::string& sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, &tail);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        throw ValidationError(std::string("Invalid query: ") + sqlite3_errmsg(db_));
    }
    if (!stmt) {
        throw ValidationError("Invalid query: empty statement");
    }
    for (const char* p = tail; p && *p; ++p) {
        if (!std::isspace(static_cast<unsigned char>(*p)) && *p != ';') {
            throw ValidationError("Invalid query: only a single statement is allowed");
        }
    }
    if (!sqlite3_stmt_readonly(stmt.get())) {
        throw ValidationError("Invalid query: only read-only statements are allowed");
    }
    return fetch_tasks(stmt.get());
}

std::optional<DownloadTask> TaskStore::find_partial_owner(const std::string& partial_file) {
    if (partial_file.empty()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "SELECT " + select_columns() + " FROM task WHERE partial_file = ? LIMIT 1;";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    bind_text(stmt.get(), 1, partial_file);

    auto tasks = fetch_tasks(stmt.get());
    if (tasks.empty()) {
        return std::nullopt;
    }
    return tasks.front();
}

bool TaskStore::delete_task(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = "DELETE FROM task WHERE task_id = ?;";
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr);
    statement_ptr stmt(raw);
    if (rc != SQLITE_OK) {
        LOG_ERR("Failed to prepare statement: ", sqlite3_errmsg(db_));
        throw PersistenceError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
    }
    bind_text(stmt.get(), 1, task_id);

    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_DONE) {
        LOG_ERR("Failed to delete task ", task_id, ": ", sqlite3_errmsg(db_));
        throw PersistenceError("Failed to delete task " + task_id + ": " + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}
