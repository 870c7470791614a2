#include "tasks/task_controller.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/id_generator.hpp"

#include <algorithm>

namespace {

constexpr int MAX_ID_ATTEMPTS = 8;

TaskEvent notification(const DownloadTask& task) {
    TaskEvent event;
    event.task_id = task.task_id;
    event.status = task.status;
    event.bytes_downloaded = task.bytes_downloaded;
    event.bytes_total = task.bytes_total;
    event.error = task.error_message;
    event.origin = EventOrigin::Controller;
    event.progress = task.progress;
    return event;
}

} // namespace

TaskController::TaskController(TaskStore& store, Executor& executor, FileSystem& file_system,
                               const DownloaderConfig& config, asio::io_context& io_context)
    : store_(store),
      executor_(executor),
      file_system_(file_system),
      config_(config),
      id_source_(IdGenerator::new_task_id),
      watchdog_timer_(io_context) {}

TaskController::~TaskController() {
    // The timer's destructor aborts the outstanding wait
    std::lock_guard<std::mutex> lock(watchdog_mutex_);
    watchdog_running_ = false;
}

void TaskController::set_publisher(Publisher publisher) {
    publisher_ = std::move(publisher);
}

void TaskController::set_id_source(IdSource id_source) {
    id_source_ = std::move(id_source);
}

void TaskController::publish(const DownloadTask& task) {
    if (publisher_) {
        publisher_(notification(task));
    }
}

DownloadTask TaskController::require_task(const std::string& task_id) {
    auto task = store_.get_task(task_id);
    if (!task) {
        throw NotFoundError(task_id);
    }
    return *task;
}

std::string TaskController::issue_task_id() {
    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
        std::string id;
        try {
            id = id_source_();
        } catch (const DownloaderError&) {
            throw;
        } catch (const std::runtime_error& e) {
            LOG_ERR("Task id generation failed: ", e.what());
            throw PersistenceError(std::string("Could not issue a task id: ") + e.what());
        }
        if (store_.reserve_task_id(id)) {
            return id;
        }
        LOG_WARN("Task id collision on ", id, ", drawing again");
    }
    throw PersistenceError("Could not issue a unique task id");
}

void TaskController::check_partial_available(const std::string& partial_file, const std::string& allowed_owner) {
    auto owner = store_.find_partial_owner(partial_file);
    if (owner && owner->task_id != allowed_owner) {
        throw ValidationError("File " + partial_file + " is already in use by task " + owner->task_id);
    }
}

void TaskController::expect_ack(const std::string& task_id, AckKind kind) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.executor.ack_timeout_ms);
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_[task_id] = PendingAck{kind, deadline};
}

bool TaskController::take_ack(const std::string& task_id, AckKind kind) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(task_id);
    if (it == pending_.end() || it->second.kind != kind) {
        return false;
    }
    pending_.erase(it);
    return true;
}

size_t TaskController::pending_acks() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void TaskController::release_partial(DownloadTask& task) {
    if (!task.partial_file.empty()) {
        file_system_.delete_file(task.partial_file);
        task.partial_file.clear();
    }
    task.resumable = false;
}

std::string TaskController::enqueue(const EnqueueRequest& request) {
    if (request.url.empty()) {
        throw ValidationError("url must not be empty");
    }

    DownloadTask task;
    task.url = request.url;
    task.saved_dir = request.saved_dir;
    if (request.save_in_public_storage) {
        if (task.saved_dir.empty()) {
            task.saved_dir = file_system_.public_directory();
        }
    } else {
        if (!file_system_.is_absolute(task.saved_dir)) {
            throw ValidationError("saved_dir must be an absolute path: '" + task.saved_dir + "'");
        }
        if (!file_system_.directory_exists(task.saved_dir)) {
            throw ValidationError("saved_dir does not exist: " + task.saved_dir);
        }
    }

    task.file_name = request.file_name && !request.file_name->empty()
                         ? *request.file_name
                         : resolve_file_name(request.url);
    if (task.file_name.find('/') != std::string::npos || task.file_name == "." || task.file_name == "..") {
        throw ValidationError("Invalid file name: " + task.file_name);
    }

    task.headers = request.headers;
    task.show_notification = request.show_notification;
    task.open_file_from_notification = request.open_file_from_notification;
    task.requires_storage_not_low = request.requires_storage_not_low;
    task.save_in_public_storage = request.save_in_public_storage;
    task.status = DownloadTaskStatus::ENQUEUED;
    task.progress = 0;
    task.partial_file = task.partial_path();

    {
        std::lock_guard<std::mutex> ownership(ownership_mutex_);
        check_partial_available(task.partial_file, "");
        task.task_id = issue_task_id();
        task.time_created = now_millis();
        auto guard = locks_.lock(task.task_id);
        store_.save_task(task);
    }

    LOG_INFO("Enqueued ", task.task_id, ": ", task.url, " -> ", task.file_path());
    publish(task);
    executor_.start(task);
    return task.task_id;
}

void TaskController::pause(const std::string& task_id) {
    auto guard = locks_.lock(task_id);
    DownloadTask task = require_task(task_id);
    if (task.status != DownloadTaskStatus::RUNNING) {
        throw InvalidStateError("Cannot pause task " + task_id + " in state " + to_string(task.status));
    }
    expect_ack(task_id, AckKind::Pause);
    guard.unlock();

    LOG_INFO("Pausing ", task_id);
    executor_.pause(task_id);
}

std::string TaskController::resume(const std::string& task_id, bool requires_storage_not_low) {
    auto guard = locks_.lock(task_id);
    DownloadTask old_task = require_task(task_id);
    if (old_task.superseded()) {
        throw InvalidStateError("Task " + task_id + " was already continued as " + old_task.superseded_by);
    }
    if (old_task.status != DownloadTaskStatus::PAUSED || !old_task.resumable || old_task.partial_file.empty()) {
        throw InvalidStateError("Task " + task_id + " is not resumable (state " + to_string(old_task.status) + ")");
    }

    DownloadTask new_task = old_task;
    new_task.task_id = issue_task_id();
    new_task.status = DownloadTaskStatus::RUNNING;
    new_task.time_created = now_millis();
    new_task.requires_storage_not_low = requires_storage_not_low;
    new_task.resumable = false;
    new_task.superseded_by.clear();
    new_task.error_message.clear();

    old_task.superseded_by = new_task.task_id;
    old_task.resumable = false;
    old_task.partial_file.clear();

    store_.save_tasks({old_task, new_task});
    guard.unlock();

    LOG_INFO("Resumed ", task_id, " as ", new_task.task_id, " at byte ", new_task.bytes_downloaded);
    publish(new_task);
    executor_.start(new_task);
    return new_task.task_id;
}

std::string TaskController::retry(const std::string& task_id, bool requires_storage_not_low) {
    auto guard = locks_.lock(task_id);
    DownloadTask old_task = require_task(task_id);
    if (old_task.superseded()) {
        throw InvalidStateError("Task " + task_id + " was already continued as " + old_task.superseded_by);
    }
    if (old_task.status != DownloadTaskStatus::FAILED && old_task.status != DownloadTaskStatus::CANCELED) {
        throw InvalidStateError("Cannot retry task " + task_id + " in state " + to_string(old_task.status));
    }

    DownloadTask new_task = old_task;
    new_task.status = DownloadTaskStatus::ENQUEUED;
    new_task.progress = 0;
    new_task.bytes_downloaded = 0;
    new_task.bytes_total = UNKNOWN_TOTAL_BYTES;
    new_task.requires_storage_not_low = requires_storage_not_low;
    new_task.resumable = false;
    new_task.superseded_by.clear();
    new_task.error_message.clear();
    new_task.partial_file = new_task.partial_path();

    {
        std::lock_guard<std::mutex> ownership(ownership_mutex_);
        check_partial_available(new_task.partial_file, old_task.task_id);
        new_task.task_id = issue_task_id();
        new_task.time_created = now_millis();

        old_task.superseded_by = new_task.task_id;
        old_task.resumable = false;
        old_task.partial_file.clear();

        store_.save_tasks({old_task, new_task});
    }
    guard.unlock();

    LOG_INFO("Retrying ", task_id, " as ", new_task.task_id);
    publish(new_task);
    executor_.start(new_task);
    return new_task.task_id;
}

void TaskController::cancel(const std::string& task_id) {
    auto guard = locks_.lock(task_id);
    DownloadTask task = require_task(task_id);
    if (!is_active(task.status) || task.superseded()) {
        throw InvalidStateError("Cannot cancel task " + task_id + " in state " + to_string(task.status));
    }
    task.status = DownloadTaskStatus::CANCELED;
    task.resumable = false;
    store_.save_task(task);
    expect_ack(task_id, AckKind::Cancel);
    guard.unlock();

    LOG_INFO("Canceling ", task_id);
    executor_.cancel(task_id);
}

void TaskController::cancel_all() {
    TaskQuery query;
    query.statuses = {DownloadTaskStatus::ENQUEUED, DownloadTaskStatus::RUNNING, DownloadTaskStatus::PAUSED};
    query.include_superseded = false;
    auto tasks = store_.query_tasks(query);
    LOG_INFO("Canceling ", tasks.size(), " active task(s)");
    for (const auto& task : tasks) {
        try {
            cancel(task.task_id);
        } catch (const InvalidStateError& e) {
            LOG_DEBUG("Skipping ", task.task_id, ": ", e.what());
        } catch (const NotFoundError& e) {
            LOG_DEBUG("Skipping ", task.task_id, ": ", e.what());
        }
    }
}

void TaskController::remove(const std::string& task_id, bool should_delete_content) {
    auto guard = locks_.lock(task_id);
    DownloadTask task = require_task(task_id);

    bool stop_transfer = is_active(task.status) && !task.superseded();
    if (stop_transfer) {
        expect_ack(task_id, AckKind::Cancel);
    }
    store_.delete_task(task_id);

    if (should_delete_content && task.status == DownloadTaskStatus::COMPLETE) {
        file_system_.delete_file(task.file_path());
    }
    // Canceling an active task discards its partial file; the executor may hold no job for it
    if ((should_delete_content || stop_transfer) && !task.partial_file.empty()) {
        file_system_.delete_file(task.partial_file);
    }
    guard.unlock();
    locks_.erase(task_id);

    LOG_INFO("Removed ", task_id, should_delete_content ? " and its content" : "");
    if (stop_transfer) {
        executor_.cancel(task_id);
    }
}

bool TaskController::open(const std::string& task_id) {
    auto guard = locks_.lock(task_id);
    DownloadTask task = require_task(task_id);
    guard.unlock();

    if (task.status != DownloadTaskStatus::COMPLETE) {
        LOG_WARN("Task ", task_id, " is not complete, cannot open");
        return false;
    }
    std::string path = task.file_path();
    if (!file_system_.file_exists(path)) {
        LOG_WARN("Downloaded file is missing: ", path);
        return false;
    }
    return file_system_.open_file(path);
}

std::vector<DownloadTask> TaskController::load_tasks() {
    return store_.get_all_tasks();
}

std::vector<DownloadTask> TaskController::load_tasks_with_raw_query(const std::string& sql) {
    return store_.query_tasks_raw(sql);
}

std::vector<DownloadTask> TaskController::query_tasks(const TaskQuery& query) {
    return store_.query_tasks(query);
}

bool TaskController::apply_event(TaskEvent& event) {
    auto guard = locks_.lock(event.task_id);
    bool settled = false;
    bool accepted = reduce(event, settled);
    if (settled) {
        locks_.release(event.task_id, guard);
    }
    return accepted;
}

bool TaskController::reduce(TaskEvent& event, bool& settled) {
    auto record = store_.get_task(event.task_id);
    settled = !record || is_terminal(record->status);

    if (event.status == DownloadTaskStatus::CANCELED) {
        bool acknowledged = take_ack(event.task_id, AckKind::Cancel);
        if (!record) {
            // Acknowledges the cancel issued by remove()
            return acknowledged;
        }
        if (record->superseded()) {
            return false;
        }
        if (!is_active(record->status) &&
            !(record->status == DownloadTaskStatus::CANCELED && acknowledged)) {
            LOG_DEBUG("Dropping CANCELED for ", event.task_id, " in state ", to_string(record->status));
            return false;
        }
        take_ack(event.task_id, AckKind::Pause);
        record->status = DownloadTaskStatus::CANCELED;
        release_partial(*record);
        store_.save_task(*record);
        event.progress = record->progress;
        LOG_INFO("Task ", event.task_id, " canceled");
        settled = true;
        return true;
    }

    if (!record) {
        LOG_DEBUG("Dropping ", to_string(event.status), " for unknown task ", event.task_id);
        return false;
    }
    if (record->superseded()) {
        LOG_DEBUG("Dropping ", to_string(event.status), " for superseded task ", event.task_id);
        return false;
    }

    DownloadTask& task = *record;
    const bool from_pending = task.status == DownloadTaskStatus::ENQUEUED;
    const bool from_running = task.status == DownloadTaskStatus::RUNNING;
    if (event.bytes_total != UNKNOWN_TOTAL_BYTES) {
        task.bytes_total = event.bytes_total;
    }
    int percent = compute_progress(event.bytes_downloaded, task.bytes_total).value_or(task.progress);

    switch (event.status) {
    case DownloadTaskStatus::RUNNING: {
        if (!from_pending && !from_running) break;
        int progress = std::max(task.progress, percent);
        bool changed = from_pending || progress != task.progress;
        task.status = DownloadTaskStatus::RUNNING;
        task.bytes_downloaded = std::max(task.bytes_downloaded, event.bytes_downloaded);
        task.progress = progress;
        if (changed) {
            store_.save_task(task);
        }
        event.progress = task.progress;
        return true;
    }
    case DownloadTaskStatus::PAUSED:
        if (!from_running) break;
        take_ack(event.task_id, AckKind::Pause);
        task.status = DownloadTaskStatus::PAUSED;
        task.bytes_downloaded = event.bytes_downloaded;
        task.progress = std::max(task.progress, percent);
        task.resumable = task.bytes_downloaded > 0 && !task.partial_file.empty();
        store_.save_task(task);
        event.progress = task.progress;
        LOG_INFO("Task ", event.task_id, " paused at byte ", task.bytes_downloaded);
        return true;
    case DownloadTaskStatus::COMPLETE:
        if (!from_pending && !from_running) break;
        take_ack(event.task_id, AckKind::Pause);
        task.status = DownloadTaskStatus::COMPLETE;
        task.progress = 100;
        task.bytes_downloaded = event.bytes_downloaded;
        task.resumable = false;
        task.partial_file.clear();
        store_.save_task(task);
        event.progress = 100;
        LOG_INFO("Task ", event.task_id, " complete");
        settled = true;
        return true;
    case DownloadTaskStatus::FAILED:
        if (!from_pending && !from_running) break;
        take_ack(event.task_id, AckKind::Pause);
        task.status = DownloadTaskStatus::FAILED;
        task.error_message = event.error;
        task.resumable = false;
        store_.save_task(task);
        event.progress = task.progress;
        LOG_WARN("Task ", event.task_id, " failed: ", event.error);
        settled = true;
        return true;
    default:
        break;
    }

    LOG_DEBUG("Dropping ", to_string(event.status), " for ", event.task_id, " in state ", to_string(task.status));
    return false;
}

void TaskController::recover() {
    TaskQuery query;
    query.statuses = {DownloadTaskStatus::RUNNING, DownloadTaskStatus::CANCELED, DownloadTaskStatus::ENQUEUED};
    query.include_superseded = false;
    auto tasks = store_.query_tasks(query);

    std::vector<DownloadTask> restart;
    size_t settled = 0;
    for (auto& task : tasks) {
        auto guard = locks_.lock(task.task_id);
        switch (task.status) {
        case DownloadTaskStatus::RUNNING:
            if (task.bytes_downloaded > 0 && !task.partial_file.empty()) {
                task.status = DownloadTaskStatus::PAUSED;
                task.resumable = true;
            } else {
                task.status = DownloadTaskStatus::FAILED;
                task.error_message = "interrupted";
            }
            store_.save_task(task);
            ++settled;
            break;
        case DownloadTaskStatus::CANCELED:
            // Cancel never acknowledged before exit
            if (!task.partial_file.empty()) {
                release_partial(task);
                store_.save_task(task);
                ++settled;
            }
            break;
        case DownloadTaskStatus::ENQUEUED:
            restart.push_back(task);
            break;
        default:
            break;
        }
    }

    if (settled > 0 || !restart.empty()) {
        LOG_INFO("Recovery: settled ", settled, " interrupted task(s), restarting ", restart.size(), " queued task(s)");
    }
    for (const auto& task : restart) {
        executor_.start(task);
    }
}

void TaskController::check_pending_acks(std::chrono::steady_clock::time_point now) {
    std::vector<std::pair<std::string, AckKind>> overdue;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        for (const auto& [id, ack] : pending_) {
            if (ack.deadline <= now) {
                overdue.emplace_back(id, ack.kind);
            }
        }
    }

    for (const auto& [task_id, kind] : overdue) {
        auto guard = locks_.lock(task_id);
        if (!take_ack(task_id, kind)) {
            continue; // acknowledged meanwhile
        }
        auto record = store_.get_task(task_id);

        if (kind == AckKind::Pause) {
            if (!record || record->status != DownloadTaskStatus::RUNNING || record->superseded()) {
                continue;
            }
            LOG_WARN("Executor did not acknowledge pause of ", task_id, ", failing the task");
            record->status = DownloadTaskStatus::FAILED;
            record->error_message = "executor did not acknowledge pause";
            record->resumable = false;
            store_.save_task(*record);
            guard.unlock();
            publish(*record);
            executor_.cancel(task_id);
            continue;
        }

        LOG_WARN("Executor did not acknowledge cancel of ", task_id, ", completing it locally");
        DownloadTask task;
        if (record) {
            if (record->status != DownloadTaskStatus::CANCELED) {
                continue;
            }
            release_partial(*record);
            store_.save_task(*record);
            task = *record;
        } else {
            task.task_id = task_id;
            task.status = DownloadTaskStatus::CANCELED;
        }
        guard.unlock();
        publish(task);
    }
}

void TaskController::start_watchdog() {
    {
        std::lock_guard<std::mutex> lock(watchdog_mutex_);
        if (watchdog_running_) return;
        watchdog_running_ = true;
    }
    asio::post(watchdog_timer_.get_executor(), [this]() { schedule_watchdog(); });
}

void TaskController::stop_watchdog() {
    std::lock_guard<std::mutex> lock(watchdog_mutex_);
    if (!watchdog_running_) return;
    watchdog_running_ = false;
    asio::post(watchdog_timer_.get_executor(), [this]() { watchdog_timer_.cancel(); });
}

void TaskController::schedule_watchdog() {
    {
        std::lock_guard<std::mutex> lock(watchdog_mutex_);
        if (!watchdog_running_) return;
    }
    auto interval = std::chrono::milliseconds(std::max<long>(config_.executor.ack_timeout_ms / 2, 1));
    watchdog_timer_.expires_after(interval);
    watchdog_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        try {
            check_pending_acks(std::chrono::steady_clock::now());
        } catch (const DownloaderError& e) {
            LOG_ERR("Ack watchdog failed: ", e.what());
        }
        schedule_watchdog();
    });
}
