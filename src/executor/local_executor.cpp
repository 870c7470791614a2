#include "executor/local_executor.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

TaskEvent make_event(const DownloadTask& task, DownloadTaskStatus status,
                     int64_t bytes_downloaded, int64_t bytes_total) {
    TaskEvent event;
    event.task_id = task.task_id;
    event.status = status;
    event.bytes_downloaded = bytes_downloaded;
    event.bytes_total = bytes_total;
    return event;
}

} // namespace

LocalExecutor::LocalExecutor(const ExecutorConfig& config, bool ignore_ssl)
    : config_(config),
      work_guard_(asio::make_work_guard(io_context_)),
      rate_limiter_(config.max_rate_bytes_per_sec) {
    if (ignore_ssl) {
        LOG_WARN("ignore_ssl is set; certificate checks do not apply to local transfers");
    }
    size_t threads = config_.worker_threads == 0 ? 1 : config_.worker_threads;
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                LOG_ERR("Executor worker error: ", e.what());
            }
        });
    }
    LOG_DEBUG("LocalExecutor started with ", threads, " worker(s), chunk size ", config_.chunk_size,
              ", rate limit ", config_.max_rate_bytes_per_sec, " B/s");
}

LocalExecutor::~LocalExecutor() {
    shutdown();
}

void LocalExecutor::set_event_sink(EventSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

std::optional<std::string> LocalExecutor::source_path(const std::string& url) {
    const std::string scheme = "file://";
    if (url.compare(0, scheme.size(), scheme) == 0) {
        std::string rest = url.substr(scheme.size());
        // file:///path or file://localhost/path
        if (rest.compare(0, 9, "localhost") == 0) {
            rest = rest.substr(9);
        }
        if (rest.empty() || rest[0] != '/') {
            return std::nullopt;
        }
        return rest;
    }
    if (!url.empty() && url[0] == '/') {
        return url;
    }
    return std::nullopt;
}

void LocalExecutor::start(const DownloadTask& task) {
    if (stopped_) {
        LOG_WARN("Executor is shut down, not starting task ", task.task_id);
        return;
    }
    auto job = std::make_shared<Job>();
    job->task = task;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(task.task_id);
        if (it != jobs_.end()) {
            LOG_WARN("Task ", task.task_id, " is already running in the executor");
            return;
        }
        jobs_[task.task_id] = job;
    }
    if (!task.headers.empty()) {
        LOG_DEBUG("Task ", task.task_id, " carries ", task.headers.size(), " header(s); not used for local copies");
    }
    LOG_INFO("Starting transfer ", task.task_id, " from ", task.url,
             task.bytes_downloaded > 0 ? " (continuing at byte " + std::to_string(task.bytes_downloaded) + ")" : "");
    asio::post(io_context_, [this, job]() { run_job(job); });
}

void LocalExecutor::pause(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(task_id);
    if (it == jobs_.end()) {
        LOG_WARN("Pause for unknown job ", task_id);
        return;
    }
    it->second->pause_requested = true;
}

void LocalExecutor::cancel(const std::string& task_id) {
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        auto it = jobs_.find(task_id);
        if (it != jobs_.end()) {
            it->second->cancel_requested = true;
            return;
        }
    }
    // Nothing running: acknowledge right away
    LOG_DEBUG("Cancel for idle task ", task_id, ", acknowledging");
    TaskEvent event;
    event.task_id = task_id;
    event.status = DownloadTaskStatus::CANCELED;
    emit(std::move(event));
}

void LocalExecutor::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        for (auto& [id, job] : jobs_) {
            job->pause_requested = true;
        }
    }
    work_guard_.reset();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = nullptr;
    }
    LOG_DEBUG("LocalExecutor stopped");
}

size_t LocalExecutor::active_jobs() const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    return jobs_.size();
}

void LocalExecutor::emit(TaskEvent event) {
    EventSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (sink) {
        sink(std::move(event));
    }
}

void LocalExecutor::finish_job(const std::shared_ptr<Job>& job) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(job->task.task_id);
    if (it != jobs_.end() && it->second == job) {
        jobs_.erase(it);
    }
}

void LocalExecutor::run_job(const std::shared_ptr<Job>& job) {
    try {
        transfer(job);
    } catch (const ExecutorError& e) {
        LOG_ERR("Transfer ", job->task.task_id, " failed: ", e.what());
        finish_job(job);
        TaskEvent event = make_event(job->task, DownloadTaskStatus::FAILED, 0, UNKNOWN_TOTAL_BYTES);
        event.error = e.what();
        emit(std::move(event));
    } catch (const fs::filesystem_error& e) {
        LOG_ERR("Transfer ", job->task.task_id, " failed: ", e.what());
        finish_job(job);
        TaskEvent event = make_event(job->task, DownloadTaskStatus::FAILED, 0, UNKNOWN_TOTAL_BYTES);
        event.error = e.what();
        emit(std::move(event));
    }
}

void LocalExecutor::transfer(const std::shared_ptr<Job>& job) {
    const DownloadTask& task = job->task;
    if (job->cancel_requested || job->pause_requested) {
        // Stopped while still queued
        finish_job(job);
        auto status = job->cancel_requested ? DownloadTaskStatus::CANCELED : DownloadTaskStatus::PAUSED;
        emit(make_event(task, status, task.bytes_downloaded, task.bytes_total));
        return;
    }

    auto source = source_path(task.url);
    if (!source) {
        throw ExecutorError("Unsupported URL: " + task.url);
    }
    std::error_code ec;
    if (!fs::is_regular_file(*source, ec)) {
        throw ExecutorError("Source not found: " + *source);
    }
    const int64_t total = static_cast<int64_t>(fs::file_size(*source));

    fs::path partial = task.partial_file.empty() ? fs::path(task.partial_path()) : fs::path(task.partial_file);
    fs::path final_path = task.file_path();
    if (!partial.parent_path().empty()) {
        fs::create_directories(partial.parent_path());
    }

    // Range continuation: keep the first bytes_downloaded bytes of the partial file
    int64_t offset = 0;
    if (task.bytes_downloaded > 0 && fs::exists(partial, ec) &&
        static_cast<int64_t>(fs::file_size(partial)) >= task.bytes_downloaded &&
        task.bytes_downloaded <= total) {
        offset = task.bytes_downloaded;
        fs::resize_file(partial, static_cast<uintmax_t>(offset));
    } else if (task.bytes_downloaded > 0) {
        LOG_WARN("Partial file for ", task.task_id, " is missing or short, restarting from byte 0");
    }

    std::ifstream in(*source, std::ios::binary);
    if (!in) {
        throw ExecutorError("Cannot read source: " + *source);
    }
    in.seekg(offset);
    std::ofstream out(partial, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!out) {
        throw ExecutorError("Cannot write partial file: " + partial.string());
    }

    int64_t bytes = offset;
    emit(make_event(task, DownloadTaskStatus::RUNNING, bytes, total));

    std::vector<char> buffer(config_.chunk_size == 0 ? 64 * 1024 : config_.chunk_size);
    while (bytes < total) {
        if (job->cancel_requested) {
            out.close();
            fs::remove(partial, ec);
            LOG_INFO("Transfer ", task.task_id, " canceled at byte ", bytes);
            finish_job(job);
            emit(make_event(task, DownloadTaskStatus::CANCELED, bytes, total));
            return;
        }
        if (job->pause_requested) {
            out.flush();
            LOG_INFO("Transfer ", task.task_id, " paused at byte ", bytes);
            finish_job(job);
            emit(make_event(task, DownloadTaskStatus::PAUSED, bytes, total));
            return;
        }

        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n <= 0) {
            throw ExecutorError("Unexpected end of source after " + std::to_string(bytes) + " bytes");
        }
        rate_limiter_.consume(static_cast<size_t>(n));
        out.write(buffer.data(), n);
        if (!out) {
            throw ExecutorError("Write failed for " + partial.string());
        }
        bytes += n;
        emit(make_event(task, DownloadTaskStatus::RUNNING, bytes, total));
    }
    out.close();

    if (job->cancel_requested) {
        fs::remove(partial, ec);
        finish_job(job);
        emit(make_event(task, DownloadTaskStatus::CANCELED, bytes, total));
        return;
    }

    fs::rename(partial, final_path, ec);
    if (ec) {
        LOG_WARN("Failed to rename file: ", ec.message(), ". Attempting copy and delete.");
        fs::copy_file(partial, final_path, fs::copy_options::overwrite_existing);
        fs::remove(partial);
    }
    LOG_INFO("Transfer ", task.task_id, " complete: ", final_path.string());
    finish_job(job);
    emit(make_event(task, DownloadTaskStatus::COMPLETE, bytes, total));
}
