#ifndef DLR_LOCAL_EXECUTOR_HPP
#define DLR_LOCAL_EXECUTOR_HPP

#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "executor.hpp"
#include "../common/config.hpp"
#include "../common/rate_limiter.hpp"

/**
 * @brief Executor copying file:// URLs and absolute local paths.
 *
 * Jobs run on an asio io_context served by worker_threads threads. Data is
 * written to the task's partial file in chunk_size pieces, each one charged
 * to a shared RateLimiter, and renamed to the final path on completion.
 * Pause and cancel are cooperative: the job checks its flags between chunks.
 */
class LocalExecutor : public Executor {
public:
    explicit LocalExecutor(const ExecutorConfig& config, bool ignore_ssl = false);
    ~LocalExecutor() override;

    LocalExecutor(const LocalExecutor&) = delete;
    LocalExecutor& operator=(const LocalExecutor&) = delete;

    void set_event_sink(EventSink sink) override;
    void start(const DownloadTask& task) override;
    void pause(const std::string& task_id) override;
    void cancel(const std::string& task_id) override;
    void shutdown() override;

    size_t active_jobs() const;

    // Local filesystem path of a file:// URL or absolute path, nullopt for other schemes
    static std::optional<std::string> source_path(const std::string& url);

private:
    struct Job {
        DownloadTask task;
        std::atomic<bool> pause_requested{false};
        std::atomic<bool> cancel_requested{false};
    };

    void run_job(const std::shared_ptr<Job>& job);
    void transfer(const std::shared_ptr<Job>& job);
    void finish_job(const std::shared_ptr<Job>& job);
    void emit(TaskEvent event);

    ExecutorConfig config_;
    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> workers_;
    RateLimiter rate_limiter_;

    std::map<std::string, std::shared_ptr<Job>> jobs_;
    mutable std::mutex jobs_mutex_;

    EventSink sink_;
    std::mutex sink_mutex_;

    std::atomic<bool> stopped_{false};
};

#endif // DLR_LOCAL_EXECUTOR_HPP
