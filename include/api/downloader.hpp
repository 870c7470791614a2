#ifndef DLR_DOWNLOADER_HPP
#define DLR_DOWNLOADER_HPP

#include <asio.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../common/config.hpp"
#include "../events/event_dispatcher.hpp"
#include "../executor/executor.hpp"
#include "../files/file_system.hpp"
#include "../storage/task_store.hpp"
#include "../tasks/task_controller.hpp"

/**
 * @brief Entry point of the library. Holding a Downloader proves the library
 * was initialized; it owns the store, executor, dispatcher and controller.
 *
 * At most one live instance may use a given database file.
 */
class Downloader {
public:
    /**
     * @brief Opens the task store, wires the components and runs startup recovery.
     * @param config Validated configuration; config.debug enables DEBUG logging.
     * @param executor Transfer engine; a LocalExecutor when null.
     * @param file_system Filesystem access; a LocalFileSystem when null.
     * @throws InvalidStateError if another live Downloader uses the same database.
     * @throws PersistenceError if the database cannot be opened.
     */
    static std::unique_ptr<Downloader> initialize(const DownloaderConfig& config,
                                                  std::shared_ptr<Executor> executor = nullptr,
                                                  std::shared_ptr<FileSystem> file_system = nullptr);

    ~Downloader();

    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    std::string enqueue(const EnqueueRequest& request);
    std::vector<DownloadTask> load_tasks();
    std::vector<DownloadTask> load_tasks_with_raw_query(const std::string& sql);
    std::vector<DownloadTask> query_tasks(const TaskQuery& query);
    void cancel(const std::string& task_id);
    void cancel_all();
    void pause(const std::string& task_id);
    std::string resume(const std::string& task_id, bool requires_storage_not_low = true);
    std::string retry(const std::string& task_id, bool requires_storage_not_low = true);
    void remove(const std::string& task_id, bool should_delete_content = false);
    bool open(const std::string& task_id);

    void register_callback(DownloadCallback callback, int step = ProgressThrottle::DEFAULT_STEP);
    void register_callback(DownloadCallback callback, int step, asio::io_context& context);

    const DownloaderConfig& config() const { return config_; }

    // Pauses running transfers and drains pending notifications. Idempotent.
    void shutdown();

private:
    Downloader(const DownloaderConfig& config, std::shared_ptr<Executor> executor,
               std::shared_ptr<FileSystem> file_system, std::string registry_key);

    DownloaderConfig config_;
    std::string registry_key_;
    bool stopped_ = false;

    asio::io_context maintenance_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> maintenance_guard_;
    std::thread maintenance_thread_;

    std::unique_ptr<TaskStore> store_;
    std::shared_ptr<FileSystem> file_system_;
    std::shared_ptr<Executor> executor_;
    std::unique_ptr<EventDispatcher> dispatcher_;
    std::unique_ptr<TaskController> controller_;
};

#endif // DLR_DOWNLOADER_HPP
