#include "api/downloader.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "executor/local_executor.hpp"

#include <filesystem>
#include <mutex>
#include <set>

namespace fs = std::filesystem;

namespace {

// Database files held by live Downloader instances
std::mutex registry_mutex;
std::set<std::string> live_databases;

std::string registry_key(const std::string& database) {
    std::error_code ec;
    auto absolute = fs::absolute(database, ec);
    if (ec) {
        return database;
    }
    return absolute.lexically_normal().string();
}

} // namespace

std::unique_ptr<Downloader> Downloader::initialize(const DownloaderConfig& config,
                                                   std::shared_ptr<Executor> executor,
                                                   std::shared_ptr<FileSystem> file_system) {
    config.validate();
    Logger::instance().set_debug(config.debug);

    std::string key = registry_key(config.database);
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        if (!live_databases.insert(key).second) {
            throw InvalidStateError("A downloader is already running on " + key);
        }
    }

    try {
        if (!file_system) {
            file_system = std::make_shared<LocalFileSystem>(config.opener_command);
        }
        if (!executor) {
            executor = std::make_shared<LocalExecutor>(config.executor, config.ignore_ssl);
        }
        return std::unique_ptr<Downloader>(new Downloader(config, std::move(executor), std::move(file_system), key));
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(registry_mutex);
        live_databases.erase(key);
        throw;
    }
}

Downloader::Downloader(const DownloaderConfig& config, std::shared_ptr<Executor> executor,
                       std::shared_ptr<FileSystem> file_system, std::string registry_key)
    : config_(config),
      registry_key_(std::move(registry_key)),
      file_system_(std::move(file_system)),
      executor_(std::move(executor)) {
    store_ = std::make_unique<TaskStore>(config_.database);
    dispatcher_ = std::make_unique<EventDispatcher>(config_.event_queue_capacity, config_.callback_step);
    controller_ = std::make_unique<TaskController>(*store_, *executor_, *file_system_, config_, maintenance_context_);

    // Executor events -> dispatcher -> reducer -> throttle -> observer
    controller_->set_publisher([this](TaskEvent event) { dispatcher_->submit(std::move(event)); });
    dispatcher_->set_filter([this](TaskEvent& event) { return controller_->apply_event(event); });
    executor_->set_event_sink([this](TaskEvent event) { dispatcher_->submit(std::move(event)); });

    if (config_.recover_interrupted) {
        try {
            controller_->recover();
        } catch (const PersistenceError&) {
            executor_->shutdown();
            dispatcher_->shutdown();
            throw;
        }
    }

    maintenance_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        asio::make_work_guard(maintenance_context_));
    maintenance_thread_ = std::thread([this]() {
        try {
            maintenance_context_.run();
        } catch (const std::exception& e) {
            LOG_ERR("Maintenance thread error: ", e.what());
        }
    });
    controller_->start_watchdog();
    LOG_INFO("Downloader initialized on ", registry_key_, (config_.debug ? " (debug)" : ""));
}

Downloader::~Downloader() {
    shutdown();
    std::lock_guard<std::mutex> lock(registry_mutex);
    live_databases.erase(registry_key_);
}

void Downloader::shutdown() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    // Running transfers report PAUSED before the dispatcher drains
    executor_->shutdown();
    dispatcher_->shutdown();

    controller_->stop_watchdog();
    maintenance_guard_.reset();
    maintenance_context_.stop();
    if (maintenance_thread_.joinable()) maintenance_thread_.join();
    LOG_INFO("Downloader on ", registry_key_, " shut down");
}

std::string Downloader::enqueue(const EnqueueRequest& request) {
    return controller_->enqueue(request);
}

std::vector<DownloadTask> Downloader::load_tasks() {
    return controller_->load_tasks();
}

std::vector<DownloadTask> Downloader::load_tasks_with_raw_query(const std::string& sql) {
    return controller_->load_tasks_with_raw_query(sql);
}

std::vector<DownloadTask> Downloader::query_tasks(const TaskQuery& query) {
    return controller_->query_tasks(query);
}

void Downloader::cancel(const std::string& task_id) {
    controller_->cancel(task_id);
}

void Downloader::cancel_all() {
    controller_->cancel_all();
}

void Downloader::pause(const std::string& task_id) {
    controller_->pause(task_id);
}

std::string Downloader::resume(const std::string& task_id, bool requires_storage_not_low) {
    return controller_->resume(task_id, requires_storage_not_low);
}

std::string Downloader::retry(const std::string& task_id, bool requires_storage_not_low) {
    return controller_->retry(task_id, requires_storage_not_low);
}

void Downloader::remove(const std::string& task_id, bool should_delete_content) {
    controller_->remove(task_id, should_delete_content);
}

bool Downloader::open(const std::string& task_id) {
    return controller_->open(task_id);
}

void Downloader::register_callback(DownloadCallback callback, int step) {
    dispatcher_->register_callback(std::move(callback), step);
}

void Downloader::register_callback(DownloadCallback callback, int step, asio::io_context& context) {
    dispatcher_->register_callback(std::move(callback), step, context);
}
