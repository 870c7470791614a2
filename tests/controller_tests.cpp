#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "tasks/task_controller.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/id_generator.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::Field;
using ::testing::NiceMock;

class MockExecutor : public Executor {
public:
    MOCK_METHOD(void, set_event_sink, (EventSink sink), (override));
    MOCK_METHOD(void, start, (const DownloadTask& task), (override));
    MOCK_METHOD(void, pause, (const std::string& task_id), (override));
    MOCK_METHOD(void, cancel, (const std::string& task_id), (override));
    MOCK_METHOD(void, shutdown, (), (override));
};

// Fixture for TaskController tests: real store and filesystem in a temp dir, mocked executor
class TaskControllerTest : public ::testing::Test {
protected:
    fs::path dir_;
    DownloaderConfig config_;
    std::unique_ptr<TaskStore> store_;
    NiceMock<MockExecutor> executor_;
    LocalFileSystem file_system_{"true"};
    asio::io_context io_context_;
    std::unique_ptr<TaskController> controller_;

    std::mutex published_mutex_;
    std::vector<TaskEvent> published_;

    void SetUp() override {
        Logger::instance().set_console(false);
        dir_ = fs::temp_directory_path() / ("dlr_controller_" + IdGenerator::new_task_id());
        fs::create_directories(dir_);
        config_.database = (dir_ / "tasks.db").string();
        config_.executor.ack_timeout_ms = 1000;
        store_ = std::make_unique<TaskStore>(config_.database);
        make_controller();
    }

    void TearDown() override {
        controller_.reset();
        store_.reset();
        fs::remove_all(dir_);
    }

    void make_controller() {
        controller_ = std::make_unique<TaskController>(*store_, executor_, file_system_, config_, io_context_);
        controller_->set_publisher([this](TaskEvent event) {
            std::lock_guard<std::mutex> lock(published_mutex_);
            published_.push_back(std::move(event));
        });
    }

    std::string enqueue(const std::string& name = "file.zip") {
        EnqueueRequest request;
        request.url = "http://x/" + name;
        request.saved_dir = dir_.string();
        return controller_->enqueue(request);
    }

    bool apply(const std::string& id, DownloadTaskStatus status, int64_t bytes = 0, int64_t total = 1000,
               const std::string& error = "") {
        TaskEvent event;
        event.task_id = id;
        event.status = status;
        event.bytes_downloaded = bytes;
        event.bytes_total = total;
        event.error = error;
        return controller_->apply_event(event);
    }

    DownloadTask task(const std::string& id) {
        auto record = store_->get_task(id);
        EXPECT_TRUE(record.has_value()) << "no record for " << id;
        return record.value_or(DownloadTask{});
    }

    // Enqueued task that has made progress and been paused by the executor
    std::string paused_task(int64_t bytes = 300) {
        std::string id = enqueue();
        apply(id, DownloadTaskStatus::RUNNING, 0);
        controller_->pause(id);
        apply(id, DownloadTaskStatus::PAUSED, bytes);
        return id;
    }

    void touch(const std::string& path) {
        std::ofstream(path, std::ios::binary) << "partial";
    }
};

TEST_F(TaskControllerTest, EnqueuePersistsNotifiesAndStarts) {
    EXPECT_CALL(executor_, start(Field(&DownloadTask::status, DownloadTaskStatus::ENQUEUED))).Times(1);
    std::string id = enqueue();

    EXPECT_TRUE(IdGenerator::is_valid_task_id(id));
    auto tasks = controller_->load_tasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].task_id, id);
    EXPECT_EQ(tasks[0].status, DownloadTaskStatus::ENQUEUED);
    EXPECT_EQ(tasks[0].progress, 0);
    EXPECT_EQ(tasks[0].file_name, "file.zip");
    EXPECT_EQ(tasks[0].partial_file, (dir_ / "file.zip.part").string());

    ASSERT_EQ(published_.size(), 1u);
    EXPECT_EQ(published_[0].status, DownloadTaskStatus::ENQUEUED);
    EXPECT_EQ(published_[0].progress, 0);
    EXPECT_EQ(published_[0].origin, EventOrigin::Controller);
}

TEST_F(TaskControllerTest, EnqueueKeepsRequestFields) {
    EnqueueRequest request;
    request.url = "http://x/archive?id=7";
    request.saved_dir = dir_.string();
    request.file_name = "named.bin";
    request.headers = {{"Authorization", "Bearer abc"}};
    request.show_notification = false;
    request.requires_storage_not_low = false;
    std::string id = controller_->enqueue(request);

    auto record = task(id);
    EXPECT_EQ(record.url, request.url);
    EXPECT_EQ(record.saved_dir, request.saved_dir);
    EXPECT_EQ(record.file_name, "named.bin");
    EXPECT_EQ(record.headers, request.headers);
    EXPECT_FALSE(record.show_notification);
    EXPECT_TRUE(record.open_file_from_notification);
    EXPECT_FALSE(record.requires_storage_not_low);
}

TEST_F(TaskControllerTest, EnqueueValidation) {
    EXPECT_CALL(executor_, start(_)).Times(0);

    EnqueueRequest request;
    request.saved_dir = dir_.string();
    EXPECT_THROW(controller_->enqueue(request), ValidationError);

    request.url = "http://x/file.zip";
    request.saved_dir = "relative/dir";
    EXPECT_THROW(controller_->enqueue(request), ValidationError);

    request.saved_dir = (dir_ / "missing").string();
    EXPECT_THROW(controller_->enqueue(request), ValidationError);

    request.saved_dir = dir_.string();
    request.file_name = "../escape";
    EXPECT_THROW(controller_->enqueue(request), ValidationError);

    EXPECT_TRUE(controller_->load_tasks().empty());
    EXPECT_TRUE(published_.empty());
}

TEST_F(TaskControllerTest, EnqueueRejectsOwnedPartialFile) {
    enqueue("same.zip");
    EXPECT_THROW(enqueue("same.zip"), ValidationError);
    EXPECT_EQ(controller_->load_tasks().size(), 1u);
}

TEST_F(TaskControllerTest, PublicStorageSkipsDirectoryChecks) {
    setenv("XDG_DOWNLOAD_DIR", dir_.c_str(), 1);
    EnqueueRequest request;
    request.url = "http://x/public.mp3";
    request.save_in_public_storage = true;
    std::string id = controller_->enqueue(request);
    unsetenv("XDG_DOWNLOAD_DIR");

    auto record = task(id);
    EXPECT_EQ(record.saved_dir, dir_.string());
    EXPECT_TRUE(record.save_in_public_storage);
}

TEST_F(TaskControllerTest, ProgressIsMonotonicUntilComplete) {
    std::string id = enqueue();
    EXPECT_TRUE(apply(id, DownloadTaskStatus::RUNNING, 0));
    EXPECT_EQ(task(id).status, DownloadTaskStatus::RUNNING);

    TaskEvent event;
    event.task_id = id;
    event.status = DownloadTaskStatus::RUNNING;
    event.bytes_downloaded = 500;
    event.bytes_total = 1000;
    ASSERT_TRUE(controller_->apply_event(event));
    EXPECT_EQ(event.progress, 50);

    EXPECT_TRUE(apply(id, DownloadTaskStatus::RUNNING, 400));
    EXPECT_EQ(task(id).progress, 50);

    EXPECT_TRUE(apply(id, DownloadTaskStatus::COMPLETE, 1000));
    auto record = task(id);
    EXPECT_EQ(record.status, DownloadTaskStatus::COMPLETE);
    EXPECT_EQ(record.progress, 100);
    EXPECT_TRUE(record.partial_file.empty());
}

TEST_F(TaskControllerTest, StaleAndInvalidEventsAreDropped) {
    std::string id = enqueue();
    EXPECT_FALSE(apply(id, DownloadTaskStatus::PAUSED, 10));
    EXPECT_FALSE(apply("unknown-task", DownloadTaskStatus::RUNNING, 10));
    EXPECT_FALSE(apply(id, DownloadTaskStatus::UNDEFINED));

    apply(id, DownloadTaskStatus::COMPLETE, 1000);
    EXPECT_FALSE(apply(id, DownloadTaskStatus::RUNNING, 10));
    EXPECT_FALSE(apply(id, DownloadTaskStatus::FAILED, 10));
    EXPECT_FALSE(apply(id, DownloadTaskStatus::CANCELED));
    EXPECT_EQ(task(id).status, DownloadTaskStatus::COMPLETE);
}

TEST_F(TaskControllerTest, PauseOnlyFromRunning) {
    std::string id = enqueue();
    EXPECT_THROW(controller_->pause(id), InvalidStateError);
    EXPECT_EQ(task(id).status, DownloadTaskStatus::ENQUEUED);
    EXPECT_THROW(controller_->pause("unknown-task"), NotFoundError);

    apply(id, DownloadTaskStatus::RUNNING, 100);
    EXPECT_CALL(executor_, pause(id)).Times(1);
    controller_->pause(id);
    EXPECT_EQ(task(id).status, DownloadTaskStatus::RUNNING);
    EXPECT_EQ(controller_->pending_acks(), 1u);

    EXPECT_TRUE(apply(id, DownloadTaskStatus::PAUSED, 300));
    auto record = task(id);
    EXPECT_EQ(record.status, DownloadTaskStatus::PAUSED);
    EXPECT_EQ(record.bytes_downloaded, 300);
    EXPECT_EQ(record.progress, 30);
    EXPECT_TRUE(record.resumable);
    EXPECT_EQ(controller_->pending_acks(), 0u);

    EXPECT_THROW(controller_->pause(id), InvalidStateError);
}

TEST_F(TaskControllerTest, ResumeCreatesLinkedTask) {
    std::string old_id = paused_task(300);
    std::string partial = task(old_id).partial_file;
    published_.clear();

    EXPECT_CALL(executor_, start(::testing::AllOf(
        Field(&DownloadTask::status, DownloadTaskStatus::RUNNING),
        Field(&DownloadTask::bytes_downloaded, 300),
        Field(&DownloadTask::partial_file, partial)))).Times(1);
    std::string new_id = controller_->resume(old_id, false);
    EXPECT_NE(new_id, old_id);

    auto old_record = task(old_id);
    EXPECT_EQ(old_record.status, DownloadTaskStatus::PAUSED);
    EXPECT_EQ(old_record.superseded_by, new_id);
    EXPECT_FALSE(old_record.resumable);
    EXPECT_TRUE(old_record.partial_file.empty());

    auto new_record = task(new_id);
    EXPECT_EQ(new_record.status, DownloadTaskStatus::RUNNING);
    EXPECT_EQ(new_record.bytes_downloaded, 300);
    EXPECT_EQ(new_record.progress, 30);
    EXPECT_EQ(new_record.partial_file, partial);
    EXPECT_FALSE(new_record.requires_storage_not_low);
    EXPECT_EQ(new_record.url, old_record.url);

    ASSERT_EQ(published_.size(), 1u);
    EXPECT_EQ(published_[0].task_id, new_id);
    EXPECT_EQ(published_[0].status, DownloadTaskStatus::RUNNING);
    EXPECT_EQ(published_[0].progress, 30);

    // The old record is history now
    EXPECT_THROW(controller_->resume(old_id), InvalidStateError);
    EXPECT_THROW(controller_->cancel(old_id), InvalidStateError);
    EXPECT_FALSE(apply(old_id, DownloadTaskStatus::RUNNING, 400));
    EXPECT_EQ(store_->find_partial_owner(partial)->task_id, new_id);
}

TEST_F(TaskControllerTest, ResumeRequiresResumablePause) {
    std::string id = enqueue();
    EXPECT_THROW(controller_->resume(id), InvalidStateError);
    apply(id, DownloadTaskStatus::RUNNING, 0);
    EXPECT_THROW(controller_->resume(id), InvalidStateError);

    // Paused before any byte arrived
    controller_->pause(id);
    apply(id, DownloadTaskStatus::PAUSED, 0);
    EXPECT_FALSE(task(id).resumable);
    EXPECT_THROW(controller_->resume(id), InvalidStateError);
    EXPECT_THROW(controller_->resume("unknown-task"), NotFoundError);
    EXPECT_EQ(controller_->load_tasks().size(), 1u);
}

TEST_F(TaskControllerTest, FailureThenRetry) {
    std::string id = enqueue();
    apply(id, DownloadTaskStatus::RUNNING, 200);
    EXPECT_TRUE(apply(id, DownloadTaskStatus::FAILED, 200, 1000, "connection reset"));
    auto failed = task(id);
    EXPECT_EQ(failed.status, DownloadTaskStatus::FAILED);
    EXPECT_EQ(failed.error_message, "connection reset");

    EXPECT_CALL(executor_, start(::testing::AllOf(
        Field(&DownloadTask::status, DownloadTaskStatus::ENQUEUED),
        Field(&DownloadTask::bytes_downloaded, 0)))).Times(1);
    std::string new_id = controller_->retry(id);
    EXPECT_NE(new_id, id);

    auto retried = task(new_id);
    EXPECT_EQ(retried.status, DownloadTaskStatus::ENQUEUED);
    EXPECT_EQ(retried.progress, 0);
    EXPECT_EQ(retried.bytes_total, UNKNOWN_TOTAL_BYTES);
    EXPECT_TRUE(retried.error_message.empty());
    EXPECT_EQ(retried.partial_file, failed.partial_file);

    auto old_record = task(id);
    EXPECT_EQ(old_record.status, DownloadTaskStatus::FAILED);
    EXPECT_EQ(old_record.superseded_by, new_id);
    EXPECT_TRUE(old_record.partial_file.empty());
    EXPECT_EQ(controller_->load_tasks().size(), 2u);

    EXPECT_THROW(controller_->retry(id), InvalidStateError);
}

TEST_F(TaskControllerTest, RetryRequiresFailedOrCanceled) {
    std::string id = enqueue();
    EXPECT_THROW(controller_->retry(id), InvalidStateError);
    apply(id, DownloadTaskStatus::COMPLETE, 1000);
    EXPECT_THROW(controller_->retry(id), InvalidStateError);
    EXPECT_THROW(controller_->retry("unknown-task"), NotFoundError);

    std::string canceled = enqueue("other.zip");
    controller_->cancel(canceled);
    apply(canceled, DownloadTaskStatus::CANCELED);
    std::string new_id = controller_->retry(canceled);
    EXPECT_EQ(task(new_id).status, DownloadTaskStatus::ENQUEUED);
}

TEST_F(TaskControllerTest, CancelIsOptimisticAndIdempotent) {
    std::string id = enqueue();
    apply(id, DownloadTaskStatus::RUNNING, 100);
    std::string partial = task(id).partial_file;
    touch(partial);

    EXPECT_CALL(executor_, cancel(id)).Times(1);
    controller_->cancel(id);
    EXPECT_EQ(task(id).status, DownloadTaskStatus::CANCELED);
    EXPECT_EQ(controller_->pending_acks(), 1u);

    EXPECT_THROW(controller_->cancel(id), InvalidStateError);
    EXPECT_EQ(task(id).status, DownloadTaskStatus::CANCELED);

    // Progress racing the cancel is ignored
    EXPECT_FALSE(apply(id, DownloadTaskStatus::RUNNING, 200));

    EXPECT_TRUE(apply(id, DownloadTaskStatus::CANCELED));
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_TRUE(task(id).partial_file.empty());
    EXPECT_EQ(controller_->pending_acks(), 0u);

    // A duplicate acknowledgement is not delivered again
    EXPECT_FALSE(apply(id, DownloadTaskStatus::CANCELED));
}

TEST_F(TaskControllerTest, CancelAllSkipsFinishedTasks) {
    std::string running = enqueue("a.zip");
    apply(running, DownloadTaskStatus::RUNNING, 10);
    std::string complete = enqueue("b.zip");
    apply(complete, DownloadTaskStatus::COMPLETE, 1000);
    std::string paused = paused_task();

    EXPECT_CALL(executor_, cancel(running)).Times(1);
    EXPECT_CALL(executor_, cancel(paused)).Times(1);
    EXPECT_CALL(executor_, cancel(complete)).Times(0);
    controller_->cancel_all();

    EXPECT_EQ(task(running).status, DownloadTaskStatus::CANCELED);
    EXPECT_EQ(task(paused).status, DownloadTaskStatus::CANCELED);
    EXPECT_EQ(task(complete).status, DownloadTaskStatus::COMPLETE);
}

TEST_F(TaskControllerTest, RemoveCompleteWithContent) {
    std::string id = enqueue();
    apply(id, DownloadTaskStatus::COMPLETE, 1000);
    std::string file = task(id).file_path();
    touch(file);

    EXPECT_CALL(executor_, cancel(_)).Times(0);
    controller_->remove(id, true);
    EXPECT_FALSE(fs::exists(file));
    EXPECT_TRUE(controller_->load_tasks().empty());
    EXPECT_THROW(controller_->remove(id), NotFoundError);
}

TEST_F(TaskControllerTest, RemoveKeepsContentByDefault) {
    std::string id = enqueue();
    apply(id, DownloadTaskStatus::COMPLETE, 1000);
    std::string file = task(id).file_path();
    touch(file);

    controller_->remove(id);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_FALSE(store_->get_task(id).has_value());
}

TEST_F(TaskControllerTest, RemoveActiveTaskCancelsIt) {
    std::string id = paused_task();
    std::string partial = task(id).partial_file;
    touch(partial);

    EXPECT_CALL(executor_, cancel(id)).Times(1);
    controller_->remove(id, true);
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_TRUE(controller_->load_tasks().empty());

    // The acknowledgement for the removed record still reaches the observer
    EXPECT_TRUE(apply(id, DownloadTaskStatus::CANCELED));
    EXPECT_EQ(controller_->pending_acks(), 0u);
    EXPECT_FALSE(apply(id, DownloadTaskStatus::CANCELED));
}

TEST_F(TaskControllerTest, RemovePausedTaskDiscardsPartialFile) {
    std::string id = paused_task();
    std::string partial = task(id).partial_file;
    touch(partial);

    // No job is running, so the executor only acknowledges
    EXPECT_CALL(executor_, cancel(id)).Times(1);
    controller_->remove(id, false);
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_TRUE(controller_->load_tasks().empty());
    EXPECT_TRUE(apply(id, DownloadTaskStatus::CANCELED));
    EXPECT_FALSE(fs::exists(partial));
}

TEST_F(TaskControllerTest, SettledTasksDropTheirLocks) {
    std::string complete = enqueue("a.zip");
    EXPECT_EQ(controller_->lock_entries(), 1u);
    apply(complete, DownloadTaskStatus::COMPLETE, 1000);
    EXPECT_EQ(controller_->lock_entries(), 0u);

    std::string removed = paused_task();
    EXPECT_EQ(controller_->lock_entries(), 1u);
    controller_->remove(removed);
    EXPECT_EQ(controller_->lock_entries(), 0u);
    // The late acknowledgement does not bring the entry back
    EXPECT_TRUE(apply(removed, DownloadTaskStatus::CANCELED));
    EXPECT_EQ(controller_->lock_entries(), 0u);

    // Events for live tasks keep theirs
    std::string running = enqueue("b.zip");
    apply(running, DownloadTaskStatus::RUNNING, 100);
    EXPECT_EQ(controller_->lock_entries(), 1u);
}

TEST_F(TaskControllerTest, IdGenerationFailureIsPersistenceError) {
    controller_->set_id_source([]() -> std::string { throw std::runtime_error("RAND_bytes failed"); });
    EXPECT_CALL(executor_, start(_)).Times(0);
    EXPECT_THROW(enqueue(), PersistenceError);
    EXPECT_TRUE(controller_->load_tasks().empty());
    EXPECT_TRUE(published_.empty());
}

TEST_F(TaskControllerTest, RepeatedIdCollisionsGiveUp) {
    controller_->set_id_source([]() { return std::string("00000000-0000-4000-8000-000000000000"); });
    enqueue("a.zip");
    EXPECT_THROW(enqueue("b.zip"), PersistenceError);
    EXPECT_EQ(controller_->load_tasks().size(), 1u);
}

TEST_F(TaskControllerTest, OpenOnlyCompleteExistingFiles) {
    std::string id = enqueue();
    EXPECT_FALSE(controller_->open(id));

    apply(id, DownloadTaskStatus::COMPLETE, 1000);
    EXPECT_FALSE(controller_->open(id)); // file not on disk
    touch(task(id).file_path());
    EXPECT_TRUE(controller_->open(id));
    EXPECT_EQ(task(id).status, DownloadTaskStatus::COMPLETE);
    EXPECT_THROW(controller_->open("unknown-task"), NotFoundError);
}

TEST_F(TaskControllerTest, UnacknowledgedPauseFailsTask) {
    std::string id = enqueue();
    apply(id, DownloadTaskStatus::RUNNING, 100);
    controller_->pause(id);
    published_.clear();

    // Not yet overdue
    controller_->check_pending_acks(std::chrono::steady_clock::now());
    EXPECT_EQ(task(id).status, DownloadTaskStatus::RUNNING);

    EXPECT_CALL(executor_, cancel(id)).Times(1);
    controller_->check_pending_acks(std::chrono::steady_clock::now() + std::chrono::seconds(2));
    auto record = task(id);
    EXPECT_EQ(record.status, DownloadTaskStatus::FAILED);
    EXPECT_EQ(record.error_message, "executor did not acknowledge pause");
    ASSERT_EQ(published_.size(), 1u);
    EXPECT_EQ(published_[0].status, DownloadTaskStatus::FAILED);

    // A late PAUSED no longer applies
    EXPECT_FALSE(apply(id, DownloadTaskStatus::PAUSED, 200));
}

TEST_F(TaskControllerTest, UnacknowledgedCancelCompletesLocally) {
    std::string id = enqueue();
    std::string partial = task(id).partial_file;
    touch(partial);
    controller_->cancel(id);
    published_.clear();

    controller_->check_pending_acks(std::chrono::steady_clock::now() + std::chrono::seconds(2));
    EXPECT_FALSE(fs::exists(partial));
    EXPECT_TRUE(task(id).partial_file.empty());
    ASSERT_EQ(published_.size(), 1u);
    EXPECT_EQ(published_[0].status, DownloadTaskStatus::CANCELED);
    EXPECT_EQ(controller_->pending_acks(), 0u);
    EXPECT_FALSE(apply(id, DownloadTaskStatus::CANCELED));
}

TEST_F(TaskControllerTest, WatchdogTimerForcesTimeout) {
    config_.executor.ack_timeout_ms = 50;
    make_controller();
    std::string id = enqueue();
    apply(id, DownloadTaskStatus::RUNNING, 100);
    controller_->pause(id);

    controller_->start_watchdog();
    std::thread timer_thread([this]() { io_context_.run_for(std::chrono::milliseconds(500)); });
    timer_thread.join();
    controller_->stop_watchdog();

    EXPECT_EQ(task(id).status, DownloadTaskStatus::FAILED);
}

TEST_F(TaskControllerTest, RecoverSettlesInterruptedTasks) {
    auto make = [this](const std::string& id, DownloadTaskStatus status, int64_t bytes) {
        DownloadTask record;
        record.task_id = id;
        record.status = status;
        record.url = "http://x/" + id;
        record.saved_dir = dir_.string();
        record.file_name = id;
        record.bytes_downloaded = bytes;
        record.bytes_total = 1000;
        record.partial_file = record.partial_path();
        record.time_created = now_millis();
        store_->save_task(record);
        return record;
    };
    make("with-bytes", DownloadTaskStatus::RUNNING, 400);
    make("no-bytes", DownloadTaskStatus::RUNNING, 0);
    make("queued", DownloadTaskStatus::ENQUEUED, 0);
    make("done", DownloadTaskStatus::COMPLETE, 1000);
    auto canceled = make("canceled", DownloadTaskStatus::CANCELED, 100);
    touch(canceled.partial_file);

    EXPECT_CALL(executor_, start(Field(&DownloadTask::task_id, "queued"))).Times(1);
    controller_->recover();

    auto paused = task("with-bytes");
    EXPECT_EQ(paused.status, DownloadTaskStatus::PAUSED);
    EXPECT_TRUE(paused.resumable);
    auto failed = task("no-bytes");
    EXPECT_EQ(failed.status, DownloadTaskStatus::FAILED);
    EXPECT_EQ(failed.error_message, "interrupted");
    EXPECT_EQ(task("done").status, DownloadTaskStatus::COMPLETE);
    EXPECT_TRUE(task("canceled").partial_file.empty());
    EXPECT_FALSE(fs::exists(canceled.partial_file));
}

TEST_F(TaskControllerTest, ConcurrentEnqueuesGetDistinctIds) {
    std::vector<std::thread> threads;
    std::mutex ids_mutex;
    std::set<std::string> ids;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 10; ++i) {
                std::string id = enqueue("f" + std::to_string(t) + "_" + std::to_string(i));
                std::lock_guard<std::mutex> lock(ids_mutex);
                ids.insert(id);
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(ids.size(), 40u);
    EXPECT_EQ(controller_->load_tasks().size(), 40u);
}

TEST_F(TaskControllerTest, RawQueryPassesThrough) {
    std::string a = enqueue("a.zip");
    std::string b = enqueue("b.zip");
    apply(b, DownloadTaskStatus::COMPLETE, 1000);

    auto complete = controller_->load_tasks_with_raw_query("SELECT * FROM task WHERE status=3");
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].task_id, b);
    EXPECT_THROW(controller_->load_tasks_with_raw_query("UPDATE task SET status=4"), ValidationError);

    TaskQuery query;
    query.statuses = {DownloadTaskStatus::ENQUEUED};
    auto queued = controller_->query_tasks(query);
    ASSERT_EQ(queued.size(), 1u);
    EXPECT_EQ(queued[0].task_id, a);
}
