#include "events/event_dispatcher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

EventDispatcher::EventDispatcher(size_t queue_capacity, int step)
    : inbound_(queue_capacity),
      observer_guard_(asio::make_work_guard(observer_context_)),
      target_context_(&observer_context_),
      throttle_(step) {
    observer_thread_ = std::thread([this]() {
        try {
            observer_context_.run();
        } catch (const std::exception& e) {
            LOG_ERR("Observer context error: ", e.what());
        }
    });
    worker_ = std::thread([this]() { run(); });
}

EventDispatcher::~EventDispatcher() {
    shutdown();
}

void EventDispatcher::set_filter(EventFilter filter) {
    filter_ = std::move(filter);
}

void EventDispatcher::register_callback(DownloadCallback callback, int step) {
    register_callback(std::move(callback), step, observer_context_);
}

void EventDispatcher::register_callback(DownloadCallback callback, int step, asio::io_context& context) {
    if (!callback) {
        throw ValidationError("callback must not be empty");
    }
    if (step < 0 || step > 100) {
        throw ValidationError("step must be in 0..100, got " + std::to_string(step));
    }
    std::lock_guard<std::mutex> lock(registration_mutex_);
    callback_ = std::move(callback);
    target_context_ = &context;
    throttle_.reset(step);
    LOG_DEBUG("Registered callback with step ", step);
}

void EventDispatcher::unregister_callback() {
    std::lock_guard<std::mutex> lock(registration_mutex_);
    callback_ = nullptr;
    target_context_ = &observer_context_;
}

bool EventDispatcher::submit(TaskEvent event) {
    if (!inbound_.push(std::move(event))) {
        LOG_DEBUG("Dispatcher closed, event dropped");
        return false;
    }
    return true;
}

void EventDispatcher::shutdown() {
    std::call_once(shutdown_flag_, [this]() {
        inbound_.close();
        if (worker_.joinable()) worker_.join();
        observer_guard_.reset();
        if (observer_thread_.joinable()) observer_thread_.join();
        LOG_DEBUG("Event dispatcher stopped");
    });
}

void EventDispatcher::run() {
    while (auto event = inbound_.pop()) {
        dispatch(std::move(*event));
    }
}

void EventDispatcher::dispatch(TaskEvent event) {
    if (event.origin == EventOrigin::Executor && filter_) {
        try {
            if (!filter_(event)) {
                return;
            }
        } catch (const DownloaderError& e) {
            LOG_ERR("Failed to apply event for ", event.task_id, ": ", e.what());
            return;
        }
    }

    DownloadCallback callback;
    asio::io_context* context = nullptr;
    std::optional<int> percent;
    {
        std::lock_guard<std::mutex> lock(registration_mutex_);
        percent = throttle_.filter(event);
        if (!percent || !callback_) {
            return;
        }
        callback = callback_;
        context = target_context_;
    }

    asio::post(*context, [callback, id = event.task_id, status = event.status, progress = *percent]() {
        try {
            callback(id, status, progress);
        } catch (const std::exception& e) {
            LOG_ERR("Download callback threw for task ", id, ": ", e.what());
        }
    });
}
