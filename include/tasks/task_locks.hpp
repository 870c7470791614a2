#ifndef DLR_TASK_LOCKS_HPP
#define DLR_TASK_LOCKS_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>

// One mutex per task id, created on first use. Commands and executor events
// for the same task are serialized; different tasks never contend.
class TaskLockTable {
public:
    class Guard {
    public:
        explicit Guard(std::shared_ptr<std::mutex> mutex)
            : mutex_(std::move(mutex)), lock_(*mutex_) {}

        void unlock() {
            if (lock_.owns_lock()) lock_.unlock();
        }

    private:
        friend class TaskLockTable;

        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    Guard lock(const std::string& task_id) {
        std::shared_ptr<std::mutex> mutex;
        {
            std::lock_guard<std::mutex> table_lock(table_mutex_);
            auto& slot = locks_[task_id];
            if (!slot) slot = std::make_shared<std::mutex>();
            mutex = slot;
        }
        return Guard(std::move(mutex));
    }

    // Drops the entry of a removed task. Holders of its guard are unaffected.
    void erase(const std::string& task_id) {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        locks_.erase(task_id);
    }

    // Unlocks guard and drops the entry if nobody else holds or waits for it.
    // References are only taken under table_mutex_, so the count cannot grow here.
    void release(const std::string& task_id, Guard& guard) {
        guard.unlock();
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        auto it = locks_.find(task_id);
        if (it != locks_.end() && it->second == guard.mutex_ && it->second.use_count() == 2) {
            locks_.erase(it);
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        return locks_.size();
    }

private:
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
    mutable std::mutex table_mutex_;
};

#endif // DLR_TASK_LOCKS_HPP
