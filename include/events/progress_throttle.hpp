#ifndef DLR_PROGRESS_THROTTLE_HPP
#define DLR_PROGRESS_THROTTLE_HPP

#include <map>
#include <optional>
#include <string>

#include "../executor/executor.hpp"

/**
 * @brief Decides which task events reach the observer and with what percent.
 *
 * A RUNNING progress event is delivered when its percent falls into a higher
 * multiple of the step than the last delivered percent of that task (for a
 * step of 0, whenever the percent grows). Status changes, controller
 * notifications and terminal statuses are always delivered. Not thread-safe;
 * owned by the dispatcher thread.
 */
class ProgressThrottle {
public:
    static constexpr int DEFAULT_STEP = 10;

    explicit ProgressThrottle(int step = DEFAULT_STEP);

    // Changes the step and forgets every task
    void reset(int step);
    int step() const { return step_; }

    // Percent to deliver, or nullopt if the event is suppressed
    std::optional<int> filter(const TaskEvent& event);

    size_t tracked_tasks() const { return last_.size(); }

private:
    struct Delivered {
        DownloadTaskStatus status;
        int progress;
    };

    bool crosses_step(int last, int percent) const;

    int step_;
    std::map<std::string, Delivered> last_;
};

#endif // DLR_PROGRESS_THROTTLE_HPP
