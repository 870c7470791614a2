#include "events/progress_throttle.hpp"
#include "common/errors.hpp"

ProgressThrottle::ProgressThrottle(int step) {
    reset(step);
}

void ProgressThrottle::reset(int step) {
    if (step < 0 || step > 100) {
        throw ValidationError("step must be in 0..100, got " + std::to_string(step));
    }
    step_ = step;
    last_.clear();
}

bool ProgressThrottle::crosses_step(int last, int percent) const {
    if (percent <= last) {
        return false;
    }
    if (step_ == 0) {
        return true;
    }
    return percent / step_ != last / step_;
}

std::optional<int> ProgressThrottle::filter(const TaskEvent& event) {
    auto it = last_.find(event.task_id);
    const int last_percent = it != last_.end() ? it->second.progress : 0;

    std::optional<int> known;
    if (event.status == DownloadTaskStatus::COMPLETE) {
        known = 100;
    } else if (event.progress >= 0) {
        known = event.progress;
    } else {
        known = compute_progress(event.bytes_downloaded, event.bytes_total);
    }
    const int percent = known.value_or(last_percent);

    if (is_terminal(event.status)) {
        last_.erase(event.task_id);
        return percent;
    }

    bool deliver = false;
    if (event.origin == EventOrigin::Controller) {
        deliver = true;
    } else if (it != last_.end() && it->second.status != event.status) {
        deliver = true;
    } else if (event.status != DownloadTaskStatus::RUNNING) {
        deliver = it == last_.end() || it->second.progress != percent;
    } else if (known) {
        deliver = crosses_step(last_percent, percent);
    }

    if (!deliver) {
        return std::nullopt;
    }
    last_[event.task_id] = Delivered{event.status, percent};
    return percent;
}
