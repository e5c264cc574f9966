/**
 * @file cancellation.cpp
 * @brief Cancellation token implementation
 */

#include <cavesync/remote_project/core/cancellation.h>

#include <thread>

namespace cavesync::remote_project {

auto cancellation_token::is_cancelled() const -> bool {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

auto cancellation_token::wait_for(std::chrono::milliseconds duration) const -> bool {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

cancellation_source::cancellation_source()
    : state_(std::make_shared<cancellation_token::state>()) {}

auto cancellation_source::token() const -> cancellation_token {
    return cancellation_token{state_};
}

void cancellation_source::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

auto cancellation_source::is_cancelled() const -> bool {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace cavesync::remote_project
