#include "core/cancellation.hpp"

namespace agentpool::core {

bool CancellationState::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationState::cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    cancelling_thread_ = std::this_thread::get_id();
    cv_.notify_all();

    // One at a time, outside the lock: callbacks may abort sockets or take
    // other locks. running_id_ lets unregister() wait for the one in flight.
    while (!callbacks_.empty()) {
        auto first = callbacks_.begin();
        running_id_ = first->first;
        Callback cb = std::move(first->second);
        callbacks_.erase(first);

        lock.unlock();
        cb();
        cb = nullptr;
        lock.lock();

        running_id_ = 0;
        cv_.notify_all();
    }
}

uint64_t CancellationState::register_callback(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            uint64_t id = next_id_++;
            callbacks_[id] = std::move(callback);
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationState::unregister(uint64_t id) {
    if (id == 0) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    if (callbacks_.erase(id) > 0) {
        return;
    }
    if (running_id_ == id && cancelling_thread_ != std::this_thread::get_id()) {
        cv_.wait(lock, [this, id]() { return running_id_ != id; });
    }
}

bool CancellationState::wait_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this]() { return cancelled_; });
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return true;
    }
    return state_->wait_for(duration);
}

uint64_t CancellationToken::on_cancel(CancellationState::Callback callback) const {
    if (!state_) {
        return 0;
    }
    return state_->register_callback(std::move(callback));
}

void CancellationToken::remove_callback(uint64_t id) const {
    if (state_) {
        state_->unregister(id);
    }
}

} // namespace agentpool::core
