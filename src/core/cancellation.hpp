#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <map>
#include <mutex>
#include <thread>

namespace agentpool::core {

// Shared state between a CancellationSource and its tokens
class CancellationState {
public:
    using Callback = std::function<void()>;

    bool is_cancelled() const;
    void cancel();

    // Registers a callback run on cancel. Runs immediately if already cancelled.
    // Returns 0 in that case, otherwise a handle for unregister().
    uint64_t register_callback(Callback callback);

    // Once this returns the callback is neither running nor going to run,
    // unless called from inside that callback.
    void unregister(uint64_t id);

    // Sleeps for the duration, returns false if cancelled first
    bool wait_for(std::chrono::milliseconds duration);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    uint64_t next_id_ = 1;
    std::map<uint64_t, Callback> callbacks_;
    uint64_t running_id_ = 0;
    std::thread::id cancelling_thread_;
};

class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::shared_ptr<CancellationState> state)
        : state_(std::move(state)) {}

    bool is_cancelled() const { return state_ && state_->is_cancelled(); }
    bool can_be_cancelled() const { return state_ != nullptr; }

    // Interruptible sleep; returns false when cancelled
    bool sleep_for(std::chrono::milliseconds duration) const;

    uint64_t on_cancel(CancellationState::Callback callback) const;
    void remove_callback(uint64_t id) const;

private:
    std::shared_ptr<CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<CancellationState>()) {}

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel() { state_->cancel(); }
    bool is_cancelled() const { return state_->is_cancelled(); }

private:
    std::shared_ptr<CancellationState> state_;
};

// Scoped callback registration
class CancellationRegistration {
public:
    CancellationRegistration(const CancellationToken& token, CancellationState::Callback callback)
        : token_(token), id_(token.on_cancel(std::move(callback))) {}
    ~CancellationRegistration() { token_.remove_callback(id_); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken token_;
    uint64_t id_;
};

} // namespace agentpool::core
