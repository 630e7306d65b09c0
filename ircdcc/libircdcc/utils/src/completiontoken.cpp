#include "completiontoken.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace ircdcc::utils
{
struct CompletionToken::State
{
    std::atomic_bool        cancelled {false};
    bool                    completed {false};
    std::mutex              mutex;
    std::condition_variable cv;
};

CompletionToken::CompletionToken()
    : state_ {std::make_shared<State>()}
{}

void CompletionToken::cancel() const
{
    state_->cancelled = true;
}

bool CompletionToken::is_cancelled() const
{
    return state_->cancelled;
}

void CompletionToken::complete() const
{
    {
        std::lock_guard lock {state_->mutex};
        state_->completed = true;
    }
    state_->cv.notify_all();
}

bool CompletionToken::is_completed() const
{
    std::lock_guard lock {state_->mutex};
    return state_->completed;
}

void CompletionToken::wait_for_completion() const
{
    std::unique_lock lock {state_->mutex};
    state_->cv.wait(lock, [this] { return state_->completed; });
}

bool CompletionToken::wait_for_completion(std::chrono::milliseconds timeout) const
{
    std::unique_lock lock {state_->mutex};
    return state_->cv.wait_for(lock, timeout, [this] { return state_->completed; });
}
}  // namespace ircdcc::utils
