#include "timer.hpp"

#include <glog/logging.h>

#include "executer.hpp"

namespace ircdcc::utils
{
Timer::Timer(std::shared_ptr<Executer> executer)
    : executer_ {std::move(executer)}
    , period_ {}
    , callback_ {}
    , single_shot_ {}
    , running_ {false}
    , generation_ {0}
    , active_jobs_ {0}
{}

Timer::~Timer()
{
    std::unique_lock lock {mutex_};
    running_ = false;
    ++generation_;
    cv_.notify_all();
    wait_for_idle(lock);
}

bool Timer::start(Period period, Callback &&callback, bool single_shot)
{
    unsigned generation;

    {
        std::lock_guard lock {mutex_};

        if (running_)
        {
            LOG(WARNING) << "Timer already running";
            return false;
        }

        next_trigger_moment_ = Clock::now() + period;
        period_              = period;
        callback_            = std::move(callback);
        single_shot_         = single_shot;
        running_             = true;
        generation           = ++generation_;
        ++active_jobs_;
    }

    executer_->add_job([this, generation](const CompletionToken &) { run(generation); });

    return true;
}

bool Timer::restart()
{
    return restart(period_);
}

bool Timer::restart(Period period)
{
    Callback callback;
    bool     single_shot;

    {
        std::lock_guard lock {mutex_};
        callback    = callback_;
        single_shot = single_shot_;
    }

    if (is_running() && !stop())
    {
        return false;
    }

    return start(period, std::move(callback), single_shot);
}

bool Timer::stop()
{
    std::unique_lock lock {mutex_};

    if (!running_)
    {
        LOG(WARNING) << "Timer not running";
        return false;
    }

    running_ = false;
    ++generation_;
    cv_.notify_all();

    // A stop requested from inside the callback cannot wait for its own job
    if (worker_thread_id_ != std::this_thread::get_id())
    {
        wait_for_idle(lock);
    }

    return true;
}

bool Timer::is_running() const
{
    std::lock_guard lock {mutex_};
    return running_;
}

void Timer::run(unsigned generation)
{
    std::unique_lock lock {mutex_};
    worker_thread_id_ = std::this_thread::get_id();

    while (generation == generation_)
    {
        if (cv_.wait_until(lock, next_trigger_moment_, [&] { return generation != generation_; }))
        {
            break;
        }

        next_trigger_moment_ = Clock::now() + period_;
        auto callback        = callback_;
        bool single_shot     = single_shot_;
        if (single_shot)
        {
            running_ = false;
            ++generation_;
        }

        lock.unlock();
        callback();
        lock.lock();

        if (single_shot)
        {
            break;
        }
    }

    worker_thread_id_ = {};
    --active_jobs_;
    cv_.notify_all();
}

void Timer::wait_for_idle(std::unique_lock<std::mutex> &lock)
{
    if (worker_thread_id_ == std::this_thread::get_id())
    {
        return;
    }
    cv_.wait(lock, [this] { return active_jobs_ == 0; });
}
}  // namespace ircdcc::utils
