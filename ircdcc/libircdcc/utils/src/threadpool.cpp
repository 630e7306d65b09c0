#include "threadpool.hpp"

#include <algorithm>

namespace ircdcc::utils
{
ThreadPool::ThreadPool(size_t thread_count)
    : unfinished_jobs_ {0}
    , running_ {true}
{
    thread_count = std::max<size_t>(thread_count, 1);
    workers_.reserve(thread_count);
    while (workers_.size() != thread_count)
    {
        workers_.emplace_back(&ThreadPool::worker_routine, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lock {mutex_};
        running_ = false;
    }
    cv_job_added_.notify_all();

    for (auto &worker : workers_)
    {
        worker.join();
    }
}

CompletionToken ThreadPool::add_job(Job &&job, Priority priority)
{
    CompletionToken completion_token;
    {
        std::lock_guard lock {mutex_};
        queues_[priority].emplace(std::move(job), completion_token);
        ++unfinished_jobs_;
    }
    cv_job_added_.notify_one();
    return completion_token;
}

void ThreadPool::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_all_done_.wait(lock, [this] { return unfinished_jobs_ == 0; });
}

size_t ThreadPool::default_thread_count()
{
    return std::max(std::thread::hardware_concurrency(), 1U);
}

void ThreadPool::worker_routine()
{
    std::unique_lock lock {mutex_};
    for (;;)
    {
        cv_job_added_.wait(lock, [this] { return !queues_.empty() || !running_; });
        if (queues_.empty())
        {
            return;
        }

        // Highest priority first
        auto top                     = queues_.begin();
        auto [job, completion_token] = std::move(top->second.front());
        top->second.pop();
        if (top->second.empty())
        {
            queues_.erase(top);
        }
        lock.unlock();

        if (!completion_token.is_cancelled())
        {
            job(completion_token);
        }
        completion_token.complete();

        lock.lock();
        if (--unfinished_jobs_ == 0)
        {
            cv_all_done_.notify_all();
        }
    }
}
}  // namespace ircdcc::utils
