#include "iothreadpool.hpp"

#include <glog/logging.h>

namespace ircdcc::utils
{
IOThreadPool::IOThreadPool(std::chrono::milliseconds idle_timeout)
    : idle_timeout_ {idle_timeout}
    , next_worker_id_ {0}
    , idle_workers_ {0}
    , unfinished_jobs_ {0}
    , running_ {true}
{}

IOThreadPool::~IOThreadPool()
{
    std::map<WorkerId, std::thread>             workers;
    std::queue<std::pair<Job, CompletionToken>> dropped_jobs;
    {
        std::lock_guard lock {mutex_};
        running_ = false;
        workers.swap(workers_);
        dropped_jobs.swap(pending_jobs_);
        unfinished_jobs_ -= dropped_jobs.size();
    }
    cv_job_added_.notify_all();

    if (!dropped_jobs.empty())
    {
        LOG(WARNING) << "Dropping " << dropped_jobs.size() << " I/O job(s) that never started";
    }
    for (; !dropped_jobs.empty(); dropped_jobs.pop())
    {
        const auto &completion_token = dropped_jobs.front().second;
        completion_token.cancel();
        completion_token.complete();
    }

    for (auto &[id, worker] : workers)
    {
        worker.join();
    }
    cv_all_done_.notify_all();
}

CompletionToken IOThreadPool::add_job(Job &&job, Executer::Priority /*priority*/)
{
    CompletionToken completion_token;

    std::unique_lock lock {mutex_};
    join_exited_workers(lock);

    pending_jobs_.emplace(std::move(job), completion_token);
    ++unfinished_jobs_;
    if (idle_workers_ < pending_jobs_.size())
    {
        auto id = next_worker_id_++;
        workers_.emplace(id, std::thread {&IOThreadPool::worker_routine, this, id});
    }
    lock.unlock();

    cv_job_added_.notify_one();
    return completion_token;
}

void IOThreadPool::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_all_done_.wait(lock, [this] { return unfinished_jobs_ == 0; });
}

size_t IOThreadPool::thread_count() const
{
    std::lock_guard lock {mutex_};
    return workers_.size() - exited_workers_.size();
}

void IOThreadPool::worker_routine(WorkerId id)
{
    std::unique_lock lock {mutex_};
    for (;;)
    {
        ++idle_workers_;
        bool has_job = cv_job_added_.wait_for(
            lock, idle_timeout_, [this] { return !pending_jobs_.empty() || !running_; });
        --idle_workers_;

        if (!running_)
        {
            return;
        }
        if (!has_job)
        {
            exited_workers_.push_back(id);
            return;
        }

        auto [job, completion_token] = std::move(pending_jobs_.front());
        pending_jobs_.pop();
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

void IOThreadPool::join_exited_workers(std::unique_lock<std::mutex> &lock)
{
    std::vector<std::thread> exited;
    for (auto id : exited_workers_)
    {
        auto it = workers_.find(id);
        exited.push_back(std::move(it->second));
        workers_.erase(it);
    }
    exited_workers_.clear();

    if (exited.empty())
    {
        return;
    }

    // The exited threads are past their last use of the mutex
    lock.unlock();
    for (auto &worker : exited)
    {
        worker.join();
    }
    lock.lock();
}
}  // namespace ircdcc::utils
