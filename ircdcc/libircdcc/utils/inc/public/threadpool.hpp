#ifndef IRCDCC_UTILS_THREADPOOL_HPP_
#define IRCDCC_UTILS_THREADPOOL_HPP_

#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "executer.hpp"

namespace ircdcc::utils
{
// Fixed set of workers taking jobs by descending priority, FIFO within a priority. With a single
// worker jobs run strictly in order, which is what the event thread relies on.
class ThreadPool : public Executer
{
public:
    explicit ThreadPool(size_t thread_count = default_thread_count());
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    // Queued jobs still run before the workers exit
    ~ThreadPool() override;

    CompletionToken add_job(Job &&job, Priority priority = default_priority) override;
    void            process_all_jobs() override;

    static size_t default_thread_count();

private:
    using JobQueue = std::queue<std::pair<Job, CompletionToken>>;

    void worker_routine();

    std::vector<std::thread>                     workers_;
    std::map<Priority, JobQueue, std::greater<>> queues_;
    size_t                                       unfinished_jobs_;
    bool                                         running_;
    std::mutex                                   mutex_;
    std::condition_variable                      cv_job_added_;
    std::condition_variable                      cv_all_done_;
};
}  // namespace ircdcc::utils

#endif  // IRCDCC_UTILS_THREADPOOL_HPP_
