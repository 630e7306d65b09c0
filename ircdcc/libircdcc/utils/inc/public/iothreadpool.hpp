#ifndef IRCDCC_UTILS_IOTHREADPOOL_HPP_
#define IRCDCC_UTILS_IOTHREADPOOL_HPP_

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include "executer.hpp"

namespace ircdcc::utils
{
// Runs every job on its own thread as soon as it is added, so a transfer blocked on a socket never
// delays another one. Threads left idle for longer than the idle timeout exit and are joined on
// the next add_job.
class IOThreadPool : public Executer
{
public:
    static constexpr std::chrono::milliseconds default_idle_timeout {30000};

    explicit IOThreadPool(std::chrono::milliseconds idle_timeout = default_idle_timeout);
    IOThreadPool(const IOThreadPool &) = delete;
    IOThreadPool &operator=(const IOThreadPool &) = delete;

    // Jobs that never started are cancelled and completed
    ~IOThreadPool() override;

    CompletionToken add_job(Job &&job, Priority /*priority*/ = default_priority) override;
    void            process_all_jobs() override;

    [[nodiscard]] size_t thread_count() const;

private:
    using WorkerId = size_t;

    void worker_routine(WorkerId id);
    void join_exited_workers(std::unique_lock<std::mutex> &lock);

    const std::chrono::milliseconds             idle_timeout_;
    std::map<WorkerId, std::thread>             workers_;
    std::vector<WorkerId>                       exited_workers_;
    WorkerId                                    next_worker_id_;
    size_t                                      idle_workers_;
    size_t                                      unfinished_jobs_;
    std::queue<std::pair<Job, CompletionToken>> pending_jobs_;
    bool                                        running_;
    mutable std::mutex                          mutex_;
    std::condition_variable                     cv_job_added_;
    std::condition_variable                     cv_all_done_;
};
}  // namespace ircdcc::utils

#endif  // IRCDCC_UTILS_IOTHREADPOOL_HPP_
