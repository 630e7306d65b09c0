#ifndef IRCDCC_UTILS_TIMER_HPP_
#define IRCDCC_UTILS_TIMER_HPP_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace ircdcc::utils
{
// Forward declarations
class Executer;

class Timer
{
public:
    using Period    = std::chrono::milliseconds;
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Callback  = std::function<void()>;

    explicit Timer(std::shared_ptr<Executer> executer);
    ~Timer();

    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;

    bool               start(Period period, Callback &&callback, bool single_shot = false);
    bool               restart();
    bool               restart(Period period);
    bool               stop();
    [[nodiscard]] bool is_running() const;

private:
    void run(unsigned generation);
    void wait_for_idle(std::unique_lock<std::mutex> &lock);

    const std::shared_ptr<Executer> executer_;
    TimePoint                       next_trigger_moment_;
    Period                          period_;
    Callback                        callback_;
    bool                            single_shot_;
    bool                            running_;
    unsigned                        generation_;
    int                             active_jobs_;
    std::thread::id                 worker_thread_id_;
    mutable std::mutex              mutex_;
    std::condition_variable         cv_;
};
}  // namespace ircdcc::utils

#endif  // IRCDCC_UTILS_TIMER_HPP_
