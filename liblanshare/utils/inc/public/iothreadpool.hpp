#ifndef LANSHARE_UTILS_IOTHREADPOOL_HPP_
#define LANSHARE_UTILS_IOTHREADPOOL_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "executer.hpp"

namespace lanshare::utils
{
/// Pool for jobs that block: io_context run loops, timers, waits on remote calls, event
/// deliveries. A job never waits for a free thread, one is started when none is idle. A thread
/// left idle for longer than idle_timeout exits, so a burst of jobs does not pin threads forever.
class IOThreadPool : public Executer
{
public:
    explicit IOThreadPool(std::chrono::milliseconds idle_timeout = std::chrono::seconds {30});
    IOThreadPool(const IOThreadPool &) = delete;
    IOThreadPool &operator=(const IOThreadPool &) = delete;
    ~IOThreadPool() override;

    /// Priorities are ignored, every job starts right away.
    CompletionToken add_job(Job &&job, Priority priority = default_priority) override;
    void            process_all_jobs() override;

    /// Threads currently alive, busy or idle.
    [[nodiscard]] size_t thread_count() const;

private:
    void worker();
    /// Must be called with mutex_ held.
    std::vector<std::thread> take_exited_threads();

    const std::chrono::milliseconds             idle_timeout_;
    std::map<std::thread::id, std::thread>      workers_;
    std::vector<std::thread>                    exited_;
    std::deque<std::pair<Job, CompletionToken>> queue_;
    size_t                                      idle_count_;
    size_t                                      unfinished_jobs_;
    bool                                        stopping_;
    mutable std::mutex                          mutex_;
    std::condition_variable                     cv_queue_;
    std::condition_variable                     cv_idle_;
};
}  // namespace lanshare::utils

#endif  // LANSHARE_UTILS_IOTHREADPOOL_HPP_
