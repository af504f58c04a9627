#ifndef LANSHARE_UTILS_THREADPOOL_HPP_
#define LANSHARE_UTILS_THREADPOOL_HPP_

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "executer.hpp"

namespace lanshare::utils
{
/// Fixed number of threads for short jobs that never block: request handlers, listener
/// notifications. Higher priorities run first; equal priorities run in the order they were added.
class ThreadPool : public Executer
{
public:
    explicit ThreadPool(size_t thread_count = default_thread_count());
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
    ~ThreadPool() override;

    CompletionToken add_job(Job &&job, Priority priority = default_priority) override;
    void            process_all_jobs() override;

    [[nodiscard]] size_t thread_count() const;

    static size_t default_thread_count();

private:
    struct QueuedJob
    {
        Priority        priority;
        uint64_t        sequence;
        Job             job;
        CompletionToken completion_token;

        bool operator<(const QueuedJob &other) const
        {
            // std::priority_queue pops the greatest element
            return priority != other.priority ? priority < other.priority :
                                                sequence > other.sequence;
        }
    };

    void worker();

    std::vector<std::thread>       workers_;
    std::priority_queue<QueuedJob> queue_;
    uint64_t                       next_sequence_;
    size_t                         unfinished_jobs_;
    bool                           stopping_;
    std::mutex                     mutex_;
    std::condition_variable        cv_queue_;
    std::condition_variable        cv_idle_;
};
}  // namespace lanshare::utils

#endif  // LANSHARE_UTILS_THREADPOOL_HPP_
