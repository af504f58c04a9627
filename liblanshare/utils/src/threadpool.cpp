#include "threadpool.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace lanshare::utils
{
ThreadPool::ThreadPool(size_t thread_count)
    : next_sequence_ {0}
    , unfinished_jobs_ {0}
    , stopping_ {false}
{
    thread_count = std::max<size_t>(thread_count, 1);
    workers_.reserve(thread_count);
    while (workers_.size() != thread_count)
    {
        workers_.emplace_back(&ThreadPool::worker, this);
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lock {mutex_};
        stopping_ = true;
    }
    cv_queue_.notify_all();

    for (auto &worker : workers_)
    {
        worker.join();
    }

    if (!queue_.empty())
    {
        LOG(INFO) << "Thread pool destroyed with " << queue_.size() << " jobs never started";
    }

    // Whoever waits on these must not hang
    while (!queue_.empty())
    {
        const auto &queued = queue_.top();
        queued.completion_token.cancel();
        queued.completion_token.complete();
        queue_.pop();
    }
}

CompletionToken ThreadPool::add_job(Job &&job, Priority priority)
{
    CompletionToken completion_token;

    {
        std::lock_guard lock {mutex_};
        queue_.push({priority, next_sequence_++, std::move(job), completion_token});
        ++unfinished_jobs_;
    }
    cv_queue_.notify_one();

    return completion_token;
}

void ThreadPool::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_idle_.wait(lock, [this] { return unfinished_jobs_ == 0; });
}

size_t ThreadPool::thread_count() const
{
    return workers_.size();
}

size_t ThreadPool::default_thread_count()
{
    return std::max(4u, std::thread::hardware_concurrency());
}

void ThreadPool::worker()
{
    std::unique_lock lock {mutex_};
    for (;;)
    {
        cv_queue_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (stopping_)
        {
            return;
        }

        // top() is const, the job is copied out before popping
        auto job              = queue_.top().job;
        auto completion_token = queue_.top().completion_token;
        queue_.pop();

        lock.unlock();
        if (!completion_token.is_cancelled())
        {
            job(completion_token);
        }
        completion_token.complete();
        lock.lock();

        if (--unfinished_jobs_ == 0)
        {
            cv_idle_.notify_all();
        }
    }
}
}  // namespace lanshare::utils
