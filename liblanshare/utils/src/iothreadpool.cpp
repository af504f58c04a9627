#include "iothreadpool.hpp"

namespace lanshare::utils
{
namespace
{
void join_all(std::vector<std::thread> &threads)
{
    for (auto &th : threads)
    {
        th.join();
    }
}
}  // namespace

IOThreadPool::IOThreadPool(std::chrono::milliseconds idle_timeout)
    : idle_timeout_ {idle_timeout}
    , idle_count_ {0}
    , unfinished_jobs_ {0}
    , stopping_ {false}
{}

IOThreadPool::~IOThreadPool()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard lock {mutex_};
        stopping_ = true;
        threads   = take_exited_threads();
        for (auto &[id, worker] : workers_)
        {
            threads.push_back(std::move(worker));
        }
        workers_.clear();
    }
    cv_queue_.notify_all();

    join_all(threads);

    for (auto &[job, completion_token] : queue_)
    {
        completion_token.cancel();
        completion_token.complete();
    }
    queue_.clear();
}

CompletionToken IOThreadPool::add_job(Job &&job, Priority /*priority*/)
{
    CompletionToken          completion_token;
    std::vector<std::thread> exited;

    {
        std::lock_guard lock {mutex_};
        if (stopping_)
        {
            completion_token.cancel();
            completion_token.complete();
            return completion_token;
        }

        queue_.emplace_back(std::move(job), completion_token);
        ++unfinished_jobs_;

        if (idle_count_ < queue_.size())
        {
            // The new thread blocks on mutex_ until it is registered
            std::thread worker {&IOThreadPool::worker, this};
            auto        id = worker.get_id();
            workers_.emplace(id, std::move(worker));
        }
        exited = take_exited_threads();
    }
    cv_queue_.notify_one();

    join_all(exited);
    return completion_token;
}

void IOThreadPool::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_idle_.wait(lock, [this] { return unfinished_jobs_ == 0; });
}

size_t IOThreadPool::thread_count() const
{
    std::lock_guard lock {mutex_};
    return workers_.size();
}

std::vector<std::thread> IOThreadPool::take_exited_threads()
{
    std::vector<std::thread> exited;
    exited.swap(exited_);
    return exited;
}

void IOThreadPool::worker()
{
    std::unique_lock lock {mutex_};
    for (;;)
    {
        ++idle_count_;
        bool has_work = cv_queue_.wait_for(
            lock, idle_timeout_, [this] { return stopping_ || !queue_.empty(); });
        --idle_count_;

        if (stopping_)
        {
            return;
        }

        if (!has_work)
        {
            // Cannot join itself, the next add_job or the destructor does
            auto it = workers_.find(std::this_thread::get_id());
            if (it != workers_.end())
            {
                exited_.push_back(std::move(it->second));
                workers_.erase(it);
            }
            return;
        }

        auto [job, completion_token] = std::move(queue_.front());
        queue_.pop_front();

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
