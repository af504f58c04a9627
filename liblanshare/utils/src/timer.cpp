#include "timer.hpp"

#include <glog/logging.h>

#include "executer.hpp"

namespace lanshare::utils
{
Timer::Timer(std::shared_ptr<Executer> executer)
    : executer_ {std::move(executer)}
    , period_ {}
    , single_shot_ {}
{}

Timer::~Timer()
{
    if (is_running())
    {
        stop();
    }
}

bool Timer::start(Period period, Callback &&callback, bool single_shot)
{
    std::lock_guard lock {mutex_};

    if (completion_token_)
    {
        LOG(WARNING) << "Timer already running";
        return false;
    }

    next_trigger_moment_ = Clock::now() + period;
    period_              = period;
    callback_            = std::make_shared<Callback>(std::move(callback));
    single_shot_         = single_shot;

    completion_token_ = executer_->add_job(
        [this](const CompletionToken &completion_token) { wait_loop(completion_token); });

    return true;
}

bool Timer::stop()
{
    CompletionToken completion_token;
    bool            called_from_callback;

    {
        std::lock_guard lock {mutex_};

        if (!completion_token_)
        {
            LOG(WARNING) << "Timer not running";
            return false;
        }

        completion_token = *completion_token_;
        completion_token.cancel();
        completion_token_.reset();
        called_from_callback = worker_thread_id_ == std::this_thread::get_id();
    }

    cv_stop_.notify_all();

    // A callback stopping its own timer cannot wait for itself
    if (!called_from_callback)
    {
        completion_token.wait_for_completion();
    }

    return true;
}

bool Timer::is_running() const
{
    std::lock_guard lock {mutex_};
    return completion_token_.has_value();
}

void Timer::wait_loop(const CompletionToken &completion_token)
{
    {
        std::lock_guard lock {mutex_};
        worker_thread_id_ = std::this_thread::get_id();
    }

    for (;;)
    {
        std::shared_ptr<Callback> callback;
        {
            std::unique_lock lock {mutex_};
            cv_stop_.wait_until(lock, next_trigger_moment_,
                [&completion_token] { return completion_token.is_cancelled(); });
            if (completion_token.is_cancelled())
            {
                break;
            }
            next_trigger_moment_ = Clock::now() + period_;
            callback             = callback_;
            if (single_shot_)
            {
                completion_token_.reset();
            }
        }

        (*callback)();

        if (single_shot_)
        {
            break;
        }
    }

    std::lock_guard lock {mutex_};
    if (worker_thread_id_ == std::this_thread::get_id())
    {
        worker_thread_id_ = {};
    }
}
}  // namespace lanshare::utils
