#ifndef LANSHARE_UTILS_TIMER_HPP_
#define LANSHARE_UTILS_TIMER_HPP_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "completiontoken.hpp"

namespace lanshare::utils
{
// Forward declarations
class Executer;

/// Periodic or single shot callback. The wait occupies one job of the given executer, so it
/// should be an IOThreadPool. The callback runs without any timer lock held.
class Timer
{
public:
    using Period    = std::chrono::milliseconds;
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Callback  = std::function<void()>;

    explicit Timer(std::shared_ptr<Executer> executer);
    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;
    ~Timer();

    bool               start(Period period, Callback &&callback, bool single_shot = false);
    bool               stop();
    [[nodiscard]] bool is_running() const;

private:
    void wait_loop(const CompletionToken &completion_token);

    const std::shared_ptr<Executer> executer_;
    TimePoint                       next_trigger_moment_;
    std::optional<CompletionToken>  completion_token_;
    std::thread::id                 worker_thread_id_;
    Period                          period_;
    std::shared_ptr<Callback>       callback_;
    bool                            single_shot_;
    mutable std::mutex              mutex_;
    std::condition_variable         cv_stop_;
};
}  // namespace lanshare::utils

#endif  // LANSHARE_UTILS_TIMER_HPP_
