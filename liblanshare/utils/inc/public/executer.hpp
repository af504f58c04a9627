#ifndef LANSHARE_UTILS_EXECUTER_HPP_
#define LANSHARE_UTILS_EXECUTER_HPP_

#include <functional>

#include "completiontoken.hpp"

namespace lanshare::utils
{
/// Runs jobs asynchronously. A job receives the token returned by add_job so it can watch for
/// cancellation.
class Executer
{
public:
    using Job      = std::function<void(const CompletionToken &)>;
    using Priority = int;

    static constexpr Priority default_priority = 0;

    virtual ~Executer() = default;

    virtual CompletionToken add_job(Job &&job, Priority priority = default_priority) = 0;
    /// Blocks until every job added so far has completed.
    virtual void process_all_jobs() = 0;
};
}  // namespace lanshare::utils

#endif  // LANSHARE_UTILS_EXECUTER_HPP_
