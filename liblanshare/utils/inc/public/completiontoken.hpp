#ifndef LANSHARE_UTILS_COMPLETIONTOKEN_HPP_
#define LANSHARE_UTILS_COMPLETIONTOKEN_HPP_

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace lanshare::utils
{
/// Handle on a job handed to an Executer. Copies share the job; the executer marks it completed
/// once the job returned or was skipped because it had been cancelled first.
class CompletionToken
{
public:
    CompletionToken();

    /// Asks the job to return early. Long running jobs poll is_cancelled().
    void               cancel() const;
    [[nodiscard]] bool is_cancelled() const;
    [[nodiscard]] bool is_completed() const;

    void wait_for_completion() const;
    /// false on timeout
    [[nodiscard]] bool wait_for_completion(std::chrono::milliseconds timeout) const;

    /// Executer side. Wakes every waiter; later calls do nothing.
    void complete() const;

    bool operator==(const CompletionToken &other) const
    {
        return state_ == other.state_;
    }

    bool operator<(const CompletionToken &other) const
    {
        return state_ < other.state_;
    }

private:
    struct State;
    std::shared_ptr<State> state_;

    friend struct std::hash<CompletionToken>;
};
}  // namespace lanshare::utils

namespace std
{
template<>
struct hash<lanshare::utils::CompletionToken>
{
    size_t operator()(const lanshare::utils::CompletionToken &token) const
    {
        return hash<shared_ptr<lanshare::utils::CompletionToken::State>>()(token.state_);
    }
};
}  // namespace std

#endif  // LANSHARE_UTILS_COMPLETIONTOKEN_HPP_
