#ifndef IRCDCC_UTILS_COMPLETIONTOKEN_HPP_
#define IRCDCC_UTILS_COMPLETIONTOKEN_HPP_

#include <chrono>
#include <memory>

namespace ircdcc::utils
{
// Shared handle to the fate of one executer job. Copies refer to the same job.
class CompletionToken
{
public:
    CompletionToken();

    // A job cancelled before it starts never runs, a running job may poll is_cancelled
    void               cancel() const;
    [[nodiscard]] bool is_cancelled() const;

    // Set by the executer after the job ran or was dropped
    void               complete() const;
    [[nodiscard]] bool is_completed() const;
    void               wait_for_completion() const;
    [[nodiscard]] bool wait_for_completion(std::chrono::milliseconds timeout) const;

    friend bool operator==(const CompletionToken &lhs, const CompletionToken &rhs)
    {
        return lhs.state_ == rhs.state_;
    }

private:
    struct State;
    std::shared_ptr<State> state_;
};
}  // namespace ircdcc::utils

#endif  // IRCDCC_UTILS_COMPLETIONTOKEN_HPP_
