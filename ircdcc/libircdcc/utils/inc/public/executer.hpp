#ifndef IRCDCC_UTILS_EXECUTER_HPP_
#define IRCDCC_UTILS_EXECUTER_HPP_

#include <functional>

#include "completiontoken.hpp"

namespace ircdcc::utils
{
class Executer
{
public:
    using Job      = std::function<void(const CompletionToken &)>;
    using Priority = int;

    virtual ~Executer()                                                              = default;
    virtual CompletionToken add_job(Job &&job, Priority priority = default_priority) = 0;
    virtual void            process_all_jobs()                                      = 0;

    static constexpr Priority default_priority = 0;
};
}  // namespace ircdcc::utils

#endif  // IRCDCC_UTILS_EXECUTER_HPP_
