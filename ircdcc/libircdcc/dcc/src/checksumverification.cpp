#include "checksumverification.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace ircdcc::dcc
{
ChecksumVerification::ChecksumVerification(bool enabled, std::string algorithm)
    : enabled_ {enabled && !algorithm.empty() && !boost::algorithm::iequals(algorithm, "none")}
    , algorithm_ {std::move(algorithm)}
    , local_done_ {false}
    , status_ {enabled_ ? ChecksumStatus::PENDING : ChecksumStatus::NOT_CHECKED}
{}

bool ChecksumVerification::set_expected(const std::string &algorithm, const std::string &value)
{
    expected_algorithm_ = algorithm;
    expected_           = value;
    return update();
}

bool ChecksumVerification::set_local(const std::string &value)
{
    local_      = value;
    local_done_ = true;
    error_.clear();
    return update();
}

bool ChecksumVerification::set_local_error(const std::string &reason)
{
    local_.clear();
    local_done_ = true;
    error_      = reason;
    return update();
}

bool ChecksumVerification::update()
{
    auto old_status = status_;

    if (!enabled_)
    {
        status_ = ChecksumStatus::NOT_CHECKED;
    }
    else if (!expected_.empty() && !boost::algorithm::iequals(expected_algorithm_, algorithm_))
    {
        status_ = ChecksumStatus::ALGORITHM_MISMATCH;
    }
    else if (!local_done_)
    {
        status_ = ChecksumStatus::PENDING;
    }
    else if (!error_.empty())
    {
        status_ = ChecksumStatus::ERROR;
    }
    else if (expected_.empty())
    {
        status_ = ChecksumStatus::SENDER_DID_NOT_PROVIDE;
    }
    else
    {
        status_ = boost::algorithm::iequals(expected_, local_) ? ChecksumStatus::MATCH :
                                                                 ChecksumStatus::MISMATCH;
    }

    return status_ != old_status;
}

bool ChecksumVerification::enabled() const
{
    return enabled_;
}

ChecksumStatus ChecksumVerification::status() const
{
    return status_;
}

const std::string &ChecksumVerification::algorithm() const
{
    return algorithm_;
}

const std::string &ChecksumVerification::expected() const
{
    return expected_;
}

const std::string &ChecksumVerification::local() const
{
    return local_;
}

const std::string &ChecksumVerification::error() const
{
    return error_;
}
}  // namespace ircdcc::dcc
