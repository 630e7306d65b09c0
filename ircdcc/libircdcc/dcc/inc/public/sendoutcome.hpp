#ifndef IRCDCC_DCC_SENDOUTCOME_HPP_
#define IRCDCC_DCC_SENDOUTCOME_HPP_

#include <cstdint>
#include <string>

namespace ircdcc::dcc
{
// What happened to one file of a send request
struct SendOutcome
{
    enum class Result
    {
        STARTED,
        QUEUED,
        ERROR
    };

    Result      result = Result::ERROR;
    std::string path;
    std::string filename;
    uint64_t    file_size = 0;
    std::string transfer_id;  // STARTED only
    std::string token;        // Passive sends only
    uint64_t    resume_offset = 0;
    size_t      queue_position = 0;  // QUEUED only, 1 based
    std::string error;
};

const char *to_string(SendOutcome::Result result);
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_SENDOUTCOME_HPP_
