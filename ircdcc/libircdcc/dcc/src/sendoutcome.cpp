#include "sendoutcome.hpp"

namespace ircdcc::dcc
{
const char *to_string(SendOutcome::Result result)
{
    switch (result)
    {
        case SendOutcome::Result::STARTED: return "started";
        case SendOutcome::Result::QUEUED: return "queued";
        case SendOutcome::Result::ERROR: return "error";
    }
    return "unknown";
}
}  // namespace ircdcc::dcc
