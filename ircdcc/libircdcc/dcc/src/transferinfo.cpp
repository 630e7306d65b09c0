#include "transferinfo.hpp"

#include <iomanip>
#include <sstream>

namespace ircdcc::dcc
{
std::string format_status_line(const TransferInfo &info)
{
    constexpr double mib = 1024.0 * 1024.0;

    double percent =
        info.file_size == 0 ? 0 : double(info.bytes_transferred) * 100 / double(info.file_size);

    std::ostringstream ss;
    ss << std::fixed;
    ss << "ID: " << info.id.substr(0, 8) << " [" << to_string(info.direction) << "] "
       << info.peer << " - '" << info.filename << "' (" << std::setprecision(2)
       << double(info.bytes_transferred) / mib << "MB / " << double(info.file_size) / mib
       << "MB, " << std::setprecision(1) << percent << "%) Status: " << to_string(info.status);

    if (info.rate > 0 && !is_terminal(info.status))
    {
        ss << ' ' << std::setprecision(1) << info.rate / 1024 << " KB/s";
    }
    if (info.eta_seconds >= 0 && !is_terminal(info.status))
    {
        auto eta = static_cast<long long>(info.eta_seconds);
        ss << " ETA: " << eta / 60 << 'm' << eta % 60 << 's';
    }
    if (!info.error.empty())
    {
        ss << " Error: " << info.error;
    }
    if (info.direction == Direction::RECEIVE && info.checksum_status != ChecksumStatus::PENDING &&
        info.checksum_status != ChecksumStatus::NOT_CHECKED)
    {
        ss << " Checksum: " << to_string(info.checksum_status);
    }

    return ss.str();
}
}  // namespace ircdcc::dcc
