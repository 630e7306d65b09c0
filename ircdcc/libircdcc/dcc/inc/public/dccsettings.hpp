#ifndef IRCDCC_DCC_DCCSETTINGS_HPP_
#define IRCDCC_DCC_DCCSETTINGS_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace ircdcc::config
{
// Forward declarations
class Config;
}  // namespace ircdcc::config

namespace ircdcc::dcc
{
struct DCCSettings
{
    bool                     enabled            = true;
    std::string              download_dir       = "downloads";
    std::string              upload_dir         = "uploads";
    bool                     auto_accept        = false;
    uint64_t                 max_file_size      = 100 * 1024 * 1024;
    unsigned short           port_range_start   = 1024;
    unsigned short           port_range_end     = 65535;
    std::chrono::seconds     transfer_timeout   = std::chrono::seconds {300};
    bool                     resume_enabled     = true;
    bool                     checksum_verify    = true;
    std::string              checksum_algorithm = "md5";
    uint64_t                 send_limit_kbps    = 0;  // 0 means unlimited
    uint64_t                 recv_limit_kbps    = 0;
    std::vector<std::string> blocked_extensions {".exe", ".bat", ".com", ".scr", ".vbs", ".pif"};
    std::chrono::seconds     passive_token_timeout = std::chrono::seconds {120};
    std::string              advertised_ip;  // Empty means auto-detect
    std::chrono::seconds     maintenance_period = std::chrono::seconds {30};
    bool                     cleanup_enabled    = true;
    std::chrono::seconds     transfer_max_age   = std::chrono::hours {72};
    size_t                   buffer_size        = 8192;

    [[nodiscard]] uint64_t send_limit_bytes_per_second() const
    {
        return send_limit_kbps * 1024;
    }

    [[nodiscard]] uint64_t recv_limit_bytes_per_second() const
    {
        return recv_limit_kbps * 1024;
    }

    static DCCSettings from_config(const config::Config &cfg);
};
}  // namespace ircdcc::dcc

#endif  // IRCDCC_DCC_DCCSETTINGS_HPP_
