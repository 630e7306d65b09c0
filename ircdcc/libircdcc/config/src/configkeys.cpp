#include "configkeys.hpp"

#include <array>
#include <string_view>

#include <glog/logging.h>

namespace ircdcc::config
{
namespace
{
constexpr std::array<std::string_view, ConfigKey::KEY_COUNT> key_names {"enabled",
    "download_dir", "upload_dir", "auto_accept", "max_file_size", "blocked_extensions",
    "port_range_start", "port_range_end", "advertised_ip", "transfer_timeout",
    "passive_token_timeout", "bandwidth_limit_send_kbps", "bandwidth_limit_recv_kbps",
    "buffer_size", "resume_enabled", "checksum_verify", "checksum_algorithm",
    "maintenance_period", "cleanup_enabled", "transfer_max_age"};

static_assert(!key_names.back().empty(), "Every config key needs a name");
}  // namespace

ConfigKey::ConfigKey(const std::string &name)
    : key_ {KEY_COUNT}
{
    for (int k = FIRST_KEY; k != KEY_COUNT; ++k)
    {
        if (key_names[size_t(k)] == name)
        {
            key_ = EnumType(k);
            return;
        }
    }
    LOG(WARNING) << "Unknown config key " << name;
}

std::string ConfigKey::to_string() const
{
    return is_valid() ? std::string {key_names[size_t(key_)]} : std::string {};
}
}  // namespace ircdcc::config
