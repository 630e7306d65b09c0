#include "defaultconfigvalues.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

#include "dccsettings.hpp"

namespace ircdcc
{
DefaultConfigValues::DefaultConfigValues()
{
    using config::ConfigKey;

    const dcc::DCCSettings defaults;

    default_values_[ConfigKey::ENABLED]            = defaults.enabled;
    default_values_[ConfigKey::DOWNLOAD_DIR]       = defaults.download_dir;
    default_values_[ConfigKey::UPLOAD_DIR]         = defaults.upload_dir;
    default_values_[ConfigKey::AUTO_ACCEPT]        = defaults.auto_accept;
    default_values_[ConfigKey::MAX_FILE_SIZE]      = static_cast<long long>(defaults.max_file_size);
    default_values_[ConfigKey::PORT_RANGE_START] =
        static_cast<long long>(defaults.port_range_start);
    default_values_[ConfigKey::PORT_RANGE_END] = static_cast<long long>(defaults.port_range_end);
    default_values_[ConfigKey::TRANSFER_TIMEOUT] =
        static_cast<long long>(defaults.transfer_timeout.count());
    default_values_[ConfigKey::RESUME_ENABLED]     = defaults.resume_enabled;
    default_values_[ConfigKey::CHECKSUM_VERIFY]    = defaults.checksum_verify;
    default_values_[ConfigKey::CHECKSUM_ALGORITHM] = defaults.checksum_algorithm;
    default_values_[ConfigKey::BANDWIDTH_LIMIT_SEND_KBPS] =
        static_cast<long long>(defaults.send_limit_kbps);
    default_values_[ConfigKey::BANDWIDTH_LIMIT_RECV_KBPS] =
        static_cast<long long>(defaults.recv_limit_kbps);
    default_values_[ConfigKey::BLOCKED_EXTENSIONS] = defaults.blocked_extensions;
    default_values_[ConfigKey::PASSIVE_TOKEN_TIMEOUT] =
        static_cast<long long>(defaults.passive_token_timeout.count());
    default_values_[ConfigKey::ADVERTISED_IP] = defaults.advertised_ip;
    default_values_[ConfigKey::MAINTENANCE_PERIOD] =
        static_cast<long long>(defaults.maintenance_period.count());
    default_values_[ConfigKey::CLEANUP_ENABLED] = defaults.cleanup_enabled;
    default_values_[ConfigKey::TRANSFER_MAX_AGE] =
        static_cast<long long>(defaults.transfer_max_age.count());
    default_values_[ConfigKey::BUFFER_SIZE] = static_cast<long long>(defaults.buffer_size);
}

std::any DefaultConfigValues::get(const config::ConfigKey &key) const
{
    if (!key.is_valid())
    {
        LOG(ERROR) << "No default for " << key;
        return {};
    }
    return default_values_[key];
}
}  // namespace ircdcc
