#include "dccsettings.hpp"

#include <limits>

#include <glog/logging.h>

#include "config.hpp"

namespace ircdcc::dcc
{
namespace
{
constexpr long long max_integer = std::numeric_limits<long long>::max();
constexpr long long max_port    = std::numeric_limits<unsigned short>::max();
}  // namespace

DCCSettings DCCSettings::from_config(const config::Config &cfg)
{
    using config::ConfigKey;
    using std::chrono::seconds;

    DCCSettings settings;

    settings.enabled            = cfg.get_bool(ConfigKey::ENABLED);
    settings.download_dir       = cfg.get_string(ConfigKey::DOWNLOAD_DIR);
    settings.upload_dir         = cfg.get_string(ConfigKey::UPLOAD_DIR);
    settings.auto_accept        = cfg.get_bool(ConfigKey::AUTO_ACCEPT);
    settings.resume_enabled     = cfg.get_bool(ConfigKey::RESUME_ENABLED);
    settings.checksum_verify    = cfg.get_bool(ConfigKey::CHECKSUM_VERIFY);
    settings.checksum_algorithm = cfg.get_string(ConfigKey::CHECKSUM_ALGORITHM);
    settings.blocked_extensions = cfg.get_string_list(ConfigKey::BLOCKED_EXTENSIONS);
    settings.advertised_ip      = cfg.get_string(ConfigKey::ADVERTISED_IP);
    settings.cleanup_enabled    = cfg.get_bool(ConfigKey::CLEANUP_ENABLED);

    settings.max_file_size = uint64_t(cfg.get_integer(ConfigKey::MAX_FILE_SIZE, 0, max_integer));
    settings.send_limit_kbps =
        uint64_t(cfg.get_integer(ConfigKey::BANDWIDTH_LIMIT_SEND_KBPS, 0, max_integer));
    settings.recv_limit_kbps =
        uint64_t(cfg.get_integer(ConfigKey::BANDWIDTH_LIMIT_RECV_KBPS, 0, max_integer));
    settings.buffer_size = size_t(cfg.get_integer(ConfigKey::BUFFER_SIZE, 1, max_integer));

    settings.port_range_start =
        static_cast<unsigned short>(cfg.get_integer(ConfigKey::PORT_RANGE_START, 1, max_port));
    settings.port_range_end =
        static_cast<unsigned short>(cfg.get_integer(ConfigKey::PORT_RANGE_END, 1, max_port));
    if (settings.port_range_start > settings.port_range_end)
    {
        DCCSettings defaults;
        LOG(WARNING) << "Port range " << settings.port_range_start << "-"
                     << settings.port_range_end << " is empty, using the default range";
        settings.port_range_start = defaults.port_range_start;
        settings.port_range_end   = defaults.port_range_end;
    }

    // Durations are given in seconds
    settings.transfer_timeout =
        seconds {cfg.get_integer(ConfigKey::TRANSFER_TIMEOUT, 1, max_integer)};
    settings.maintenance_period =
        seconds {cfg.get_integer(ConfigKey::MAINTENANCE_PERIOD, 1, max_integer)};
    settings.passive_token_timeout =
        seconds {cfg.get_integer(ConfigKey::PASSIVE_TOKEN_TIMEOUT, 1, max_integer)};
    settings.transfer_max_age =
        seconds {cfg.get_integer(ConfigKey::TRANSFER_MAX_AGE, 0, max_integer)};

    return settings;
}
}  // namespace ircdcc::dcc
