#ifndef IRCDCC_CONFIG_CONFIGKEYS_HPP_
#define IRCDCC_CONFIG_CONFIGKEYS_HPP_

#include <ostream>
#include <string>

namespace ircdcc::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        // General
        ENABLED = FIRST_KEY,
        DOWNLOAD_DIR,
        UPLOAD_DIR,
        AUTO_ACCEPT,
        MAX_FILE_SIZE,
        BLOCKED_EXTENSIONS,

        // Network
        PORT_RANGE_START,
        PORT_RANGE_END,
        ADVERTISED_IP,
        TRANSFER_TIMEOUT,
        PASSIVE_TOKEN_TIMEOUT,
        BANDWIDTH_LIMIT_SEND_KBPS,
        BANDWIDTH_LIMIT_RECV_KBPS,
        BUFFER_SIZE,

        // Integrity
        RESUME_ENABLED,
        CHECKSUM_VERIFY,
        CHECKSUM_ALGORITHM,

        // Housekeeping
        MAINTENANCE_PERIOD,
        CLEANUP_ENABLED,
        TRANSFER_MAX_AGE,

        KEY_COUNT
    };

    // Unknown names give KEY_COUNT
    ConfigKey(const std::string &name);

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] bool is_valid() const
    {
        return key_ >= FIRST_KEY && key_ < KEY_COUNT;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return key_;
    }

private:
    EnumType key_;
};

inline std::ostream &operator<<(std::ostream &os, const ConfigKey &key)
{
    return key.is_valid() ? os << key.to_string() : os << "<invalid key " << int(key) << ">";
}
}  // namespace ircdcc::config

#endif  // IRCDCC_CONFIG_CONFIGKEYS_HPP_
