#ifndef IRCDCC_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define IRCDCC_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

namespace ircdcc::config
{
// Forward declarations
class ConfigKey;

class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace ircdcc::config

#endif  // IRCDCC_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
