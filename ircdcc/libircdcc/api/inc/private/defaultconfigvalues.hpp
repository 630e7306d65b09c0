#ifndef IRCDCC_API_DEFAULTCONFIGVALUES_HPP_
#define IRCDCC_API_DEFAULTCONFIGVALUES_HPP_

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace ircdcc
{
// Values used for keys missing from the configuration file, taken from a default DCCSettings
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    DefaultConfigValues();
    [[nodiscard]] std::any get(const config::ConfigKey &key) const override;

private:
    std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace ircdcc

#endif  // IRCDCC_API_DEFAULTCONFIGVALUES_HPP_
