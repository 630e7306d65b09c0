#ifndef IRCDCC_CONFIG_CONFIG_HPP_
#define IRCDCC_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <memory>
#include <string>
#include <vector>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace ircdcc::config
{
class ConfigLoader;

/**
 * Typed view over the values produced by a ConfigLoader.
 *
 * A value that is missing from the loaded set, has the wrong type or is out of the requested
 * range is replaced by the one from the fallback provider. A missing fallback is fatal.
 */
class Config
{
public:
    using StringList = std::vector<std::string>;

    explicit Config(const ConfigLoader &             config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] bool                     is_loaded(ConfigKey key) const;
    [[nodiscard]] std::vector<std::string> loaded_keys() const;

    [[nodiscard]] bool        get_bool(ConfigKey key) const;
    [[nodiscard]] std::string get_string(ConfigKey key) const;
    [[nodiscard]] StringList  get_string_list(ConfigKey key) const;
    [[nodiscard]] long long   get_integer(ConfigKey key) const;

    /**
     * Same as get_integer, but a loaded value outside [min, max] is rejected with a warning and
     * the fallback value is returned instead.
     */
    [[nodiscard]] long long get_integer(ConfigKey key, long long min, long long max) const;

private:
    [[nodiscard]] const std::any &loaded_value(ConfigKey key) const;
    [[nodiscard]] std::any        fallback_value(ConfigKey key) const;

    template<typename T>
    [[nodiscard]] T lookup(ConfigKey key) const;

    std::array<std::any, ConfigKey::KEY_COUNT> values_;

    // Shared so that a Config stays copyable
    std::shared_ptr<const FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace ircdcc::config

#endif  // IRCDCC_CONFIG_CONFIG_HPP_
