#include "config.hpp"

#include <optional>
#include <typeinfo>

#include <glog/logging.h>

#include "configloader.hpp"

namespace ircdcc::config
{
namespace
{
template<typename T>
std::optional<T> value_as(const std::any &value)
{
    if (auto typed = std::any_cast<T>(&value))
    {
        return *typed;
    }
    return std::nullopt;
}

// JSON has no separate integer width, so a float like 10.0 is accepted where an integer is asked
template<>
std::optional<long long> value_as<long long>(const std::any &value)
{
    if (auto integer = std::any_cast<long long>(&value))
    {
        return *integer;
    }
    if (auto real = std::any_cast<double>(&value);
        real && *real == static_cast<double>(static_cast<long long>(*real)))
    {
        return static_cast<long long>(*real);
    }
    return std::nullopt;
}
}  // namespace

Config::Config(const ConfigLoader &              config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    for (auto &[name, value] : config_loader.load())
    {
        ConfigKey key {name};
        if (!key.is_valid())
        {
            // Unknown keys are reported by the ConfigKey constructor
            continue;
        }
        values_[key] = std::move(value);
    }
}

const std::any &Config::loaded_value(ConfigKey key) const
{
    if (!key.is_valid())
    {
        LOG(FATAL) << "Lookup of " << key;
    }
    return values_[key];
}

std::any Config::fallback_value(ConfigKey key) const
{
    if (!fallback_value_provider_)
    {
        LOG(FATAL) << "No default available for " << key.to_string()
                   << ": the configuration has no fallback provider";
    }

    auto value = fallback_value_provider_->get(key);
    if (!value.has_value())
    {
        LOG(FATAL) << "No default value for config key " << key.to_string();
    }
    return value;
}

template<typename T>
T Config::lookup(ConfigKey key) const
{
    const auto &loaded = loaded_value(key);
    if (loaded.has_value())
    {
        if (auto value = value_as<T>(loaded))
        {
            return *value;
        }
        LOG(ERROR) << key.to_string() << " has type " << loaded.type().name() << ", expected "
                   << typeid(T).name() << "; using the default value";
    }

    auto fallback = fallback_value(key);
    if (auto value = value_as<T>(fallback))
    {
        return *value;
    }
    LOG(FATAL) << "Default value of " << key.to_string() << " has type "
               << fallback.type().name() << ", expected " << typeid(T).name();
    return T {};
}

bool Config::is_loaded(ConfigKey key) const
{
    return loaded_value(key).has_value();
}

std::vector<std::string> Config::loaded_keys() const
{
    std::vector<std::string> keys;
    for (int k = ConfigKey::FIRST_KEY; k != ConfigKey::KEY_COUNT; ++k)
    {
        if (values_[k].has_value())
        {
            keys.push_back(ConfigKey {ConfigKey::EnumType(k)}.to_string());
        }
    }
    return keys;
}

bool Config::get_bool(ConfigKey key) const
{
    return lookup<bool>(key);
}

std::string Config::get_string(ConfigKey key) const
{
    return lookup<std::string>(key);
}

Config::StringList Config::get_string_list(ConfigKey key) const
{
    return lookup<StringList>(key);
}

long long Config::get_integer(ConfigKey key) const
{
    return lookup<long long>(key);
}

long long Config::get_integer(ConfigKey key, long long min, long long max) const
{
    const auto &loaded = loaded_value(key);
    if (auto value = value_as<long long>(loaded); value && (*value < min || *value > max))
    {
        LOG(WARNING) << key.to_string() << " = " << *value << " is outside of [" << min << ", "
                     << max << "], using the default value";
        auto fallback = fallback_value(key);
        if (auto fallback_integer = value_as<long long>(fallback))
        {
            return *fallback_integer;
        }
        LOG(FATAL) << "Fallback value of " << key.to_string() << " is not an integer";
    }
    return lookup<long long>(key);
}
}  // namespace ircdcc::config
