#ifndef IRCDCC_CONFIG_CONFIGLOADER_HPP_
#define IRCDCC_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace ircdcc::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    [[nodiscard]] virtual std::map<std::string, std::any> load() const = 0;
};
}  // namespace ircdcc::config

#endif  // IRCDCC_CONFIG_CONFIGLOADER_HPP_
