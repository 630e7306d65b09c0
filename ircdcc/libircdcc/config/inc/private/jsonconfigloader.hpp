#ifndef IRCDCC_CONFIG_JSONCONFIGLOADER_HPP_
#define IRCDCC_CONFIG_JSONCONFIGLOADER_HPP_

#include <nlohmann/json.hpp>

#include "configloader.hpp"

namespace ircdcc::config
{
/**
 * Reads settings from a JSON file. Sections are only a grouping aid: {"dcc": {"timeout": 5}}
 * yields the key "timeout". When a key appears more than once the least nested one is kept.
 */
class JSONConfigLoader : public ConfigLoader
{
public:
    explicit JSONConfigLoader(std::string config_file_path);
    [[nodiscard]] std::map<std::string, std::any> load() const override;

private:
    [[nodiscard]] bool read_document(nlohmann::json &document) const;

    const std::string config_file_path_;
};
}  // namespace ircdcc::config

#endif  // IRCDCC_CONFIG_JSONCONFIGLOADER_HPP_
