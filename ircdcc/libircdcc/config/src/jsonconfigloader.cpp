#include "jsonconfigloader.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <utility>
#include <vector>

#include <glog/logging.h>

namespace ircdcc::config
{
namespace
{
// Empty when the JSON value has no configuration counterpart
std::any to_config_value(const nlohmann::json &value)
{
    switch (value.type())
    {
        case nlohmann::json::value_t::boolean: return value.get<bool>();
        case nlohmann::json::value_t::string: return value.get<std::string>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return value.get<long long>();
        case nlohmann::json::value_t::number_float: return value.get<double>();
        case nlohmann::json::value_t::array:
            if (std::all_of(value.begin(), value.end(),
                    [](const nlohmann::json &element) { return element.is_string(); }))
            {
                return value.get<std::vector<std::string>>();
            }
            return {};
        default: return {};
    }
}
}  // namespace

JSONConfigLoader::JSONConfigLoader(std::string config_file_path)
    : config_file_path_ {std::move(config_file_path)}
{}

std::map<std::string, std::any> JSONConfigLoader::load() const
{
    std::map<std::string, std::any> values;

    nlohmann::json document;
    if (!read_document(document))
    {
        return values;
    }

    std::deque<const nlohmann::json *> sections {&document};
    while (!sections.empty())
    {
        const nlohmann::json *section = sections.front();
        sections.pop_front();

        for (const auto &[key, value] : section->items())
        {
            if (value.is_object())
            {
                sections.push_back(&value);
                continue;
            }

            auto config_value = to_config_value(value);
            if (!config_value.has_value())
            {
                LOG(WARNING) << "Ignoring " << key << " in " << config_file_path_
                             << ": unsupported value " << value.dump();
            }
            else if (!values.emplace(key, std::move(config_value)).second)
            {
                LOG(WARNING) << key << " appears more than once in " << config_file_path_
                             << ", keeping the least nested one";
            }
        }
    }

    LOG(INFO) << "Loaded " << values.size() << " configuration values from "
              << config_file_path_;
    return values;
}

bool JSONConfigLoader::read_document(nlohmann::json &document) const
{
    std::ifstream fs {config_file_path_};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open configuration file " << config_file_path_;
        return false;
    }

    try
    {
        fs >> document;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        LOG(ERROR) << "Malformed configuration file " << config_file_path_ << ": " << e.what();
        return false;
    }

    if (!document.is_object())
    {
        LOG(ERROR) << "Configuration file " << config_file_path_
                   << " must contain a JSON object";
        return false;
    }
    return true;
}
}  // namespace ircdcc::config
