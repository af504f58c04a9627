#include "jsonconfigloader.hpp"

#include <fstream>
#include <utility>
#include <vector>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace lanshare::config
{
JSONConfigLoader::JSONConfigLoader(std::string config_file_path)
    : config_file_path_ {std::move(config_file_path)}
{}

ConfigLoader::Values JSONConfigLoader::load() const
{
    Values values;

    std::ifstream fs {config_file_path_};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << config_file_path_ << ", falling back to defaults";
        return values;
    }

    auto root = nlohmann::json::parse(fs, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        LOG(ERROR) << config_file_path_ << " does not hold a JSON object, falling back to defaults";
        return values;
    }

    // (dotted path of the object, object)
    std::vector<std::pair<std::string, const nlohmann::json *>> pending {{"", &root}};
    while (!pending.empty())
    {
        auto [prefix, object] = pending.back();
        pending.pop_back();

        for (auto it = object->cbegin(); it != object->cend(); ++it)
        {
            const auto &value = it.value();
            auto        path  = prefix.empty() ? it.key() : prefix + '.' + it.key();

            if (value.is_object())
            {
                pending.emplace_back(path, &value);
                continue;
            }

            std::any any_value;
            if (value.is_string())
            {
                any_value = value.get<std::string>();
            }
            else if (value.is_boolean())
            {
                any_value = value.get<bool>();
            }
            else if (value.is_number_integer())
            {
                any_value = value.get<long long>();
            }
            else
            {
                LOG(WARNING) << config_file_path_ << ": " << path << " has an unsupported type ("
                             << value.type_name() << ")";
                continue;
            }

            if (!values.emplace(it.key(), std::move(any_value)).second)
            {
                LOG(WARNING) << config_file_path_ << ": " << path << " repeats key " << it.key()
                             << ", keeping the first one";
            }
        }
    }

    return values;
}
}  // namespace lanshare::config
