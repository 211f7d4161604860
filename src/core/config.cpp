/// @file config.cpp
/// @brief YAML configuration loading via yaml-cpp.

#include "core/config.hpp"

#include "core/errors.hpp"

#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

namespace astrochart::core
{

Config Config::load(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
    {
        throw ConfigError("configuration file not found: " + path.string());
    }

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path.string());
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError("failed to parse " + path.string() + ": " + e.what());
    }

    return from_yaml(root);
}

Config Config::from_yaml(const YAML::Node& root)
{
    Config cfg;

    if (!root || root.IsNull())
    {
        return cfg;
    }
    if (!root.IsMap())
    {
        throw ConfigError("configuration root must be a mapping");
    }

    try
    {
        if (const YAML::Node ephemeris = root["ephemeris"])
        {
            if (const YAML::Node path = ephemeris["path"])
            {
                cfg.ephemeris.data_path = path.as<std::string>();
            }
        }

        if (const YAML::Node logging = root["logging"])
        {
            if (const YAML::Node level = logging["level"])
            {
                cfg.logging.level = level.as<std::string>();
            }
            if (const YAML::Node file = logging["file"])
            {
                cfg.logging.file = file.as<std::string>();
            }
        }
    }
    catch (const YAML::Exception& e)
    {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }

    return cfg;
}

void Config::apply_environment()
{
    if (const char* env_path = std::getenv("EPHEMERIS_PATH"); env_path != nullptr && *env_path != '\0')
    {
        ephemeris.data_path = env_path;
    }
}

void Config::validate() const
{
    if (ephemeris.data_path.empty())
    {
        throw ConfigError("ephemeris.path must not be empty");
    }

    // spdlog maps unrecognized names to "off"; only accept "off" when spelled out
    if (spdlog::level::from_str(logging.level) == spdlog::level::off && logging.level != "off")
    {
        throw ConfigError("unknown logging.level: " + logging.level);
    }
}

} // namespace astrochart::core
