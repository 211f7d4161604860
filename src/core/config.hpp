#pragma once

/// @file config.hpp
/// @brief Process configuration loaded from YAML (ephemeris data path, logging).

#include <filesystem>
#include <string>

namespace YAML
{
    class Node;
}

namespace astrochart::core
{
    /// @brief Ephemeris provider settings. Fixed once the provider is constructed.
    struct EphemerisConfig
    {
        std::filesystem::path data_path = "ephemeris_data";  ///< Directory holding .se1 files
    };

    /// @brief Logger settings consumed by Logger::init().
    struct LoggingConfig
    {
        std::string level = "info";        ///< trace, debug, info, warn, error, critical, off
        std::filesystem::path file;        ///< Rotating log file; empty = console only
    };

    /// @brief Top-level configuration.
    ///
    /// Example YAML:
    /// @code
    /// ephemeris:
    ///   path: /usr/share/astrochart/ephe
    /// logging:
    ///   level: debug
    ///   file: astrochart.log
    /// @endcode
    ///
    /// Every key is optional; missing keys keep their defaults.
    struct Config
    {
        EphemerisConfig ephemeris;
        LoggingConfig logging;

        /// @brief Read and parse a YAML configuration file.
        /// @throws ConfigError if the file is missing or not valid YAML.
        [[nodiscard]] static Config load(const std::filesystem::path& path);

        /// @brief Build a configuration from an already-parsed YAML node.
        /// @throws ConfigError on a value of the wrong type.
        [[nodiscard]] static Config from_yaml(const YAML::Node& root);

        /// @brief Override the data path from the EPHEMERIS_PATH environment variable, if set.
        void apply_environment();

        /// @brief Reject unknown log levels and an empty ephemeris path.
        /// @throws ConfigError on the first invalid setting.
        void validate() const;
    };

} // namespace astrochart::core
