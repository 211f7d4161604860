// src/main.cpp - astrochart command-line entry point
//
// Computes one Whole Sign natal chart and prints it as JSON on stdout:
//  1. Parse command line, load configuration
//  2. Initialize logging
//  3. Open the ephemeris provider once
//  4. Build the chart request from flags or a JSON document
//  5. Compute, print
//
// Exit codes: 0 ok, 1 usage/JSON/config, 2 input rejected,
// 3 calculation failure, 4 output invariant failure, 99 unexpected.

#include "chart/chart_json.hpp"
#include "chart/chart_orchestrator.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "ephemeris/swiss_ephemeris.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

#ifndef ASTROCHART_VERSION
#define ASTROCHART_VERSION "0.0.0"
#endif

using namespace astrochart;

namespace
{

constexpr int kExitOk            = 0;
constexpr int kExitUsage         = 1;
constexpr int kExitInput         = 2;
constexpr int kExitCalculation   = 3;
constexpr int kExitValidation    = 4;
constexpr int kExitUnexpected    = 99;

} // namespace

int main(int argc, char** argv)
{
    // -----------------------------------------------------------------------
    // 1. Command line
    // -----------------------------------------------------------------------
    CLI::App app{"astrochart - Whole Sign natal chart positions from Swiss Ephemeris"};
    app.footer(
        "Examples:\n"
        "  astrochart --datetime 1977-09-05T17:24:00Z --lat 37.82 --lon -79.82\n"
        "  astrochart --json '{\"datetime_utc\": \"1977-09-05T17:24:00Z\", "
        "\"latitude\": 37.82, \"longitude\": -79.82}'");

    std::string datetime;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string json_text;
    std::string ephemeris_path;
    std::string config_path;
    std::string log_level;
    bool pretty = false;

    auto* opt_datetime = app.add_option("-d,--datetime", datetime,
                                        "UTC datetime in ISO 8601 (e.g. 1977-09-05T17:24:00Z)");
    auto* opt_lat = app.add_option("--lat,--latitude", latitude,
                                   "Geographic latitude in decimal degrees (-90 to 90)");
    auto* opt_lon = app.add_option("--lon,--longitude", longitude,
                                   "Geographic longitude in decimal degrees (-180 to 180)");
    auto* opt_json = app.add_option("-j,--json", json_text, "Full chart request as a JSON object");
    app.add_option("-e,--ephemeris-path", ephemeris_path, "Directory holding Swiss Ephemeris .se1 files");
    app.add_option("-c,--config", config_path, "YAML configuration file")->check(CLI::ExistingFile);
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical, off");
    app.add_flag("-p,--pretty", pretty, "Pretty-print JSON output");

    opt_json->excludes(opt_datetime)->excludes(opt_lat)->excludes(opt_lon);

    app.set_version_flag("--version", [] {
        return std::string("astrochart ") + ASTROCHART_VERSION
             + " (Swiss Ephemeris " + ephemeris::SwissEphemeris::library_version() + ")";
    });

    CLI11_PARSE(app, argc, argv);

    const bool have_flags = opt_datetime->count() > 0 && opt_lat->count() > 0 && opt_lon->count() > 0;
    if (opt_json->count() == 0 && !have_flags)
    {
        std::cerr << "ERROR: Must provide either --json or (--datetime, --lat, --lon)\n";
        return kExitUsage;
    }

    // -----------------------------------------------------------------------
    // 2. Configuration: defaults < YAML < EPHEMERIS_PATH < flags
    // -----------------------------------------------------------------------
    core::Config cfg;
    try
    {
        if (!config_path.empty())
        {
            cfg = core::Config::load(config_path);
        }
        cfg.apply_environment();
        if (!ephemeris_path.empty())
        {
            cfg.ephemeris.data_path = ephemeris_path;
        }
        if (!log_level.empty())
        {
            cfg.logging.level = log_level;
        }
        cfg.validate();
    }
    catch (const core::ConfigError& e)
    {
        std::cerr << "CONFIG ERROR: " << e.what() << "\n";
        return kExitUsage;
    }

    core::Logger::init(cfg.logging);
    ACH_DEBUG("astrochart {} starting, ephemeris path {}",
              ASTROCHART_VERSION, cfg.ephemeris.data_path.string());

    int exit_code = kExitOk;
    try
    {
        // -------------------------------------------------------------------
        // 3. Chart request
        // -------------------------------------------------------------------
        chart::ChartInput input;
        if (opt_json->count() > 0)
        {
            input = chart::ChartJson::input_from_string(json_text);
        }
        else
        {
            input.datetime_utc = datetime;
            input.latitude = latitude;
            input.longitude = longitude;
        }

        // -------------------------------------------------------------------
        // 4. Provider (opened once) + compute
        // -------------------------------------------------------------------
        const ephemeris::SwissEphemeris provider(cfg.ephemeris);
        const chart::ChartOrchestrator orchestrator(provider);
        const chart::ChartOutput result = orchestrator.compute(input);

        // -------------------------------------------------------------------
        // 5. Output
        // -------------------------------------------------------------------
        std::cout << chart::ChartJson::to_json(result).dump(pretty ? 2 : -1) << "\n";
    }
    catch (const nlohmann::json::parse_error& e)
    {
        ACH_ERROR("Invalid JSON input: {}", e.what());
        exit_code = kExitUsage;
    }
    catch (const core::InputError& e)
    {
        ACH_ERROR("Input rejected: {}", e.what());
        exit_code = kExitInput;
    }
    catch (const core::CalculationError& e)
    {
        ACH_ERROR("Calculation failed: {}", e.what());
        exit_code = kExitCalculation;
    }
    catch (const core::ValidationError& e)
    {
        ACH_CRITICAL("Output validation failed: {}", e.what());
        exit_code = kExitValidation;
    }
    catch (const std::exception& e)
    {
        ACH_CRITICAL("Unexpected error: {}", e.what());
        exit_code = kExitUnexpected;
    }

    core::Logger::shutdown();
    return exit_code;
}
