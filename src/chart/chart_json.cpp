/// @file chart_json.cpp
/// @brief Implementation of chart JSON mapping.

#include "chart/chart_json.hpp"

#include "core/errors.hpp"

#include <string>

namespace astrochart::chart
{

namespace
{

const nlohmann::json& require(const nlohmann::json& j, const char* field)
{
    const auto it = j.find(field);
    if (it == j.end() || it->is_null())
    {
        throw core::InputError(field, "field is required");
    }
    return *it;
}

std::string require_string(const nlohmann::json& j, const char* field)
{
    const nlohmann::json& value = require(j, field);
    if (!value.is_string())
    {
        throw core::InputError(field, "must be a string");
    }
    return value.get<std::string>();
}

f64 require_number(const nlohmann::json& j, const char* field)
{
    const nlohmann::json& value = require(j, field);
    if (!value.is_number())
    {
        throw core::InputError(field, "must be a number");
    }
    return value.get<f64>();
}

} // namespace

nlohmann::ordered_json ChartJson::to_json(const ChartOutput& chart)
{
    nlohmann::ordered_json planets = nlohmann::ordered_json::object();
    for (const astro::Body body : astro::kTrackedBodies)
    {
        const astro::BodyPosition& pos = chart.body(body);
        planets[std::string(astro::body_name(body))] = {
            {"longitude", pos.longitude},
            {"sign", std::string(astro::sign_name(pos.sign))},
            {"degree", pos.degree},
            {"retrograde", pos.retrograde},
        };
    }

    nlohmann::ordered_json angles = nlohmann::ordered_json::object();
    for (const astro::Angle angle : astro::kChartAngles)
    {
        const astro::AnglePosition& pos = chart.angle(angle);
        angles[std::string(astro::angle_name(angle))] = {
            {"longitude", pos.longitude},
            {"sign", std::string(astro::sign_name(pos.sign))},
            {"degree", pos.degree},
        };
    }

    nlohmann::ordered_json houses = nlohmann::ordered_json::object();
    for (i32 house = 1; house <= astro::kHouseCount; ++house)
    {
        houses[std::to_string(house)] = std::string(astro::sign_name(chart.houses.sign_of(house)));
    }

    const ChartMetadata& meta = chart.metadata;
    nlohmann::ordered_json metadata = {
        {"ephemeris", meta.ephemeris},
        {"calculation_method", meta.calculation_method},
        {"julian_day", meta.julian_day},
        {"precision", meta.precision},
        {"ephemeris_mode", std::string(ephemeris::precision_mode_name(meta.precision_mode))},
    };

    nlohmann::ordered_json out;
    out["planets"]  = std::move(planets);
    out["angles"]   = std::move(angles);
    out["houses"]   = std::move(houses);
    out["metadata"] = std::move(metadata);
    return out;
}

ChartInput ChartJson::input_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
    {
        throw core::InputError("input", "chart request must be a JSON object");
    }

    ChartInput input;
    input.datetime_utc = require_string(j, "datetime_utc");
    input.latitude     = require_number(j, "latitude");
    input.longitude    = require_number(j, "longitude");

    if (const auto it = j.find("house_system"); it != j.end() && !it->is_null())
    {
        input.house_system = require_string(j, "house_system");
    }
    if (const auto it = j.find("zodiac"); it != j.end() && !it->is_null())
    {
        input.zodiac = require_string(j, "zodiac");
    }
    if (const auto it = j.find("ayanamsa"); it != j.end() && !it->is_null())
    {
        // Any non-null value is carried through so InputValidator can reject it
        input.ayanamsa = it->is_string() ? it->get<std::string>() : it->dump();
    }

    return input;
}

ChartInput ChartJson::input_from_string(std::string_view text)
{
    return input_from_json(nlohmann::json::parse(text));
}

} // namespace astrochart::chart
