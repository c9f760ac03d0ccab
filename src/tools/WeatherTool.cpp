#include "WeatherTool.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdio>
#include <map>
#include <stdexcept>

namespace mcp_orch {

WeatherTool::WeatherTool(std::shared_ptr<IHttpClient> http,
                         std::string geocoding_url,
                         std::string forecast_url,
                         long timeout_ms,
                         CancellationToken cancel)
    : http_(std::move(http)),
      geocoding_url_(std::move(geocoding_url)),
      forecast_url_(std::move(forecast_url)),
      timeout_ms_(timeout_ms),
      cancel_(std::move(cancel)) {
    if (!http_) {
        throw std::invalid_argument("HTTP client cannot be null");
    }
}

ToolInfo WeatherTool::get_info() {
    return {
        "get_weather",
        "Get the current weather conditions for a city or place name",
        {
            {"type", "object"},
            {"properties", {
                {"location", {
                    {"type", "string"},
                    {"description", "City or place name, e.g. \"Paris\""}
                }},
                {"units", {
                    {"type", "string"},
                    {"enum", json::array({"metric", "imperial"})},
                    {"default", "metric"},
                    {"description", "Unit system for temperature and wind speed"}
                }}
            }},
            {"required", json::array({"location"})}
        }
    };
}

std::string WeatherTool::url_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", c);
            encoded.append(buffer);
        }
    }
    return encoded;
}

std::string WeatherTool::describe_weather_code(int code) {
    static const std::map<int, std::string> descriptions = {
        {0, "Clear sky"},
        {1, "Mainly clear"}, {2, "Partly cloudy"}, {3, "Overcast"},
        {45, "Fog"}, {48, "Depositing rime fog"},
        {51, "Light drizzle"}, {53, "Moderate drizzle"}, {55, "Dense drizzle"},
        {56, "Light freezing drizzle"}, {57, "Dense freezing drizzle"},
        {61, "Slight rain"}, {63, "Moderate rain"}, {65, "Heavy rain"},
        {66, "Light freezing rain"}, {67, "Heavy freezing rain"},
        {71, "Slight snow fall"}, {73, "Moderate snow fall"}, {75, "Heavy snow fall"},
        {77, "Snow grains"},
        {80, "Slight rain showers"}, {81, "Moderate rain showers"}, {82, "Violent rain showers"},
        {85, "Slight snow showers"}, {86, "Heavy snow showers"},
        {95, "Thunderstorm"}, {96, "Thunderstorm with slight hail"}, {99, "Thunderstorm with heavy hail"}
    };

    auto it = descriptions.find(code);
    return it == descriptions.end() ? "Unknown" : it->second;
}

json WeatherTool::get_json(const std::string& url) const {
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.headers["Accept"] = "application/json";
    request.timeout_ms = timeout_ms_;

    HttpResponse response = http_->send(request, cancel_);
    if (response.cancelled) {
        throw CancelledError("Weather request cancelled");
    }
    if (response.timeout) {
        throw ToolError(ToolErrorKind::TIMEOUT, "Weather service timed out", {{"url", url}});
    }
    if (response.network_error) {
        throw ToolError(ToolErrorKind::NETWORK, "Weather service unreachable: " + response.network_error_message,
                        {{"url", url}});
    }
    if (!response.ok()) {
        throw ToolError(ToolErrorKind::NETWORK,
                        "Weather service returned HTTP " + std::to_string(response.status),
                        {{"url", url}, {"status", response.status}});
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ToolError(ToolErrorKind::PARSE, std::string("Malformed weather service response: ") + e.what(),
                        {{"url", url}});
    }
}

json WeatherTool::execute(const json& args) const {
    const std::string location = args.at("location").get<std::string>();
    if (location.empty()) {
        throw ToolError(ToolErrorKind::VALIDATION, "location must not be empty");
    }
    const std::string units = args.value("units", "metric");
    if (units != "metric" && units != "imperial") {
        throw ToolError(ToolErrorKind::VALIDATION, "units must be 'metric' or 'imperial'", {{"units", units}});
    }

    spdlog::debug("WeatherTool: looking up {}", location);

    json places = get_json(geocoding_url_ + "?name=" + url_encode(location) + "&count=1&language=en&format=json");
    if (!places.is_object() || !places.contains("results") || !places["results"].is_array() ||
        places["results"].empty()) {
        throw ToolError(ToolErrorKind::VALIDATION, "Location not found: " + location, {{"location", location}});
    }

    const json& place = places["results"][0];
    if (!place.contains("latitude") || !place["latitude"].is_number() ||
        !place.contains("longitude") || !place["longitude"].is_number()) {
        throw ToolError(ToolErrorKind::PARSE, "Geocoding result has no coordinates", {{"location", location}});
    }
    const double latitude = place["latitude"].get<double>();
    const double longitude = place["longitude"].get<double>();

    std::string url = forecast_url_ + "?latitude=" + std::to_string(latitude) +
                      "&longitude=" + std::to_string(longitude) +
                      "&current=temperature_2m,relative_humidity_2m,apparent_temperature,weather_code,wind_speed_10m";
    if (units == "imperial") {
        url += "&temperature_unit=fahrenheit&wind_speed_unit=mph";
    }

    json forecast = get_json(url);
    if (!forecast.is_object() || !forecast.contains("current") || !forecast["current"].is_object()) {
        throw ToolError(ToolErrorKind::PARSE, "Forecast response has no current conditions", {{"location", location}});
    }

    const json& current = forecast["current"];
    const int code = current.value("weather_code", -1);

    return {
        {"location", {
            {"name", place.value("name", location)},
            {"country", place.value("country", "")},
            {"latitude", latitude},
            {"longitude", longitude}
        }},
        {"units", units},
        {"current", {
            {"time", current.value("time", "")},
            {"temperature", current.value("temperature_2m", 0.0)},
            {"apparentTemperature", current.value("apparent_temperature", 0.0)},
            {"humidity", current.value("relative_humidity_2m", 0.0)},
            {"windSpeed", current.value("wind_speed_10m", 0.0)},
            {"weatherCode", code},
            {"conditions", describe_weather_code(code)},
            {"temperatureUnit", units == "imperial" ? "°F" : "°C"},
            {"windSpeedUnit", units == "imperial" ? "mph" : "km/h"}
        }}
    };
}

} // namespace mcp_orch
