#pragma once

#include "core/CancellationToken.hpp"
#include "core/HttpClient.hpp"
#include "registry/ToolRegistry.hpp"
#include <memory>
#include <string>

namespace mcp_orch {

/**
 * @brief Current weather for a place name
 *
 * Resolves the name with an Open-Meteo compatible geocoding endpoint, then
 * queries the forecast endpoint for current conditions.
 */
class WeatherTool {
public:
    WeatherTool(std::shared_ptr<IHttpClient> http,
                std::string geocoding_url,
                std::string forecast_url,
                long timeout_ms,
                CancellationToken cancel);

    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args {location, units?} where units is "metric" or "imperial"
     * @return {location:{...}, units, current:{...}}
     * @throws ToolError (VALIDATION for unknown places, NETWORK, TIMEOUT, PARSE)
     */
    json execute(const json& args) const;

    /**
     * @brief Human readable text for a WMO weather code
     */
    static std::string describe_weather_code(int code);

    /**
     * @brief Percent-encode a query parameter value
     */
    static std::string url_encode(const std::string& value);

private:
    json get_json(const std::string& url) const;

    std::shared_ptr<IHttpClient> http_;
    std::string geocoding_url_;
    std::string forecast_url_;
    long timeout_ms_;
    CancellationToken cancel_;
};

} // namespace mcp_orch
