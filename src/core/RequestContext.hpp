#pragma once

#include "core/CancellationToken.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>

namespace mcp_orch {

/**
 * @brief Per-request metadata supplied by the hosting transport
 */
struct RequestContext {
    std::map<std::string, std::string> headers;
    CancellationToken cancel;

    /**
     * @brief Case-insensitive header lookup
     */
    std::optional<std::string> header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (key.size() == name.size() &&
                std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                })) {
                return value;
            }
        }
        return std::nullopt;
    }
};

} // namespace mcp_orch
