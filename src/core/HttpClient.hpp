#pragma once

#include "core/CancellationToken.hpp"
#include <map>
#include <string>

namespace mcp_orch {

/**
 * @brief Outbound HTTP request
 */
struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 60000;
};

/**
 * @brief Outcome of an HTTP exchange
 *
 * Transport failures are reported through the flags rather than thrown, so
 * callers decide which error class they map to.
 */
struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;
    bool timeout = false;
    bool cancelled = false;
    bool network_error = false;
    std::string network_error_message;

    bool ok() const {
        return !timeout && !cancelled && !network_error && status >= 200 && status < 300;
    }
};

/**
 * @brief Abstract HTTP client
 *
 * Implementations must honor the cancellation token by aborting the
 * transfer in progress.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /**
     * @brief Perform a request and block until it completes
     * @param request Request description
     * @param cancel Token checked during the transfer
     * @return Response with status, body and failure flags
     */
    virtual HttpResponse send(const HttpRequest& request, const CancellationToken& cancel) = 0;
};

} // namespace mcp_orch
