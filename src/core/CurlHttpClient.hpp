#pragma once

#include "core/HttpClient.hpp"
#include <string>

namespace mcp_orch {

/**
 * @brief IHttpClient backed by libcurl easy handles
 *
 * One easy handle per request; the object itself holds no per-request
 * state and may be shared between threads.
 */
class CurlHttpClient : public IHttpClient {
public:
    /**
     * @brief Construct client
     * @param user_agent Value sent in the User-Agent header
     */
    explicit CurlHttpClient(std::string user_agent = "mcp-orchestrator/1.0");

    HttpResponse send(const HttpRequest& request, const CancellationToken& cancel) override;

private:
    std::string user_agent_;
};

} // namespace mcp_orch
