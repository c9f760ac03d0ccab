#pragma once

#include "ITransport.hpp"
#include "core/CancellationToken.hpp"
#include "mcp/RequestRouter.hpp"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_orch {

/**
 * @brief Host loop pumping payloads from a transport through the router
 *
 * Each payload is handled as its own task; up to `workers` tasks run at
 * once and their responses are written in completion order. Every payload
 * gets exactly one response line.
 */
class MCPServer {
public:
    /**
     * @brief Construct server
     * @param transport Unique pointer to transport implementation
     * @param router Request entry point
     * @param workers Maximum concurrently handled payloads (>= 1)
     * @param headers Headers attached to every request context
     * @param cancel Token handed to every request and fired by stop()
     */
    MCPServer(std::unique_ptr<ITransport> transport,
              std::shared_ptr<const RequestRouter> router,
              int workers = 1,
              std::map<std::string, std::string> headers = {},
              CancellationToken cancel = CancellationToken());

    ~MCPServer();

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or the transport reaches EOF, then
     * waits for in-flight tasks before returning.
     */
    void run();

    /**
     * @brief Signal server to stop and cancel in-flight requests
     */
    void stop();

    /**
     * @brief Token shared by every request context
     */
    const CancellationToken& cancellation() const { return cancel_; }

private:
    void handle_payload(const std::string& payload);
    void write_response(const json& response);
    void reap_finished(bool wait_all);

    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<const RequestRouter> router_;
    std::size_t workers_;
    std::map<std::string, std::string> headers_;
    CancellationToken cancel_;
    std::atomic<bool> running_{false};
    std::mutex write_mutex_;
    std::vector<std::future<void>> in_flight_;
};

} // namespace mcp_orch
