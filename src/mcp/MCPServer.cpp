#include "MCPServer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace mcp_orch {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport,
                     std::shared_ptr<const RequestRouter> router,
                     int workers,
                     std::map<std::string, std::string> headers,
                     CancellationToken cancel)
    : transport_(std::move(transport)),
      router_(std::move(router)),
      workers_(static_cast<std::size_t>(workers < 1 ? 1 : workers)),
      headers_(std::move(headers)),
      cancel_(std::move(cancel)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (!router_) {
        throw std::invalid_argument("Router cannot be null");
    }
    if (workers < 1) {
        throw std::invalid_argument("Worker count must be at least 1");
    }
    spdlog::info("MCPServer initialized with {} worker(s)", workers_);
}

MCPServer::~MCPServer() {
    cancel_.cancel();
    reap_finished(true);
}

void MCPServer::run() {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport_->is_open()) {
        std::optional<std::string> payload = transport_->read_message();
        if (!payload) {
            spdlog::info("Transport closed, stopping server");
            break;
        }
        if (is_blank(*payload)) {
            continue;
        }

        if (workers_ == 1) {
            handle_payload(*payload);
            continue;
        }

        reap_finished(false);
        while (in_flight_.size() >= workers_) {
            in_flight_.front().wait();
            reap_finished(false);
        }
        in_flight_.push_back(std::async(std::launch::async,
                                        [this, text = std::move(*payload)]() { handle_payload(text); }));
    }

    reap_finished(true);
    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
    cancel_.cancel();
}

void MCPServer::handle_payload(const std::string& payload) {
    RequestContext context;
    context.headers = headers_;
    context.cancel = cancel_;

    json response;
    try {
        response = router_->route(payload, context);
    } catch (const std::exception& e) {
        spdlog::error("Error in request task: {}", e.what());
        response = AgentRequestHandler::make_error(std::string("Internal error: ") + e.what(),
                                                   "InternalError", "INTERNAL_ERROR");
    }
    write_response(response);
}

void MCPServer::write_response(const json& response) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    try {
        transport_->write_message(response);
    } catch (const std::exception& e) {
        spdlog::error("Failed to send response: {}", e.what());
    }
}

void MCPServer::reap_finished(bool wait_all) {
    auto done = [wait_all](std::future<void>& task) {
        if (wait_all) {
            task.wait();
            return true;
        }
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    };
    in_flight_.erase(std::remove_if(in_flight_.begin(), in_flight_.end(), done), in_flight_.end());
}

} // namespace mcp_orch
