#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Abstract interface for message transports
 *
 * Implementations frame inbound payloads (one per line for stdio) and write
 * serialized responses. Payloads are handed over unparsed so malformed JSON
 * can still be answered with a structured error.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next raw payload
     * @return Payload text, or std::nullopt on EOF/error
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write a response message
     * @param message JSON message to write
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace mcp_orch
