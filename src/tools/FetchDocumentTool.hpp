#pragma once

#include "core/CancellationToken.hpp"
#include "registry/ResourceReader.hpp"
#include "registry/ToolRegistry.hpp"
#include <memory>

namespace mcp_orch {

/**
 * @brief Tool that downloads a web document and returns it as text
 *
 * Reads through the ResourceReader, so JSON is pretty-printed and binary
 * bodies come back as a metadata stub.
 */
class FetchDocumentTool {
public:
    static constexpr std::size_t DEFAULT_MAX_LENGTH = 20000;

    /**
     * @param reader Reader with http/https fetchers registered
     * @param cancel Server-wide cancellation token
     */
    FetchDocumentTool(std::shared_ptr<const ResourceReader> reader, CancellationToken cancel);

    /**
     * @brief Get tool metadata and JSON schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args {url, max_length?}
     * @return {url, mimeType, content, truncated, length}
     * @throws ToolError on invalid URL or fetch failure
     */
    json execute(const json& args) const;

private:
    std::shared_ptr<const ResourceReader> reader_;
    CancellationToken cancel_;
};

} // namespace mcp_orch
