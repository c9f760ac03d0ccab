#include "FetchDocumentTool.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcp_orch {

namespace {

// Cut point at or before max_length that does not split a UTF-8 sequence
std::size_t utf8_cut(const std::string& text, std::size_t max_length) {
    std::size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

} // namespace

FetchDocumentTool::FetchDocumentTool(std::shared_ptr<const ResourceReader> reader, CancellationToken cancel)
    : reader_(std::move(reader)), cancel_(std::move(cancel)) {
    if (!reader_) {
        throw std::invalid_argument("Resource reader cannot be null");
    }
}

ToolInfo FetchDocumentTool::get_info() {
    return {
        "fetch_document",
        "Download a web page or document over HTTP(S) and return its text content",
        {
            {"type", "object"},
            {"properties", {
                {"url", {
                    {"type", "string"},
                    {"description", "Absolute http:// or https:// URL"}
                }},
                {"max_length", {
                    {"type", "integer"},
                    {"default", DEFAULT_MAX_LENGTH},
                    {"description", "Maximum number of characters of content to return"}
                }}
            }},
            {"required", json::array({"url"})}
        }
    };
}

json FetchDocumentTool::execute(const json& args) const {
    const std::string url = args.at("url").get<std::string>();
    const std::string scheme = ResourceReader::scheme_of(url);
    if (scheme != "http" && scheme != "https") {
        throw ToolError(ToolErrorKind::VALIDATION, "url must use http or https: " + url, {{"url", url}});
    }

    std::size_t max_length = DEFAULT_MAX_LENGTH;
    if (args.contains("max_length")) {
        const long long requested = args["max_length"].get<long long>();
        if (requested < 1) {
            throw ToolError(ToolErrorKind::VALIDATION, "max_length must be positive");
        }
        max_length = static_cast<std::size_t>(requested);
    }

    spdlog::debug("FetchDocumentTool: fetching {}", url);

    ResourceContent content;
    try {
        content = reader_->read(url, cancel_);
    } catch (const ResourceReadError& e) {
        throw ToolError(ToolErrorKind::NETWORK, e.what(), {{"url", e.uri()}, {"status", e.status()}});
    }

    const std::size_t length = content.text.size();
    bool truncated = false;
    if (length > max_length) {
        content.text.resize(utf8_cut(content.text, max_length));
        truncated = true;
    }

    return {
        {"url", url},
        {"mimeType", content.mime_type},
        {"content", content.text},
        {"truncated", truncated},
        {"length", length}
    };
}

} // namespace mcp_orch
