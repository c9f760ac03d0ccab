#include "registry/ResourceReader.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcp_orch {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// "application/json; charset=utf-8" -> "application/json"
std::string media_type(const std::string& content_type) {
    std::string result = content_type.substr(0, content_type.find(';'));
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
        result.pop_back();
    }
    while (!result.empty() && std::isspace(static_cast<unsigned char>(result.front()))) {
        result.erase(result.begin());
    }
    return to_lower(result);
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_json_type(const std::string& type) {
    return type == "application/json" || ends_with(type, "+json") || ends_with(type, "/json");
}

bool is_text_type(const std::string& type) {
    return type.rfind("text/", 0) == 0 ||
           type == "application/xml" ||
           type == "application/javascript" ||
           type == "application/x-yaml" ||
           type == "application/yaml" ||
           type == "application/x-www-form-urlencoded" ||
           ends_with(type, "+xml");
}

bool looks_binary(const std::string& body) {
    return body.find('\0') != std::string::npos;
}

ResourceContent binary_stub(const std::string& uri, const std::string& type, const std::string& body) {
    const std::string mime = type.empty() ? "application/octet-stream" : type;
    json stub = {
        {"binary", true},
        {"size", body.size()},
        {"mimeType", mime}
    };
    return {uri, mime, stub.dump()};
}

} // namespace

bool ResourceDescriptor::is_template() const {
    const auto open = uri.find('{');
    return open != std::string::npos && uri.find('}', open) != std::string::npos;
}

json ResourceDescriptor::to_json() const {
    json result = {
        {is_template() ? "uriTemplate" : "uri", uri},
        {"name", name}
    };
    if (!description.empty()) {
        result["description"] = description;
    }
    if (!mime_type.empty()) {
        result["mimeType"] = mime_type;
    }
    return result;
}

json ResourceContent::to_json() const {
    return {
        {"uri", uri},
        {"mimeType", mime_type},
        {"text", text}
    };
}

// ============================================================================
// HttpResourceFetcher
// ============================================================================

HttpResourceFetcher::HttpResourceFetcher(std::shared_ptr<IHttpClient> http, long timeout_ms)
    : http_(std::move(http)), timeout_ms_(timeout_ms) {
    if (!http_) {
        throw std::invalid_argument("HTTP client cannot be null");
    }
}

ResourceContent HttpResourceFetcher::fetch(const std::string& uri, const CancellationToken& cancel) {
    HttpRequest request;
    request.method = "GET";
    request.url = uri;
    request.timeout_ms = timeout_ms_;
    request.headers["Accept"] = "application/json, text/*;q=0.9, */*;q=0.5";

    HttpResponse response = http_->send(request, cancel);

    if (response.cancelled) {
        throw CancelledError("Resource read cancelled: " + uri);
    }
    if (response.timeout) {
        throw ResourceReadError(uri, "Timed out reading resource: " + uri);
    }
    if (response.network_error) {
        throw ResourceReadError(uri, "Network error reading " + uri + ": " + response.network_error_message);
    }
    if (response.status < 200 || response.status >= 300) {
        throw ResourceReadError(uri, "Resource request failed with status " +
                                std::to_string(response.status), response.status);
    }

    return normalize(uri, response.content_type, response.body);
}

ResourceContent HttpResourceFetcher::normalize(const std::string& uri,
                                               const std::string& content_type,
                                               const std::string& body) {
    const std::string type = media_type(content_type);

    if (is_json_type(type)) {
        try {
            return {uri, "application/json", json::parse(body).dump(2)};
        } catch (const json::parse_error& e) {
            spdlog::warn("Resource {} declared JSON but failed to parse: {}", uri, e.what());
            return {uri, type, body};
        }
    }

    if (is_text_type(type)) {
        return {uri, type, body};
    }

    if (type.empty()) {
        if (looks_binary(body)) {
            return binary_stub(uri, type, body);
        }
        try {
            json parsed = json::parse(body);
            if (parsed.is_object() || parsed.is_array()) {
                return {uri, "application/json", parsed.dump(2)};
            }
        } catch (const json::parse_error&) {
            // Not JSON; fall through to plain text
        }
        return {uri, "text/plain", body};
    }

    return binary_stub(uri, type, body);
}

// ============================================================================
// ResourceReader
// ============================================================================

ResourceReader::ResourceReader(std::vector<ResourceDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {}

void ResourceReader::register_scheme(const std::string& scheme, std::shared_ptr<IResourceFetcher> fetcher) {
    if (scheme.empty()) {
        throw std::invalid_argument("Scheme cannot be empty");
    }
    if (!fetcher) {
        throw std::invalid_argument("Resource fetcher cannot be null");
    }
    fetchers_[to_lower(scheme)] = std::move(fetcher);
    spdlog::debug("Registered resource fetcher for scheme: {}", scheme);
}

std::vector<ResourceDescriptor> ResourceReader::list() const {
    std::vector<ResourceDescriptor> result;
    for (const auto& descriptor : descriptors_) {
        if (!descriptor.is_template()) {
            result.push_back(descriptor);
        }
    }
    return result;
}

std::vector<ResourceDescriptor> ResourceReader::list_templates() const {
    std::vector<ResourceDescriptor> result;
    for (const auto& descriptor : descriptors_) {
        if (descriptor.is_template()) {
            result.push_back(descriptor);
        }
    }
    return result;
}

std::string ResourceReader::scheme_of(const std::string& uri) {
    const auto colon = uri.find(':');
    if (colon == std::string::npos || colon == 0) {
        return "";
    }
    const std::string scheme = uri.substr(0, colon);
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return "";
        }
    }
    return to_lower(scheme);
}

ResourceContent ResourceReader::read(const std::string& uri, const CancellationToken& cancel) const {
    const std::string scheme = scheme_of(uri);
    auto it = fetchers_.find(scheme);
    if (scheme.empty() || it == fetchers_.end()) {
        throw ResourceReadError(uri, "Unsupported resource URI scheme: " +
                                (scheme.empty() ? std::string("<none>") : scheme));
    }

    spdlog::debug("Reading resource: {}", uri);
    ResourceContent content = it->second->fetch(uri, cancel);

    // Prefer the advertised MIME type when the fetcher could not tell
    if (content.mime_type.empty()) {
        for (const auto& descriptor : descriptors_) {
            if (descriptor.uri == uri && !descriptor.mime_type.empty()) {
                content.mime_type = descriptor.mime_type;
                break;
            }
        }
    }
    return content;
}

} // namespace mcp_orch
