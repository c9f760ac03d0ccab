#pragma once

#include "core/CancellationToken.hpp"
#include "core/HttpClient.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcp_orch {

using json = nlohmann::json;

/**
 * @brief Resource advertised through resources/list
 *
 * A URI containing `{param}` placeholders is a template and is listed via
 * resources/templates/list instead.
 */
struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;

    bool is_template() const;
    json to_json() const;
};

/**
 * @brief Normalized content returned by resources/read
 */
struct ResourceContent {
    std::string uri;
    std::string mime_type;
    std::string text;

    json to_json() const;
};

/**
 * @brief Fetches content for one URI scheme
 */
class IResourceFetcher {
public:
    virtual ~IResourceFetcher() = default;

    /**
     * @brief Fetch and normalize the resource
     * @throws ResourceReadError on failure
     */
    virtual ResourceContent fetch(const std::string& uri, const CancellationToken& cancel) = 0;
};

/**
 * @brief HTTP(S) GET fetcher with content-type sniffing
 */
class HttpResourceFetcher : public IResourceFetcher {
public:
    HttpResourceFetcher(std::shared_ptr<IHttpClient> http, long timeout_ms = 30000);

    ResourceContent fetch(const std::string& uri, const CancellationToken& cancel) override;

    /**
     * @brief Turn a raw body into text
     *
     * JSON bodies are re-serialized with indentation, text bodies pass
     * through, anything else becomes a metadata stub.
     *
     * @param uri Source URI
     * @param content_type Content-Type header value (may be empty)
     * @param body Raw body bytes
     */
    static ResourceContent normalize(const std::string& uri,
                                     const std::string& content_type,
                                     const std::string& body);

private:
    std::shared_ptr<IHttpClient> http_;
    long timeout_ms_;
};

/**
 * @brief Resource catalog plus scheme-dispatched reader
 */
class ResourceReader {
public:
    explicit ResourceReader(std::vector<ResourceDescriptor> descriptors = {});

    /**
     * @brief Attach a fetcher to a URI scheme (e.g. "https")
     * @throws std::invalid_argument on empty scheme or null fetcher
     */
    void register_scheme(const std::string& scheme, std::shared_ptr<IResourceFetcher> fetcher);

    /**
     * @brief Concrete (non-template) descriptors
     */
    std::vector<ResourceDescriptor> list() const;

    /**
     * @brief Templated descriptors
     */
    std::vector<ResourceDescriptor> list_templates() const;

    /**
     * @brief Read a URI through the fetcher registered for its scheme
     * @throws ResourceReadError when no fetcher handles the scheme or the fetch fails
     */
    ResourceContent read(const std::string& uri, const CancellationToken& cancel) const;

    /**
     * @brief Lower-cased scheme of a URI, empty if none
     */
    static std::string scheme_of(const std::string& uri);

private:
    std::vector<ResourceDescriptor> descriptors_;
    std::map<std::string, std::shared_ptr<IResourceFetcher>> fetchers_;
};

} // namespace mcp_orch
