#include "core/CurlHttpClient.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

namespace mcp_orch {

namespace {

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }
};

void ensure_curl_initialized() {
    static CurlGlobal global;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* cancel = static_cast<const CancellationToken*>(clientp);
    return cancel->is_cancelled() ? 1 : 0;
}

struct EasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {
    ensure_curl_initialized();
}

HttpResponse CurlHttpClient::send(const HttpRequest& request, const CancellationToken& cancel) {
    HttpResponse response;

    if (cancel.is_cancelled()) {
        response.cancelled = true;
        return response;
    }

    std::unique_ptr<CURL, EasyDeleter> handle(curl_easy_init());
    if (!handle) {
        response.network_error = true;
        response.network_error_message = "curl_easy_init failed";
        return response;
    }

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, static_cast<void*>(const_cast<CancellationToken*>(&cancel)));
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    curl_slist* raw_headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        const std::string line = name + ": " + value;
        raw_headers = curl_slist_append(raw_headers, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_headers);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
    }

    spdlog::debug("HTTP {} {}", request.method, request.url);

    const CURLcode code = curl_easy_perform(curl);

    if (code == CURLE_ABORTED_BY_CALLBACK) {
        spdlog::info("HTTP {} {} cancelled", request.method, request.url);
        response.cancelled = true;
        return response;
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        spdlog::warn("HTTP {} {} timed out after {} ms", request.method, request.url, request.timeout_ms);
        response.timeout = true;
        return response;
    }
    if (code != CURLE_OK) {
        spdlog::warn("HTTP {} {} failed: {}", request.method, request.url, curl_easy_strerror(code));
        response.network_error = true;
        response.network_error_message = curl_easy_strerror(code);
        return response;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }

    spdlog::debug("HTTP {} {} -> {} ({} bytes)", request.method, request.url,
                  response.status, response.body.size());
    return response;
}

} // namespace mcp_orch
