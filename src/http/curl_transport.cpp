#include "shipyard/http.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace shipyard {

namespace {

size_t curl_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::vector<uint8_t>*>(userdata);
    size_t total = size * nmemb;
    buffer->insert(buffer->end(), ptr, ptr + total);
    return total;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

// RAII wrapper for a curl header list
class CurlHeaders {
public:
    CurlHeaders() = default;
    ~CurlHeaders() { if (list_) curl_slist_free_all(list_); }

    CurlHeaders(const CurlHeaders&) = delete;
    CurlHeaders& operator=(const CurlHeaders&) = delete;

    void append(const std::string& header) {
        list_ = curl_slist_append(list_, header.c_str());
    }

    curl_slist* get() { return list_; }

private:
    curl_slist* list_ = nullptr;
};

class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

} // namespace

CurlTransport::CurlTransport(CurlTransportOptions options)
    : options_(std::move(options)) {
    get_curl_init();
}

HttpResponse CurlTransport::perform(const HttpRequest& request) {
    HttpResponse response;

    CurlHandle curl;
    if (!curl) {
        response.error = "failed to initialize CURL";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    if (request.method == "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty() || request.method != "DELETE") {
            static const char empty_body[] = "";
            const char* data = request.body.empty()
                ? empty_body
                : reinterpret_cast<const char*>(request.body.data());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, data);
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }
    }

    CurlHeaders headers;
    for (const auto& [name, value] : request.headers) {
        headers.append(name + ": " + value);
    }
    // Suppress libcurl's automatic "Expect: 100-continue" on large bodies
    headers.append("Expect:");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    if (!options_.ca_bundle_path.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, options_.ca_bundle_path.c_str());
    }

    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, request.timeout_seconds);
    }
    if (request.stall_timeout_seconds > 0) {
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, request.stall_timeout_seconds);
    }
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());

    spdlog::debug("{} {}", request.method, request.url);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        response.error = std::string("HTTP request failed: ") +
                         (error_buffer[0] ? error_buffer : curl_easy_strerror(res));
        return response;
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    char* content_type = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type) {
        response.content_type = content_type;
    }

    spdlog::debug("{} {} -> {}", request.method, request.url, response.status);
    response.ok = true;
    return response;
}

std::string url_encode(const std::string& value) {
    static const char hex_chars[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('%');
            result.push_back(hex_chars[(c >> 4) & 0x0F]);
            result.push_back(hex_chars[c & 0x0F]);
        }
    }
    return result;
}

} // namespace shipyard
