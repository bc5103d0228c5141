#include "curl_transport.H"
#include "gateway_error.H"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <curl/curl.h>

namespace predex::gateway {

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t header_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(ptr, size * nmemb);

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::string value = line.substr(colon + 1);
        auto first = value.find_first_not_of(" \t");
        auto last = value.find_last_not_of(" \t\r\n");
        value = (first == std::string::npos) ? "" : value.substr(first, last - first + 1);
        (*headers)[name] = value;
    }
    return size * nmemb;
}

CurlTransport::CurlTransport(std::shared_ptr<spdlog::logger> logger) : logger(logger) {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// curl_global_cleanup is left to process exit, other handles may still be alive
CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::perform(const HttpRequest& request, std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw GatewayError(GATEWAY_ERROR::NETWORK_ERROR, "curl_easy_init failed");
    }

    curl_slist* header_list = nullptr;
    for (const auto& [name, value] : request.headers) {
        std::string line = name + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(header_list, curl_slist_free_all);

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw GatewayError(GATEWAY_ERROR::TIMEOUT,
                           request.method + " " + request.url + " timed out after " +
                           std::to_string(timeout.count()) + "ms");
    }
    if (res != CURLE_OK) {
        throw GatewayError(GATEWAY_ERROR::NETWORK_ERROR,
                           request.method + " " + request.url + " failed: " + curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    logger->debug("{} {} -> {} ({} bytes)", request.method, request.url, response.status, response.body.size());
    return response;
}

} // namespace predex::gateway
