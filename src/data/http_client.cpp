// src/data/http_client.cpp
#include "trade_pilot/data/http_client.hpp"
#include <curl/curl.h>
#include <chrono>
#include <mutex>

namespace trade_pilot {

namespace {

std::once_flag curl_init_flag;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return (token != nullptr && token->is_cancelled()) ? 1 : 0;
}

}  // namespace

HttpClient::HttpClient() {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> HttpClient::perform(const HttpRequest& request,
                                         const CancellationToken* cancel) const {
    if (request.url.empty()) {
        return make_error<HttpResponse>(ErrorCode::INVALID_ARGUMENT, "Request URL is empty",
                                        "HttpClient");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize curl",
                                        "HttpClient");
    }

    HttpResponse response;
    struct curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    if (cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl);
    response.latency_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count();

    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    switch (res) {
        case CURLE_OK:
            return Result<HttpResponse>(std::move(response));
        case CURLE_OPERATION_TIMEDOUT:
            return make_error<HttpResponse>(ErrorCode::TIMEOUT_ERROR,
                                            "Request timed out: " + request.url, "HttpClient");
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error<HttpResponse>(ErrorCode::CANCELLED,
                                            "Request cancelled: " + request.url, "HttpClient");
        default:
            return make_error<HttpResponse>(
                ErrorCode::CONNECTION_ERROR,
                "Request failed: " + std::string(curl_easy_strerror(res)), "HttpClient");
    }
}

}  // namespace trade_pilot
