// include/trade_pilot/data/http_client.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "trade_pilot/core/cancellation.hpp"
#include "trade_pilot/core/error.hpp"

namespace trade_pilot {

struct HttpRequest {
    std::string url;
    std::string method{"GET"};  // GET or POST
    std::string body;
    std::vector<std::string> headers;
    int timeout_ms{4000};
};

struct HttpResponse {
    long status{0};
    std::string body;
    int64_t latency_ms{0};
};

/**
 * @brief Minimal blocking HTTP client on top of libcurl
 *
 * Each call uses its own easy handle, so one instance may be shared across
 * threads. A cancelled token aborts the transfer at the next progress callback.
 */
class HttpClient {
public:
    HttpClient();
    virtual ~HttpClient() = default;

    /**
     * @brief Perform a request
     * @param request Request description
     * @param cancel Optional token checked during the transfer
     * @return Response for any HTTP status, or CONNECTION_ERROR / TIMEOUT_ERROR / CANCELLED
     */
    virtual Result<HttpResponse> perform(const HttpRequest& request,
                                         const CancellationToken* cancel = nullptr) const;
};

}  // namespace trade_pilot
