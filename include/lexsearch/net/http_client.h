#pragma once

#include <lexsearch/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lexsearch::net {

struct Header {
    std::string name;
    std::string value;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Minimal HTTP transport used by the service adapters
 *
 * Only transport failures are errors; any HTTP status is returned as a
 * response. Implementations must be safe to call from several threads.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> postJson(std::string_view url, const std::string& body,
                                          const std::vector<Header>& headers,
                                          std::chrono::milliseconds timeout) = 0;
};

// libcurl-backed client. Initializes libcurl globally on first use.
std::shared_ptr<IHttpClient> makeCurlHttpClient();

/**
 * @brief Check the status of a JSON API response and parse its body
 *
 * 404 maps to NotFound, other 4xx statuses to InvalidArgument, 5xx to
 * NetworkError, and an unparsable body to InvalidData.
 */
Result<nlohmann::json> parseJsonResponse(const HttpResponse& response, std::string_view what);

// Join a base URL and a path with exactly one slash between them.
std::string joinUrl(std::string_view base, std::string_view path);

} // namespace lexsearch::net
