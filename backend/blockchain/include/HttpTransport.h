#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace EthereumService {

using QueryParameters = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Outcome of one HTTP exchange
 *
 * statusCode is 0 when the request never completed; error then says why.
 */
struct HttpResponse {
    long statusCode;
    std::string body;
    std::string error;

    HttpResponse() : statusCode(0) {}
    HttpResponse(long code, const std::string& text) : statusCode(code), body(text) {}

    bool ok() const { return statusCode == 200 && error.empty(); }
};

/**
 * @brief Platform-independent HTTP transport used by the explorer and RPC client
 *
 * The production implementation is backed by cpr; tests inject a transport
 * that replays canned responses.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief GET url with URL-encoded query parameters
     */
    virtual HttpResponse Get(const std::string& url, const QueryParameters& parameters) = 0;

    /**
     * @brief POST a JSON body (Content-Type: application/json)
     */
    virtual HttpResponse PostJson(const std::string& url, const std::string& body) = 0;
};

/**
 * @brief Create the cpr-backed transport
 * @param timeoutMs Per-request timeout in milliseconds
 */
std::shared_ptr<HttpTransport> CreateHttpTransport(long timeoutMs = 10000);

} // namespace EthereumService
