#include "include/HttpTransport.h"
#include "Callout/Logger.h"

#include <cpr/cpr.h>

namespace EthereumService {

namespace {

class CprHttpTransport : public HttpTransport {
public:
    explicit CprHttpTransport(long timeoutMs) : m_timeoutMs(timeoutMs) {}

    HttpResponse Get(const std::string& url, const QueryParameters& parameters) override {
        cpr::Parameters query;
        for (const auto& parameter : parameters) {
            query.Add(cpr::Parameter{parameter.first, parameter.second});
        }

        try {
            cpr::Response response = cpr::Get(cpr::Url{url}, query, cpr::Timeout{m_timeoutMs},
                                              headers(), cpr::VerifySsl{true});
            return toHttpResponse(response);
        } catch (const std::exception& e) {
            // Do not log the query string, it carries the API key
            CALLOUT_LOG_ERROR("HttpTransport", "GET failed", "Host: " + url + " | " + e.what());
            HttpResponse failed;
            failed.error = e.what();
            return failed;
        }
    }

    HttpResponse PostJson(const std::string& url, const std::string& body) override {
        cpr::Header header = headers();
        header["Content-Type"] = "application/json";

        try {
            cpr::Response response = cpr::Post(cpr::Url{url}, cpr::Body{body}, header,
                                               cpr::Timeout{m_timeoutMs}, cpr::VerifySsl{true});
            return toHttpResponse(response);
        } catch (const std::exception& e) {
            CALLOUT_LOG_ERROR("HttpTransport", "POST failed", "Host: " + url + " | " + e.what());
            HttpResponse failed;
            failed.error = e.what();
            return failed;
        }
    }

private:
    static cpr::Header headers() {
        return cpr::Header{{"User-Agent", "Callout/1.0"}, {"Accept", "application/json"}};
    }

    static HttpResponse toHttpResponse(const cpr::Response& response) {
        HttpResponse result(response.status_code, response.text);
        if (response.error.code != cpr::ErrorCode::OK) {
            result.statusCode = 0;
            result.error = response.error.message;
        } else if (response.status_code != 200) {
            result.error = "HTTP " + std::to_string(response.status_code);
        }
        return result;
    }

    long m_timeoutMs;
};

} // namespace

std::shared_ptr<HttpTransport> CreateHttpTransport(long timeoutMs) {
    return std::make_shared<CprHttpTransport>(timeoutMs);
}

} // namespace EthereumService
