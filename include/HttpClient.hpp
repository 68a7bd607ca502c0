#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <string_view>
#include "RevocationTypes.hpp"

namespace revcheck {

struct HttpResponse {
    long status = 0;
    std::vector<uint8_t> body;

    bool isSuccess() const { return status >= 200 && status < 300; }
};

// Transport used for CRL, issuer and OCSP fetches. Implementations throw
// RevocationError(TransportError) when no response was received at all;
// any HTTP status, successful or not, is returned in HttpResponse.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url) = 0;
    virtual HttpResponse post(const std::string& url,
                              std::string_view contentType,
                              const std::vector<uint8_t>& body) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(
        std::chrono::seconds timeout = std::chrono::seconds(RevocationParameters::DEFAULT_TIMEOUT_SECONDS),
        size_t maxResponseSize = RevocationParameters::MAX_RESPONSE_SIZE);

    HttpResponse get(const std::string& url) override;
    HttpResponse post(const std::string& url,
                      std::string_view contentType,
                      const std::vector<uint8_t>& body) override;

private:
    HttpResponse perform(const std::string& url,
                         const std::string* contentType,
                         const std::vector<uint8_t>* body);

    std::chrono::seconds timeout_;
    size_t max_response_size_;
};

} // namespace revcheck
