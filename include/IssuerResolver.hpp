#pragma once

#include <memory>
#include "Certificate.hpp"
#include "HttpClient.hpp"

namespace revcheck {

// Fetches the certificate that issued a given certificate by walking its
// issuer-fetch URLs in order. Failures only show up in the log.
class IssuerResolver {
public:
    explicit IssuerResolver(std::shared_ptr<HttpClient> http);

    // Returns nullptr if no URL yields a parseable certificate
    IssuerPtr resolveIssuer(const Certificate& certificate) const;

private:
    IssuerPtr fetchIssuer(const std::string& url) const;

    std::shared_ptr<HttpClient> http_;
};

} // namespace revcheck
