#include "IssuerResolver.hpp"
#include "Logger.hpp"
#include <stdexcept>

namespace revcheck {

IssuerResolver::IssuerResolver(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {
    if (!http_) {
        throw std::invalid_argument("IssuerResolver requires an HTTP client");
    }
}

IssuerPtr IssuerResolver::resolveIssuer(const Certificate& certificate) const {
    for (const auto& url : certificate.issuingCertificateUrls()) {
        try {
            return fetchIssuer(url);
        }
        catch (const RevocationError& e) {
            Logger::logError(e.code(),
                "Failed to fetch issuer from " + url + ": " + e.what());
        }
    }

    Logger::logEvent(LogLevel::Debug,
        "No issuer certificate available for " + certificate.subjectName());
    return nullptr;
}

IssuerPtr IssuerResolver::fetchIssuer(const std::string& url) const {
    HttpResponse response = http_->get(url);
    if (!response.isSuccess()) {
        throw RevocationError(ErrorCode::FetchError,
            "HTTP status " + std::to_string(response.status));
    }
    return X509Certificate::parse(response.body);
}

} // namespace revcheck
