#pragma once // Ensures this header is included only once

#include <string> // For std::string
#include <vector>
#include <memory>
#include "Certificate.hpp"
#include "HttpClient.hpp"
#include "IssuerResolver.hpp"
#include "OpenSSLHandles.hpp"
#include "RevocationTypes.hpp"

namespace revcheck { // Begin namespace revcheck

/**
 * Online Certificate Status Protocol client.
 *
 * Asks each responder listed in the certificate, in order, until one gives a
 * usable answer. The answer must be signed by the issuer, or by a delegated
 * responder certificate the issuer signed.
 */
class OcspClient {
public:
    OcspClient(std::shared_ptr<HttpClient> http, std::shared_ptr<IssuerResolver> issuers);

    // With strict set, the first responder failure ends the check instead of
    // moving on to the next responder.
    RevocationResult checkOCSP(const Certificate& leaf, bool strict) const;

    // DER-encoded request for the leaf's status, SHA-1 CertID
    static std::vector<uint8_t> buildRequest(const Certificate& leaf, const X509Certificate& issuer);

    // Maps an OCSPResponseStatus other than successful to its error code
    static ErrorCode errorForResponseStatus(int status);

private:
    OCSPResponsePtr sendRequest(const std::string& server,
                                const std::vector<uint8_t>& request) const;
    static void verifyResponse(OCSP_BASICRESP* basic, const X509Certificate& issuer);
    static OCSPCertIdPtr makeCertId(const Certificate& leaf, const X509Certificate& issuer);

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<IssuerResolver> issuers_;
};

} // namespace revcheck
