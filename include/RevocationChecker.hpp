#pragma once

#include <string>
#include <memory>
#include <mutex>
#include "Certificate.hpp"
#include "CrlStore.hpp"
#include "HttpClient.hpp"
#include "IssuerResolver.hpp"
#include "OcspClient.hpp"
#include "RevocationTypes.hpp"

namespace revcheck {

struct CheckerOptions {
    // Treat a failed check as revoked
    bool hardFail = false;
    // Refuse remote CRLs whose issuer certificate cannot be fetched instead
    // of caching them unverified
    bool requireVerifiedCrl = false;
};

// Decides whether a certificate is revoked by combining its validity window,
// an optional pinned local CRL, the remote CRLs it points at and OCSP.
//
// Safe to share between threads. Configuration and the CRL cache sit behind
// one mutex that is never held across I/O.
class RevocationChecker {
public:
    explicit RevocationChecker(CheckerOptions options = {},
                               std::shared_ptr<HttpClient> http = nullptr,
                               Clock clock = nullptr);

    RevocationChecker(const RevocationChecker&) = delete;
    RevocationChecker& operator=(const RevocationChecker&) = delete;

    // Never throws; failures come back as ok=false
    RevocationResult check(const Certificate& certificate);

    void setHardFail(bool hardFail);
    bool isHardFail() const;

    // Pins a CRL file (bare path or file:// URI) that every check consults
    // first. An empty string clears the pin. Loads the file immediately and
    // throws RevocationError if it cannot be used.
    void setLocalCRL(const std::string& pathOrUri);
    std::string localCRL() const;

    // Loads a remote CRL into the cache, throws RevocationError on failure
    void refreshCRL(const std::string& url, const IssuerPtr& issuer, bool force);

    CrlStore& crlStore() { return *crl_store_; }

private:
    bool isTimeValid(const Certificate& certificate) const;
    RevocationResult revocationCheck(const Certificate& certificate);

    mutable std::mutex mutex_;
    bool hard_fail_;
    std::string local_crl_;

    Clock clock_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<IssuerResolver> issuers_;
    std::unique_ptr<CrlStore> crl_store_;
    OcspClient ocsp_;
};

} // namespace revcheck
