#include "RevocationChecker.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

namespace revcheck {

namespace {
    void logRevoked(const Certificate& certificate, const std::string& source) {
        Logger::logEvent(LogLevel::Security,
            std::string(toString(ErrorCode::CertificateRevoked)) + ": " +
            certificate.subjectName() + ", serial " + certificate.serialNumber().toHex() +
            ", by " + source);
    }
}

RevocationChecker::RevocationChecker(CheckerOptions options,
                                     std::shared_ptr<HttpClient> http,
                                     Clock clock)
    : hard_fail_(options.hardFail),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      http_(http ? std::move(http) : std::make_shared<CurlHttpClient>()),
      issuers_(std::make_shared<IssuerResolver>(http_)),
      crl_store_(std::make_unique<CrlStore>(mutex_, http_, issuers_, clock_,
                                            options.requireVerifiedCrl)),
      ocsp_(http_, issuers_) {}

RevocationResult RevocationChecker::check(const Certificate& certificate) {
    try {
        if (!isTimeValid(certificate)) {
            return RevocationResult::revokedResult();
        }
        return revocationCheck(certificate);
    }
    catch (const RevocationError& e) {
        Logger::logError(e.code(),
            "Revocation check aborted for " + certificate.subjectName() + ": " + e.what());
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::InternalError,
            "Revocation check aborted for " + certificate.subjectName() + ": " + e.what());
    }
    return RevocationResult::failed(isHardFail());
}

void RevocationChecker::setHardFail(bool hardFail) {
    std::lock_guard<std::mutex> lock(mutex_);
    hard_fail_ = hardFail;
}

bool RevocationChecker::isHardFail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hard_fail_;
}

void RevocationChecker::setLocalCRL(const std::string& pathOrUri) {
    if (pathOrUri.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!local_crl_.empty()) {
            crl_store_->evictLocked(local_crl_);
            Logger::logEvent(LogLevel::Info, "Cleared local CRL " + local_crl_);
        }
        local_crl_.clear();
        return;
    }

    const std::string scheme = Utils::urlScheme(pathOrUri);
    std::string path;
    if (scheme.empty()) {
        path = pathOrUri;
    } else if (scheme == "file") {
        path = Utils::fileUriToPath(pathOrUri);
    } else {
        throw RevocationError(ErrorCode::InvalidConfiguration,
            "Path is not valid: " + pathOrUri);
    }

    // Load before pinning so a bad file never replaces a working one
    crl_store_->fetchLocal(path, true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (local_crl_ != path) {
        if (!local_crl_.empty()) {
            crl_store_->evictLocked(local_crl_);
        }
        local_crl_ = path;
    }
    Logger::logEvent(LogLevel::Info, "Pinned local CRL " + path);
}

std::string RevocationChecker::localCRL() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return local_crl_;
}

void RevocationChecker::refreshCRL(const std::string& url, const IssuerPtr& issuer, bool force) {
    crl_store_->fetchRemote(url, issuer, force);
}

bool RevocationChecker::isTimeValid(const Certificate& certificate) const {
    const auto now = clock_();
    const auto notAfter = certificate.notAfter();
    const auto notBefore = certificate.notBefore();

    if (now >= notAfter) {
        Logger::logEvent(LogLevel::Info,
            "Certificate expired " + Utils::formatTime(notAfter) +
            " (" + certificate.subjectName() + ")");
        return false;
    }
    if (now < notBefore) {
        Logger::logEvent(LogLevel::Info,
            "Certificate isn't valid until " + Utils::formatTime(notBefore) +
            " (" + certificate.subjectName() + ")");
        return false;
    }
    return true;
}

RevocationResult RevocationChecker::revocationCheck(const Certificate& certificate) {
    std::string localCrl;
    bool hardFail;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        localCrl = local_crl_;
        hardFail = hard_fail_;
    }

    if (!localCrl.empty()) {
        bool revoked = false;
        try {
            revoked = crl_store_->isSerialRevoked(certificate, localCrl, CrlSource::Local);
        }
        catch (const RevocationError& e) {
            Logger::logError(e.code(), e.what());
            Logger::logEvent(LogLevel::Warning, "Error checking revocation via local CRL file");
            return RevocationResult::failed(hardFail);
        }

        {
            // The pin may have moved while the file was being read, in which
            // case the entry just loaded for the old path belongs to nobody
            std::lock_guard<std::mutex> lock(mutex_);
            if (local_crl_ != localCrl) {
                crl_store_->evictLocked(localCrl);
            }
        }

        if (revoked) {
            logRevoked(certificate, "CRL file '" + localCrl + "'");
            return RevocationResult::revokedResult();
        }
    }

    for (const auto& url : certificate.crlDistributionPoints()) {
        if (Utils::isLdapUrl(url)) {
            Logger::logEvent(LogLevel::Info,
                std::string("Skipping LDAP CRL (") + toString(ErrorCode::UnsupportedTransport) +
                "): " + url);
            continue;
        }

        try {
            if (crl_store_->isSerialRevoked(certificate, url, CrlSource::Remote)) {
                logRevoked(certificate, "CRL '" + url + "'");
                return RevocationResult::revokedResult();
            }
        }
        catch (const RevocationError& e) {
            Logger::logError(e.code(), e.what());
            Logger::logEvent(LogLevel::Warning, "Error checking revocation via CRL " + url);
            return RevocationResult::failed(hardFail);
        }

        RevocationResult ocsp = ocsp_.checkOCSP(certificate, hardFail);
        if (!ocsp.ok) {
            Logger::logEvent(LogLevel::Warning, "Error checking revocation via OCSP");
            return RevocationResult::failed(hardFail);
        }
        if (ocsp.revoked) {
            logRevoked(certificate, "OCSP");
            return RevocationResult::revokedResult();
        }
    }

    return RevocationResult::good();
}

} // namespace revcheck
