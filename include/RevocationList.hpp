#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <optional>
#include "Certificate.hpp"
#include "OpenSSLHandles.hpp"

namespace revcheck {

// A parsed, immutable certificate revocation list.
class RevocationList {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Accepts PEM or DER. Empty input raises EmptyListError, anything
    // OpenSSL cannot decode raises ParseError.
    static std::shared_ptr<const RevocationList> parse(const std::vector<uint8_t>& data);

    // Throws RevocationError(SignatureError) if the list was not signed by issuer
    void verifySignature(const X509Certificate& issuer) const;

    // A list without nextUpdate never counts as fresh
    bool isFresh(TimePoint now) const { return nextUpdate_ && now < *nextUpdate_; }

    bool contains(const SerialNumber& serial) const;

    const std::string& issuerName() const { return issuerName_; }
    TimePoint thisUpdate() const { return thisUpdate_; }
    const std::optional<TimePoint>& nextUpdate() const { return nextUpdate_; }
    const std::vector<SerialNumber>& revokedSerials() const { return revoked_; }

private:
    explicit RevocationList(X509CRLPtr crl);

    X509CRLPtr crl_;
    std::string issuerName_;
    TimePoint thisUpdate_;
    std::optional<TimePoint> nextUpdate_;
    std::vector<SerialNumber> revoked_;
};

} // namespace revcheck
