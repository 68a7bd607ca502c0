#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <cstdint>
#include <openssl/asn1.h>
#include <openssl/x509.h>
#include "OpenSSLHandles.hpp"

namespace revcheck {

// Arbitrary-precision serial number, compared by value.
class SerialNumber {
public:
    SerialNumber() = default;
    SerialNumber(std::vector<uint8_t> magnitude, bool negative);

    static SerialNumber fromUint64(uint64_t value);
    static SerialNumber fromAsn1Integer(const ASN1_INTEGER* value);

    ASN1IntegerPtr toAsn1Integer() const;
    std::string toHex() const;

    const std::vector<uint8_t>& magnitude() const { return magnitude_; }
    bool isNegative() const { return negative_; }

    bool operator==(const SerialNumber& other) const {
        return negative_ == other.negative_ && magnitude_ == other.magnitude_;
    }
    bool operator!=(const SerialNumber& other) const { return !(*this == other); }

private:
    // Big-endian, no leading zero bytes; zero is the empty vector
    std::vector<uint8_t> magnitude_;
    bool negative_ = false;
};

// The capabilities the revocation checker needs from a certificate.
class Certificate {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Certificate() = default;

    virtual SerialNumber serialNumber() const = 0;
    virtual TimePoint notBefore() const = 0;
    virtual TimePoint notAfter() const = 0;
    virtual std::vector<std::string> crlDistributionPoints() const = 0;
    virtual std::vector<std::string> ocspServers() const = 0;
    virtual std::vector<std::string> issuingCertificateUrls() const = 0;

    // Only used for log lines
    virtual std::string subjectName() const = 0;
};

// Certificate backed by an OpenSSL X509 object.
class X509Certificate : public Certificate {
public:
    explicit X509Certificate(X509Ptr cert);

    // Accepts PEM or raw DER; throws RevocationError(ParseError)
    static std::shared_ptr<const X509Certificate> parse(const std::vector<uint8_t>& data);

    SerialNumber serialNumber() const override;
    TimePoint notBefore() const override;
    TimePoint notAfter() const override;
    std::vector<std::string> crlDistributionPoints() const override;
    std::vector<std::string> ocspServers() const override;
    std::vector<std::string> issuingCertificateUrls() const override;
    std::string subjectName() const override;

    X509* native() const { return cert_.get(); }

private:
    X509Ptr cert_;
};

using IssuerPtr = std::shared_ptr<const X509Certificate>;

} // namespace revcheck
