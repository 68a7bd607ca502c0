#include "Certificate.hpp"
#include "Utils.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <openssl/bn.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

namespace revcheck {

namespace {
    struct BNDeleter {
        void operator()(BIGNUM* bn) const { BN_free(bn); }
    };
    using BNPtr = std::unique_ptr<BIGNUM, BNDeleter>;

    struct DistPointsDeleter {
        void operator()(CRL_DIST_POINTS* dps) const { CRL_DIST_POINTS_free(dps); }
    };
    struct AuthorityInfoAccessDeleter {
        void operator()(AUTHORITY_INFO_ACCESS* aia) const { AUTHORITY_INFO_ACCESS_free(aia); }
    };
    struct StringStackDeleter {
        void operator()(STACK_OF(OPENSSL_STRING)* sk) const { X509_email_free(sk); }
    };

    std::string uriFromGeneralName(const GENERAL_NAME* name) {
        if (!name || name->type != GEN_URI) {
            return {};
        }
        const ASN1_IA5STRING* uri = name->d.uniformResourceIdentifier;
        return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(uri)),
                           static_cast<size_t>(ASN1_STRING_length(uri)));
    }
}

SerialNumber::SerialNumber(std::vector<uint8_t> magnitude, bool negative)
    : magnitude_(std::move(magnitude)), negative_(negative) {
    auto firstNonZero = std::find_if(magnitude_.begin(), magnitude_.end(),
        [](uint8_t b) { return b != 0; });
    magnitude_.erase(magnitude_.begin(), firstNonZero);
    if (magnitude_.empty()) {
        negative_ = false;
    }
}

SerialNumber SerialNumber::fromUint64(uint64_t value) {
    std::vector<uint8_t> bytes(8);
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return SerialNumber(std::move(bytes), false);
}

SerialNumber SerialNumber::fromAsn1Integer(const ASN1_INTEGER* value) {
    if (!value) {
        throw RevocationError(ErrorCode::ParseError, "Missing serial number");
    }

    BNPtr bn(ASN1_INTEGER_to_BN(value, nullptr));
    if (!bn) {
        throwOpenSSLError(ErrorCode::ParseError, "ASN1_INTEGER_to_BN");
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(BN_num_bytes(bn.get())));
    if (!bytes.empty()) {
        BN_bn2bin(bn.get(), bytes.data());
    }
    return SerialNumber(std::move(bytes), BN_is_negative(bn.get()) != 0);
}

ASN1IntegerPtr SerialNumber::toAsn1Integer() const {
    BNPtr bn(BN_bin2bn(magnitude_.data(), static_cast<int>(magnitude_.size()), nullptr));
    if (!bn) {
        throwOpenSSLError(ErrorCode::ProtocolError, "BN_bin2bn");
    }
    BN_set_negative(bn.get(), negative_ ? 1 : 0);

    ASN1IntegerPtr result(BN_to_ASN1_INTEGER(bn.get(), nullptr));
    if (!result) {
        throwOpenSSLError(ErrorCode::ProtocolError, "BN_to_ASN1_INTEGER");
    }
    return result;
}

std::string SerialNumber::toHex() const {
    if (magnitude_.empty()) {
        return "0";
    }

    std::stringstream ss;
    if (negative_) {
        ss << '-';
    }
    ss << std::uppercase << std::hex << std::setfill('0');
    for (uint8_t b : magnitude_) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

X509Certificate::X509Certificate(X509Ptr cert) : cert_(std::move(cert)) {
    if (!cert_) {
        throw std::invalid_argument("X509Certificate requires a certificate");
    }
}

std::shared_ptr<const X509Certificate> X509Certificate::parse(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        throw RevocationError(ErrorCode::ParseError, "Empty certificate data");
    }

    X509Ptr cert;
    if (Utils::looksLikePem(data)) {
        BIOPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
        if (!bio) {
            throwOpenSSLError(ErrorCode::ParseError, "BIO_new_mem_buf");
        }
        cert.reset(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    } else {
        const unsigned char* p = data.data();
        cert.reset(d2i_X509(nullptr, &p, static_cast<long>(data.size())));
    }

    if (!cert) {
        throwOpenSSLError(ErrorCode::ParseError, "Certificate parsing");
    }
    return std::make_shared<const X509Certificate>(std::move(cert));
}

SerialNumber X509Certificate::serialNumber() const {
    return SerialNumber::fromAsn1Integer(X509_get0_serialNumber(cert_.get()));
}

Certificate::TimePoint X509Certificate::notBefore() const {
    return Utils::fromAsn1Time(X509_get0_notBefore(cert_.get()));
}

Certificate::TimePoint X509Certificate::notAfter() const {
    return Utils::fromAsn1Time(X509_get0_notAfter(cert_.get()));
}

std::vector<std::string> X509Certificate::crlDistributionPoints() const {
    std::vector<std::string> urls;
    std::unique_ptr<CRL_DIST_POINTS, DistPointsDeleter> dps(
        static_cast<CRL_DIST_POINTS*>(
            X509_get_ext_d2i(cert_.get(), NID_crl_distribution_points, nullptr, nullptr)));
    if (!dps) {
        return urls;
    }

    for (int i = 0; i < sk_DIST_POINT_num(dps.get()); ++i) {
        const DIST_POINT* dp = sk_DIST_POINT_value(dps.get(), i);
        // Only fullName distribution points carry URLs
        if (!dp->distpoint || dp->distpoint->type != 0) {
            continue;
        }
        const GENERAL_NAMES* names = dp->distpoint->name.fullname;
        for (int j = 0; j < sk_GENERAL_NAME_num(names); ++j) {
            std::string uri = uriFromGeneralName(sk_GENERAL_NAME_value(names, j));
            if (!uri.empty()) {
                urls.push_back(std::move(uri));
            }
        }
    }
    return urls;
}

std::vector<std::string> X509Certificate::ocspServers() const {
    std::vector<std::string> urls;
    std::unique_ptr<STACK_OF(OPENSSL_STRING), StringStackDeleter> ocspUrls(
        X509_get1_ocsp(cert_.get()));
    if (!ocspUrls) {
        return urls;
    }

    for (int i = 0; i < sk_OPENSSL_STRING_num(ocspUrls.get()); ++i) {
        urls.emplace_back(sk_OPENSSL_STRING_value(ocspUrls.get(), i));
    }
    return urls;
}

std::vector<std::string> X509Certificate::issuingCertificateUrls() const {
    std::vector<std::string> urls;
    std::unique_ptr<AUTHORITY_INFO_ACCESS, AuthorityInfoAccessDeleter> aia(
        static_cast<AUTHORITY_INFO_ACCESS*>(
            X509_get_ext_d2i(cert_.get(), NID_info_access, nullptr, nullptr)));
    if (!aia) {
        return urls;
    }

    for (int i = 0; i < sk_ACCESS_DESCRIPTION_num(aia.get()); ++i) {
        const ACCESS_DESCRIPTION* ad = sk_ACCESS_DESCRIPTION_value(aia.get(), i);
        if (OBJ_obj2nid(ad->method) != NID_ad_ca_issuers) {
            continue;
        }
        std::string uri = uriFromGeneralName(ad->location);
        if (!uri.empty()) {
            urls.push_back(std::move(uri));
        }
    }
    return urls;
}

std::string X509Certificate::subjectName() const {
    BIOPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || X509_NAME_print_ex(bio.get(), X509_get_subject_name(cert_.get()), 0,
                                   XN_FLAG_RFC2253) < 0) {
        return "<unprintable subject>";
    }

    char* buf = nullptr;
    long len = BIO_get_mem_data(bio.get(), &buf);
    return std::string(buf, static_cast<size_t>(len));
}

} // namespace revcheck
