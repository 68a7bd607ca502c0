#include "RevocationList.hpp"
#include "Utils.hpp"
#include <openssl/pem.h>

namespace revcheck {

namespace {
    std::string nameToString(const X509_NAME* name) {
        BIOPtr bio(BIO_new(BIO_s_mem()));
        if (!bio || X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253) < 0) {
            return {};
        }
        char* buf = nullptr;
        long len = BIO_get_mem_data(bio.get(), &buf);
        return std::string(buf, static_cast<size_t>(len));
    }
}

RevocationList::RevocationList(X509CRLPtr crl) : crl_(std::move(crl)) {
    issuerName_ = nameToString(X509_CRL_get_issuer(crl_.get()));
    thisUpdate_ = Utils::fromAsn1Time(X509_CRL_get0_lastUpdate(crl_.get()));
    if (const ASN1_TIME* next = X509_CRL_get0_nextUpdate(crl_.get())) {
        nextUpdate_ = Utils::fromAsn1Time(next);
    }

    STACK_OF(X509_REVOKED)* entries = X509_CRL_get_REVOKED(crl_.get());
    for (int i = 0; i < sk_X509_REVOKED_num(entries); ++i) {
        const X509_REVOKED* entry = sk_X509_REVOKED_value(entries, i);
        revoked_.push_back(SerialNumber::fromAsn1Integer(X509_REVOKED_get0_serialNumber(entry)));
    }
}

std::shared_ptr<const RevocationList> RevocationList::parse(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        throw RevocationError(ErrorCode::EmptyListError, "CRL data is empty");
    }

    X509CRLPtr crl;
    if (Utils::looksLikePem(data)) {
        BIOPtr bio(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
        if (!bio) {
            throwOpenSSLError(ErrorCode::ParseError, "BIO_new_mem_buf");
        }
        crl.reset(PEM_read_bio_X509_CRL(bio.get(), nullptr, nullptr, nullptr));
    } else {
        const unsigned char* p = data.data();
        crl.reset(d2i_X509_CRL(nullptr, &p, static_cast<long>(data.size())));
    }

    if (!crl) {
        throwOpenSSLError(ErrorCode::ParseError, "CRL parsing");
    }
    return std::shared_ptr<const RevocationList>(new RevocationList(std::move(crl)));
}

void RevocationList::verifySignature(const X509Certificate& issuer) const {
    EVP_PKEY* key = X509_get0_pubkey(issuer.native());
    if (!key) {
        throwOpenSSLError(ErrorCode::SignatureError, "Reading issuer public key");
    }
    if (X509_CRL_verify(crl_.get(), key) != 1) {
        throw RevocationError(ErrorCode::SignatureError,
            "CRL signature does not match issuer " + issuer.subjectName() +
            ": " + openSSLErrorString());
    }
}

bool RevocationList::contains(const SerialNumber& serial) const {
    for (const auto& revoked : revoked_) {
        if (revoked == serial) {
            return true;
        }
    }
    return false;
}

} // namespace revcheck
