#pragma once

#include <memory>
#include <string>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ocsp.h>
#include <openssl/x509.h>
#include "RevocationTypes.hpp"

namespace revcheck {

// RAII wrappers for the OpenSSL objects the checker passes around
struct BIODeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};
struct X509Deleter {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct X509CRLDeleter {
    void operator()(X509_CRL* crl) const { X509_CRL_free(crl); }
};
struct OCSPRequestDeleter {
    void operator()(OCSP_REQUEST* req) const { OCSP_REQUEST_free(req); }
};
struct OCSPResponseDeleter {
    void operator()(OCSP_RESPONSE* resp) const { OCSP_RESPONSE_free(resp); }
};
struct OCSPBasicResponseDeleter {
    void operator()(OCSP_BASICRESP* basic) const { OCSP_BASICRESP_free(basic); }
};
struct OCSPCertIdDeleter {
    void operator()(OCSP_CERTID* id) const { OCSP_CERTID_free(id); }
};
struct ASN1IntegerDeleter {
    void operator()(ASN1_INTEGER* value) const { ASN1_INTEGER_free(value); }
};

using BIOPtr = std::unique_ptr<BIO, BIODeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using X509CRLPtr = std::unique_ptr<X509_CRL, X509CRLDeleter>;
using OCSPRequestPtr = std::unique_ptr<OCSP_REQUEST, OCSPRequestDeleter>;
using OCSPResponsePtr = std::unique_ptr<OCSP_RESPONSE, OCSPResponseDeleter>;
using OCSPBasicResponsePtr = std::unique_ptr<OCSP_BASICRESP, OCSPBasicResponseDeleter>;
using OCSPCertIdPtr = std::unique_ptr<OCSP_CERTID, OCSPCertIdDeleter>;
using ASN1IntegerPtr = std::unique_ptr<ASN1_INTEGER, ASN1IntegerDeleter>;

// Drains the OpenSSL error queue into a single line
inline std::string openSSLErrorString() {
    std::string error;
    while (unsigned long err = ERR_get_error()) {
        char err_buf[256];
        ERR_error_string_n(err, err_buf, sizeof(err_buf));
        if (!error.empty()) error += "; ";
        error += err_buf;
    }
    return error.empty() ? "no OpenSSL error reported" : error;
}

[[noreturn]] inline void throwOpenSSLError(ErrorCode code, const std::string& operation) {
    throw RevocationError(code, operation + " failed: " + openSSLErrorString());
}

} // namespace revcheck
