#include "OcspClient.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <openssl/ocsp.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/x509_vfy.h>
#include <stdexcept>
#include <memory>

namespace revcheck {

namespace {
    constexpr const char* OCSP_CONTENT_TYPE = "application/ocsp-request";

    struct X509StackDeleter {
        // The stack only borrows its certificates
        void operator()(STACK_OF(X509)* sk) const { sk_X509_free(sk); }
    };
    struct X509StoreDeleter {
        void operator()(X509_STORE* store) const { X509_STORE_free(store); }
    };

    // base64 output contains '+', '/' and '=', none of which may appear raw
    // in a URL path segment
    std::string escapeBase64(const std::string& encoded) {
        std::string escaped;
        escaped.reserve(encoded.size());
        for (char c : encoded) {
            switch (c) {
                case '+': escaped += "%2B"; break;
                case '/': escaped += "%2F"; break;
                case '=': escaped += "%3D"; break;
                default:  escaped += c; break;
            }
        }
        return escaped;
    }
}

OcspClient::OcspClient(std::shared_ptr<HttpClient> http, std::shared_ptr<IssuerResolver> issuers)
    : http_(std::move(http)), issuers_(std::move(issuers)) {
    if (!http_ || !issuers_) {
        throw std::invalid_argument("OcspClient requires an HTTP client and an issuer resolver");
    }
}

RevocationResult OcspClient::checkOCSP(const Certificate& leaf, bool strict) const {
    const auto servers = leaf.ocspServers();
    if (servers.empty()) {
        // OCSP not enabled for this certificate
        return RevocationResult::good();
    }

    IssuerPtr issuer = issuers_->resolveIssuer(leaf);
    if (!issuer) {
        Logger::logError(ErrorCode::IssuerUnavailable,
            "Cannot build OCSP request for " + leaf.subjectName() + ": issuer unknown");
        return {false, false};
    }

    std::vector<uint8_t> request;
    OCSPCertIdPtr certId;
    try {
        request = buildRequest(leaf, *issuer);
        certId = makeCertId(leaf, *issuer);
    }
    catch (const RevocationError& e) {
        Logger::logError(e.code(), std::string("Failed to build OCSP request: ") + e.what());
        return {false, false};
    }

    for (const auto& server : servers) {
        OCSPResponsePtr response;
        try {
            response = sendRequest(server, request);
        }
        catch (const RevocationError& e) {
            if (isProtocolError(e.code())) {
                Logger::logError(e.code(), "OCSP responder " + server + " refused the request: " + e.what());
            } else {
                Logger::logError(e.code(), "OCSP responder " + server + " gave no usable answer: " + e.what());
            }
            if (strict) {
                return {false, false};
            }
            continue;
        }

        try {
            OCSPBasicResponsePtr basic(OCSP_response_get1_basic(response.get()));
            if (!basic) {
                throwOpenSSLError(ErrorCode::ParseError, "OCSP_response_get1_basic");
            }

            verifyResponse(basic.get(), *issuer);

            int status = V_OCSP_CERTSTATUS_UNKNOWN;
            int reason = 0;
            ASN1_GENERALIZEDTIME* revtime = nullptr;
            ASN1_GENERALIZEDTIME* thisupd = nullptr;
            ASN1_GENERALIZEDTIME* nextupd = nullptr;
            if (!OCSP_resp_find_status(basic.get(), certId.get(), &status, &reason,
                                       &revtime, &thisupd, &nextupd)) {
                throw RevocationError(ErrorCode::ParseError,
                    "OCSP response from " + server + " does not cover serial " +
                    leaf.serialNumber().toHex());
            }

            const bool revoked = status != V_OCSP_CERTSTATUS_GOOD;
            Logger::logEvent(LogLevel::Debug,
                "OCSP responder " + server + " reports " + OCSP_cert_status_str(status) +
                " for serial " + leaf.serialNumber().toHex());
            return {revoked, true};
        }
        catch (const RevocationError& e) {
            Logger::logError(e.code(), "OCSP response from " + server + " rejected: " + e.what());
            return {false, false};
        }
    }

    return {false, false};
}

std::vector<uint8_t> OcspClient::buildRequest(const Certificate& leaf, const X509Certificate& issuer) {
    OCSPRequestPtr req(OCSP_REQUEST_new());
    if (!req) {
        throwOpenSSLError(ErrorCode::ProtocolError, "OCSP_REQUEST_new");
    }

    OCSPCertIdPtr certId = makeCertId(leaf, issuer);
    if (!OCSP_request_add0_id(req.get(), certId.get())) {
        throwOpenSSLError(ErrorCode::ProtocolError, "OCSP_request_add0_id");
    }
    certId.release(); // Owned by the request now

    int len = i2d_OCSP_REQUEST(req.get(), nullptr);
    if (len <= 0) {
        throwOpenSSLError(ErrorCode::ProtocolError, "i2d_OCSP_REQUEST");
    }
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* p = der.data();
    if (i2d_OCSP_REQUEST(req.get(), &p) != len) {
        throwOpenSSLError(ErrorCode::ProtocolError, "i2d_OCSP_REQUEST");
    }
    return der;
}

ErrorCode OcspClient::errorForResponseStatus(int status) {
    switch (status) {
        case OCSP_RESPONSE_STATUS_MALFORMEDREQUEST: return ErrorCode::OcspMalformedRequest;
        case OCSP_RESPONSE_STATUS_INTERNALERROR:    return ErrorCode::OcspInternalError;
        case OCSP_RESPONSE_STATUS_TRYLATER:         return ErrorCode::OcspTryLater;
        case OCSP_RESPONSE_STATUS_SIGREQUIRED:      return ErrorCode::OcspSignatureRequired;
        case OCSP_RESPONSE_STATUS_UNAUTHORIZED:     return ErrorCode::OcspUnauthorized;
        default:                                    return ErrorCode::ProtocolError;
    }
}

OCSPResponsePtr OcspClient::sendRequest(const std::string& server,
                                        const std::vector<uint8_t>& request) const {
    HttpResponse response;
    if (request.size() > RevocationParameters::OCSP_GET_MAX_REQUEST_SIZE) {
        response = http_->post(server, OCSP_CONTENT_TYPE, request);
    } else {
        std::string url = server;
        if (url.empty() || url.back() != '/') {
            url += '/';
        }
        url += escapeBase64(Utils::base64Encode(request));
        response = http_->get(url);
    }

    if (response.status != 200) {
        throw RevocationError(ErrorCode::FetchError,
            "HTTP status " + std::to_string(response.status));
    }

    const unsigned char* p = response.body.data();
    OCSPResponsePtr parsed(d2i_OCSP_RESPONSE(nullptr, &p, static_cast<long>(response.body.size())));
    if (!parsed) {
        throwOpenSSLError(ErrorCode::ParseError, "d2i_OCSP_RESPONSE");
    }

    int status = OCSP_response_status(parsed.get());
    if (status != OCSP_RESPONSE_STATUS_SUCCESSFUL) {
        throw RevocationError(errorForResponseStatus(status),
            std::string("responder answered ") + OCSP_response_status_str(status));
    }
    return parsed;
}

void OcspClient::verifyResponse(OCSP_BASICRESP* basic, const X509Certificate& issuer) {
    std::unique_ptr<STACK_OF(X509), X509StackDeleter> certs(sk_X509_new_null());
    std::unique_ptr<X509_STORE, X509StoreDeleter> store(X509_STORE_new());
    if (!certs || !store || !sk_X509_push(certs.get(), issuer.native())) {
        throwOpenSSLError(ErrorCode::SignatureError, "Preparing OCSP verification");
    }

    // The issuer is the only trust anchor. A delegated responder has to
    // chain to it directly.
    if (!X509_STORE_add_cert(store.get(), issuer.native())) {
        throwOpenSSLError(ErrorCode::SignatureError, "X509_STORE_add_cert");
    }
    X509_STORE_set_flags(store.get(), X509_V_FLAG_PARTIAL_CHAIN);

    if (OCSP_basic_verify(basic, certs.get(), store.get(), OCSP_TRUSTOTHER) <= 0) {
        throwOpenSSLError(ErrorCode::SignatureError, "OCSP response signature check");
    }
}

OCSPCertIdPtr OcspClient::makeCertId(const Certificate& leaf, const X509Certificate& issuer) {
    ASN1IntegerPtr serial = leaf.serialNumber().toAsn1Integer();
    OCSPCertIdPtr certId(OCSP_cert_id_new(EVP_sha1(),
                                          X509_get_subject_name(issuer.native()),
                                          X509_get0_pubkey_bitstr(issuer.native()),
                                          serial.get()));
    if (!certId) {
        throwOpenSSLError(ErrorCode::ProtocolError, "OCSP_cert_id_new");
    }
    return certId;
}

} // namespace revcheck
