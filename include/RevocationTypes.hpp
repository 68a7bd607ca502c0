#pragma once // Ensures this header is included only once during compilation

#include <string>    // Provides the std::string type
#include <stdexcept> // Provides std::runtime_error
#include <cstddef>   // Provides std::size_t

namespace revcheck { // Begin namespace revcheck to group related functionality

// Error codes for the revocation checker
enum class ErrorCode {
    None = 0,
    InvalidConfiguration,
    IOError,
    FetchError,
    TransportError,
    ParseError,
    EmptyListError,
    SignatureError,
    IssuerUnavailable,
    UnsupportedTransport,
    ProtocolError,
    OcspMalformedRequest,
    OcspInternalError,
    OcspTryLater,
    OcspSignatureRequired,
    OcspUnauthorized,
    CertificateRevoked,
    InternalError
};

// Converts an ErrorCode to a human-readable string
inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "No error";
        case ErrorCode::InvalidConfiguration:
            return "Invalid Configuration"; // Bad local CRL path or scheme
        case ErrorCode::IOError:
            return "I/O Error"; // Local file could not be read
        case ErrorCode::FetchError:
            return "Fetch Error"; // Remote answered with a non-success status
        case ErrorCode::TransportError:
            return "Transport Error"; // Remote could not be reached at all
        case ErrorCode::ParseError:
            return "Parse Error";
        case ErrorCode::EmptyListError:
            return "Empty CRL";
        case ErrorCode::SignatureError:
            return "Signature Error";
        case ErrorCode::IssuerUnavailable:
            return "Issuer Unavailable";
        case ErrorCode::UnsupportedTransport:
            return "Unsupported Transport"; // e.g. ldap:// distribution points
        case ErrorCode::ProtocolError:
            return "OCSP Protocol Error";
        case ErrorCode::OcspMalformedRequest:
            return "OCSP Malformed Request";
        case ErrorCode::OcspInternalError:
            return "OCSP Internal Error";
        case ErrorCode::OcspTryLater:
            return "OCSP Try Later";
        case ErrorCode::OcspSignatureRequired:
            return "OCSP Signature Required";
        case ErrorCode::OcspUnauthorized:
            return "OCSP Unauthorized";
        case ErrorCode::CertificateRevoked:
            return "Certificate Revoked";
        case ErrorCode::InternalError:
            return "Internal Error";
        default:
            return "Unknown error"; // Catch-all for unhandled error codes
    }
}

// True for the codes an OCSP responder can send back instead of a status
inline bool isProtocolError(ErrorCode code) {
    switch (code) {
        case ErrorCode::ProtocolError:
        case ErrorCode::OcspMalformedRequest:
        case ErrorCode::OcspInternalError:
        case ErrorCode::OcspTryLater:
        case ErrorCode::OcspSignatureRequired:
        case ErrorCode::OcspUnauthorized:
            return true;
        default:
            return false;
    }
}

// Thrown inside the checker and by the configuration entry points
class RevocationError : public std::runtime_error {
public:
    RevocationError(ErrorCode code, const std::string& details)
        : std::runtime_error(details), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Outcome of a revocation check.
//
//   revoked=false ok=true   verified not revoked
//   revoked=true  ok=true   verified revoked
//   revoked=false ok=false  check failed, soft-fail (do not block)
//   revoked=true  ok=false  check failed, hard-fail (fail closed)
struct RevocationResult {
    bool revoked = false;
    bool ok = false;

    static RevocationResult good() { return {false, true}; }
    static RevocationResult revokedResult() { return {true, true}; }
    static RevocationResult failed(bool hardFail) { return {hardFail, false}; }

    bool operator==(const RevocationResult& other) const {
        return revoked == other.revoked && ok == other.ok;
    }
    bool operator!=(const RevocationResult& other) const { return !(*this == other); }
};

inline const char* toString(const RevocationResult& result) {
    if (result.ok) {
        return result.revoked ? "revoked" : "good";
    }
    return result.revoked ? "failed" : "unknown";
}

// Constants for protocol parameters
struct RevocationParameters {
    static constexpr size_t OCSP_GET_MAX_REQUEST_SIZE = 256;        // Larger requests are POSTed
    static constexpr size_t MAX_RESPONSE_SIZE = 16 * 1024 * 1024;   // 16MB, large CRLs exist
    static constexpr long DEFAULT_TIMEOUT_SECONDS = 10;
};

} // namespace revcheck
