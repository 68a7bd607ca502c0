#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <openssl/asn1.h>

namespace revcheck {

class Utils {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // URL helpers
    // Lower-cased RFC 3986 scheme, or an empty string for a bare path
    static std::string urlScheme(const std::string& url);
    static bool isLdapUrl(const std::string& url);
    // Percent-decoded path of a file:// URI, throws RevocationError otherwise
    static std::string fileUriToPath(const std::string& uri);

    // Encoding
    static std::string base64Encode(const std::vector<uint8_t>& data);
    static bool looksLikePem(const std::vector<uint8_t>& data);

    // Timestamp utilities
    static TimePoint fromAsn1Time(const ASN1_TIME* time);
    static std::string formatTime(TimePoint time);

private:
    Utils() = delete;
    ~Utils() = delete;
    Utils(const Utils&) = delete;
    Utils& operator=(const Utils&) = delete;
};

} // namespace revcheck
