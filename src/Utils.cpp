#include "Utils.hpp"
#include "RevocationTypes.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string_view>
#include <curl/curl.h>
#include <openssl/evp.h>

namespace revcheck {

namespace {
    struct CurlUrlDeleter {
        void operator()(CURLU* url) const { curl_url_cleanup(url); }
    };
    using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

    struct CurlStringDeleter {
        void operator()(char* str) const { curl_free(str); }
    };
    using CurlStringPtr = std::unique_ptr<char, CurlStringDeleter>;

    constexpr std::string_view PEM_MARKER = "-----BEGIN";
}

std::string Utils::urlScheme(const std::string& url) {
    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) {
        return {};
    }
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return {};
    }
    for (size_t i = 1; i < colon; ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return {};
        }
    }

    std::string scheme = url.substr(0, colon);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return scheme;
}

bool Utils::isLdapUrl(const std::string& url) {
    return urlScheme(url) == "ldap";
}

std::string Utils::fileUriToPath(const std::string& uri) {
    if (urlScheme(uri) != "file") {
        throw RevocationError(ErrorCode::InvalidConfiguration,
            "Not a file URI: " + uri);
    }

    CurlUrlPtr handle(curl_url());
    if (!handle) {
        throw std::runtime_error("Failed to allocate CURLU handle");
    }

    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, uri.c_str(), 0);
    if (rc != CURLUE_OK) {
        throw RevocationError(ErrorCode::InvalidConfiguration,
            "Path is not valid: " + uri + " (" + curl_url_strerror(rc) + ")");
    }

    char* raw = nullptr;
    rc = curl_url_get(handle.get(), CURLUPART_PATH, &raw, CURLU_URLDECODE);
    CurlStringPtr path(raw);
    if (rc != CURLUE_OK || !path || *path == '\0') {
        throw RevocationError(ErrorCode::InvalidConfiguration,
            "Path is not valid: " + uri);
    }
    return std::string(path.get());
}

std::string Utils::base64Encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return {};
    }

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
    std::string result(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("Failed to base64 encode data");
    }
    result.resize(static_cast<size_t>(written));
    return result;
}

bool Utils::looksLikePem(const std::vector<uint8_t>& data) {
    auto it = std::search(data.begin(), data.end(), PEM_MARKER.begin(), PEM_MARKER.end());
    return it != data.end();
}

Utils::TimePoint Utils::fromAsn1Time(const ASN1_TIME* time) {
    if (!time) {
        throw RevocationError(ErrorCode::ParseError, "Missing ASN.1 time");
    }

    std::tm tm_buf{};
    if (ASN1_TIME_to_tm(time, &tm_buf) != 1) {
        throw RevocationError(ErrorCode::ParseError, "Malformed ASN.1 time");
    }

    // The clock counts nanoseconds and cannot reach past 2262, so far-off
    // dates such as 99991231235959Z saturate instead of wrapping
    using std::chrono::seconds;
    constexpr auto latest = std::chrono::duration_cast<seconds>(TimePoint::max().time_since_epoch()).count();
    constexpr auto earliest = std::chrono::duration_cast<seconds>(TimePoint::min().time_since_epoch()).count();
    const auto secs = static_cast<long long>(timegm(&tm_buf));
    if (secs > latest) {
        return TimePoint::max();
    }
    if (secs < earliest) {
        return TimePoint::min();
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(seconds(secs)));
}

std::string Utils::formatTime(TimePoint time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

} // namespace revcheck
