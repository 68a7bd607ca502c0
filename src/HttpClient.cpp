#include "HttpClient.hpp"
#include "Logger.hpp"
#include <memory>
#include <mutex>
#include <curl/curl.h>

namespace revcheck {

namespace {
    struct CurlDeleter {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };
    using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

    struct CurlListDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
    using CurlListPtr = std::unique_ptr<curl_slist, CurlListDeleter>;

    std::once_flag curl_init_flag;

    struct ResponseBuffer {
        std::vector<uint8_t> data;
        size_t limit;
        bool overflow = false;
    };

    // CURL write callback
    size_t writeCallback(void* contents, size_t size, size_t nmemb, ResponseBuffer* userp) {
        size_t realsize = size * nmemb;
        if (userp->data.size() + realsize > userp->limit) {
            userp->overflow = true;
            return 0;
        }
        try {
            auto* bytes = static_cast<unsigned char*>(contents);
            userp->data.insert(userp->data.end(), bytes, bytes + realsize);
            return realsize;
        } catch(const std::bad_alloc&) {
            return 0;
        }
    }
}

CurlHttpClient::CurlHttpClient(std::chrono::seconds timeout, size_t maxResponseSize)
    : timeout_(timeout), max_response_size_(maxResponseSize) {
    std::call_once(curl_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

HttpResponse CurlHttpClient::get(const std::string& url) {
    return perform(url, nullptr, nullptr);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  std::string_view contentType,
                                  const std::vector<uint8_t>& body) {
    const std::string header = "Content-Type: " + std::string(contentType);
    return perform(url, &header, &body);
}

HttpResponse CurlHttpClient::perform(const std::string& url,
                                     const std::string* contentType,
                                     const std::vector<uint8_t>* body) {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        throw RevocationError(ErrorCode::TransportError, "Failed to initialize CURL");
    }

    ResponseBuffer response{{}, max_response_size_};
    CurlListPtr headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));

    if (body) {
        headers.reset(curl_slist_append(nullptr, contentType->c_str()));
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        if (response.overflow) {
            throw RevocationError(ErrorCode::TransportError,
                "Response from " + url + " exceeds " + std::to_string(max_response_size_) + " bytes");
        }
        throw RevocationError(ErrorCode::TransportError,
            std::string("CURL request to ") + url + " failed: " + curl_easy_strerror(res));
    }

    HttpResponse result;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
    result.body = std::move(response.data);

    Logger::logEvent(LogLevel::Debug,
        (body ? "POST " : "GET ") + url + " -> " + std::to_string(result.status) +
        " (" + std::to_string(result.body.size()) + " bytes)");
    return result;
}

} // namespace revcheck
