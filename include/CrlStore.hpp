#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include <unordered_map>
#include "Certificate.hpp"
#include "HttpClient.hpp"
#include "IssuerResolver.hpp"
#include "RevocationList.hpp"

namespace revcheck {

using Clock = std::function<std::chrono::system_clock::time_point()>;

enum class CrlSource {
    Local,  // filesystem path
    Remote  // URL fetched over HttpClient
};

// Expiry-aware cache of parsed CRLs keyed by the URL or path they came from.
//
// The map is guarded by a mutex owned by the caller (the checker), which
// guards its own configuration with the same mutex. Fetching and parsing run
// without the lock held; only lookups and replacements take it.
class CrlStore {
public:
    CrlStore(std::mutex& stateMutex,
             std::shared_ptr<HttpClient> http,
             std::shared_ptr<IssuerResolver> issuers,
             Clock clock,
             bool requireVerifiedCrl = false);

    // True iff an entry exists and is still fresh. Expired entries are
    // dropped as a side effect.
    bool isCacheValid(const std::string& sourceKey);

    // Both return the list now in effect for the key: the fresh cached one,
    // or the one just fetched and stored.
    std::shared_ptr<const RevocationList> fetchLocal(const std::string& path, bool force);
    std::shared_ptr<const RevocationList> fetchRemote(const std::string& url,
                                                      const IssuerPtr& issuer,
                                                      bool force);

    // Loads the list if needed, then looks the serial up in it. The issuer is
    // only resolved when a remote list actually has to be fetched.
    bool isSerialRevoked(const Certificate& certificate,
                         const std::string& sourceKey,
                         CrlSource source);

    std::shared_ptr<const RevocationList> find(const std::string& sourceKey) const;
    size_t size() const;

    // Caller must hold the state mutex
    void evictLocked(const std::string& sourceKey);

private:
    // The cached list if it is still fresh. Expired entries are dropped.
    std::shared_ptr<const RevocationList> freshEntry(const std::string& sourceKey);
    void store(const std::string& sourceKey, std::shared_ptr<const RevocationList> list);

    std::mutex& mutex_;
    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<IssuerResolver> issuers_;
    Clock clock_;
    const bool require_verified_crl_;
    std::unordered_map<std::string, std::shared_ptr<const RevocationList>> crls_;
};

} // namespace revcheck
