#include "CrlStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace revcheck {

namespace {
    std::vector<uint8_t> readAll(const std::string& path) {
        std::error_code ec;
        auto status = std::filesystem::status(path, ec);
        if (ec || !std::filesystem::exists(status)) {
            throw RevocationError(ErrorCode::IOError,
                "Failed to read local CRL path " + path +
                (ec ? ": " + ec.message() : ": no such file"));
        }
        if (std::filesystem::is_directory(status)) {
            throw RevocationError(ErrorCode::IOError,
                "Failed to read local CRL path " + path + ": is a directory");
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw RevocationError(ErrorCode::IOError,
                "Failed to read local CRL path " + path + ": cannot open file");
        }

        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw RevocationError(ErrorCode::IOError,
                "Failed to read local CRL path " + path + ": read error");
        }
        return data;
    }
}

CrlStore::CrlStore(std::mutex& stateMutex,
                   std::shared_ptr<HttpClient> http,
                   std::shared_ptr<IssuerResolver> issuers,
                   Clock clock,
                   bool requireVerifiedCrl)
    : mutex_(stateMutex),
      http_(std::move(http)),
      issuers_(std::move(issuers)),
      clock_(std::move(clock)),
      require_verified_crl_(requireVerifiedCrl) {
    if (!http_ || !issuers_) {
        throw std::invalid_argument("CrlStore requires an HTTP client and an issuer resolver");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

bool CrlStore::isCacheValid(const std::string& sourceKey) {
    return freshEntry(sourceKey) != nullptr;
}

std::shared_ptr<const RevocationList> CrlStore::freshEntry(const std::string& sourceKey) {
    const auto now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = crls_.find(sourceKey);
    if (it == crls_.end()) {
        return nullptr;
    }
    if (it->second && it->second->isFresh(now)) {
        return it->second;
    }

    crls_.erase(it);
    return nullptr;
}

std::shared_ptr<const RevocationList> CrlStore::fetchLocal(const std::string& path, bool force) {
    if (!force) {
        if (auto cached = freshEntry(path)) {
            return cached;
        }
    }

    std::shared_ptr<const RevocationList> list;
    try {
        list = RevocationList::parse(readAll(path));
    }
    catch (const RevocationError& e) {
        if (e.code() == ErrorCode::IOError) {
            throw;
        }
        throw RevocationError(e.code(),
            "Failed to parse local CRL file " + path + ": " + e.what());
    }

    store(path, list);
    Logger::logEvent(LogLevel::Info, "Loaded local CRL " + path);
    return list;
}

std::shared_ptr<const RevocationList> CrlStore::fetchRemote(const std::string& url,
                                                            const IssuerPtr& issuer,
                                                            bool force) {
    if (!force) {
        if (auto cached = freshEntry(url)) {
            return cached;
        }
    }

    HttpResponse response = http_->get(url);
    if (!response.isSuccess()) {
        throw RevocationError(ErrorCode::FetchError,
            "Failed to fetch CRL from " + url + ": HTTP status " +
            std::to_string(response.status));
    }

    std::shared_ptr<const RevocationList> list;
    try {
        list = RevocationList::parse(response.body);
    }
    catch (const RevocationError& e) {
        throw RevocationError(e.code(),
            "Failed to parse CRL from " + url + ": " + e.what());
    }

    if (issuer) {
        list->verifySignature(*issuer);
    } else if (require_verified_crl_) {
        throw RevocationError(ErrorCode::IssuerUnavailable,
            "Refusing unverified CRL from " + url + ": no issuer certificate");
    } else {
        Logger::logEvent(LogLevel::Warning,
            "Caching CRL from " + url + " without signature verification: no issuer certificate");
    }

    store(url, list);
    Logger::logEvent(LogLevel::Info, "Fetched CRL " + url);
    return list;
}

bool CrlStore::isSerialRevoked(const Certificate& certificate,
                               const std::string& sourceKey,
                               CrlSource source) {
    // Scan the list this call obtained. Going back to the map could find the
    // entry already evicted by a concurrent expiry check.
    std::shared_ptr<const RevocationList> list;
    if (source == CrlSource::Local) {
        list = fetchLocal(sourceKey, false);
    } else {
        list = freshEntry(sourceKey);
        if (!list) {
            list = fetchRemote(sourceKey, issuers_->resolveIssuer(certificate), true);
        }
    }

    const SerialNumber serial = certificate.serialNumber();
    if (list->contains(serial)) {
        Logger::logEvent(LogLevel::Info,
            "Serial number match in " + sourceKey + ": " + serial.toHex());
        return true;
    }
    return false;
}

std::shared_ptr<const RevocationList> CrlStore::find(const std::string& sourceKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = crls_.find(sourceKey);
    return it == crls_.end() ? nullptr : it->second;
}

size_t CrlStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return crls_.size();
}

void CrlStore::evictLocked(const std::string& sourceKey) {
    crls_.erase(sourceKey);
}

void CrlStore::store(const std::string& sourceKey, std::shared_ptr<const RevocationList> list) {
    // A list that is already stale still answers the check that fetched it.
    // The next lookup evicts it, so it is never served from the cache.
    if (!list->isFresh(clock_())) {
        const auto nextUpdate = list->nextUpdate();
        Logger::logEvent(LogLevel::Warning,
            "CRL from " + sourceKey + (nextUpdate
                ? " is already past its nextUpdate " + Utils::formatTime(*nextUpdate)
                : std::string(" has no nextUpdate")) +
            "; it will be refetched on the next check");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    crls_[sourceKey] = std::move(list);
}

} // namespace revcheck
