#include <gtest/gtest.h>

#include <thread>

#include "RevocationChecker.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

using namespace revcheck;
using namespace test_helpers;

namespace {
    const std::string CRL_URL = "http://ca.example/root.crl";
    const std::string BACKUP_CRL_URL = "http://backup.example/root.crl";
    const std::string LDAP_CRL_URL = "ldap://dir.example/cn=Test%20CA?certificateRevocationList";
    const std::string ISSUER_URL = "http://ca.example/root.der";
    const std::string OCSP_URL = "http://ocsp.example";

    const RevocationResult SOFT_FAILURE{false, false};
    const RevocationResult HARD_FAILURE{true, false};
}

class RevocationCheckerTest : public ::testing::Test {
protected:
    void SetUp() override {
        leaf.crlUrls = {CRL_URL};
        leaf.issuerUrls = {ISSUER_URL};
        http->respond(ISSUER_URL, 200, toDer(pki.ca.get()));
    }

    RevocationChecker& makeChecker(CheckerOptions options = {}) {
        checker = std::make_unique<RevocationChecker>(options, http, clock.clock());
        return *checker;
    }

    std::vector<uint8_t> crlRevoking(std::vector<uint64_t> serials) {
        CrlProfile profile;
        profile.revokedSerials = std::move(serials);
        return pki.crl(profile);
    }

    TestPki pki;
    ManualClock clock;
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::unique_ptr<RevocationChecker> checker;
    FakeCertificate leaf;
};

TEST_F(RevocationCheckerTest, ExpiredCertificateIsRevokedWithoutNetwork) {
    auto& c = makeChecker();
    leaf.validUntil = fixedTime();
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());

    leaf.validUntil = fixedTime() - 1h;
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(RevocationCheckerTest, NotYetValidCertificateIsRevoked) {
    auto& c = makeChecker();
    leaf.validFrom = fixedTime() + 1h;
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(RevocationCheckerTest, NoDistributionPointsMeansGood) {
    auto& c = makeChecker({true, false});
    leaf.crlUrls.clear();
    // OCSP is only consulted alongside a distribution point
    leaf.ocspUrls = {OCSP_URL};

    EXPECT_EQ(c.check(leaf), RevocationResult::good());
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(RevocationCheckerTest, ListedSerialIsRevoked) {
    auto& c = makeChecker();
    http->respond(CRL_URL, 200, crlRevoking({99, 100}));
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());

    leaf.serial = SerialNumber::fromUint64(101);
    EXPECT_EQ(c.check(leaf), RevocationResult::good());
}

TEST_F(RevocationCheckerTest, CachedListIsNotRefetched) {
    auto& c = makeChecker();
    http->respond(CRL_URL, 200, crlRevoking({}));

    EXPECT_EQ(c.check(leaf), RevocationResult::good());
    EXPECT_EQ(c.check(leaf), RevocationResult::good());
    EXPECT_EQ(http->fetchCount(CRL_URL), 1);

    clock.advance(std::chrono::hours(8 * 24));
    leaf.validUntil = fixedTime() + std::chrono::hours(30 * 24);
    EXPECT_EQ(c.check(leaf), RevocationResult::good());
    EXPECT_EQ(http->fetchCount(CRL_URL), 2);
}

TEST_F(RevocationCheckerTest, FailureFollowsHardFailPolicy) {
    auto& c = makeChecker();
    http->failTransport(CRL_URL);

    EXPECT_FALSE(c.isHardFail());
    EXPECT_EQ(c.check(leaf), SOFT_FAILURE);

    c.setHardFail(true);
    EXPECT_TRUE(c.isHardFail());
    EXPECT_EQ(c.check(leaf), HARD_FAILURE);

    http->respond(CRL_URL, 500);
    EXPECT_EQ(c.check(leaf), HARD_FAILURE);

    c.setHardFail(false);
    EXPECT_EQ(c.check(leaf), SOFT_FAILURE);
}

TEST_F(RevocationCheckerTest, FirstFailingPointEndsCheck) {
    auto& c = makeChecker();
    leaf.crlUrls = {CRL_URL, BACKUP_CRL_URL};
    http->respond(CRL_URL, 404);
    http->respond(BACKUP_CRL_URL, 200, crlRevoking({100}));

    EXPECT_EQ(c.check(leaf), SOFT_FAILURE);
    EXPECT_EQ(http->fetchCount(BACKUP_CRL_URL), 0);
}

TEST_F(RevocationCheckerTest, LdapPointIsSkipped) {
    auto& c = makeChecker({true, false});
    leaf.crlUrls = {LDAP_CRL_URL, CRL_URL};
    http->respond(CRL_URL, 200, crlRevoking({100}));

    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_EQ(http->fetchCount(LDAP_CRL_URL), 0);
}

TEST_F(RevocationCheckerTest, OnlyLdapPointsMeansGood) {
    auto& c = makeChecker({true, false});
    leaf.crlUrls = {LDAP_CRL_URL};
    EXPECT_EQ(c.check(leaf), RevocationResult::good());
    EXPECT_TRUE(http->requests().empty());
}

TEST_F(RevocationCheckerTest, ForgedListFailsCheck) {
    auto& c = makeChecker();
    CrlProfile profile;
    profile.revokedSerials = {100};
    http->respond(CRL_URL, 200, pki.forgedCrl(profile));

    EXPECT_EQ(c.check(leaf), SOFT_FAILURE);
    c.setHardFail(true);
    EXPECT_EQ(c.check(leaf), HARD_FAILURE);
}

TEST_F(RevocationCheckerTest, UnverifiableListPolicy) {
    leaf.issuerUrls.clear();
    http->respond(CRL_URL, 200, crlRevoking({100}));

    EXPECT_EQ(makeChecker().check(leaf), RevocationResult::revokedResult());
    EXPECT_EQ(makeChecker({false, true}).check(leaf), SOFT_FAILURE);
    EXPECT_EQ(makeChecker({true, true}).check(leaf), HARD_FAILURE);
}

TEST_F(RevocationCheckerTest, PinnedLocalListIsConsultedFirst) {
    auto& c = makeChecker();
    TempFile local(crlRevoking({100}));
    http->respond(CRL_URL, 200, crlRevoking({}));

    c.setLocalCRL(local.path());
    EXPECT_EQ(c.localCRL(), local.path());
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_EQ(http->fetchCount(CRL_URL), 0);

    c.setLocalCRL("");
    EXPECT_EQ(c.localCRL(), "");
    EXPECT_EQ(c.crlStore().find(local.path()), nullptr);
    EXPECT_EQ(c.check(leaf), RevocationResult::good());
    EXPECT_EQ(http->fetchCount(CRL_URL), 1);
}

TEST_F(RevocationCheckerTest, CleanLocalListFallsThroughToRemote) {
    auto& c = makeChecker();
    TempFile local(crlRevoking({7}));
    http->respond(CRL_URL, 200, crlRevoking({100}));

    c.setLocalCRL(local.path());
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_EQ(http->fetchCount(CRL_URL), 1);
}

TEST_F(RevocationCheckerTest, LocalListAcceptsFileUri) {
    auto& c = makeChecker();
    TempFile local(crlRevoking({100}));
    c.setLocalCRL("file://" + local.path());
    EXPECT_EQ(c.localCRL(), local.path());
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
}

TEST_F(RevocationCheckerTest, LocalListRejectsNetworkSchemes) {
    auto& c = makeChecker();
    for (const std::string& uri : {CRL_URL, LDAP_CRL_URL, std::string("https://ca.example/x.crl")}) {
        try {
            c.setLocalCRL(uri);
            FAIL() << "Expected RevocationError for " << uri;
        }
        catch (const RevocationError& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidConfiguration);
        }
    }
    EXPECT_EQ(c.localCRL(), "");
}

TEST_F(RevocationCheckerTest, UnusableLocalListKeepsPreviousPin) {
    auto& c = makeChecker();
    TempFile good(crlRevoking({100}));
    TempFile bad({'b', 'a', 'd'});
    c.setLocalCRL(good.path());

    EXPECT_THROW(c.setLocalCRL(bad.path()), RevocationError);
    EXPECT_THROW(c.setLocalCRL("/nonexistent/revcheck/none.crl"), RevocationError);
    EXPECT_EQ(c.localCRL(), good.path());
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
}

TEST_F(RevocationCheckerTest, RepinningReplacesOldEntry) {
    auto& c = makeChecker();
    TempFile first(crlRevoking({100}));
    TempFile second(crlRevoking({}));
    http->respond(CRL_URL, 200, crlRevoking({}));

    c.setLocalCRL(first.path());
    c.setLocalCRL(second.path());
    EXPECT_EQ(c.crlStore().find(first.path()), nullptr);
    EXPECT_EQ(c.check(leaf), RevocationResult::good());
}

TEST_F(RevocationCheckerTest, LocalListErrorFollowsPolicy) {
    auto& c = makeChecker({true, false});
    {
        TempFile local(crlRevoking({}));
        c.setLocalCRL(local.path());
    }
    // Past nextUpdate the file has to be reread, and it is gone
    clock.advance(std::chrono::hours(8 * 24));
    EXPECT_EQ(c.check(leaf), HARD_FAILURE);
    EXPECT_EQ(http->fetchCount(CRL_URL), 0);
}

TEST_F(RevocationCheckerTest, OcspRevocationAfterCleanList) {
    auto& c = makeChecker();
    leaf.ocspUrls = {OCSP_URL};
    http->respond(CRL_URL, 200, crlRevoking({}));
    http->respond(OCSP_URL + "/", 200,
        makeOcspResponse(pki.ca.get(), pki.ca.get(), pki.caKey.get(), 100, V_OCSP_CERTSTATUS_REVOKED));

    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
}

TEST_F(RevocationCheckerTest, OcspGoodAfterCleanList) {
    auto& c = makeChecker({true, false});
    leaf.ocspUrls = {OCSP_URL};
    http->respond(CRL_URL, 200, crlRevoking({}));
    http->respond(OCSP_URL + "/", 200,
        makeOcspResponse(pki.ca.get(), pki.ca.get(), pki.caKey.get(), 100, V_OCSP_CERTSTATUS_GOOD));

    EXPECT_EQ(c.check(leaf), RevocationResult::good());
}

TEST_F(RevocationCheckerTest, OcspFailureFollowsPolicy) {
    auto& c = makeChecker();
    leaf.ocspUrls = {OCSP_URL};
    http->respond(CRL_URL, 200, crlRevoking({}));
    http->respond(OCSP_URL + "/", 200, makeOcspErrorResponse(OCSP_RESPONSE_STATUS_INTERNALERROR));

    EXPECT_EQ(c.check(leaf), SOFT_FAILURE);
    c.setHardFail(true);
    EXPECT_EQ(c.check(leaf), HARD_FAILURE);
}

TEST_F(RevocationCheckerTest, RefreshPreloadsCache) {
    auto& c = makeChecker();
    http->respond(CRL_URL, 200, crlRevoking({100}));

    c.refreshCRL(CRL_URL, pki.issuer(), false);
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_EQ(http->fetchCount(CRL_URL), 1);
    EXPECT_EQ(http->fetchCount(ISSUER_URL), 0);

    http->respond(CRL_URL, 503);
    EXPECT_THROW(c.refreshCRL(CRL_URL, pki.issuer(), true), RevocationError);
}

TEST_F(RevocationCheckerTest, ChecksRealCertificate) {
    auto& c = makeChecker();
    KeyPtr leafKey = generateKey();
    CertProfile profile;
    profile.serial = 0x1234;
    profile.crlUrls = {LDAP_CRL_URL, CRL_URL};
    profile.issuerUrls = {ISSUER_URL};
    auto cert = X509Certificate::parse(
        toDer(makeCertificate(profile, leafKey.get(), pki.ca.get(), pki.caKey.get()).get()));

    http->respond(CRL_URL, 200, crlRevoking({0x1234}));
    EXPECT_EQ(c.check(*cert), RevocationResult::revokedResult());
}

TEST_F(RevocationCheckerTest, ConcurrentChecksAgree) {
    auto& c = makeChecker();
    http->respond(CRL_URL, 200, crlRevoking({100}));

    std::vector<std::thread> threads;
    std::atomic<int> revoked{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 10; ++j) {
                if (c.check(leaf) == RevocationResult::revokedResult()) {
                    ++revoked;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(revoked.load(), 80);
    EXPECT_EQ(c.crlStore().size(), 1u);
}

TEST_F(RevocationCheckerTest, UncacheableListNeverFailsConcurrentChecks) {
    auto& c = makeChecker({true, false});
    CrlProfile profile;
    profile.revokedSerials = {7};
    profile.nextUpdate.reset();
    http->respond(CRL_URL, 200, pki.crl(profile));

    std::vector<std::thread> threads;
    std::atomic<int> good{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 200; ++j) {
                if (c.check(leaf) == RevocationResult::good()) {
                    ++good;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(good.load(), 1600);
}

TEST_F(RevocationCheckerTest, FarFutureExpiryIsNotTreatedAsExpired) {
    auto& c = makeChecker({true, false});
    KeyPtr leafKey = generateKey();
    CertProfile profile;
    profile.notAfterText = "99991231235959Z";
    auto cert = X509Certificate::parse(
        toDer(makeCertificate(profile, leafKey.get(), pki.ca.get(), pki.caKey.get()).get()));

    EXPECT_EQ(cert->notAfter(), Utils::TimePoint::max());
    EXPECT_EQ(c.check(*cert), RevocationResult::good());

    profile.crlUrls = {CRL_URL};
    profile.issuerUrls = {ISSUER_URL};
    cert = X509Certificate::parse(
        toDer(makeCertificate(profile, leafKey.get(), pki.ca.get(), pki.caKey.get()).get()));
    http->respond(CRL_URL, 200, crlRevoking({}));
    EXPECT_EQ(c.check(*cert), RevocationResult::good());
}

TEST_F(RevocationCheckerTest, RevocationsAreLoggedWithTheirCode) {
    auto& c = makeChecker();
    http->respond(CRL_URL, 200, crlRevoking({100}));

    LogCapture log;
    EXPECT_EQ(c.check(leaf), RevocationResult::revokedResult());
    EXPECT_TRUE(log.contains("[SECURITY]"));
    EXPECT_TRUE(log.contains("Certificate Revoked: " + leaf.subjectName()));
    EXPECT_TRUE(log.contains("by CRL '" + CRL_URL + "'"));
}

TEST_F(RevocationCheckerTest, ChecksRacingRepinLeaveNoStrayEntries) {
    auto& c = makeChecker();
    leaf.crlUrls.clear();
    TempFile first(crlRevoking({100}));
    TempFile second(crlRevoking({}));
    c.setLocalCRL(first.path());

    std::atomic<bool> done{false};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            while (!done) {
                if (!c.check(leaf).ok) {
                    ++failures;
                }
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        c.setLocalCRL(i % 2 ? first.path() : second.path());
    }
    done = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_LE(c.crlStore().size(), 1u);
    c.setLocalCRL("");
    EXPECT_EQ(c.crlStore().size(), 0u);
}
