/**
 * @file test_client_identity_loader.cpp
 * @brief Unit tests for ClientIdentityLoader: PKCS#12 decoding and caching
 */

#include <gtest/gtest.h>
#include <certpin/pinning/client_identity_loader.h>
#include "test_helpers.h"

#include <thread>

using namespace certpin::pinning;
using namespace test_helpers;

class ClientIdentityLoaderTest : public ::testing::Test {
protected:
    TestClientIdentity client_;

    void SetUp() override {
        client_ = TestClientIdentity::create("client-secret", "device-0001");
    }
};

// ============================================================================
// Successful decode
// ============================================================================

TEST_F(ClientIdentityLoaderTest, Decode_KeyCertAndChain) {
    auto result = ClientIdentityLoader::decode(client_.bundle, "client-secret");
    ASSERT_TRUE(result.success) << result.message;
    ASSERT_TRUE(result.identity);
    EXPECT_EQ(result.error, IdentityError::NONE);
    EXPECT_EQ(result.keyBagCount, 1);

    const ClientIdentity& id = *result.identity;
    EXPECT_EQ(X509_cmp(id.certificate(), client_.cert.get()), 0);
    EXPECT_EQ(EVP_PKEY_eq(id.privateKey(), client_.key.get()), 1);
    ASSERT_EQ(id.caCertificates().size(), 1u);
    EXPECT_EQ(X509_cmp(id.caCertificates()[0].get(), client_.ca.get()), 0);

    ASSERT_EQ(id.certificateChain().size(), 2u);
    EXPECT_EQ(id.leaf().subjectCN(), "device-0001");
    EXPECT_EQ(id.certificateChain()[0].chainIndex(), 0);
    EXPECT_EQ(id.certificateChain()[1].chainIndex(), 1);
    EXPECT_EQ(id.certificateChain()[1].subjectCN(), "Example Client CA");
}

TEST_F(ClientIdentityLoaderTest, Decode_WithoutCaCertificates) {
    auto bundle = createPkcs12(client_.key.get(), client_.cert.get(), {}, "pw");
    auto result = ClientIdentityLoader::decode(bundle, "pw");
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(result.identity->caCertificates().empty());
    EXPECT_EQ(result.identity->certificateChain().size(), 1u);
}

TEST_F(ClientIdentityLoaderTest, Decode_EmptyPassphrase) {
    auto bundle = createPkcs12(client_.key.get(), client_.cert.get(), {}, "");
    auto result = ClientIdentityLoader::decode(bundle, "");
    EXPECT_TRUE(result.success) << result.message;
}

TEST_F(ClientIdentityLoaderTest, Decode_Sha256ChainModels) {
    auto result = ClientIdentityLoader::decode(client_.bundle, "client-secret", ThumbprintDigest::SHA256);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.identity->leaf().digest(), ThumbprintDigest::SHA256);
    EXPECT_EQ(result.identity->leaf().thumbprint().size(), 32u);
}

TEST_F(ClientIdentityLoaderTest, Decode_LegacyRc2TripleDesBundle) {
    auto bundle = createLegacyPkcs12(client_.key.get(), client_.cert.get(), {client_.ca.get()},
                                     "client-secret");
    if (bundle.empty()) {
        GTEST_SKIP() << "OpenSSL legacy provider not installed";
    }

    auto result = ClientIdentityLoader::decode(bundle, "client-secret");
    ASSERT_TRUE(result.success) << identityErrorToString(result.error) << ": " << result.message;
    EXPECT_EQ(X509_cmp(result.identity->certificate(), client_.cert.get()), 0);
    EXPECT_EQ(EVP_PKEY_eq(result.identity->privateKey(), client_.key.get()), 1);
    ASSERT_EQ(result.identity->caCertificates().size(), 1u);
    EXPECT_EQ(result.identity->leaf().subjectCN(), "device-0001");
}

TEST_F(ClientIdentityLoaderTest, Decode_LegacyBundleWrongPassphrase) {
    auto bundle = createLegacyPkcs12(client_.key.get(), client_.cert.get(), {}, "client-secret");
    if (bundle.empty()) {
        GTEST_SKIP() << "OpenSSL legacy provider not installed";
    }

    auto result = ClientIdentityLoader::decode(bundle, "wrong");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IdentityError::BAD_PASSPHRASE);
}

// ============================================================================
// Failure classes
// ============================================================================

TEST_F(ClientIdentityLoaderTest, Decode_WrongPassphrase) {
    auto result = ClientIdentityLoader::decode(client_.bundle, "wrong-secret");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IdentityError::BAD_PASSPHRASE);
    EXPECT_FALSE(result.identity);
}

TEST_F(ClientIdentityLoaderTest, Decode_WrongPassphraseWithoutMac) {
    auto bundle = buildPkcs12({{client_.key.get(), "k1"}}, {{client_.cert.get(), "k1"}}, "right", false);
    auto result = ClientIdentityLoader::decode(bundle, "wrong");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IdentityError::BAD_PASSPHRASE);
}

TEST_F(ClientIdentityLoaderTest, Decode_EmptyInputMalformed) {
    auto result = ClientIdentityLoader::decode({}, "client-secret");
    EXPECT_EQ(result.error, IdentityError::MALFORMED);
}

TEST_F(ClientIdentityLoaderTest, Decode_GarbageMalformed) {
    std::vector<uint8_t> garbage(256, 0xA5);
    auto result = ClientIdentityLoader::decode(garbage, "client-secret");
    EXPECT_EQ(result.error, IdentityError::MALFORMED);
}

TEST_F(ClientIdentityLoaderTest, Decode_TruncatedMalformed) {
    auto bundle = client_.bundle;
    bundle.resize(bundle.size() / 2);
    auto result = ClientIdentityLoader::decode(bundle, "client-secret");
    EXPECT_EQ(result.error, IdentityError::MALFORMED);
}

TEST_F(ClientIdentityLoaderTest, Decode_CertificateOnlyHasNoIdentity) {
    auto bundle = createPkcs12(nullptr, client_.cert.get(), {}, "pw");
    auto result = ClientIdentityLoader::decode(bundle, "pw");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IdentityError::NO_IDENTITY);
}

TEST_F(ClientIdentityLoaderTest, Decode_KeyWithoutMatchingCertificate) {
    auto otherKey = generateEcKey();
    auto bundle = buildPkcs12({{otherKey.get(), "k1"}}, {{client_.cert.get(), "k2"}}, "pw");
    auto result = ClientIdentityLoader::decode(bundle, "pw");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, IdentityError::NO_IDENTITY);
}

// ============================================================================
// Selection
// ============================================================================

TEST_F(ClientIdentityLoaderTest, Select_CertificateByPublicKeyWithoutLocalKeyId) {
    auto bundle = buildPkcs12({{client_.key.get(), ""}},
                              {{client_.ca.get(), ""}, {client_.cert.get(), ""}}, "pw");
    auto result = ClientIdentityLoader::decode(bundle, "pw");
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(X509_cmp(result.identity->certificate(), client_.cert.get()), 0);
    ASSERT_EQ(result.identity->caCertificates().size(), 1u);
}

TEST_F(ClientIdentityLoaderTest, Select_FirstKeyWinsInMultiIdentityBundle) {
    auto second = TestClientIdentity::create("x", "device-0002");
    auto bundle = buildPkcs12(
        {{client_.key.get(), "first"}, {second.key.get(), "second"}},
        {{second.cert.get(), "second"}, {client_.cert.get(), "first"}, {client_.ca.get(), ""}},
        "pw");

    auto result = ClientIdentityLoader::decode(bundle, "pw");
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.keyBagCount, 2);
    EXPECT_EQ(result.identity->leaf().subjectCN(), "device-0001");

    // The other identity's certificate is not part of the chain
    ASSERT_EQ(result.identity->caCertificates().size(), 1u);
    EXPECT_EQ(X509_cmp(result.identity->caCertificates()[0].get(), client_.ca.get()), 0);
}

TEST_F(ClientIdentityLoaderTest, Select_Deterministic) {
    auto second = TestClientIdentity::create("x", "device-0002");
    auto bundle = buildPkcs12(
        {{second.key.get(), "b"}, {client_.key.get(), "a"}},
        {{client_.cert.get(), "a"}, {second.cert.get(), "b"}},
        "pw");

    for (int i = 0; i < 3; i++) {
        auto result = ClientIdentityLoader::decode(bundle, "pw");
        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.identity->leaf().subjectCN(), "device-0002");
    }
}

// ============================================================================
// Compute-once
// ============================================================================

TEST_F(ClientIdentityLoaderTest, Load_CachesResult) {
    ClientIdentityLoader loader(client_.bundle, "client-secret");
    EXPECT_EQ(loader.decodeCount(), 0);

    const auto& first = loader.load();
    const auto& second = loader.load();
    ASSERT_TRUE(first.success);
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.identity.get(), second.identity.get());
    EXPECT_EQ(loader.decodeCount(), 1);
}

TEST_F(ClientIdentityLoaderTest, Load_CachesFailure) {
    ClientIdentityLoader loader(client_.bundle, "wrong-secret");
    EXPECT_EQ(loader.load().error, IdentityError::BAD_PASSPHRASE);
    EXPECT_EQ(loader.load().error, IdentityError::BAD_PASSPHRASE);
    EXPECT_EQ(loader.decodeCount(), 1);
}

TEST_F(ClientIdentityLoaderTest, Load_ConcurrentCallersDecodeOnce) {
    ClientIdentityLoader loader(client_.bundle, "client-secret");

    std::vector<const ClientIdentity*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); i++) {
        threads.emplace_back([&loader, &seen, i]() {
            seen[i] = loader.load().identity.get();
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(loader.decodeCount(), 1);
    ASSERT_NE(seen[0], nullptr);
    for (const auto* id : seen) {
        EXPECT_EQ(id, seen[0]);
    }
}

// ============================================================================
// ClientIdentity
// ============================================================================

TEST_F(ClientIdentityLoaderTest, Identity_RejectsMismatchedKey) {
    auto otherKey = generateEcKey();
    UniqueX509 cert(X509_dup(client_.cert.get()));
    EXPECT_THROW(ClientIdentity(std::move(otherKey), std::move(cert), {}), std::invalid_argument);
}

TEST_F(ClientIdentityLoaderTest, Identity_RejectsNullParts) {
    EXPECT_THROW(ClientIdentity(UniquePKey(), UniqueX509(), {}), std::invalid_argument);
}
