/**
 * @file test_openssl_binding.cpp
 * @brief End-to-end mutual TLS handshakes over an in-memory BIO pair
 */

#include <gtest/gtest.h>
#include <certpin/pinning/client_identity_loader.h>
#include <certpin/pinning/openssl_trust_store.h>
#include <certpin/pinning/pinning_client.h>
#include "exceptions.h"
#include "test_helpers.h"
#include <openssl/err.h>

using namespace certpin::pinning;
using namespace test_helpers;

namespace {

/// Drive both ends until each completes or one fails hard
bool runHandshake(SSL* client, SSL* server) {
    bool clientDone = false;
    bool serverDone = false;

    for (int round = 0; round < 64 && !(clientDone && serverDone); round++) {
        if (!clientDone) {
            int ret = SSL_do_handshake(client);
            if (ret == 1) {
                clientDone = true;
            } else {
                int err = SSL_get_error(client, ret);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) return false;
            }
        }
        if (!serverDone) {
            int ret = SSL_do_handshake(server);
            if (ret == 1) {
                serverDone = true;
            } else {
                int err = SSL_get_error(server, ret);
                if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) return false;
            }
        }
    }
    ERR_clear_error();
    return clientDone && serverDone;
}

} // anonymous namespace

class OpenSslBindingTest : public ::testing::Test {
protected:
    TestPki serverPki_;
    TestClientIdentity clientId_;
    SSL_CTX* serverCtx_ = nullptr;
    SSL_CTX* clientCtx_ = nullptr;
    SSL* server_ = nullptr;
    SSL* client_ = nullptr;

    void SetUp() override {
        serverPki_ = TestPki::create("server.test");
        clientId_ = TestClientIdentity::create("client-secret", "device-0001");

        serverCtx_ = SSL_CTX_new(TLS_server_method());
        ASSERT_NE(serverCtx_, nullptr);
        ASSERT_EQ(SSL_CTX_use_certificate(serverCtx_, serverPki_.leaf.get()), 1);
        ASSERT_EQ(SSL_CTX_use_PrivateKey(serverCtx_, serverPki_.leafKey.get()), 1);
        ASSERT_EQ(SSL_CTX_add1_chain_cert(serverCtx_, serverPki_.intermediate.get()), 1);
        ASSERT_EQ(X509_STORE_add_cert(SSL_CTX_get_cert_store(serverCtx_), clientId_.ca.get()), 1);
        SSL_CTX_set_verify(serverCtx_, SSL_VERIFY_PEER | SSL_VERIFY_FAIL_IF_NO_PEER_CERT, nullptr);
    }

    void TearDown() override {
        SSL_free(client_);
        SSL_free(server_);
        SSL_CTX_free(clientCtx_);
        SSL_CTX_free(serverCtx_);
    }

    std::unique_ptr<PinningClient> makeClient(const CertificateModel& pinnedRoot) {
        PinningConfig config;
        config.serverCertReference = pinnedRoot.toBase64();
        config.clientPkcs12 = clientId_.bundle;
        config.clientPkcs12Passphrase = "client-secret";

        auto store = std::make_unique<OpenSslTrustStore>();
        store->addTrustAnchor(serverPki_.rootModel());
        return std::make_unique<PinningClient>(std::move(config), std::move(store));
    }

    /// Create both connections joined by a BIO pair
    void connect(const PinningClient& pinning) {
        clientCtx_ = pinning.createSslContext();
        client_ = SSL_new(clientCtx_);
        server_ = SSL_new(serverCtx_);
        ASSERT_NE(client_, nullptr);
        ASSERT_NE(server_, nullptr);

        BIO* clientBio = nullptr;
        BIO* serverBio = nullptr;
        ASSERT_EQ(BIO_new_bio_pair(&clientBio, 0, &serverBio, 0), 1);
        SSL_set_bio(client_, clientBio, clientBio);
        SSL_set_bio(server_, serverBio, serverBio);

        SSL_set_connect_state(client_);
        SSL_set_accept_state(server_);
    }

    std::string serverSeenClientCn() const {
        X509* peer = SSL_get0_peer_certificate(server_);
        if (!peer) return "";
        return toModel(peer).subjectCN();
    }
};

TEST_F(OpenSslBindingTest, PinnedRoot_HandshakeSucceeds) {
    auto pinning = makeClient(serverPki_.rootModel());
    connect(*pinning);
    ASSERT_TRUE(pinning->attach(client_, "server.test"));

    EXPECT_TRUE(runHandshake(client_, server_));

    auto outcome = OpenSslHandshakeBinding::outcome(client_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::ACCEPTED);
    ASSERT_TRUE(outcome->rootCertificate.has_value());
    EXPECT_EQ(outcome->rootCertificate->subjectCN(), "Example Root CA");

    EXPECT_EQ(serverSeenClientCn(), "device-0001");
    EXPECT_EQ(OpenSslHandshakeBinding::session(client_)->state(), HandshakeState::CLIENT_CERT_SUPPLIED);
}

TEST_F(OpenSslBindingTest, PinnedRoot_Tls12HandshakeSucceeds) {
    auto pinning = makeClient(serverPki_.rootModel());
    connect(*pinning);
    ASSERT_EQ(SSL_set_max_proto_version(client_, TLS1_2_VERSION), 1);
    ASSERT_TRUE(pinning->attach(client_, "server.test"));

    EXPECT_TRUE(runHandshake(client_, server_));
    EXPECT_EQ(SSL_version(client_), TLS1_2_VERSION);
    EXPECT_EQ(serverSeenClientCn(), "device-0001");
    EXPECT_TRUE(OpenSslHandshakeBinding::session(client_)->wasAccepted());
}

TEST_F(OpenSslBindingTest, OtherRootPinned_HandshakeFailsWithoutClientCert) {
    TestPki other = TestPki::create("server.test");
    auto pinning = makeClient(other.rootModel());
    connect(*pinning);
    ASSERT_TRUE(pinning->attach(client_, "server.test"));

    EXPECT_FALSE(runHandshake(client_, server_));

    auto outcome = OpenSslHandshakeBinding::outcome(client_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::REJECTED_PIN);
    EXPECT_EQ(outcome->pinField, PinField::THUMBPRINT);
    EXPECT_EQ(OpenSslHandshakeBinding::session(client_)->state(), HandshakeState::REJECTED);
    EXPECT_EQ(SSL_get0_peer_certificate(server_), nullptr);
}

TEST_F(OpenSslBindingTest, HostnameMismatch_HandshakeFails) {
    auto pinning = makeClient(serverPki_.rootModel());
    connect(*pinning);
    ASSERT_TRUE(pinning->attach(client_, "other.test"));

    EXPECT_FALSE(runHandshake(client_, server_));

    auto outcome = OpenSslHandshakeBinding::outcome(client_);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->kind, OutcomeKind::REJECTED_CHAIN);
    EXPECT_EQ(outcome->chainError, ChainError::HOSTNAME_MISMATCH);
    EXPECT_EQ(SSL_get0_peer_certificate(server_), nullptr);
}

TEST_F(OpenSslBindingTest, NotAttached_HandshakeFails) {
    auto pinning = makeClient(serverPki_.rootModel());
    connect(*pinning);

    EXPECT_FALSE(runHandshake(client_, server_));
    EXPECT_FALSE(OpenSslHandshakeBinding::outcome(client_).has_value());
    EXPECT_EQ(SSL_get0_peer_certificate(server_), nullptr);
}

TEST_F(OpenSslBindingTest, ReattachReplacesSession) {
    auto pinning = makeClient(serverPki_.rootModel());
    connect(*pinning);
    ASSERT_TRUE(pinning->attach(client_, "server.test"));

    HandshakeSession* first = OpenSslHandshakeBinding::session(client_);
    ASSERT_TRUE(pinning->attach(client_, "server.test"));
    EXPECT_NE(OpenSslHandshakeBinding::session(client_), first);
    EXPECT_EQ(OpenSslHandshakeBinding::session(client_)->state(), HandshakeState::AWAITING_SERVER_CERT);
}

TEST(OpenSslHandshakeBindingTest, NullOrchestratorThrows) {
    EXPECT_THROW(OpenSslHandshakeBinding(nullptr), std::invalid_argument);
}

TEST(SslIdentityConsumerTest, NullConnectionRefuses) {
    TestClientIdentity id = TestClientIdentity::create();
    auto loaded = ClientIdentityLoader::decode(id.bundle, "client-secret");
    ASSERT_TRUE(loaded.success);

    SslIdentityConsumer consumer(nullptr);
    EXPECT_FALSE(consumer.consumeClientIdentity(*loaded.identity));
}
