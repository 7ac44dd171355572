/**
 * @file openssl_transport_binding.h
 * @brief Binds the handshake orchestrator to OpenSSL client connections
 *
 * install() registers two callbacks on a client SSL_CTX:
 *   - certificate verify: converts the peer chain to CertificateModels and
 *     runs HandshakeSession::presentChainForValidation; a reject fails the
 *     handshake with X509_V_ERR_APPLICATION_VERIFICATION
 *   - client certificate: releases the identity only to accepted sessions
 *
 * attach() must be called on every SSL before SSL_connect; it creates the
 * per-connection session (held in SSL ex_data) and sets SNI. A connection
 * without a session is rejected.
 */

#pragma once

#include <optional>
#include <string>
#include <openssl/ssl.h>

#include "handshake_orchestrator.h"
#include "providers.h"
#include "types.h"

namespace certpin::pinning {

/**
 * @brief IClientIdentityConsumer installing the identity on an SSL
 */
class SslIdentityConsumer : public IClientIdentityConsumer {
public:
    explicit SslIdentityConsumer(SSL* ssl) : ssl_(ssl) {}

    /// @brief SSL_use_certificate + SSL_use_PrivateKey + chain certificates
    bool consumeClientIdentity(const ClientIdentity& identity) override;

private:
    SSL* ssl_;
};

class OpenSslHandshakeBinding {
public:
    /**
     * @brief Constructor
     * @param orchestrator Decision orchestrator (non-owning, must outlive every
     *        SSL_CTX the binding is installed on)
     * @param digest Digest used to model presented certificates; must match
     *        the pinning reference's digest
     * @throws std::invalid_argument if orchestrator is nullptr
     */
    OpenSslHandshakeBinding(const HandshakeDecisionOrchestrator* orchestrator,
                            ThumbprintDigest digest = ThumbprintDigest::SHA1);

    /**
     * @brief Install verify and client certificate callbacks
     *
     * The context keeps a raw pointer to this binding as the verify
     * callback argument. The binding must outlive ctx and every SSL
     * created from it; nothing unregisters the callbacks.
     *
     * @throws common::TransportException if ctx is nullptr
     */
    void install(SSL_CTX* ctx) const;

    /**
     * @brief Start a handshake session for a connection
     * @param ssl Client connection (before SSL_connect)
     * @param hostname Requested hostname (also sent as SNI)
     * @return false if the session or SNI could not be set
     */
    bool attach(SSL* ssl, const std::string& hostname) const;

    /// @brief Session attached to a connection, or nullptr
    static HandshakeSession* session(const SSL* ssl);

    /// @brief Outcome of the server validation for a connection, if it ran
    static std::optional<ValidationOutcome> outcome(const SSL* ssl);

private:
    static int verifyCallback(X509_STORE_CTX* storeCtx, void* arg);
    static int clientCertCallback(SSL* ssl, void* arg);

    const HandshakeDecisionOrchestrator* orchestrator_;
    ThumbprintDigest digest_;
};

} // namespace certpin::pinning
