/**
 * @file pinning_client.h
 * @brief Pinning client facade: configuration to ready-to-use SSL_CTX
 *
 * Usage:
 * @code
 *   auto config = PinningConfig::fromConfigManager(ConfigManager::getInstance());
 *   PinningClient client(std::move(config));    // throws IdentityException
 *   SSL_CTX* ctx = client.createSslContext();
 *   SSL* ssl = SSL_new(ctx);
 *   client.attach(ssl, "api.example.com");
 *   // ... SSL_set_fd / SSL_connect ...
 * @endcode
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <openssl/ssl.h>

#include "chain_validator.h"
#include "client_identity.h"
#include "client_identity_loader.h"
#include "handshake_orchestrator.h"
#include "openssl_transport_binding.h"
#include "pinning_reference.h"
#include "providers.h"
#include "types.h"

namespace certpin::common {
class ConfigManager;
}

namespace certpin::pinning {

/// @brief Pinning client configuration
struct PinningConfig {
    std::string serverCertReference;      ///< Base64 DER root; empty = bootstrap mode
    std::vector<uint8_t> clientPkcs12;    ///< DER PKCS#12 bundle (secret)
    std::string clientPkcs12Passphrase;   ///< Bundle passphrase (secret)
    std::string caFile;                   ///< PEM trust anchors; empty = system defaults
    ThumbprintDigest digest = ThumbprintDigest::SHA1;
    bool allowPinBootstrap = false;

    /**
     * @brief Read the PIN_* keys
     * @throws common::ConfigException on invalid Base64 bundle or digest name
     */
    static PinningConfig fromConfigManager(const common::ConfigManager& config);
};

/**
 * @brief Composed pinning client
 *
 * Contexts configured by a client call back into its binding through a raw
 * pointer. The client must outlive every SSL_CTX it configured or created,
 * and every SSL made from those contexts.
 */
class PinningClient {
public:
    /**
     * @brief Build the client with an OpenSSL trust store
     *
     * Trust anchors come from config.caFile, or the platform defaults.
     *
     * @throws common::ParsingException if the reference cannot be decoded
     * @throws IdentityException if the client identity cannot be loaded
     * @throws common::ConfigException if the trust anchors cannot be loaded
     */
    explicit PinningClient(PinningConfig config);

    /**
     * @brief Build the client with a caller-supplied trust store
     * @throws std::invalid_argument if trustStore is nullptr
     */
    PinningClient(PinningConfig config, std::unique_ptr<ITrustStore> trustStore);

    PinningClient(const PinningClient&) = delete;
    PinningClient& operator=(const PinningClient&) = delete;

    /**
     * @brief Install the pinning callbacks on a client context
     *
     * ctx must be freed before this client is destroyed.
     *
     * @throws common::TransportException on a null context
     */
    void configure(SSL_CTX* ctx) const;

    /**
     * @brief New TLS client context with the pinning callbacks installed
     * @return Owned SSL_CTX (caller frees with SSL_CTX_free, before this
     *         client is destroyed)
     * @throws common::TransportException if the context cannot be created
     */
    SSL_CTX* createSslContext() const;

    /// @brief Start a handshake session on a connection (sets SNI)
    bool attach(SSL* ssl, const std::string& hostname) const;

    /// @brief Transport-independent session for a connection attempt
    std::unique_ptr<HandshakeSession> beginHandshake() const;

    const HandshakeDecisionOrchestrator& orchestrator() const { return *orchestrator_; }
    const ClientIdentity& identity() const { return *orchestrator_->identity(); }
    const std::optional<PinningReference>& reference() const { return orchestrator_->reference(); }

private:
    void build(PinningConfig& config);

    std::unique_ptr<ITrustStore> trustStore_;
    std::unique_ptr<ChainValidator> validator_;
    std::unique_ptr<HandshakeDecisionOrchestrator> orchestrator_;
    std::unique_ptr<OpenSslHandshakeBinding> binding_;
};

} // namespace certpin::pinning
