/**
 * @file pinning_client.cpp
 * @brief PinningClient composition
 */

#include "certpin/pinning/pinning_client.h"
#include "certpin/pinning/cert_ops.h"
#include "certpin/pinning/client_identity_loader.h"
#include "certpin/pinning/openssl_trust_store.h"
#include "config_manager.h"
#include "exceptions.h"
#include "shared/util/Base64Util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

namespace certpin::pinning {

namespace {

ThumbprintDigest parseDigest(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    name.erase(std::remove(name.begin(), name.end(), '-'), name.end());

    if (name.empty() || name == "sha1") return ThumbprintDigest::SHA1;
    if (name == "sha256") return ThumbprintDigest::SHA256;
    throw common::ConfigException("unsupported thumbprint digest '" + name + "' (expected sha1 or sha256)");
}

bool isBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::unique_ptr<ITrustStore> makeOpenSslTrustStore(const std::string& caFile) {
    auto store = std::make_unique<OpenSslTrustStore>();
    if (!caFile.empty()) {
        if (!store->loadCaFile(caFile)) {
            throw common::ConfigException("cannot load trust anchors from " + caFile);
        }
        spdlog::info("Trust anchors loaded from {} ({} certificates)", caFile, store->anchorCount());
    } else {
        if (!store->loadSystemDefaults()) {
            throw common::ConfigException("cannot load platform default trust anchors");
        }
        spdlog::info("Using platform default trust anchors");
    }
    return store;
}

} // anonymous namespace

// --- PinningConfig ---

PinningConfig PinningConfig::fromConfigManager(const common::ConfigManager& config) {
    using common::ConfigManager;

    PinningConfig result;
    result.serverCertReference = config.getString(ConfigManager::PIN_SERVER_CERT_REFERENCE);
    result.clientPkcs12Passphrase = config.getString(ConfigManager::PIN_CLIENT_PKCS12_PASSPHRASE);
    result.caFile = config.getString(ConfigManager::PIN_CA_FILE);
    result.digest = parseDigest(config.getString(ConfigManager::PIN_THUMBPRINT_DIGEST, "sha1"));
    result.allowPinBootstrap = config.getBool(ConfigManager::PIN_ALLOW_BOOTSTRAP, false);

    std::string bundle = config.getString(ConfigManager::PIN_CLIENT_PKCS12);
    try {
        result.clientPkcs12 = util::Base64Util::decode(bundle);
    } catch (const std::invalid_argument& e) {
        OPENSSL_cleanse(&bundle[0], bundle.size());
        throw common::ConfigException(std::string(ConfigManager::PIN_CLIENT_PKCS12) + " is not Base64: " + e.what());
    }
    if (!bundle.empty()) {
        OPENSSL_cleanse(&bundle[0], bundle.size());
    }
    return result;
}

// --- PinningClient ---

PinningClient::PinningClient(PinningConfig config)
{
    build(config);
}

PinningClient::PinningClient(PinningConfig config, std::unique_ptr<ITrustStore> trustStore)
    : trustStore_(std::move(trustStore))
{
    if (!trustStore_) {
        throw std::invalid_argument("PinningClient: trust store cannot be nullptr");
    }
    build(config);
}

void PinningClient::build(PinningConfig& config) {
    std::optional<PinningReference> reference;
    if (!isBlank(config.serverCertReference)) {
        reference = PinningReference::fromBase64Der(config.serverCertReference, config.digest);
    }

    ClientIdentityLoader loader(std::move(config.clientPkcs12),
                                std::move(config.clientPkcs12Passphrase),
                                config.digest);
    const IdentityLoadResult& loaded = loader.load();
    if (!loaded.success) {
        throw IdentityException(loaded.error, loaded.message);
    }

    // Platform anchors are only loaded once the identity is known good
    if (!trustStore_) {
        trustStore_ = makeOpenSslTrustStore(config.caFile);
    }

    validator_ = std::make_unique<ChainValidator>(trustStore_.get());

    OrchestratorOptions options;
    options.allowPinBootstrap = config.allowPinBootstrap;
    orchestrator_ = std::make_unique<HandshakeDecisionOrchestrator>(
        validator_.get(), std::move(reference), loaded.identity, options);

    binding_ = std::make_unique<OpenSslHandshakeBinding>(orchestrator_.get(), config.digest);
}

void PinningClient::configure(SSL_CTX* ctx) const {
    binding_->install(ctx);
}

SSL_CTX* PinningClient::createSslContext() const {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) {
        throw common::TransportException("SSL_CTX_new failed: " + drainOpenSslErrors());
    }
    if (SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION) != 1) {
        std::string err = drainOpenSslErrors();
        SSL_CTX_free(ctx);
        throw common::TransportException("Cannot set minimum TLS version: " + err);
    }
    binding_->install(ctx);
    return ctx;
}

bool PinningClient::attach(SSL* ssl, const std::string& hostname) const {
    return binding_->attach(ssl, hostname);
}

std::unique_ptr<HandshakeSession> PinningClient::beginHandshake() const {
    return orchestrator_->beginHandshake();
}

} // namespace certpin::pinning
