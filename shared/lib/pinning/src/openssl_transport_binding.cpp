/**
 * @file openssl_transport_binding.cpp
 * @brief OpenSSL client callbacks driving HandshakeSession
 */

#include "certpin/pinning/openssl_transport_binding.h"
#include "certpin/pinning/cert_ops.h"
#include "exceptions.h"

#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/err.h>
#include <openssl/x509_vfy.h>
#include <spdlog/spdlog.h>

namespace certpin::pinning {

namespace {

/// Per-connection data held in SSL ex_data, freed with the SSL
struct ConnectionState {
    std::unique_ptr<HandshakeSession> session;
    std::string hostname;
    std::optional<ValidationOutcome> outcome;
};

void freeConnectionState(void* /*parent*/, void* ptr, CRYPTO_EX_DATA* /*ad*/,
                         int /*idx*/, long /*argl*/, void* /*argp*/) {
    auto* state = static_cast<ConnectionState*>(ptr);
    if (!state) return;
    if (state->session) {
        state->session->close();
    }
    delete state;
}

int connectionStateIndex() {
    static const int index = SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, freeConnectionState);
    return index;
}

ConnectionState* stateOf(const SSL* ssl) {
    if (!ssl || connectionStateIndex() < 0) return nullptr;
    return static_cast<ConnectionState*>(SSL_get_ex_data(ssl, connectionStateIndex()));
}

/// Peer chain as sent (leaf first). Any certificate that cannot be modelled
/// yields an empty chain, which the validator rejects as malformed.
std::vector<CertificateModel> presentedChain(X509_STORE_CTX* storeCtx, ThumbprintDigest digest) {
    std::vector<X509*> certs;
    X509* leaf = X509_STORE_CTX_get0_cert(storeCtx);
    if (leaf) certs.push_back(leaf);

    STACK_OF(X509)* untrusted = X509_STORE_CTX_get0_untrusted(storeCtx);
    for (int i = 0; untrusted && i < sk_X509_num(untrusted); i++) {
        X509* cert = sk_X509_value(untrusted, i);
        if (leaf && X509_cmp(cert, leaf) == 0) continue;
        certs.push_back(cert);
    }

    std::vector<CertificateModel> chain;
    for (X509* cert : certs) {
        auto model = CertificateModel::fromX509(cert, static_cast<int>(chain.size()), digest);
        if (!model) {
            spdlog::warn("Presented certificate at index {} could not be parsed", chain.size());
            return {};
        }
        spdlog::debug("Presented [{}]: subject='{}' issuer='{}'",
                      chain.size(), model->subjectDn(), model->issuerDn());
        chain.push_back(std::move(*model));
    }
    return chain;
}

} // anonymous namespace

// --- SslIdentityConsumer ---

bool SslIdentityConsumer::consumeClientIdentity(const ClientIdentity& identity) {
    if (!ssl_) return false;

    if (SSL_use_certificate(ssl_, identity.certificate()) != 1 ||
        SSL_use_PrivateKey(ssl_, identity.privateKey()) != 1 ||
        SSL_clear_chain_certs(ssl_) != 1) {
        spdlog::error("Client identity could not be installed: {}", drainOpenSslErrors());
        return false;
    }
    for (const auto& ca : identity.caCertificates()) {
        if (SSL_add1_chain_cert(ssl_, ca.get()) != 1) {
            spdlog::error("Client chain certificate could not be installed: {}", drainOpenSslErrors());
            return false;
        }
    }
    if (SSL_check_private_key(ssl_) != 1) {
        spdlog::error("Client key does not match installed certificate: {}", drainOpenSslErrors());
        return false;
    }

    spdlog::debug("Client certificate supplied: subject='{}', {} chain certificates",
                  identity.leaf().subjectDn(), identity.caCertificates().size());
    return true;
}

// --- OpenSslHandshakeBinding ---

OpenSslHandshakeBinding::OpenSslHandshakeBinding(const HandshakeDecisionOrchestrator* orchestrator,
                                                 ThumbprintDigest digest)
    : orchestrator_(orchestrator), digest_(digest)
{
    if (!orchestrator_) {
        throw std::invalid_argument("OpenSslHandshakeBinding: orchestrator cannot be nullptr");
    }
}

void OpenSslHandshakeBinding::install(SSL_CTX* ctx) const {
    if (!ctx) {
        throw common::TransportException("Cannot install pinning callbacks on a null SSL_CTX");
    }
    if (connectionStateIndex() < 0) {
        throw common::TransportException("SSL ex_data index unavailable: " + drainOpenSslErrors());
    }

    SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_cert_verify_callback(ctx, &OpenSslHandshakeBinding::verifyCallback,
                                     const_cast<OpenSslHandshakeBinding*>(this));
    SSL_CTX_set_cert_cb(ctx, &OpenSslHandshakeBinding::clientCertCallback, nullptr);
}

bool OpenSslHandshakeBinding::attach(SSL* ssl, const std::string& hostname) const {
    if (!ssl || hostname.empty() || connectionStateIndex() < 0) {
        return false;
    }

    auto state = std::make_unique<ConnectionState>();
    state->session = orchestrator_->beginHandshake();
    state->hostname = hostname;

    if (SSL_set_tlsext_host_name(ssl, hostname.c_str()) != 1) {
        spdlog::error("Cannot set SNI '{}': {}", hostname, drainOpenSslErrors());
        return false;
    }

    ConnectionState* previous = stateOf(ssl);
    if (SSL_set_ex_data(ssl, connectionStateIndex(), state.get()) != 1) {
        spdlog::error("Cannot attach handshake session: {}", drainOpenSslErrors());
        return false;
    }
    state.release();
    if (previous) {
        freeConnectionState(nullptr, previous, nullptr, 0, 0, nullptr);
    }
    return true;
}

HandshakeSession* OpenSslHandshakeBinding::session(const SSL* ssl) {
    ConnectionState* state = stateOf(ssl);
    return state ? state->session.get() : nullptr;
}

std::optional<ValidationOutcome> OpenSslHandshakeBinding::outcome(const SSL* ssl) {
    ConnectionState* state = stateOf(ssl);
    if (!state) return std::nullopt;
    return state->outcome;
}

int OpenSslHandshakeBinding::verifyCallback(X509_STORE_CTX* storeCtx, void* arg) {
    const auto* binding = static_cast<const OpenSslHandshakeBinding*>(arg);
    auto* ssl = static_cast<SSL*>(
        X509_STORE_CTX_get_ex_data(storeCtx, SSL_get_ex_data_X509_STORE_CTX_idx()));

    ConnectionState* state = stateOf(ssl);
    if (!binding || !state || !state->session) {
        spdlog::error("Server certificate received on a connection without a pinning session");
        X509_STORE_CTX_set_error(storeCtx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }

    std::vector<CertificateModel> chain = presentedChain(storeCtx, binding->digest_);
    state->outcome = state->session->presentChainForValidation(chain, state->hostname);

    if (!state->outcome->accepted()) {
        X509_STORE_CTX_set_error(storeCtx, X509_V_ERR_APPLICATION_VERIFICATION);
        return 0;
    }
    X509_STORE_CTX_set_error(storeCtx, X509_V_OK);
    return 1;
}

int OpenSslHandshakeBinding::clientCertCallback(SSL* ssl, void* /*arg*/) {
    ConnectionState* state = stateOf(ssl);
    if (!state || !state->session) {
        spdlog::error("Client certificate requested on a connection without a pinning session");
        return 0;
    }

    SslIdentityConsumer consumer(ssl);
    return state->session->supplyClientIdentity(consumer) ? 1 : 0;
}

} // namespace certpin::pinning
