/**
 * @file handshake_orchestrator.h
 * @brief Handshake decision orchestration (chain gate, pin gate, client identity)
 *
 * One HandshakeDecisionOrchestrator per client, constructed with its
 * collaborators and handed to the transport adapter. Each connection
 * attempt gets its own HandshakeSession:
 *
 *   AWAITING_SERVER_CERT -> VALIDATING -> {ACCEPTED, REJECTED}
 *   ACCEPTED -> AWAITING_CLIENT_CERT_REQUEST -> CLIENT_CERT_SUPPLIED -> CLOSED
 *
 * REJECTED and CLOSED are final. Nothing is retried here.
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "certificate_model.h"
#include "chain_validator.h"
#include "client_identity.h"
#include "pinning_reference.h"
#include "providers.h"
#include "types.h"

namespace certpin::pinning {

/// @brief Per-handshake validation outcome
struct ValidationOutcome {
    OutcomeKind kind = OutcomeKind::ABORTED;
    std::optional<CertificateModel> rootCertificate;  ///< Set when ACCEPTED
    ChainError chainError = ChainError::NONE;         ///< Set when REJECTED_CHAIN
    PinField pinField = PinField::NONE;               ///< Set when REJECTED_PIN
    std::string reason;

    bool accepted() const { return kind == OutcomeKind::ACCEPTED; }
};

/// @brief Orchestrator options
struct OrchestratorOptions {
    /// Write the presented root (Base64 DER) to the warn log when no
    /// pinning reference is configured. The handshake is still rejected.
    bool allowPinBootstrap = false;
};

class HandshakeDecisionOrchestrator;

/**
 * @brief State machine for one connection attempt
 *
 * Thread-safe: the transport may cancel from another thread while the
 * validation callback runs.
 */
class HandshakeSession {
public:
    HandshakeSession(const HandshakeSession&) = delete;
    HandshakeSession& operator=(const HandshakeSession&) = delete;

    /**
     * @brief "Received server certificate" step
     *
     * Runs ChainValidator, then (only on success) PinMatcher. Valid once;
     * any call outside AWAITING_SERVER_CERT is rejected.
     */
    ValidationOutcome presentChainForValidation(
        const std::vector<CertificateModel>& chain,
        const std::string& hostname,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief "Server requests client certificate" step
     * @return The pre-loaded identity, or nullptr unless the server was accepted
     */
    std::shared_ptr<const ClientIdentity> getClientIdentity();

    /**
     * @brief Hand the identity to a transport consumer
     * @return true if the session was accepted and the consumer took the identity
     */
    bool supplyClientIdentity(IClientIdentityConsumer& consumer);

    /// @brief Connection cancelled or timed out; never leaves the session accepted
    void cancel();

    /// @brief Connection finished or torn down
    void close();

    HandshakeState state() const;

    /// @brief True once both gates passed (even after CLOSED)
    bool wasAccepted() const;

    const std::string& hostname() const { return hostname_; }

private:
    friend class HandshakeDecisionOrchestrator;
    explicit HandshakeSession(const HandshakeDecisionOrchestrator& orchestrator);

    void transition(HandshakeState next);

    const HandshakeDecisionOrchestrator& orchestrator_;
    mutable std::mutex mutex_;
    HandshakeState state_ = HandshakeState::AWAITING_SERVER_CERT;
    bool accepted_ = false;
    std::string hostname_;
};

class HandshakeDecisionOrchestrator {
public:
    /**
     * @brief Constructor
     * @param validator Chain validator (non-owning, must outlive the orchestrator)
     * @param reference Pinned reference; std::nullopt puts the client in
     *        bootstrap mode where every handshake is rejected
     * @param identity Client identity loaded once at client construction
     * @param options Orchestrator options
     * @throws std::invalid_argument if validator or identity is null
     */
    HandshakeDecisionOrchestrator(const ChainValidator* validator,
                                  std::optional<PinningReference> reference,
                                  std::shared_ptr<const ClientIdentity> identity,
                                  OrchestratorOptions options = OrchestratorOptions());

    /// @brief New session for a connection attempt
    std::unique_ptr<HandshakeSession> beginHandshake() const;

    /**
     * @brief Stateless decision (chain gate then pin gate)
     *
     * Same logic the sessions use; exposed for transports that only need
     * a boolean verify callback.
     */
    ValidationOutcome decide(const std::vector<CertificateModel>& chain,
                             const std::string& hostname,
                             std::chrono::system_clock::time_point now) const;

    const std::optional<PinningReference>& reference() const { return reference_; }
    const std::shared_ptr<const ClientIdentity>& identity() const { return identity_; }
    const OrchestratorOptions& options() const { return options_; }

private:
    const ChainValidator* validator_;
    std::optional<PinningReference> reference_;
    std::shared_ptr<const ClientIdentity> identity_;
    OrchestratorOptions options_;
};

} // namespace certpin::pinning
