/**
 * @file handshake_orchestrator.cpp
 * @brief Handshake decision orchestrator and per-connection session
 *
 * Chain check always precedes the pin check; the pin is never evaluated
 * for a chain that failed. Every failure path ends in REJECTED, and the
 * client identity is only released from a session that passed both gates.
 */

#include "certpin/pinning/handshake_orchestrator.h"
#include "certpin/pinning/pin_matcher.h"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace certpin::pinning {

namespace {

ValidationOutcome aborted(std::string reason) {
    ValidationOutcome outcome;
    outcome.kind = OutcomeKind::ABORTED;
    outcome.reason = std::move(reason);
    return outcome;
}

bool isFinal(HandshakeState s) {
    return s == HandshakeState::REJECTED || s == HandshakeState::CLOSED;
}

} // anonymous namespace

// --- HandshakeDecisionOrchestrator ---

HandshakeDecisionOrchestrator::HandshakeDecisionOrchestrator(
    const ChainValidator* validator,
    std::optional<PinningReference> reference,
    std::shared_ptr<const ClientIdentity> identity,
    OrchestratorOptions options)
    : validator_(validator),
      reference_(std::move(reference)),
      identity_(std::move(identity)),
      options_(options)
{
    if (!validator_) {
        throw std::invalid_argument("HandshakeDecisionOrchestrator: validator cannot be nullptr");
    }
    if (!identity_) {
        throw std::invalid_argument("HandshakeDecisionOrchestrator: client identity cannot be nullptr");
    }

    if (reference_) {
        spdlog::debug("Pinning reference: {}", reference_->describe());
    } else if (options_.allowPinBootstrap) {
        spdlog::warn("No pinning reference configured: bootstrap mode, all handshakes will be rejected "
                     "and presented roots logged");
    } else {
        spdlog::warn("No pinning reference configured: all handshakes will be rejected");
    }
}

std::unique_ptr<HandshakeSession> HandshakeDecisionOrchestrator::beginHandshake() const {
    return std::unique_ptr<HandshakeSession>(new HandshakeSession(*this));
}

ValidationOutcome HandshakeDecisionOrchestrator::decide(
    const std::vector<CertificateModel>& chain,
    const std::string& hostname,
    std::chrono::system_clock::time_point now) const
{
    ValidationOutcome outcome;

    // Gate 1: chain
    ChainValidationResult chainResult = validator_->validate(chain, hostname, now);
    if (!chainResult.valid) {
        outcome.kind = OutcomeKind::REJECTED_CHAIN;
        outcome.chainError = chainResult.error;
        outcome.reason = chainResult.message;
        spdlog::warn("Handshake rejected for {}: chain {} ({})",
                     hostname, chainErrorToString(chainResult.error), chainResult.message);
        return outcome;
    }
    const CertificateModel& root = *chainResult.rootCertificate;

    // Gate 2: pin
    if (!reference_) {
        outcome.kind = OutcomeKind::REJECTED_PIN;
        outcome.pinField = PinField::REFERENCE;
        outcome.reason = "No pinning reference configured";
        if (options_.allowPinBootstrap) {
            spdlog::warn("Pin bootstrap for {}: presented root '{}' {}={} Base64 DER: {}",
                         hostname, root.subjectCN(), thumbprintDigestToString(root.digest()),
                         root.thumbprintHex(), root.toBase64());
        } else {
            spdlog::warn("Handshake rejected for {}: no pinning reference configured", hostname);
        }
        return outcome;
    }

    PinMatchResult pin = PinMatcher::matches(root, *reference_);
    if (!pin.matched) {
        outcome.kind = OutcomeKind::REJECTED_PIN;
        outcome.pinField = pin.field;
        outcome.reason = pin.message;
        spdlog::warn("Handshake rejected for {}: pin mismatch on {} ({})",
                     hostname, pinFieldToString(pin.field), pin.message);
        return outcome;
    }

    outcome.kind = OutcomeKind::ACCEPTED;
    outcome.rootCertificate = root;
    outcome.reason = pin.message;
    spdlog::info("Handshake accepted for {}: root '{}' matches pin", hostname, root.subjectCN());
    return outcome;
}

// --- HandshakeSession ---

HandshakeSession::HandshakeSession(const HandshakeDecisionOrchestrator& orchestrator)
    : orchestrator_(orchestrator)
{
}

ValidationOutcome HandshakeSession::presentChainForValidation(
    const std::vector<CertificateModel>& chain,
    const std::string& hostname,
    std::chrono::system_clock::time_point now)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != HandshakeState::AWAITING_SERVER_CERT) {
            std::string reason = "Server chain presented in state " + handshakeStateToString(state_);
            if (!isFinal(state_)) {
                transition(HandshakeState::REJECTED);
            }
            spdlog::warn("Handshake session for {}: {}", hostname, reason);
            return aborted(reason);
        }
        hostname_ = hostname;
        transition(HandshakeState::VALIDATING);
    }

    ValidationOutcome outcome = orchestrator_.decide(chain, hostname, now);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != HandshakeState::VALIDATING) {
        // Cancelled while the validators ran
        return aborted("Connection cancelled during validation");
    }
    if (outcome.accepted()) {
        transition(HandshakeState::ACCEPTED);
        accepted_ = true;
        transition(HandshakeState::AWAITING_CLIENT_CERT_REQUEST);
    } else {
        transition(HandshakeState::REJECTED);
    }
    return outcome;
}

std::shared_ptr<const ClientIdentity> HandshakeSession::getClientIdentity() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ == HandshakeState::AWAITING_CLIENT_CERT_REQUEST) {
        transition(HandshakeState::CLIENT_CERT_SUPPLIED);
        return orchestrator_.identity();
    }
    if (state_ == HandshakeState::CLIENT_CERT_SUPPLIED) {
        return orchestrator_.identity();
    }

    spdlog::warn("Client certificate requested for '{}' in state {}; withholding identity",
                 hostname_, handshakeStateToString(state_));
    if (!isFinal(state_)) {
        transition(HandshakeState::REJECTED);
    }
    return nullptr;
}

bool HandshakeSession::supplyClientIdentity(IClientIdentityConsumer& consumer) {
    std::shared_ptr<const ClientIdentity> identity = getClientIdentity();
    if (!identity) return false;

    if (!consumer.consumeClientIdentity(*identity)) {
        spdlog::error("Transport refused client identity for '{}'", hostname_);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isFinal(state_)) {
            transition(HandshakeState::CLOSED);
        }
        return false;
    }
    return true;
}

void HandshakeSession::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == HandshakeState::AWAITING_SERVER_CERT || state_ == HandshakeState::VALIDATING) {
        transition(HandshakeState::REJECTED);
    } else if (!isFinal(state_)) {
        transition(HandshakeState::CLOSED);
    }
}

void HandshakeSession::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isFinal(state_)) {
        transition(HandshakeState::CLOSED);
    }
}

HandshakeState HandshakeSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool HandshakeSession::wasAccepted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepted_;
}

void HandshakeSession::transition(HandshakeState next) {
    spdlog::debug("Handshake session '{}': {} -> {}", hostname_,
                  handshakeStateToString(state_), handshakeStateToString(next));
    state_ = next;
}

} // namespace certpin::pinning
