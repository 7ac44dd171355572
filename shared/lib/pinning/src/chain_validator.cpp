/**
 * @file chain_validator.cpp
 * @brief Chain validator implementation
 */

#include "certpin/pinning/chain_validator.h"
#include "certpin/pinning/cert_ops.h"
#include "certpin/pinning/hostname_matcher.h"

#include <stdexcept>

namespace certpin::pinning {

namespace {

ChainValidationResult reject(ChainError error, std::string message, int depth) {
    ChainValidationResult result;
    result.error = error;
    result.message = std::move(message);
    result.depth = depth;
    return result;
}

} // anonymous namespace

ChainValidator::ChainValidator(const ITrustStore* trustStore)
    : trustStore_(trustStore)
{
    if (!trustStore_) {
        throw std::invalid_argument("ChainValidator: trustStore cannot be nullptr");
    }
}

ChainValidationResult ChainValidator::validate(const std::vector<CertificateModel>& presentedChain,
                                               const std::string& requestedHostname,
                                               std::chrono::system_clock::time_point now) const {
    const int depth = static_cast<int>(presentedChain.size());

    // Step 1: structure
    if (presentedChain.empty()) {
        return reject(ChainError::MALFORMED_CHAIN, "Empty certificate chain", depth);
    }
    if (presentedChain.size() < 2) {
        return reject(ChainError::MALFORMED_CHAIN,
                      "Chain contains only the leaf certificate", depth);
    }
    for (int i = 0; i < depth; i++) {
        if (presentedChain[i].chainIndex() != i) {
            return reject(ChainError::MALFORMED_CHAIN,
                          "Certificate at position " + std::to_string(i) +
                          " carries chain index " + std::to_string(presentedChain[i].chainIndex()),
                          depth);
        }
    }

    // Step 2: hostname
    const CertificateModel& leaf = presentedChain.front();
    if (!certificateMatchesHostname(leaf, requestedHostname)) {
        return reject(ChainError::HOSTNAME_MISMATCH,
                      "Leaf '" + leaf.subjectCN() + "' does not match host '" + requestedHostname + "'",
                      depth);
    }

    // Step 3: validity window
    for (const auto& cert : presentedChain) {
        if (!cert.isValidAt(now)) {
            bool notYetValid = now < cert.notBefore();
            return reject(ChainError::EXPIRED,
                          "Certificate at depth " + std::to_string(cert.chainIndex()) + " ('" +
                          cert.subjectCN() + "') " + (notYetValid ? "not valid before " : "expired at ") +
                          formatIso8601(notYetValid ? cert.notBefore() : cert.notAfter()),
                          depth);
        }
    }

    // Step 4: trust anchor
    TrustVerdict verdict = trustStore_->verify(presentedChain, now);
    if (!verdict.trusted) {
        return reject(ChainError::UNTRUSTED_ROOT,
                      "Chain does not verify to a trust anchor: " + verdict.message, depth);
    }

    ChainValidationResult result;
    if (!verdict.anchorDer.empty()) {
        result.rootCertificate = CertificateModel::fromDer(
            verdict.anchorDer, depth - 1, presentedChain.back().digest());
        if (result.rootCertificate && result.rootCertificate->rawBytes() != presentedChain.back().rawBytes()) {
            // Anchor came from the store rather than the presented chain
            result.rootCertificate = result.rootCertificate->withChainIndex(depth);
        }
    }
    if (!result.rootCertificate) {
        result.rootCertificate = presentedChain.back();
    }

    result.valid = true;
    result.depth = depth;
    result.message = verdict.message;
    return result;
}

} // namespace certpin::pinning
