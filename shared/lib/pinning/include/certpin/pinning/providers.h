/**
 * @file providers.h
 * @brief Collaborator interfaces for platform abstraction
 *
 * These interfaces decouple the pinning engine from the host platform:
 *   - ITrustStore: platform trust anchors (OpenSslTrustStore, test mocks)
 *   - IClientIdentityConsumer: the transport's client-credential sink
 *     (OpenSSL SSL* binding, or any other native handshake callback)
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "certificate_model.h"

namespace certpin::pinning {

class ClientIdentity;

/// @brief Trust store verdict for a presented chain
struct TrustVerdict {
    bool trusted = false;            ///< Chain verifies to a trust anchor
    std::vector<uint8_t> anchorDer;  ///< DER of the anchor that terminated the path (may be empty)
    std::string message;             ///< Error or info message
};

/**
 * @brief Platform trust anchor verification
 *
 * Implementations must be safe for concurrent verify() calls once
 * configured; the engine never mutates a store.
 */
class ITrustStore {
public:
    virtual ~ITrustStore() = default;

    /**
     * @brief Verify the chain cryptographically up to a trust anchor
     * @param chain Presented chain, leaf first
     * @param now Evaluation time
     * @return TrustVerdict; anchorDer identifies the root of the built path
     */
    virtual TrustVerdict verify(const std::vector<CertificateModel>& chain,
                                std::chrono::system_clock::time_point now) const = 0;
};

/**
 * @brief Transport-side consumer of the client identity
 *
 * Receives the identity at the "server requests client certificate" step.
 * The identity remains owned by the pinning client; implementations take
 * their own references (e.g. EVP_PKEY_up_ref) if they outlive the call.
 */
class IClientIdentityConsumer {
public:
    virtual ~IClientIdentityConsumer() = default;

    /**
     * @brief Install the identity for the current handshake
     * @return true if the transport accepted the credential
     */
    virtual bool consumeClientIdentity(const ClientIdentity& identity) = 0;
};

} // namespace certpin::pinning
