/**
 * @file chain_validator.h
 * @brief Presented server chain validation
 *
 * Checks, in order (first failure wins, no retries):
 *   1. Structure: leaf plus at least one issuer, chain indices 0..n-1
 *   2. Leaf hostname (SAN dNSName, else CN; "*." = one left-most label)
 *   3. Validity window of every presented certificate at `now`
 *   4. Cryptographic path to a platform trust anchor (ITrustStore)
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "certificate_model.h"
#include "providers.h"
#include "types.h"

namespace certpin::pinning {

/// @brief Chain validation result
struct ChainValidationResult {
    bool valid = false;                              ///< True if all four checks passed
    ChainError error = ChainError::NONE;             ///< Failure reason
    std::string message;                             ///< Error or info message
    std::optional<CertificateModel> rootCertificate; ///< Terminal certificate of the verified path
    int depth = 0;                                   ///< Number of presented certificates
};

class ChainValidator {
public:
    /**
     * @brief Constructor
     * @param trustStore Trust anchor verifier (non-owning)
     * @throws std::invalid_argument if trustStore is nullptr
     */
    explicit ChainValidator(const ITrustStore* trustStore);

    /**
     * @brief Validate a presented chain
     *
     * The root certificate is the anchor reported by the trust store;
     * when the store does not report one, the last presented certificate.
     *
     * @param presentedChain Chain as sent by the server, leaf first
     * @param requestedHostname Hostname the connection was opened for
     * @param now Evaluation time
     */
    ChainValidationResult validate(const std::vector<CertificateModel>& presentedChain,
                                   const std::string& requestedHostname,
                                   std::chrono::system_clock::time_point now) const;

private:
    const ITrustStore* trustStore_;
};

} // namespace certpin::pinning
