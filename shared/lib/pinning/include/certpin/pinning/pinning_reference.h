/**
 * @file pinning_reference.h
 * @brief Pinned reference certificate fields
 *
 * Derived once from a trusted root certificate supplied out-of-band and
 * shared read-only across all concurrent handshake validations.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "certificate_model.h"
#include "types.h"

namespace certpin::pinning {

class PinningReference {
public:
    /**
     * @brief Construct from explicit fields
     * @throws std::invalid_argument if thumbprint length does not match digest
     */
    PinningReference(std::string subjectCN,
                     std::string issuerCN,
                     std::string issuerO,
                     std::vector<uint8_t> thumbprint,
                     ThumbprintDigest digest = ThumbprintDigest::SHA1);

    /// @brief Reference fields taken from a parsed root certificate
    static PinningReference fromCertificate(const CertificateModel& root);

    /**
     * @brief Parse a Base64-encoded DER certificate into a reference
     * @param base64Der Base64 DER (whitespace tolerated)
     * @param digest Thumbprint digest
     * @throws common::ParsingException on invalid Base64 or certificate bytes
     */
    static PinningReference fromBase64Der(const std::string& base64Der,
                                          ThumbprintDigest digest = ThumbprintDigest::SHA1);

    const std::string& subjectCN() const { return subjectCN_; }
    const std::string& issuerCN() const { return issuerCN_; }
    const std::string& issuerO() const { return issuerO_; }
    const std::vector<uint8_t>& thumbprint() const { return thumbprint_; }
    ThumbprintDigest digest() const { return digest_; }

    /// @brief One-line description for logs (no secrets involved)
    std::string describe() const;

private:
    std::string subjectCN_;
    std::string issuerCN_;
    std::string issuerO_;
    std::vector<uint8_t> thumbprint_;
    ThumbprintDigest digest_;
};

} // namespace certpin::pinning
