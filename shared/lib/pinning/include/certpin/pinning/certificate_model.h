/**
 * @file certificate_model.h
 * @brief Immutable parsed X.509 certificate
 *
 * Value type carrying the fields the pinning engine decides on. The
 * thumbprint is always recomputed from the DER bytes at parse time and is
 * never accepted from external input.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <openssl/x509.h>

#include "types.h"

namespace certpin::pinning {

class CertificateModel {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Parse a DER-encoded certificate
     *
     * @param der DER bytes (copied into the model)
     * @param chainIndex Position in the presented chain (0 = leaf)
     * @param digest Thumbprint digest
     * @return Model, or std::nullopt if the bytes are not a single certificate
     */
    static std::optional<CertificateModel> fromDer(
        const std::vector<uint8_t>& der,
        int chainIndex = 0,
        ThumbprintDigest digest = ThumbprintDigest::SHA1);

    /**
     * @brief Build a model from an OpenSSL certificate
     * @param cert Certificate (non-owning, re-encoded to DER)
     */
    static std::optional<CertificateModel> fromX509(
        X509* cert,
        int chainIndex = 0,
        ThumbprintDigest digest = ThumbprintDigest::SHA1);

    const std::string& subjectCN() const { return subjectCN_; }
    const std::string& issuerCN() const { return issuerCN_; }
    const std::string& issuerO() const { return issuerO_; }
    const std::string& subjectDn() const { return subjectDn_; }
    const std::string& issuerDn() const { return issuerDn_; }
    const std::vector<std::string>& dnsNames() const { return dnsNames_; }
    const std::vector<uint8_t>& thumbprint() const { return thumbprint_; }
    ThumbprintDigest digest() const { return digest_; }
    TimePoint notBefore() const { return notBefore_; }
    TimePoint notAfter() const { return notAfter_; }
    const std::vector<uint8_t>& rawBytes() const { return rawBytes_; }
    int chainIndex() const { return chainIndex_; }
    bool selfSigned() const { return selfSigned_; }

    /// @brief True if notBefore <= now <= notAfter
    bool isValidAt(TimePoint now) const;

    /// @brief Lowercase hex thumbprint with colon separators (aa:bb:...)
    std::string thumbprintHex() const;

    /// @brief Base64 of the DER bytes (the form used for pinning references)
    std::string toBase64() const;

    /// @brief Same certificate at a different chain position
    CertificateModel withChainIndex(int chainIndex) const;

    /// @brief Re-parse the DER bytes into an owned OpenSSL handle
    X509* toX509() const;

    bool operator==(const CertificateModel& other) const {
        return rawBytes_ == other.rawBytes_ && chainIndex_ == other.chainIndex_;
    }
    bool operator!=(const CertificateModel& other) const { return !(*this == other); }

private:
    CertificateModel() = default;

    std::string subjectCN_;
    std::string issuerCN_;
    std::string issuerO_;
    std::string subjectDn_;
    std::string issuerDn_;
    std::vector<std::string> dnsNames_;
    std::vector<uint8_t> thumbprint_;
    ThumbprintDigest digest_ = ThumbprintDigest::SHA1;
    TimePoint notBefore_;
    TimePoint notAfter_;
    std::vector<uint8_t> rawBytes_;
    int chainIndex_ = 0;
    bool selfSigned_ = false;
};

} // namespace certpin::pinning
