/**
 * @file client_identity.h
 * @brief Client authentication identity (private key + certificate chain)
 *
 * Sensitive: never serialized or logged. Key material is released
 * (EVP_PKEY_free clears it) when the last owner drops the identity.
 */

#pragma once

#include <vector>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include "cert_ops.h"
#include "certificate_model.h"

namespace certpin::pinning {

class ClientIdentity {
public:
    /**
     * @brief Take ownership of a key and its certificate chain
     * @param privateKey Private key
     * @param certificate Certificate matching the private key
     * @param caCertificates Issuer certificates, in container order
     * @param digest Thumbprint digest for the chain models
     * @throws std::invalid_argument if key/certificate are null or do not match
     */
    ClientIdentity(UniquePKey privateKey,
                   UniqueX509 certificate,
                   std::vector<UniqueX509> caCertificates,
                   ThumbprintDigest digest = ThumbprintDigest::SHA1);

    ClientIdentity(const ClientIdentity&) = delete;
    ClientIdentity& operator=(const ClientIdentity&) = delete;

    /// @brief Private key handle (non-owning; up-ref to keep it)
    EVP_PKEY* privateKey() const { return privateKey_.get(); }

    /// @brief Certificate matching the private key (non-owning)
    X509* certificate() const { return certificate_.get(); }

    /// @brief Issuer certificates (non-owning handles)
    const std::vector<UniqueX509>& caCertificates() const { return caCertificates_; }

    /// @brief Parsed chain, leaf first (chainIndex 0)
    const std::vector<CertificateModel>& certificateChain() const { return chain_; }

    const CertificateModel& leaf() const { return chain_.front(); }

private:
    UniquePKey privateKey_;
    UniqueX509 certificate_;
    std::vector<UniqueX509> caCertificates_;
    std::vector<CertificateModel> chain_;
};

} // namespace certpin::pinning
