/**
 * @file openssl_trust_store.h
 * @brief ITrustStore backed by an OpenSSL X509_STORE
 */

#pragma once

#include <string>
#include <openssl/x509_vfy.h>

#include "providers.h"

namespace certpin::pinning {

/**
 * @brief Trust store over OpenSSL X509_STORE
 *
 * Configure (add anchors, load files) before sharing; verify() is safe
 * to call concurrently afterwards.
 *
 * Usage:
 * @code
 *   OpenSslTrustStore store;
 *   store.loadSystemDefaults();
 *   ChainValidator validator(&store);
 * @endcode
 */
class OpenSslTrustStore : public ITrustStore {
public:
    /// @brief Empty store (no anchors)
    OpenSslTrustStore();
    ~OpenSslTrustStore() override;

    OpenSslTrustStore(const OpenSslTrustStore&) = delete;
    OpenSslTrustStore& operator=(const OpenSslTrustStore&) = delete;

    /// @brief Add a trust anchor; returns false if it could not be added
    bool addTrustAnchor(const CertificateModel& anchor);

    /// @brief Load PEM anchors from a file; returns false on failure
    bool loadCaFile(const std::string& path);

    /// @brief Load the platform default CA paths; returns false on failure
    bool loadSystemDefaults();

    /// @brief Number of anchors added explicitly or from a CA file
    int anchorCount() const;

    TrustVerdict verify(const std::vector<CertificateModel>& chain,
                        std::chrono::system_clock::time_point now) const override;

private:
    X509_STORE* store_;
};

} // namespace certpin::pinning
