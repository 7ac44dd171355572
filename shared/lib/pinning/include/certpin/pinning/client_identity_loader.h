/**
 * @file client_identity_loader.h
 * @brief PKCS#12 client identity loader with compute-once caching
 *
 * Selection rule for containers holding several identities: the FIRST
 * private key bag in container order wins. Its certificate is the cert
 * bag sharing its localKeyID, or failing that the first certificate whose
 * public key matches. Remaining certificates (except those tied to other
 * keys by localKeyID) form the issuer chain, in container order.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "client_identity.h"
#include "exceptions.h"
#include "types.h"

namespace certpin::pinning {

/**
 * @brief Client identity could not be loaded from the PKCS#12 bundle
 */
class IdentityException : public common::PinningException {
public:
    IdentityException(IdentityError error, const std::string& message)
        : common::PinningException("Identity error (" + identityErrorToString(error) + "): " + message),
          error_(error) {}

    IdentityError error() const noexcept { return error_; }

private:
    IdentityError error_;
};

/// @brief Identity load result
struct IdentityLoadResult {
    bool success = false;
    IdentityError error = IdentityError::NONE;
    std::string message;
    std::shared_ptr<const ClientIdentity> identity;  ///< Set only on success
    int keyBagCount = 0;                             ///< Private keys found in the container
};

class ClientIdentityLoader {
public:
    /**
     * @brief Constructor; nothing is decoded until load()
     * @param pkcs12Bytes DER PKCS#12 container
     * @param passphrase Container passphrase (secret, never logged)
     * @param digest Thumbprint digest for the identity's chain models
     */
    ClientIdentityLoader(std::vector<uint8_t> pkcs12Bytes,
                         std::string passphrase,
                         ThumbprintDigest digest = ThumbprintDigest::SHA1);

    /// @brief Wipes any bundle/passphrase copy still held
    ~ClientIdentityLoader();

    ClientIdentityLoader(const ClientIdentityLoader&) = delete;
    ClientIdentityLoader& operator=(const ClientIdentityLoader&) = delete;

    /**
     * @brief Decode the bundle once; later calls return the cached result
     *
     * Safe to call concurrently: exactly one caller decrypts, the others
     * block until the result is available. The bundle bytes and passphrase
     * are wiped after the first decode, success or failure.
     */
    const IdentityLoadResult& load();

    /// @brief Number of times the bundle was actually decrypted (0 or 1)
    int decodeCount() const { return decodeCount_.load(); }

    /**
     * @brief Decode a PKCS#12 container without caching
     *
     * Fails closed: BAD_PASSPHRASE on MAC/decryption failure, NO_IDENTITY
     * when no key/certificate pair is present, MALFORMED on structural
     * decode failure. Never returns a partially decoded key.
     */
    static IdentityLoadResult decode(const std::vector<uint8_t>& pkcs12Bytes,
                                     const std::string& passphrase,
                                     ThumbprintDigest digest = ThumbprintDigest::SHA1);

private:
    std::vector<uint8_t> bundle_;
    std::string passphrase_;
    ThumbprintDigest digest_;

    std::once_flag once_;
    IdentityLoadResult result_;
    std::atomic<int> decodeCount_{0};

    void wipeSecrets();
};

} // namespace certpin::pinning
