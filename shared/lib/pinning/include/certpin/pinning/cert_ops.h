/**
 * @file cert_ops.h
 * @brief Pure X.509 certificate operations: no I/O, no logging
 *
 * Thin helpers over OpenSSL X509 structures used by CertificateModel,
 * the trust store and the transport binding. All functions are side-effect
 * free and accept nullptr (returning an empty/false result).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <openssl/asn1.h>
#include <openssl/evp.h>
#include <openssl/x509.h>

#include "types.h"

namespace certpin::pinning {

/// @name RAII handles
/// @{

struct X509Deleter { void operator()(X509* p) const { X509_free(p); } };
using UniqueX509 = std::unique_ptr<X509, X509Deleter>;

struct PKeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
using UniquePKey = std::unique_ptr<EVP_PKEY, PKeyDeleter>;

/// @}

/// @name DER Encoding
/// @{

/**
 * @brief Parse a single DER-encoded certificate
 *
 * Trailing bytes after the certificate are rejected.
 *
 * @param der DER bytes
 * @return Owned certificate, or empty handle on malformed input
 */
UniqueX509 parseCertificateFromDer(const std::vector<uint8_t>& der);

/**
 * @brief Serialize certificate to DER
 * @param cert Certificate (non-owning)
 * @return DER bytes, or empty vector on error
 */
std::vector<uint8_t> certificateToDer(X509* cert);

/// @}

/// @name Names
/// @{

/// @brief Subject DN in OpenSSL oneline format (e.g. "/C=US/O=Example/CN=host")
std::string getSubjectDn(X509* cert);

/// @brief Issuer DN in OpenSSL oneline format
std::string getIssuerDn(X509* cert);

/**
 * @brief First entry of a name attribute, UTF-8 encoded
 * @param name X509 name (non-owning)
 * @param nid Attribute NID (NID_commonName, NID_organizationName, ...)
 * @return Attribute value, or empty string if absent
 */
std::string getNameEntry(const X509_NAME* name, int nid);

/**
 * @brief DNS names from the Subject Alternative Name extension
 * @param cert Certificate (non-owning)
 * @return dNSName entries in extension order (empty if no SAN extension)
 */
std::vector<std::string> getDnsSubjectAltNames(X509* cert);

/// @}

/// @name Digests and Signatures
/// @{

/**
 * @brief Digest of the certificate's DER encoding
 * @param der DER bytes
 * @param digest Digest algorithm
 * @return Raw digest bytes (20 for SHA-1, 32 for SHA-256), empty on error
 */
std::vector<uint8_t> computeThumbprint(const std::vector<uint8_t>& der, ThumbprintDigest digest);

/// @brief Expected thumbprint length in bytes for a digest
size_t thumbprintLength(ThumbprintDigest digest);

/// @brief True if subject DN equals issuer DN (case-insensitive) and the
///        certificate verifies under its own public key
bool isSelfSigned(X509* cert);

/**
 * @brief Verify certificate signature with the issuer's public key
 * @return true if signature is cryptographically valid
 */
bool verifyCertificateSignature(X509* cert, X509* issuerCert);

/// @}

/// @name Time
/// @{

/**
 * @brief Convert ASN1_TIME to system_clock time_point
 * @return time_point, or std::nullopt on unparseable input
 */
std::optional<std::chrono::system_clock::time_point> asn1TimeToTimePoint(const ASN1_TIME* t);

/// @brief Format a time_point as ISO 8601 UTC ("2026-02-16T12:00:00Z")
std::string formatIso8601(std::chrono::system_clock::time_point tp);

/// @}

/// @brief Drain the OpenSSL error queue into a single string
std::string drainOpenSslErrors();

} // namespace certpin::pinning
