/**
 * @file types.h
 * @brief Common enums for the certificate pinning library
 *
 * Status codes shared by the chain validator, pin matcher, identity loader
 * and handshake orchestrator.
 */

#pragma once

#include <string>

namespace certpin::pinning {

/// @brief Digest used to compute certificate thumbprints
enum class ThumbprintDigest {
    SHA1,    ///< 20-byte SHA-1 (default, matches platform thumbprints)
    SHA256   ///< 32-byte SHA-256
};

/// @brief Chain validation failure reasons
enum class ChainError {
    NONE,               ///< Chain accepted
    HOSTNAME_MISMATCH,  ///< Leaf does not cover the requested hostname
    EXPIRED,            ///< A certificate is outside its validity window
    UNTRUSTED_ROOT,     ///< Chain does not verify to a platform trust anchor
    MALFORMED_CHAIN     ///< Empty chain, leaf only, or inconsistent chain order
};

/// @brief Pinning reference field that failed to match
enum class PinField {
    NONE,         ///< All fields matched
    THUMBPRINT,   ///< Root thumbprint differs from the reference
    SUBJECT_CN,   ///< Root subject CN does not contain reference subject CN
    ISSUER_CN,    ///< Root issuer CN does not contain reference issuer CN
    ISSUER_O,     ///< Root issuer O does not contain reference issuer O
    REFERENCE     ///< No pinning reference configured
};

/// @brief PKCS#12 client identity load failures
enum class IdentityError {
    NONE,            ///< Identity loaded
    BAD_PASSPHRASE,  ///< MAC verification or decryption failed
    NO_IDENTITY,     ///< Container holds no usable key/certificate pair
    MALFORMED        ///< Container could not be decoded
};

/// @brief Per-connection handshake states
enum class HandshakeState {
    AWAITING_SERVER_CERT,
    VALIDATING,
    ACCEPTED,
    REJECTED,
    AWAITING_CLIENT_CERT_REQUEST,
    CLIENT_CERT_SUPPLIED,
    CLOSED
};

/// @brief Handshake validation outcome kind
enum class OutcomeKind {
    ACCEPTED,        ///< Chain and pin both passed
    REJECTED_CHAIN,  ///< Chain validation failed; pin was not evaluated
    REJECTED_PIN,    ///< Chain valid, pin mismatch (or no reference)
    ABORTED          ///< Connection cancelled or closed before a decision
};

inline std::string thumbprintDigestToString(ThumbprintDigest d) {
    switch (d) {
        case ThumbprintDigest::SHA1:   return "SHA1";
        case ThumbprintDigest::SHA256: return "SHA256";
    }
    return "UNKNOWN";
}

inline std::string chainErrorToString(ChainError e) {
    switch (e) {
        case ChainError::NONE:              return "NONE";
        case ChainError::HOSTNAME_MISMATCH: return "HOSTNAME_MISMATCH";
        case ChainError::EXPIRED:           return "EXPIRED";
        case ChainError::UNTRUSTED_ROOT:    return "UNTRUSTED_ROOT";
        case ChainError::MALFORMED_CHAIN:   return "MALFORMED_CHAIN";
    }
    return "UNKNOWN";
}

inline std::string pinFieldToString(PinField f) {
    switch (f) {
        case PinField::NONE:       return "NONE";
        case PinField::THUMBPRINT: return "THUMBPRINT";
        case PinField::SUBJECT_CN: return "SUBJECT_CN";
        case PinField::ISSUER_CN:  return "ISSUER_CN";
        case PinField::ISSUER_O:   return "ISSUER_O";
        case PinField::REFERENCE:  return "REFERENCE";
    }
    return "UNKNOWN";
}

inline std::string identityErrorToString(IdentityError e) {
    switch (e) {
        case IdentityError::NONE:           return "NONE";
        case IdentityError::BAD_PASSPHRASE: return "BAD_PASSPHRASE";
        case IdentityError::NO_IDENTITY:    return "NO_IDENTITY";
        case IdentityError::MALFORMED:      return "MALFORMED";
    }
    return "UNKNOWN";
}

inline std::string handshakeStateToString(HandshakeState s) {
    switch (s) {
        case HandshakeState::AWAITING_SERVER_CERT:         return "AWAITING_SERVER_CERT";
        case HandshakeState::VALIDATING:                   return "VALIDATING";
        case HandshakeState::ACCEPTED:                     return "ACCEPTED";
        case HandshakeState::REJECTED:                     return "REJECTED";
        case HandshakeState::AWAITING_CLIENT_CERT_REQUEST: return "AWAITING_CLIENT_CERT_REQUEST";
        case HandshakeState::CLIENT_CERT_SUPPLIED:         return "CLIENT_CERT_SUPPLIED";
        case HandshakeState::CLOSED:                       return "CLOSED";
    }
    return "UNKNOWN";
}

inline std::string outcomeKindToString(OutcomeKind k) {
    switch (k) {
        case OutcomeKind::ACCEPTED:       return "ACCEPTED";
        case OutcomeKind::REJECTED_CHAIN: return "REJECTED_CHAIN";
        case OutcomeKind::REJECTED_PIN:   return "REJECTED_PIN";
        case OutcomeKind::ABORTED:        return "ABORTED";
    }
    return "UNKNOWN";
}

} // namespace certpin::pinning
