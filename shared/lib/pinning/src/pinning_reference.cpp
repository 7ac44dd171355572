/**
 * @file pinning_reference.cpp
 * @brief PinningReference construction
 */

#include "certpin/pinning/pinning_reference.h"
#include "certpin/pinning/cert_ops.h"
#include "exceptions.h"
#include "shared/util/Base64Util.hpp"

#include <stdexcept>

namespace certpin::pinning {

PinningReference::PinningReference(std::string subjectCN,
                                   std::string issuerCN,
                                   std::string issuerO,
                                   std::vector<uint8_t> thumbprint,
                                   ThumbprintDigest digest)
    : subjectCN_(std::move(subjectCN)),
      issuerCN_(std::move(issuerCN)),
      issuerO_(std::move(issuerO)),
      thumbprint_(std::move(thumbprint)),
      digest_(digest)
{
    if (thumbprint_.size() != thumbprintLength(digest_)) {
        throw std::invalid_argument(
            "PinningReference: thumbprint must be " + std::to_string(thumbprintLength(digest_)) +
            " bytes for " + thumbprintDigestToString(digest_) +
            " (got " + std::to_string(thumbprint_.size()) + ")");
    }
}

PinningReference PinningReference::fromCertificate(const CertificateModel& root) {
    return PinningReference(root.subjectCN(), root.issuerCN(), root.issuerO(),
                            root.thumbprint(), root.digest());
}

PinningReference PinningReference::fromBase64Der(const std::string& base64Der,
                                                 ThumbprintDigest digest) {
    std::vector<uint8_t> der;
    try {
        der = util::Base64Util::decode(base64Der);
    } catch (const std::invalid_argument& e) {
        throw common::ParsingException(std::string("pinning reference is not Base64: ") + e.what());
    }
    if (der.empty()) {
        throw common::ParsingException("pinning reference is empty");
    }

    auto model = CertificateModel::fromDer(der, 0, digest);
    if (!model) {
        throw common::ParsingException("pinning reference is not a DER X.509 certificate");
    }
    return fromCertificate(*model);
}

std::string PinningReference::describe() const {
    return "subjectCN='" + subjectCN_ + "' issuerCN='" + issuerCN_ +
           "' issuerO='" + issuerO_ + "' " + thumbprintDigestToString(digest_) +
           "=" + util::Base64Util::toHexFingerprint(thumbprint_);
}

} // namespace certpin::pinning
