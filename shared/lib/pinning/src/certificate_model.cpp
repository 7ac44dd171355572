/**
 * @file certificate_model.cpp
 * @brief CertificateModel parsing
 */

#include "certpin/pinning/certificate_model.h"
#include "certpin/pinning/cert_ops.h"
#include "shared/util/Base64Util.hpp"

#include <openssl/objects.h>

namespace certpin::pinning {

std::optional<CertificateModel> CertificateModel::fromDer(
    const std::vector<uint8_t>& der,
    int chainIndex,
    ThumbprintDigest digest)
{
    if (chainIndex < 0) return std::nullopt;

    UniqueX509 cert = parseCertificateFromDer(der);
    if (!cert) return std::nullopt;

    auto notBefore = asn1TimeToTimePoint(X509_get0_notBefore(cert.get()));
    auto notAfter = asn1TimeToTimePoint(X509_get0_notAfter(cert.get()));
    if (!notBefore || !notAfter) return std::nullopt;

    CertificateModel model;
    model.rawBytes_ = der;
    model.chainIndex_ = chainIndex;
    model.digest_ = digest;
    model.thumbprint_ = computeThumbprint(der, digest);
    if (model.thumbprint_.empty()) return std::nullopt;

    model.subjectCN_ = getNameEntry(X509_get_subject_name(cert.get()), NID_commonName);
    model.issuerCN_ = getNameEntry(X509_get_issuer_name(cert.get()), NID_commonName);
    model.issuerO_ = getNameEntry(X509_get_issuer_name(cert.get()), NID_organizationName);
    model.subjectDn_ = getSubjectDn(cert.get());
    model.issuerDn_ = getIssuerDn(cert.get());
    model.dnsNames_ = getDnsSubjectAltNames(cert.get());
    model.notBefore_ = *notBefore;
    model.notAfter_ = *notAfter;
    model.selfSigned_ = isSelfSigned(cert.get());
    return model;
}

std::optional<CertificateModel> CertificateModel::fromX509(
    X509* cert,
    int chainIndex,
    ThumbprintDigest digest)
{
    if (!cert) return std::nullopt;
    return fromDer(certificateToDer(cert), chainIndex, digest);
}

bool CertificateModel::isValidAt(TimePoint now) const {
    return notBefore_ <= now && now <= notAfter_;
}

std::string CertificateModel::thumbprintHex() const {
    return util::Base64Util::toHexFingerprint(thumbprint_);
}

std::string CertificateModel::toBase64() const {
    return util::Base64Util::encode(rawBytes_);
}

CertificateModel CertificateModel::withChainIndex(int chainIndex) const {
    CertificateModel copy(*this);
    copy.chainIndex_ = chainIndex;
    return copy;
}

X509* CertificateModel::toX509() const {
    return parseCertificateFromDer(rawBytes_).release();
}

} // namespace certpin::pinning
