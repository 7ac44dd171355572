/**
 * @file client_identity.cpp
 * @brief ClientIdentity construction
 */

#include "certpin/pinning/client_identity.h"

#include <stdexcept>
#include <openssl/err.h>

namespace certpin::pinning {

ClientIdentity::ClientIdentity(UniquePKey privateKey,
                               UniqueX509 certificate,
                               std::vector<UniqueX509> caCertificates,
                               ThumbprintDigest digest)
    : privateKey_(std::move(privateKey)),
      certificate_(std::move(certificate)),
      caCertificates_(std::move(caCertificates))
{
    if (!privateKey_ || !certificate_) {
        throw std::invalid_argument("ClientIdentity: private key and certificate are required");
    }
    if (X509_check_private_key(certificate_.get(), privateKey_.get()) != 1) {
        ERR_clear_error();
        throw std::invalid_argument("ClientIdentity: certificate does not match private key");
    }

    auto leafModel = CertificateModel::fromX509(certificate_.get(), 0, digest);
    if (!leafModel) {
        throw std::invalid_argument("ClientIdentity: certificate could not be encoded");
    }
    chain_.push_back(std::move(*leafModel));

    for (const auto& ca : caCertificates_) {
        auto model = CertificateModel::fromX509(ca.get(), static_cast<int>(chain_.size()), digest);
        if (!model) {
            throw std::invalid_argument("ClientIdentity: chain certificate could not be encoded");
        }
        chain_.push_back(std::move(*model));
    }
}

} // namespace certpin::pinning
