/**
 * @file pin_matcher.cpp
 * @brief Pin matcher implementation
 */

#include "certpin/pinning/pin_matcher.h"
#include "shared/util/Base64Util.hpp"

namespace certpin::pinning {

namespace {

PinMatchResult mismatch(PinField field, std::string message) {
    PinMatchResult result;
    result.field = field;
    result.message = std::move(message);
    return result;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

PinMatchResult PinMatcher::matches(const CertificateModel& root, const PinningReference& reference) {
    if (root.digest() != reference.digest() || root.thumbprint() != reference.thumbprint()) {
        return mismatch(PinField::THUMBPRINT,
                        "Root thumbprint " + thumbprintDigestToString(root.digest()) + "=" +
                        root.thumbprintHex() + " does not match pinned " +
                        thumbprintDigestToString(reference.digest()) + "=" +
                        util::Base64Util::toHexFingerprint(reference.thumbprint()));
    }

    if (!contains(root.subjectCN(), reference.subjectCN())) {
        return mismatch(PinField::SUBJECT_CN,
                        "Root subject CN '" + root.subjectCN() + "' does not contain '" +
                        reference.subjectCN() + "'");
    }

    if (!contains(root.issuerCN(), reference.issuerCN())) {
        return mismatch(PinField::ISSUER_CN,
                        "Root issuer CN '" + root.issuerCN() + "' does not contain '" +
                        reference.issuerCN() + "'");
    }

    if (!contains(root.issuerO(), reference.issuerO())) {
        return mismatch(PinField::ISSUER_O,
                        "Root issuer O '" + root.issuerO() + "' does not contain '" +
                        reference.issuerO() + "'");
    }

    PinMatchResult result;
    result.matched = true;
    result.message = "Root matches pinned reference";
    return result;
}

} // namespace certpin::pinning
