/**
 * @file pin_matcher.h
 * @brief Root certificate pin matching (no I/O)
 *
 * Policy (conjunction, all must hold):
 *   1. root.thumbprint == reference.thumbprint (exact bytes, same digest)
 *   2. root.subjectCN contains reference.subjectCN
 *   3. root.issuerCN contains reference.issuerCN
 *   4. root.issuerO contains reference.issuerO
 *
 * Subject/issuer clauses are case-sensitive substring matches. The
 * thumbprint is evaluated first, so a thumbprint difference is always
 * reported as THUMBPRINT regardless of the other fields.
 */

#pragma once

#include <string>

#include "certificate_model.h"
#include "pinning_reference.h"
#include "types.h"

namespace certpin::pinning {

/// @brief Pin match result
struct PinMatchResult {
    bool matched = false;
    PinField field = PinField::NONE;  ///< First failing clause
    std::string message;
};

class PinMatcher {
public:
    /**
     * @brief Match a chain's root certificate against the pinning reference
     * @param root Terminal certificate of the validated chain
     * @param reference Pinned reference
     * @return PinMatchResult (matched, or Mismatch{field})
     */
    static PinMatchResult matches(const CertificateModel& root, const PinningReference& reference);
};

} // namespace certpin::pinning
