/**
 * @file hostname_matcher.h
 * @brief Leaf certificate hostname matching (RFC 6125 subset)
 */

#pragma once

#include <string>

#include "certificate_model.h"

namespace certpin::pinning {

/**
 * @brief Match a single certificate name against a hostname
 *
 * Case-insensitive; one trailing dot on either side is ignored.
 * "*." matches exactly one non-empty left-most label:
 *   "*.example.com" matches "api.example.com",
 *   but not "example.com" or "a.b.example.com".
 * Partial-label wildcards ("f*.example.com") and wildcards over a
 * single-label suffix ("*.com") never match.
 *
 * @param pattern Name from the certificate (SAN dNSName or CN)
 * @param hostname Requested hostname
 * @return true on match
 */
bool matchesHostname(const std::string& pattern, const std::string& hostname);

/**
 * @brief Check whether a leaf certificate covers a hostname
 *
 * DNS SAN entries are authoritative when present; the subject CN is only
 * consulted for a leaf that carries no DNS SAN.
 */
bool certificateMatchesHostname(const CertificateModel& leaf, const std::string& hostname);

} // namespace certpin::pinning
