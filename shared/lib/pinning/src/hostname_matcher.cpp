/**
 * @file hostname_matcher.cpp
 * @brief Hostname matching implementation
 */

#include "certpin/pinning/hostname_matcher.h"

#include <cctype>

namespace certpin::pinning {

namespace {

std::string normalizeName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (!result.empty() && result.back() == '.') {
        result.pop_back();
    }
    return result;
}

} // anonymous namespace

bool matchesHostname(const std::string& pattern, const std::string& hostname) {
    std::string p = normalizeName(pattern);
    std::string h = normalizeName(hostname);
    if (p.empty() || h.empty()) return false;

    if (p.compare(0, 2, "*.") != 0) {
        // Wildcard anywhere but the full left-most label is not honored
        if (p.find('*') != std::string::npos) return false;
        return p == h;
    }

    std::string suffix = p.substr(1);  // ".example.com"
    if (suffix.find('*') != std::string::npos) return false;
    if (suffix.find('.', 1) == std::string::npos) return false;  // "*.com"

    if (h.size() <= suffix.size()) return false;
    if (h.compare(h.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    std::string label = h.substr(0, h.size() - suffix.size());
    return !label.empty() && label.find('.') == std::string::npos;
}

bool certificateMatchesHostname(const CertificateModel& leaf, const std::string& hostname) {
    const auto& dnsNames = leaf.dnsNames();
    if (!dnsNames.empty()) {
        for (const auto& name : dnsNames) {
            if (matchesHostname(name, hostname)) return true;
        }
        return false;
    }
    return matchesHostname(leaf.subjectCN(), hostname);
}

} // namespace certpin::pinning
