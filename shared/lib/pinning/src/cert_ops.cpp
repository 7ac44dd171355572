/**
 * @file cert_ops.cpp
 * @brief Pure X.509 certificate operations implementation
 *
 * All functions are idempotent. No logging: callers decide what to report.
 */

#include "certpin/pinning/cert_ops.h"

#include <cstring>
#include <ctime>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <strings.h>

namespace certpin::pinning {

// --- DER Encoding ---

UniqueX509 parseCertificateFromDer(const std::vector<uint8_t>& der) {
    if (der.empty()) return UniqueX509();

    const unsigned char* p = der.data();
    X509* cert = d2i_X509(nullptr, &p, static_cast<long>(der.size()));
    if (!cert) {
        ERR_clear_error();
        return UniqueX509();
    }

    // Reject trailing garbage so the thumbprint covers exactly what was parsed
    if (p != der.data() + der.size()) {
        X509_free(cert);
        return UniqueX509();
    }
    return UniqueX509(cert);
}

std::vector<uint8_t> certificateToDer(X509* cert) {
    std::vector<uint8_t> der;
    if (!cert) return der;

    int len = i2d_X509(cert, nullptr);
    if (len <= 0) return der;

    der.resize(static_cast<size_t>(len));
    unsigned char* p = der.data();
    if (i2d_X509(cert, &p) <= 0) {
        der.clear();
    }
    return der;
}

// --- Names ---

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_subject_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getIssuerDn(X509* cert) {
    if (!cert) return "";

    char* dn = X509_NAME_oneline(X509_get_issuer_name(cert), nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::string getNameEntry(const X509_NAME* name, int nid) {
    if (!name) return "";

    int idx = X509_NAME_get_index_by_NID(name, nid, -1);
    if (idx < 0) return "";

    const X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
    if (!entry) return "";

    const ASN1_STRING* data = X509_NAME_ENTRY_get_data(entry);
    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0 || !utf8) return "";

    std::string result(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return result;
}

std::vector<std::string> getDnsSubjectAltNames(X509* cert) {
    std::vector<std::string> names;
    if (!cert) return names;

    GENERAL_NAMES* sans = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (!sans) return names;

    for (int i = 0; i < sk_GENERAL_NAME_num(sans); i++) {
        const GENERAL_NAME* gn = sk_GENERAL_NAME_value(sans, i);
        if (gn->type != GEN_DNS) continue;

        const ASN1_IA5STRING* dns = gn->d.dNSName;
        const unsigned char* data = ASN1_STRING_get0_data(dns);
        int len = ASN1_STRING_length(dns);
        if (!data || len <= 0) continue;

        std::string name(reinterpret_cast<const char*>(data), static_cast<size_t>(len));
        // Embedded NUL would let "good.com\0.evil.com" masquerade as good.com
        if (name.find('\0') != std::string::npos) continue;
        names.push_back(name);
    }
    GENERAL_NAMES_free(sans);
    return names;
}

// --- Digests and Signatures ---

std::vector<uint8_t> computeThumbprint(const std::vector<uint8_t>& der, ThumbprintDigest digest) {
    if (der.empty()) return {};

    const EVP_MD* md = (digest == ThumbprintDigest::SHA256) ? EVP_sha256() : EVP_sha1();
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;

    if (EVP_Digest(der.data(), der.size(), out, &outLen, md, nullptr) != 1) {
        ERR_clear_error();
        return {};
    }
    return std::vector<uint8_t>(out, out + outLen);
}

size_t thumbprintLength(ThumbprintDigest digest) {
    return digest == ThumbprintDigest::SHA256 ? 32 : 20;
}

bool isSelfSigned(X509* cert) {
    if (!cert) return false;

    std::string subject = getSubjectDn(cert);
    std::string issuer = getIssuerDn(cert);
    if (subject.empty() || strcasecmp(subject.c_str(), issuer.c_str()) != 0) {
        return false;
    }
    // Same name is not enough: the certificate must verify under its own key
    return verifyCertificateSignature(cert, cert);
}

bool verifyCertificateSignature(X509* cert, X509* issuerCert) {
    if (!cert || !issuerCert) return false;

    EVP_PKEY* issuerPubKey = X509_get0_pubkey(issuerCert);
    if (!issuerPubKey) {
        ERR_clear_error();
        return false;
    }

    int result = X509_verify(cert, issuerPubKey);
    if (result != 1) {
        ERR_clear_error();
    }
    return result == 1;
}

// --- Time ---

std::optional<std::chrono::system_clock::time_point> asn1TimeToTimePoint(const ASN1_TIME* t) {
    if (!t) return std::nullopt;

    struct tm tmVal;
    std::memset(&tmVal, 0, sizeof(tmVal));
    if (ASN1_TIME_to_tm(t, &tmVal) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    time_t epoch = timegm(&tmVal);
    return std::chrono::system_clock::from_time_t(epoch);
}

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tmVal;
    if (!gmtime_r(&t, &tmVal)) return "";

    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmVal);
    return std::string(buf);
}

std::string drainOpenSslErrors() {
    std::string result;
    unsigned long err;
    while ((err = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result;
}

} // namespace certpin::pinning
