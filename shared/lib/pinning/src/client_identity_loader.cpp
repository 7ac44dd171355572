/**
 * @file client_identity_loader.cpp
 * @brief PKCS#12 decoding with explicit bag selection
 *
 * Walks the authenticated safes bag by bag. Failures are classified as
 * BAD_PASSPHRASE, NO_IDENTITY or MALFORMED. Legacy bundles (RC2 certificate
 * safes, 3DES key bags) need OpenSSL's legacy provider, which is loaded on
 * first decode.
 */

#include "certpin/pinning/client_identity_loader.h"

#include <optional>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/provider.h>
#include <spdlog/spdlog.h>

namespace certpin::pinning {

namespace {

struct Pkcs12Deleter { void operator()(PKCS12* p) const { PKCS12_free(p); } };
struct AuthSafesDeleter { void operator()(STACK_OF(PKCS7)* p) const { sk_PKCS7_pop_free(p, PKCS7_free); } };
struct SafeBagsDeleter {
    void operator()(STACK_OF(PKCS12_SAFEBAG)* p) const { sk_PKCS12_SAFEBAG_pop_free(p, PKCS12_SAFEBAG_free); }
};
struct P8InfoDeleter { void operator()(PKCS8_PRIV_KEY_INFO* p) const { PKCS8_PRIV_KEY_INFO_free(p); } };

struct KeyEntry {
    UniquePKey key;
    std::string localKeyId;
};

struct CertEntry {
    UniqueX509 cert;
    std::string localKeyId;
};

/// Bag collection state shared across nested safe contents
struct BagCollector {
    const char* pass = nullptr;
    int passLen = 0;
    bool macVerified = false;

    std::optional<KeyEntry> firstKey;
    std::vector<std::string> otherKeyIds;
    std::vector<CertEntry> certs;
    int keyCount = 0;

    IdentityError error = IdentityError::NONE;
    std::string message;
};

IdentityLoadResult failure(IdentityError error, std::string message) {
    IdentityLoadResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

std::string localKeyIdOf(const PKCS12_SAFEBAG* bag) {
    const ASN1_TYPE* attr = PKCS12_SAFEBAG_get0_attr(bag, NID_localKeyID);
    if (!attr || attr->type != V_ASN1_OCTET_STRING || !attr->value.octet_string) {
        return "";
    }
    const ASN1_OCTET_STRING* id = attr->value.octet_string;
    return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(id)),
                       static_cast<size_t>(ASN1_STRING_length(id)));
}

/// RC2 and RC4 (OpenSSL 1.x and Windows exports) live in the legacy provider
void loadLegacyAlgorithms() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (OSSL_PROVIDER_try_load(nullptr, "legacy", 1) == nullptr) {
            ERR_clear_error();
            spdlog::warn("OpenSSL legacy provider unavailable; RC2-protected PKCS#12 bundles cannot be decrypted");
        }
    });
}

/// Drains the error queue; true if a cipher or PBE algorithm could not be fetched
bool unsupportedAlgorithmReported() {
    bool unsupported = false;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        int reason = ERR_GET_REASON(e);
        if (reason == ERR_R_UNSUPPORTED || reason == ERR_R_FETCH_FAILED ||
            (ERR_GET_LIB(e) == ERR_LIB_EVP &&
             (reason == EVP_R_UNSUPPORTED_CIPHER || reason == EVP_R_UNSUPPORTED_ALGORITHM))) {
            unsupported = true;
        }
    }
    return unsupported;
}

/// Classify a decryption failure. A missing algorithm is reported as such;
/// otherwise, after a verified MAC the passphrase is right, so the content
/// itself is broken.
bool decryptionFailed(BagCollector& c, const std::string& what) {
    if (unsupportedAlgorithmReported()) {
        c.error = IdentityError::MALFORMED;
        c.message = what + " uses an unsupported encryption algorithm";
    } else {
        c.error = c.macVerified ? IdentityError::MALFORMED : IdentityError::BAD_PASSPHRASE;
        c.message = what + " could not be decrypted";
    }
    return false;
}

void addKey(BagCollector& c, UniquePKey key, std::string localKeyId) {
    c.keyCount++;
    if (!c.firstKey) {
        c.firstKey = KeyEntry{std::move(key), std::move(localKeyId)};
    } else if (!localKeyId.empty()) {
        c.otherKeyIds.push_back(std::move(localKeyId));
    }
}

bool collectBags(BagCollector& c, const STACK_OF(PKCS12_SAFEBAG)* bags, int nesting) {
    if (nesting > 8) {
        c.error = IdentityError::MALFORMED;
        c.message = "Safe contents nested too deeply";
        return false;
    }

    for (int i = 0; i < sk_PKCS12_SAFEBAG_num(bags); i++) {
        const PKCS12_SAFEBAG* bag = sk_PKCS12_SAFEBAG_value(bags, i);

        switch (PKCS12_SAFEBAG_get_nid(bag)) {
            case NID_keyBag: {
                const PKCS8_PRIV_KEY_INFO* p8 = PKCS12_SAFEBAG_get0_p8inf(bag);
                UniquePKey key(p8 ? EVP_PKCS82PKEY(p8) : nullptr);
                if (!key) {
                    c.error = IdentityError::MALFORMED;
                    c.message = "Key bag does not hold a usable private key";
                    return false;
                }
                addKey(c, std::move(key), localKeyIdOf(bag));
                break;
            }
            case NID_pkcs8ShroudedKeyBag: {
                std::unique_ptr<PKCS8_PRIV_KEY_INFO, P8InfoDeleter> p8(
                    PKCS12_decrypt_skey(bag, c.pass, c.passLen));
                if (!p8) {
                    return decryptionFailed(c, "Shrouded key bag");
                }
                UniquePKey key(EVP_PKCS82PKEY(p8.get()));
                if (!key) {
                    c.error = IdentityError::MALFORMED;
                    c.message = "Decrypted key bag does not hold a usable private key";
                    return false;
                }
                addKey(c, std::move(key), localKeyIdOf(bag));
                break;
            }
            case NID_certBag: {
                if (PKCS12_SAFEBAG_get_bag_nid(bag) != NID_x509Certificate) break;
                UniqueX509 cert(PKCS12_SAFEBAG_get1_cert(bag));
                if (!cert) {
                    c.error = IdentityError::MALFORMED;
                    c.message = "Certificate bag does not hold an X.509 certificate";
                    return false;
                }
                c.certs.push_back(CertEntry{std::move(cert), localKeyIdOf(bag)});
                break;
            }
            case NID_safeContentsBag: {
                const STACK_OF(PKCS12_SAFEBAG)* nested = PKCS12_SAFEBAG_get0_safes(bag);
                if (nested && !collectBags(c, nested, nesting + 1)) return false;
                break;
            }
            default:
                // CRL and secret bags carry nothing usable for client auth
                break;
        }
    }
    return true;
}

} // anonymous namespace

// --- ClientIdentityLoader ---

ClientIdentityLoader::ClientIdentityLoader(std::vector<uint8_t> pkcs12Bytes,
                                           std::string passphrase,
                                           ThumbprintDigest digest)
    : bundle_(std::move(pkcs12Bytes)),
      passphrase_(std::move(passphrase)),
      digest_(digest)
{
}

ClientIdentityLoader::~ClientIdentityLoader() {
    wipeSecrets();
}

const IdentityLoadResult& ClientIdentityLoader::load() {
    std::call_once(once_, [this]() {
        decodeCount_++;
        result_ = decode(bundle_, passphrase_, digest_);
        wipeSecrets();

        if (result_.success) {
            spdlog::info("Client identity loaded: subject CN='{}', chain length {}, {}={}",
                         result_.identity->leaf().subjectCN(),
                         result_.identity->certificateChain().size(),
                         thumbprintDigestToString(digest_),
                         result_.identity->leaf().thumbprintHex());
            if (result_.keyBagCount > 1) {
                spdlog::warn("PKCS#12 bundle holds {} private keys; using the first", result_.keyBagCount);
            }
        } else {
            spdlog::error("Client identity load failed: {} ({})",
                          identityErrorToString(result_.error), result_.message);
        }
    });
    return result_;
}

void ClientIdentityLoader::wipeSecrets() {
    if (!bundle_.empty()) {
        OPENSSL_cleanse(bundle_.data(), bundle_.size());
        bundle_.clear();
        bundle_.shrink_to_fit();
    }
    if (!passphrase_.empty()) {
        OPENSSL_cleanse(&passphrase_[0], passphrase_.size());
        passphrase_.clear();
        passphrase_.shrink_to_fit();
    }
}

IdentityLoadResult ClientIdentityLoader::decode(const std::vector<uint8_t>& pkcs12Bytes,
                                                const std::string& passphrase,
                                                ThumbprintDigest digest) {
    if (pkcs12Bytes.empty()) {
        return failure(IdentityError::MALFORMED, "PKCS#12 bundle is empty");
    }
    loadLegacyAlgorithms();

    // Step 1: outer structure
    const unsigned char* p = pkcs12Bytes.data();
    std::unique_ptr<PKCS12, Pkcs12Deleter> p12(
        d2i_PKCS12(nullptr, &p, static_cast<long>(pkcs12Bytes.size())));
    if (!p12) {
        ERR_clear_error();
        return failure(IdentityError::MALFORMED, "Bundle is not a DER PKCS#12 container");
    }

    // Step 2: passphrase (MAC). An empty passphrase may have been encoded
    // either as an empty BMPString or as no password at all.
    BagCollector collector;
    collector.pass = passphrase.c_str();
    collector.passLen = static_cast<int>(passphrase.size());

    if (PKCS12_mac_present(p12.get())) {
        if (PKCS12_verify_mac(p12.get(), collector.pass, collector.passLen) == 1) {
            collector.macVerified = true;
        } else if (passphrase.empty() && PKCS12_verify_mac(p12.get(), nullptr, 0) == 1) {
            collector.pass = nullptr;
            collector.passLen = 0;
            collector.macVerified = true;
        } else {
            ERR_clear_error();
            return failure(IdentityError::BAD_PASSPHRASE, "PKCS#12 MAC verification failed");
        }
    }

    // Step 3: authenticated safes
    std::unique_ptr<STACK_OF(PKCS7), AuthSafesDeleter> authSafes(PKCS12_unpack_authsafes(p12.get()));
    if (!authSafes) {
        ERR_clear_error();
        return failure(IdentityError::MALFORMED, "PKCS#12 authenticated safes could not be decoded");
    }

    for (int i = 0; i < sk_PKCS7_num(authSafes.get()); i++) {
        PKCS7* p7 = sk_PKCS7_value(authSafes.get(), i);

        std::unique_ptr<STACK_OF(PKCS12_SAFEBAG), SafeBagsDeleter> bags;
        if (PKCS7_type_is_data(p7)) {
            bags.reset(PKCS12_unpack_p7data(p7));
            if (!bags) {
                ERR_clear_error();
                return failure(IdentityError::MALFORMED, "Safe contents could not be decoded");
            }
        } else if (PKCS7_type_is_encrypted(p7)) {
            bags.reset(PKCS12_unpack_p7encdata(p7, collector.pass, collector.passLen));
            if (!bags) {
                decryptionFailed(collector, "Encrypted safe contents");
                return failure(collector.error, collector.message);
            }
        } else {
            continue;
        }

        if (!collectBags(collector, bags.get(), 0)) {
            ERR_clear_error();
            return failure(collector.error, collector.message);
        }
    }

    // Step 4: select the identity (first key wins)
    if (!collector.firstKey) {
        return failure(IdentityError::NO_IDENTITY, "PKCS#12 bundle contains no private key");
    }
    KeyEntry& key = *collector.firstKey;

    int selected = -1;
    if (!key.localKeyId.empty()) {
        for (size_t i = 0; i < collector.certs.size(); i++) {
            if (collector.certs[i].localKeyId == key.localKeyId) {
                selected = static_cast<int>(i);
                break;
            }
        }
    }
    if (selected < 0) {
        for (size_t i = 0; i < collector.certs.size(); i++) {
            if (X509_check_private_key(collector.certs[i].cert.get(), key.key.get()) == 1) {
                selected = static_cast<int>(i);
                break;
            }
        }
        ERR_clear_error();
    }
    if (selected < 0) {
        return failure(IdentityError::NO_IDENTITY,
                       "PKCS#12 bundle contains no certificate for its first private key");
    }

    UniqueX509 leaf = std::move(collector.certs[selected].cert);
    std::vector<UniqueX509> issuers;
    for (size_t i = 0; i < collector.certs.size(); i++) {
        if (static_cast<int>(i) == selected) continue;

        const std::string& id = collector.certs[i].localKeyId;
        bool ownedByOtherKey = false;
        for (const auto& other : collector.otherKeyIds) {
            if (!id.empty() && id == other) {
                ownedByOtherKey = true;
                break;
            }
        }
        if (!ownedByOtherKey) {
            issuers.push_back(std::move(collector.certs[i].cert));
        }
    }

    IdentityLoadResult result;
    try {
        result.identity = std::make_shared<const ClientIdentity>(
            std::move(key.key), std::move(leaf), std::move(issuers), digest);
    } catch (const std::invalid_argument& e) {
        return failure(IdentityError::NO_IDENTITY, e.what());
    }
    result.success = true;
    result.keyBagCount = collector.keyCount;
    result.message = "Identity loaded";
    return result;
}

} // namespace certpin::pinning
