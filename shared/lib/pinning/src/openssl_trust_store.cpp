/**
 * @file openssl_trust_store.cpp
 * @brief OpenSSL X509_STORE trust store implementation
 *
 * Presented intermediates are handed to X509_verify_cert as untrusted
 * material; only certificates in the store act as anchors.
 */

#include "certpin/pinning/openssl_trust_store.h"
#include "certpin/pinning/cert_ops.h"

#include <ctime>
#include <stdexcept>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace certpin::pinning {

namespace {

struct StoreCtxDeleter { void operator()(X509_STORE_CTX* p) const { X509_STORE_CTX_free(p); } };
struct X509StackDeleter { void operator()(STACK_OF(X509)* p) const { sk_X509_pop_free(p, X509_free); } };

} // anonymous namespace

OpenSslTrustStore::OpenSslTrustStore()
    : store_(X509_STORE_new())
{
    if (!store_) {
        throw std::runtime_error("OpenSslTrustStore: X509_STORE_new failed");
    }
}

OpenSslTrustStore::~OpenSslTrustStore() {
    X509_STORE_free(store_);
}

bool OpenSslTrustStore::addTrustAnchor(const CertificateModel& anchor) {
    UniqueX509 cert(anchor.toX509());
    if (!cert) return false;

    // X509_STORE_add_cert takes its own reference
    if (X509_STORE_add_cert(store_, cert.get()) != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

bool OpenSslTrustStore::loadCaFile(const std::string& path) {
    if (path.empty()) return false;

    if (X509_STORE_load_locations(store_, path.c_str(), nullptr) != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

bool OpenSslTrustStore::loadSystemDefaults() {
    if (X509_STORE_set_default_paths(store_) != 1) {
        ERR_clear_error();
        return false;
    }
    return true;
}

int OpenSslTrustStore::anchorCount() const {
    int count = 0;
    STACK_OF(X509_OBJECT)* objects = X509_STORE_get0_objects(store_);
    for (int i = 0; i < sk_X509_OBJECT_num(objects); i++) {
        if (X509_OBJECT_get_type(sk_X509_OBJECT_value(objects, i)) == X509_LU_X509) {
            count++;
        }
    }
    return count;
}

TrustVerdict OpenSslTrustStore::verify(const std::vector<CertificateModel>& chain,
                                       std::chrono::system_clock::time_point now) const {
    TrustVerdict verdict;

    if (chain.empty()) {
        verdict.message = "Empty chain";
        return verdict;
    }

    UniqueX509 leaf(chain.front().toX509());
    if (!leaf) {
        verdict.message = "Leaf certificate could not be decoded";
        return verdict;
    }

    std::unique_ptr<STACK_OF(X509), X509StackDeleter> untrusted(sk_X509_new_null());
    if (!untrusted) {
        verdict.message = "Out of memory";
        return verdict;
    }
    for (size_t i = 1; i < chain.size(); i++) {
        X509* cert = chain[i].toX509();
        if (!cert || !sk_X509_push(untrusted.get(), cert)) {
            X509_free(cert);
            verdict.message = "Chain certificate " + std::to_string(i) + " could not be decoded";
            return verdict;
        }
    }

    std::unique_ptr<X509_STORE_CTX, StoreCtxDeleter> ctx(X509_STORE_CTX_new());
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store_, leaf.get(), untrusted.get()) != 1) {
        verdict.message = "X509_STORE_CTX_init failed: " + drainOpenSslErrors();
        return verdict;
    }

    X509_VERIFY_PARAM* param = X509_STORE_CTX_get0_param(ctx.get());
    X509_VERIFY_PARAM_set_time(param, std::chrono::system_clock::to_time_t(now));
    X509_STORE_CTX_set_purpose(ctx.get(), X509_PURPOSE_SSL_SERVER);

    int rc = X509_verify_cert(ctx.get());
    if (rc != 1) {
        int err = X509_STORE_CTX_get_error(ctx.get());
        int depth = X509_STORE_CTX_get_error_depth(ctx.get());
        verdict.message = std::string(X509_verify_cert_error_string(err)) +
                          " at depth " + std::to_string(depth);
        ERR_clear_error();
        return verdict;
    }

    STACK_OF(X509)* built = X509_STORE_CTX_get0_chain(ctx.get());
    int builtLen = built ? sk_X509_num(built) : 0;
    if (builtLen > 0) {
        verdict.anchorDer = certificateToDer(sk_X509_value(built, builtLen - 1));
    }
    verdict.trusted = true;
    verdict.message = "Chain verified (" + std::to_string(builtLen) + " certificates)";
    return verdict;
}

} // namespace certpin::pinning
