/**
 * @file pin_reference_tool.cpp
 * @brief Print the pinning reference value for a root certificate
 *
 * Reads a PEM or DER certificate and prints the Base64 DER value to use
 * as PIN_SERVER_CERT_REFERENCE, followed by the fields it pins.
 *
 * Usage:
 *   ./certpin-reference [--sha256] [--config <file.json>] <cert.pem|cert.der>
 *
 * LOG_LEVEL is read from the environment and, when given, the JSON config
 * file.
 */

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <openssl/bio.h>
#include <openssl/pem.h>
#include <spdlog/spdlog.h>

#include "certpin/pinning/cert_ops.h"
#include "certpin/pinning/certificate_model.h"
#include "certpin/pinning/pinning_reference.h"
#include "config_manager.h"
#include "exceptions.h"
#include "logger.h"

using namespace certpin;

namespace {

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };

bool readFile(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

// PEM first, then raw DER
std::optional<pinning::CertificateModel> parseCertificate(const std::vector<uint8_t>& bytes,
                                                          pinning::ThumbprintDigest digest) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(bytes.data(), static_cast<int>(bytes.size())));
    if (bio) {
        pinning::UniqueX509 cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
        if (cert) {
            return pinning::CertificateModel::fromX509(cert.get(), 0, digest);
        }
    }
    pinning::drainOpenSslErrors();
    return pinning::CertificateModel::fromDer(bytes, 0, digest);
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--sha256] [--config <file.json>] <cert.pem|cert.der>\n";
    std::cout << "  --sha256         Compute the thumbprint with SHA-256 (default: SHA-1)\n";
    std::cout << "  --config <file>  Load settings (LOG_LEVEL) from a JSON object file\n";
}

int run(int argc, char* argv[]) {
    auto& config = common::ConfigManager::getInstance();
    common::Logger::initialize("certpin-reference", config.getString(common::ConfigManager::LOG_LEVEL, "warn"));

    pinning::ThumbprintDigest digest = pinning::ThumbprintDigest::SHA1;
    std::string path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--sha256") {
            digest = pinning::ThumbprintDigest::SHA256;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            try {
                config.loadFromJsonFile(argv[++i]);
            } catch (const common::ConfigException& e) {
                spdlog::error("{}", e.what());
                return 1;
            }
            common::Logger::setLevel(config.getString(common::ConfigManager::LOG_LEVEL, "warn"));
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (path.empty()) {
            path = arg;
        } else {
            printUsage(argv[0]);
            return 2;
        }
    }
    if (path.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    std::vector<uint8_t> bytes;
    if (!readFile(path, bytes) || bytes.empty()) {
        spdlog::error("Cannot read certificate file: {}", path);
        return 1;
    }

    auto model = parseCertificate(bytes, digest);
    if (!model) {
        spdlog::error("{} is not a PEM or DER X.509 certificate", path);
        return 1;
    }

    pinning::PinningReference reference = pinning::PinningReference::fromCertificate(*model);
    if (!model->selfSigned()) {
        spdlog::warn("Certificate is not self-signed; the pin compares against the chain root");
    }

    std::cout << common::ConfigManager::PIN_SERVER_CERT_REFERENCE << "=" << model->toBase64() << "\n\n";
    std::cout << "Subject CN:  " << reference.subjectCN() << "\n";
    std::cout << "Issuer CN:   " << reference.issuerCN() << "\n";
    std::cout << "Issuer O:    " << reference.issuerO() << "\n";
    std::cout << "Thumbprint:  " << pinning::thumbprintDigestToString(digest) << " "
              << model->thumbprintHex() << "\n";
    std::cout << "Valid until: " << pinning::formatIso8601(model->notAfter()) << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    int rc = run(argc, argv);
    common::Logger::flush();
    return rc;
}
