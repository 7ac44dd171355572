#pragma once

#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace certpin::util {

/**
 * Base64 and hex helpers for provisioning inputs (pinning reference,
 * PKCS#12 bundle) using OpenSSL's block codec.
 */
class Base64Util {
public:
    /**
     * Encode binary data to Base64 (no line breaks).
     */
    static std::string encode(const std::vector<uint8_t>& data) {
        if (data.empty()) {
            return "";
        }

        std::string result(4 * ((data.size() + 2) / 3), '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                      data.data(), static_cast<int>(data.size()));
        result.resize(static_cast<size_t>(written));
        return result;
    }

    /**
     * Decode Base64. Whitespace (line breaks from PEM-style wrapping,
     * copy/paste indentation) is ignored; any other invalid character or a
     * truncated final quantum throws std::invalid_argument.
     */
    static std::vector<uint8_t> decode(const std::string& encoded) {
        std::string compact;
        compact.reserve(encoded.size());
        for (char c : encoded) {
            if (std::isspace(static_cast<unsigned char>(c))) continue;
            if (!isBase64Char(c)) {
                throw std::invalid_argument("Invalid Base64 character");
            }
            compact.push_back(c);
        }

        if (compact.empty()) {
            return {};
        }
        if (compact.size() % 4 != 0) {
            throw std::invalid_argument("Invalid Base64 length");
        }

        size_t padding = 0;
        if (compact[compact.size() - 1] == '=') padding++;
        if (compact[compact.size() - 2] == '=') padding++;
        if (compact.find('=') < compact.size() - padding) {
            throw std::invalid_argument("Misplaced Base64 padding");
        }

        std::vector<uint8_t> result(compact.size() / 4 * 3);
        int decoded = EVP_DecodeBlock(result.data(),
                                      reinterpret_cast<const unsigned char*>(compact.data()),
                                      static_cast<int>(compact.size()));
        if (decoded < 0) {
            throw std::invalid_argument("Base64 decoding failed");
        }

        // EVP_DecodeBlock counts padding as zero bytes
        result.resize(static_cast<size_t>(decoded) - padding);
        return result;
    }

    /**
     * Lowercase hex without separators.
     */
    static std::string toHex(const std::vector<uint8_t>& data) {
        static const char hexChars[] = "0123456789abcdef";
        std::string result;
        result.reserve(data.size() * 2);

        for (uint8_t byte : data) {
            result.push_back(hexChars[(byte >> 4) & 0x0F]);
            result.push_back(hexChars[byte & 0x0F]);
        }
        return result;
    }

    /**
     * Lowercase hex with colon separators, the usual thumbprint display form.
     */
    static std::string toHexFingerprint(const std::vector<uint8_t>& data) {
        std::string hex = toHex(data);
        std::string result;
        for (size_t i = 0; i < hex.size(); i += 2) {
            if (i > 0) result.push_back(':');
            result.append(hex, i, 2);
        }
        return result;
    }

private:
    static bool isBase64Char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
    }
};

} // namespace certpin::util
