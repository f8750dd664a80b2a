#include "utils/TextEncoding.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace TextEncoding {

std::string base64Encode(const std::string& bytes) {
    if (bytes.empty()) return "";

    // EVP_EncodeBlock takes an int length, so encode in chunks (multiple of 3).
    const size_t chunk = 3 * 1024 * 1024;
    std::string out;
    out.reserve(4 * ((bytes.size() + 2) / 3));

    std::vector<unsigned char> buffer(4 * (chunk / 3) + 1);
    for (size_t offset = 0; offset < bytes.size(); offset += chunk) {
        size_t len = std::min(chunk, bytes.size() - offset);
        int written = EVP_EncodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(bytes.data() + offset),
                                      static_cast<int>(len));
        out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));
    }
    return out;
}

std::optional<std::string> base64Decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        bool alphabet = std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
        if (!alphabet) return std::nullopt;
        clean.push_back(c);
    }
    if (clean.empty()) return std::string();
    if (clean.size() % 4 != 0) return std::nullopt;

    size_t padding = 0;
    if (clean[clean.size() - 1] == '=') padding++;
    if (clean[clean.size() - 2] == '=') padding++;
    // '=' is only legal as trailing padding
    if (clean.find('=') < clean.size() - padding) return std::nullopt;

    std::string out;
    out.reserve(clean.size() / 4 * 3);
    const size_t chunk = 4 * 1024 * 1024;
    std::vector<unsigned char> buffer(chunk / 4 * 3 + 1);
    for (size_t offset = 0; offset < clean.size(); offset += chunk) {
        size_t len = std::min(chunk, clean.size() - offset);
        int decoded = EVP_DecodeBlock(buffer.data(),
                                      reinterpret_cast<const unsigned char*>(clean.data() + offset),
                                      static_cast<int>(len));
        if (decoded < 0) return std::nullopt;
        out.append(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(decoded));
    }
    // EVP_DecodeBlock emits zero bytes for the padding characters.
    out.resize(out.size() - padding);
    return out;
}

std::string sha256Hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digestLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLen; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

}

namespace UTF8Utils {

namespace {
    const char kReplacement[] = "\xEF\xBF\xBD";

    bool isContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }
}

std::string sanitize(const std::string& input) {
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    const size_t n = input.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(input[i]);

        // Single-byte ASCII
        if (c <= 0x7F) {
            output.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // allowed range of the second byte
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;        // overlong
            else if (c == 0xED) hi = 0x9F;   // surrogates
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;        // overlong
            else if (c == 0xF4) hi = 0x8F;   // above U+10FFFF
        }

        if (len == 0) {
            output.append(kReplacement);
            i++;
            continue;
        }

        // Consume the longest valid prefix; a broken sequence becomes one U+FFFD.
        size_t consumed = 1;
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            if (i + k >= n) { valid = false; break; }
            unsigned char ck = static_cast<unsigned char>(input[i + k]);
            bool ok = (k == 1) ? (ck >= lo && ck <= hi) : isContinuation(ck);
            if (!ok) { valid = false; break; }
            consumed++;
        }

        if (valid) {
            output.append(input, i, len);
        } else {
            output.append(kReplacement);
        }
        i += consumed;
    }
    return output;
}

}
