#pragma once
#include <optional>
#include <string>

/**
 * @brief Encoding helpers for file content and audit hashing (OpenSSL backed).
 */
namespace TextEncoding {
    /** @brief Standard base64 with padding, no line breaks. */
    std::string base64Encode(const std::string& bytes);

    /**
     * @brief Decode standard base64.
     *
     * Whitespace (including MIME line breaks) is ignored. Anything else outside
     * the alphabet, or wrong padding, makes the input invalid.
     * @return Decoded bytes, or std::nullopt for malformed input
     */
    std::optional<std::string> base64Decode(const std::string& text);

    /** @brief Lowercase hex SHA-256 digest. */
    std::string sha256Hex(const std::string& data);
}

// UTF-8 validation and cleanup
namespace UTF8Utils {
    /**
     * @brief Replace every invalid UTF-8 sequence with U+FFFD.
     *
     * Overlong encodings, surrogates and code points above U+10FFFF count as
     * invalid. Valid input is returned unchanged.
     */
    std::string sanitize(const std::string& input);
}
