#include <shortguid/base64.hpp>

namespace shortguid::base64 {

static const char url_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
static const char std_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int url_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-') return 62;
    if (c == '_') return 63;
    return -1;
}

static std::string encode_with(const char* alphabet, const uint8_t* data, size_t len, bool pad) {
    std::string out;
    out.reserve((len + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= len; i += 3) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16)
                   | (static_cast<uint32_t>(data[i + 1]) << 8)
                   | data[i + 2];
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }

    size_t rest = len - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        if (pad) out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16)
                   | (static_cast<uint32_t>(data[i + 1]) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        if (pad) out += '=';
    }
    return out;
}

std::string encode_url(const uint8_t* data, size_t len) {
    return encode_with(url_chars, data, len, false);
}

std::string encode_standard(const uint8_t* data, size_t len) {
    return encode_with(std_chars, data, len, true);
}

Result<std::vector<uint8_t>> decode_url(std::string_view s) {
    // Strip up to two trailing pad characters; padded input must be whole quads.
    size_t data_len = s.size();
    size_t pad = 0;
    while (data_len > 0 && s[data_len - 1] == '=' && pad < 2) {
        --data_len;
        ++pad;
    }
    if (pad > 0 && s.size() % 4 != 0) {
        return ShortGuidError(ShortGuidError::InvalidEncoding,
            "Base64 padding does not complete a 4-character group",
            "Got " + std::to_string(s.size()) + " characters");
    }
    if (data_len % 4 == 1) {
        return ShortGuidError(ShortGuidError::InvalidEncoding,
            "Base64 input has an impossible length",
            std::to_string(data_len) + " symbols leave a dangling 6-bit group");
    }
    std::vector<uint8_t> out;
    out.reserve(data_len * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = 0; i < data_len; ++i) {
        int v = url_val(s[i]);
        if (v < 0) {
            std::string shown = (s[i] >= 0x20 && s[i] < 0x7F)
                ? std::string("'") + s[i] + "'"
                : "byte " + std::to_string(static_cast<unsigned char>(s[i]));
            return ShortGuidError(ShortGuidError::InvalidEncoding,
                "Base64 input contains invalid character",
                "Invalid " + shown + " at position " + std::to_string(i)
                    + "; expected A-Z, a-z, 0-9, '-' or '_'");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }

    // Leftover bits must be zero, otherwise the input is not the canonical
    // encoding of any byte string.
    if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) {
        return ShortGuidError(ShortGuidError::InvalidEncoding,
            "Base64 input has non-zero trailing bits",
            "The last symbol '" + std::string(1, s[data_len - 1]) + "' is not canonical");
    }

    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

} // namespace shortguid::base64
