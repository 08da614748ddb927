#include <shortguid/uuid.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <random>

namespace shortguid {

// ---- RNG: /dev/urandom with std::random_device fallback ----

#ifdef SHORTGUID_ENABLE_RANDOM
static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    for (size_t i = 0; i < len; i += sizeof(unsigned)) {
        unsigned word = rd();
        size_t n = std::min(sizeof(unsigned), len - i);
        std::memcpy(buf + i, &word, n);
    }
}
#endif

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static ShortGuidError bad_hex(std::string_view s, size_t pos) {
    std::string shown = (s[pos] >= 0x20 && s[pos] < 0x7F)
        ? std::string("'") + s[pos] + "'"
        : "byte " + std::to_string(static_cast<unsigned char>(s[pos]));
    return ShortGuidError(ShortGuidError::InvalidEncoding,
        "UUID string contains invalid hex character",
        "Invalid " + shown + " at position " + std::to_string(pos));
}

// Reads 2*16 hex digits from s, skipping positions listed in `skip`.
static Result<Uuid> read_hex(std::string_view s, const size_t* skip, size_t nskip) {
    Uuid u;
    size_t byte_idx = 0;
    size_t k = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (k < nskip && i == skip[k]) { ++i; ++k; continue; }
        int hi = hex_val(s[i]);
        if (hi < 0) return bad_hex(s, i);
        int lo = hex_val(s[i + 1]);
        if (lo < 0) return bad_hex(s, i + 1);
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

// ---- UUID v4 ----

#ifdef SHORTGUID_ENABLE_RANDOM
Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);
    // Set version 4: bytes[6] high nibble = 0100
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    // Set variant 1: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}
#endif

bool Uuid::is_nil() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

// ---- Text forms ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

std::string Uuid::to_hex() const {
    std::string out;
    out.reserve(32);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

Result<Uuid> Uuid::from_string(std::string_view s) {
    if (s.size() != 36) {
        return ShortGuidError(ShortGuidError::InvalidLength,
            "UUID string must be 36 characters, got " + std::to_string(s.size()),
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    static const size_t dashes[] = {8, 13, 18, 23};
    for (size_t d : dashes) {
        if (s[d] != '-') {
            return ShortGuidError(ShortGuidError::InvalidEncoding,
                "UUID string has invalid dash positions",
                "Expected '-' at position " + std::to_string(d));
        }
    }
    return read_hex(s, dashes, 4);
}

Result<Uuid> Uuid::from_hex(std::string_view s) {
    if (s.size() != 32) {
        return ShortGuidError(ShortGuidError::InvalidLength,
            "Hex UUID string must be 32 characters, got " + std::to_string(s.size()),
            "Expected format: 32 hex digits without separators");
    }
    return read_hex(s, nullptr, 0);
}

// ---- Byte order ----

Bytes Uuid::to_bytes_le() const {
    Bytes le = bytes;
    std::reverse(le.begin(), le.begin() + 4);
    std::reverse(le.begin() + 4, le.begin() + 6);
    std::reverse(le.begin() + 6, le.begin() + 8);
    return le;
}

Uuid Uuid::from_bytes_le(const Bytes& le) {
    // The swap is an involution, so decoding is the same operation.
    Uuid tmp;
    tmp.bytes = le;
    Uuid u;
    u.bytes = tmp.to_bytes_le();
    return u;
}

// ---- Comparison ----

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

} // namespace shortguid

size_t std::hash<shortguid::Uuid>::operator()(const shortguid::Uuid& u) const noexcept {
    // FNV-1a over the 16 bytes
    uint64_t h = 14695981039346656037ULL;
    for (uint8_t b : u.bytes) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<size_t>(h);
}
