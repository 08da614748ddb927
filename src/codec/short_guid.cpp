#include <shortguid/short_guid.hpp>
#include <shortguid/base64.hpp>
#include <cstring>
#include <ostream>

namespace shortguid {

// Every equality overload funnels through here.
static bool same_bytes(const Bytes& a, const Bytes& b) {
    return a == b;
}

static ShortGuid wrap(const Uuid& u) {
    return ShortGuid(u);
}

#ifdef SHORTGUID_ENABLE_RANDOM
ShortGuid ShortGuid::new_random() {
    return ShortGuid(Uuid::v4());
}
#endif

// ---- Parsing ----

Result<ShortGuid> ShortGuid::try_parse(std::string_view s) {
    // The three syntaxes have disjoint lengths, so length alone picks the decoder.
    switch (s.size()) {
        case 36:
            return Uuid::from_string(s).map(wrap);
        case 32:
            return Uuid::from_hex(s).map(wrap);
        case encoded_length:
        case encoded_length + 2:
            return try_decode(s).map(wrap);
        default:
            break;
    }
    return ShortGuidError(ShortGuidError::InvalidLength,
        "Invalid ID length; expected 22, 32 or 36 characters, got " + std::to_string(s.size()),
        "Accepted forms: yaZG05xhTLe_ze4lIsj2Mw, c9a646d39c614cb7bfcdee2522c8f633, "
        "c9a646d3-9c61-4cb7-bfcd-ee2522c8f633");
}

Result<Uuid> ShortGuid::try_decode(std::string_view s) {
    if (s.size() != encoded_length && s.size() != encoded_length + 2) {
        return ShortGuidError(ShortGuidError::InvalidLength,
            "Invalid ID length; expected 22 characters, got " + std::to_string(s.size()));
    }

    auto decoded = base64::decode_url(s);
    SHORTGUID_TRY(decoded);

    const auto& raw = decoded.value();
    if (raw.size() != 16) {
        return ShortGuidError(ShortGuidError::DecodedLengthMismatch,
            "Short ID decodes to " + std::to_string(raw.size()) + " bytes, expected 16",
            "The input is valid Base64 but not a 128-bit identifier");
    }

    Uuid u;
    std::memcpy(u.bytes.data(), raw.data(), 16);
    return Result<Uuid>::ok(u);
}

std::string ShortGuid::encode(const Uuid& uuid) {
    return base64::encode_url(uuid.bytes.data(), uuid.bytes.size());
}

// ---- Bytes ----

ShortGuid ShortGuid::from_bytes(const Bytes& bytes) {
    Uuid u;
    u.bytes = bytes;
    return ShortGuid(u);
}

ShortGuid ShortGuid::from_bytes_le(const Bytes& le) {
    return ShortGuid(Uuid::from_bytes_le(le));
}

Result<ShortGuid> ShortGuid::from_slice(const uint8_t* data, size_t len) {
    if (len != 16) {
        return ShortGuidError(ShortGuidError::InvalidLength,
            "Invalid slice; expected 16 bytes, got " + std::to_string(len));
    }
    Uuid u;
    std::memcpy(u.bytes.data(), data, 16);
    return Result<ShortGuid>::ok(ShortGuid(u));
}

Result<ShortGuid> ShortGuid::from_slice(const std::vector<uint8_t>& bytes) {
    return from_slice(bytes.data(), bytes.size());
}

std::string ShortGuid::debug_string() const {
    return to_string() + " (" + uuid_.to_string() + ")";
}

int ShortGuid::compare(const ShortGuid& other) const {
    int c = std::memcmp(as_bytes().data(), other.as_bytes().data(), 16);
    return (c > 0) - (c < 0);
}

// ---- Equality ----

bool operator==(const ShortGuid& a, const ShortGuid& b) {
    return same_bytes(a.as_bytes(), b.as_bytes());
}

bool operator==(const ShortGuid& a, const Uuid& b) {
    return same_bytes(a.as_bytes(), b.bytes);
}

bool operator==(const ShortGuid& a, const Bytes& b) {
    return same_bytes(a.as_bytes(), b);
}

bool operator==(const ShortGuid& a, const std::vector<uint8_t>& b) {
    auto other = ShortGuid::from_slice(b);
    return other.is_ok() && same_bytes(a.as_bytes(), other.value().as_bytes());
}

bool operator==(const ShortGuid& a, std::string_view b) {
    auto other = ShortGuid::try_parse(b);
    return other.is_ok() && same_bytes(a.as_bytes(), other.value().as_bytes());
}

bool operator==(const ShortGuid& a, const std::string& b) {
    return a == std::string_view(b);
}

bool operator==(const ShortGuid& a, const char* b) {
    return b != nullptr && a == std::string_view(b);
}

bool operator==(const Uuid& a, const ShortGuid& b) { return b == a; }
bool operator==(const Bytes& a, const ShortGuid& b) { return b == a; }
bool operator==(const std::vector<uint8_t>& a, const ShortGuid& b) { return b == a; }
bool operator==(std::string_view a, const ShortGuid& b) { return b == a; }
bool operator==(const std::string& a, const ShortGuid& b) { return b == a; }
bool operator==(const char* a, const ShortGuid& b) { return b == a; }

// ---- Ordering ----

bool operator<(const ShortGuid& a, const ShortGuid& b) { return a.compare(b) < 0; }
bool operator>(const ShortGuid& a, const ShortGuid& b) { return a.compare(b) > 0; }
bool operator<=(const ShortGuid& a, const ShortGuid& b) { return a.compare(b) <= 0; }
bool operator>=(const ShortGuid& a, const ShortGuid& b) { return a.compare(b) >= 0; }

std::ostream& operator<<(std::ostream& os, const ShortGuid& id) {
    return os << id.to_string();
}

} // namespace shortguid
