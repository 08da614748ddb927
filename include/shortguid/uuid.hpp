#pragma once

#include <shortguid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace shortguid {

using Bytes = std::array<uint8_t, 16>;

// A 128-bit identifier in RFC 4122 byte order: time_low (4 bytes),
// time_mid (2), time_hi_and_version (2), all big-endian, then 8 opaque
// clock-sequence/node bytes.
struct Uuid {
    Bytes bytes{};

    static Uuid nil() { return Uuid{}; }
    bool is_nil() const;

#ifdef SHORTGUID_ENABLE_RANDOM
    static Uuid v4();
#endif

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    // 32 lowercase hex digits, no separators
    std::string to_hex() const;

    static Result<Uuid> from_string(std::string_view s);
    static Result<Uuid> from_hex(std::string_view s);

    // Byte view with the three leading fields in little-endian order
    // (the in-memory layout of a Microsoft GUID). Applying it twice is
    // the identity.
    Bytes to_bytes_le() const;
    static Uuid from_bytes_le(const Bytes& le);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

} // namespace shortguid

namespace std {
template<>
struct hash<shortguid::Uuid> {
    size_t operator()(const shortguid::Uuid& u) const noexcept;
};
} // namespace std
