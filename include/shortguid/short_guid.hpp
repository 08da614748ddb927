#pragma once

#include <shortguid/result.hpp>
#include <shortguid/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace shortguid {

// A UUID rendered as 22 characters of unpadded URL-safe Base64.
//
//   auto a = ShortGuid::try_parse("c9a646d3-9c61-4cb7-bfcd-ee2522c8f633");
//   auto b = ShortGuid::try_parse("yaZG05xhTLe_ze4lIsj2Mw");
//   a.value() == b.value();                  // true
//   a.value().to_string();                   // "yaZG05xhTLe_ze4lIsj2Mw"
//
// Holds nothing but the 16 bytes of the wrapped Uuid. The dashed and undashed
// hex forms are accepted by try_parse but never produced.
class ShortGuid {
public:
    static constexpr size_t encoded_length = 22;

    // The nil value (all zero bytes).
    ShortGuid() = default;
    explicit ShortGuid(const Uuid& uuid) : uuid_(uuid) {}

    static ShortGuid from_uuid(const Uuid& uuid) { return ShortGuid(uuid); }

#ifdef SHORTGUID_ENABLE_RANDOM
    // A fresh version 4 UUID.
    static ShortGuid new_random();
#endif

    // Accepts, by length:
    //   36  dashed hex    c9a646d3-9c61-4cb7-bfcd-ee2522c8f633
    //   32  undashed hex  c9a646d39c614cb7bfcdee2522c8f633
    //   22  short form    yaZG05xhTLe_ze4lIsj2Mw   (24 with "==" padding)
    // Any other length is InvalidLength. Hex digits are case-insensitive.
    static Result<ShortGuid> try_parse(std::string_view s);

    // Short form only. A string that is valid Base64 but does not carry
    // exactly 16 bytes fails with DecodedLengthMismatch.
    static Result<Uuid> try_decode(std::string_view s);

    static std::string encode(const Uuid& uuid);

    static ShortGuid from_bytes(const Bytes& bytes);
    static ShortGuid from_bytes_le(const Bytes& le);
    static Result<ShortGuid> from_slice(const uint8_t* data, size_t len);
    static Result<ShortGuid> from_slice(const std::vector<uint8_t>& bytes);

    bool is_empty() const { return uuid_.is_nil(); }

    const Uuid& as_uuid() const { return uuid_; }
    const Bytes& as_bytes() const { return uuid_.bytes; }
    Bytes to_bytes_le() const { return uuid_.to_bytes_le(); }

    // The canonical 22-character form.
    std::string to_string() const { return encode(uuid_); }

    // "<short> (<dashed uuid>)"
    std::string debug_string() const;

    // Orders by the raw big-endian bytes. This is NOT the order of the
    // short strings: the Base64 symbol order (A-Z, a-z, 0-9, '-', '_')
    // differs from ASCII, so sorting the text gives a different sequence.
    int compare(const ShortGuid& other) const;

    explicit operator Uuid() const { return uuid_; }

private:
    Uuid uuid_;
};

// Equality against every accepted representation. Text is parsed with
// try_parse (a parse failure compares unequal); byte sequences compare
// unequal unless they hold exactly 16 bytes.
bool operator==(const ShortGuid& a, const ShortGuid& b);
bool operator==(const ShortGuid& a, const Uuid& b);
bool operator==(const ShortGuid& a, const Bytes& b);
bool operator==(const ShortGuid& a, const std::vector<uint8_t>& b);
bool operator==(const ShortGuid& a, std::string_view b);
bool operator==(const ShortGuid& a, const std::string& b);
bool operator==(const ShortGuid& a, const char* b);

bool operator==(const Uuid& a, const ShortGuid& b);
bool operator==(const Bytes& a, const ShortGuid& b);
bool operator==(const std::vector<uint8_t>& a, const ShortGuid& b);
bool operator==(std::string_view a, const ShortGuid& b);
bool operator==(const std::string& a, const ShortGuid& b);
bool operator==(const char* a, const ShortGuid& b);

template<typename T>
bool operator!=(const ShortGuid& a, const T& b) { return !(a == b); }
template<typename T, typename = std::enable_if_t<!std::is_same_v<T, ShortGuid>>>
bool operator!=(const T& a, const ShortGuid& b) { return !(a == b); }

bool operator<(const ShortGuid& a, const ShortGuid& b);
bool operator>(const ShortGuid& a, const ShortGuid& b);
bool operator<=(const ShortGuid& a, const ShortGuid& b);
bool operator>=(const ShortGuid& a, const ShortGuid& b);

std::ostream& operator<<(std::ostream& os, const ShortGuid& id);

} // namespace shortguid

namespace std {
template<>
struct hash<shortguid::ShortGuid> {
    size_t operator()(const shortguid::ShortGuid& id) const noexcept {
        return hash<shortguid::Uuid>()(id.as_uuid());
    }
};
} // namespace std
