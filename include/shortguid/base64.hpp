#pragma once

#include <shortguid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shortguid::base64 {

// URL-safe alphabet (RFC 4648 section 5): '-' and '_' replace '+' and '/'.
// Output is never padded.
std::string encode_url(const uint8_t* data, size_t len);

// Standard alphabet with '=' padding, as printed by the CLI.
std::string encode_standard(const uint8_t* data, size_t len);

// Decodes URL-safe input, padded or unpadded.
// Fails with InvalidEncoding on characters outside the alphabet, misplaced
// padding, an impossible length, or non-zero trailing bits in the last symbol.
Result<std::vector<uint8_t>> decode_url(std::string_view s);

} // namespace shortguid::base64
