#pragma once

#include <shortguid/short_guid.hpp>
#include <tomlplusplus/toml.hpp>
#include <string_view>

// ShortGuid <-> TOML values. Identifiers are written in the 22-character
// form so documents stay readable; readers also accept the two hex forms
// and an array of 16 byte values.
namespace shortguid {

toml::value<std::string> to_toml(const ShortGuid& id);

void insert_toml(toml::table& tbl, std::string_view key, const ShortGuid& id);

Result<ShortGuid> from_toml(const toml::node& node);

// NotFound when the key is absent.
Result<ShortGuid> read_toml(const toml::table& tbl, std::string_view key);

} // namespace shortguid
