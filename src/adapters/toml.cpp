#include <shortguid/toml.hpp>
#include <cstdint>

namespace shortguid {

toml::value<std::string> to_toml(const ShortGuid& id) {
    return toml::value<std::string>(id.to_string());
}

void insert_toml(toml::table& tbl, std::string_view key, const ShortGuid& id) {
    tbl.insert_or_assign(key, to_toml(id));
}

static Result<ShortGuid> from_toml_array(const toml::array& arr) {
    if (arr.size() != 16) {
        return ShortGuidError(ShortGuidError::InvalidLength,
            "ID byte array must have 16 elements, got " + std::to_string(arr.size()));
    }
    Bytes bytes{};
    for (size_t i = 0; i < 16; ++i) {
        auto v = arr[i].value<int64_t>();
        if (!v || *v < 0 || *v > 255) {
            return ShortGuidError(ShortGuidError::InvalidEncoding,
                "ID byte array element " + std::to_string(i) + " is not an integer in 0..255");
        }
        bytes[i] = static_cast<uint8_t>(*v);
    }
    return Result<ShortGuid>::ok(ShortGuid::from_bytes(bytes));
}

Result<ShortGuid> from_toml(const toml::node& node) {
    if (node.is_string()) {
        auto parsed = ShortGuid::try_parse(node.value_or(std::string{}));
        if (parsed.is_err()) {
            auto err = std::move(parsed).error();
            err.message = "ShortGuid parsing failed: " + err.message;
            return err;
        }
        return parsed;
    }
    if (auto arr = node.as_array()) {
        return from_toml_array(*arr);
    }
    return ShortGuidError(ShortGuidError::InvalidEncoding,
        "expected a ShortGuid string or an array of 16 bytes");
}

Result<ShortGuid> read_toml(const toml::table& tbl, std::string_view key) {
    const toml::node* node = tbl.get(key);
    if (!node) {
        return ShortGuidError(ShortGuidError::NotFound,
            "missing key '" + std::string(key) + "'");
    }
    return from_toml(*node);
}

} // namespace shortguid
