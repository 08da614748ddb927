#include <catch2/catch.hpp>
#include <shortguid/toml.hpp>
#include <sstream>

using namespace shortguid;

static const char* uuid_str = "f9168c5e-ceb2-4faa-b6bf-329bf39fa1e4";
static const char* short_str = "-RaMXs6yT6q2vzKb85-h5A";

TEST_CASE("to_toml writes the short form", "[toml]") {
    auto id = ShortGuid::try_parse(uuid_str).value();
    auto v = to_toml(id);
    REQUIRE(v.get() == short_str);
}

TEST_CASE("insert_toml then read_toml", "[toml]") {
    auto id = ShortGuid::try_parse(uuid_str).value();
    toml::table tbl;
    insert_toml(tbl, "id", id);

    std::ostringstream os;
    os << tbl;
    REQUIRE(os.str().find(short_str) != std::string::npos);

    auto back = read_toml(tbl, "id");
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == id);
}

TEST_CASE("from_toml accepts every text form", "[toml]") {
    toml::table doc = toml::parse(R"(
short = "-RaMXs6yT6q2vzKb85-h5A"
dashed = "f9168c5e-ceb2-4faa-b6bf-329bf39fa1e4"
hex = "F9168C5ECEB24FAAB6BF329BF39FA1E4"
)");
    auto expected = ShortGuid::try_parse(uuid_str).value();
    REQUIRE(read_toml(doc, "short").value() == expected);
    REQUIRE(read_toml(doc, "dashed").value() == expected);
    REQUIRE(read_toml(doc, "hex").value() == expected);
}

TEST_CASE("from_toml accepts an array of 16 bytes", "[toml]") {
    toml::table doc = toml::parse(R"(
id = [161, 162, 163, 164, 177, 178, 193, 194, 209, 210, 211, 212, 213, 214, 215, 216]
)");
    auto r = read_toml(doc, "id");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == "a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8");
}

TEST_CASE("from_toml rejects malformed values", "[toml]") {
    toml::table doc = toml::parse(R"(
bad_text = "Nothing to see here..."
short_text = "abc"
short_array = [1, 2, 3]
big_byte = [256, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0]
not_int = ["a", 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0]
number = 42
)");
    auto bad_text = read_toml(doc, "bad_text");
    REQUIRE(bad_text.is_err(ShortGuidError::InvalidEncoding));
    REQUIRE(bad_text.error().message.find("ShortGuid parsing failed") == 0);

    REQUIRE(read_toml(doc, "short_text").is_err(ShortGuidError::InvalidLength));
    REQUIRE(read_toml(doc, "short_array").is_err(ShortGuidError::InvalidLength));
    REQUIRE(read_toml(doc, "big_byte").is_err(ShortGuidError::InvalidEncoding));
    REQUIRE(read_toml(doc, "not_int").is_err(ShortGuidError::InvalidEncoding));
    REQUIRE(read_toml(doc, "number").is_err(ShortGuidError::InvalidEncoding));
}

TEST_CASE("read_toml of a missing key is NotFound", "[toml]") {
    toml::table tbl;
    REQUIRE(read_toml(tbl, "id").is_err(ShortGuidError::NotFound));
}
