#include <catch2/catch_test_macros.hpp>

#include "core/base64.hpp"

using namespace nbfs;

TEST_CASE("base64 decodes padded and unpadded input", "[base64]") {
    CHECK(base64::decode("UE5HIQ==").value() == "PNG!");
    CHECK(base64::decode("UE5HIQ").value() == "PNG!");
    CHECK(base64::decode("TWFu").value() == "Man");
    CHECK(base64::decode("TWE=").value() == "Ma");
    CHECK(base64::decode("").value().empty());
}

TEST_CASE("base64 ignores embedded line breaks", "[base64]") {
    CHECK(base64::decode("TW\nFu\r\nTWE=\n").value() == "ManMa");
}

TEST_CASE("base64 decodes binary bytes", "[base64]") {
    auto decoded = base64::decode("iVBORw0KGgo=");
    REQUIRE(decoded.ok());
    const std::string png_magic("\x89PNG\r\n\x1a\n", 8);
    CHECK(decoded.value() == png_magic);
    CHECK(base64::encode(png_magic) == "iVBORw0KGgo=");
}

TEST_CASE("base64 rejects malformed input", "[base64]") {
    CHECK_FALSE(base64::decode("T").ok());
    CHECK_FALSE(base64::decode("TW*u").ok());
    CHECK_FALSE(base64::decode("TQ==TQ==").ok());
    CHECK(base64::decode("!!!!").error().kind == ErrorKind::ParseError);
}
