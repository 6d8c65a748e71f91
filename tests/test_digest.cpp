#include <catch2/catch.hpp>
#include "crypto/digest.hpp"

using namespace rendezvous;

TEST_CASE("sha256 known vectors", "[crypto]") {
    CHECK(crypto::sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(crypto::sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("streaming sha256 matches the one-shot digest", "[crypto]") {
    const std::string data = "The quick brown fox jumps over the lazy dog";
    crypto::Sha256Stream stream;
    stream.update(data.substr(0, 10));
    stream.update(data.substr(10));
    CHECK(stream.finalHex() == crypto::sha256Hex(data));
}

TEST_CASE("hmac-sha256 known vector", "[crypto]") {
    const std::string mac = crypto::hmacSha256("key", "The quick brown fox jumps over the lazy dog");
    CHECK(crypto::toHex(mac) == "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST_CASE("base64", "[crypto]") {
    CHECK(crypto::base64Encode("") == "");
    CHECK(crypto::base64Encode("f") == "Zg==");
    CHECK(crypto::base64Encode("fo") == "Zm8=");
    CHECK(crypto::base64Encode("hello") == "aGVsbG8=");
    CHECK(crypto::base64Decode("Zm9v") == "foo");
    CHECK(crypto::base64Decode("aGVsbG8=") == "hello");

    CHECK_THROWS_AS(crypto::base64Decode("Zm9v!"), std::invalid_argument);
    CHECK_THROWS_AS(crypto::base64Decode("Zm=v"), std::invalid_argument);
    CHECK_THROWS_AS(crypto::base64Decode("Zm9*"), std::invalid_argument);
}

TEST_CASE("base64url uses the url-safe alphabet without padding", "[crypto]") {
    const std::string bytes("\xfb\xff\xbf", 3);
    CHECK(crypto::base64Encode(bytes) == "+/+/");
    CHECK(crypto::base64UrlEncode(bytes) == "-_-_");
    CHECK(crypto::base64UrlEncode("f") == "Zg");
    CHECK(crypto::base64UrlDecode("-_-_") == bytes);
    CHECK(crypto::base64UrlDecode("Zg") == "f");
    CHECK_THROWS_AS(crypto::base64UrlDecode("+/+/"), std::invalid_argument);
}

TEST_CASE("random hex and constant time comparison", "[crypto]") {
    const std::string a = crypto::randomHex(16);
    const std::string b = crypto::randomHex(16);
    CHECK(a.size() == 32);
    CHECK(a != b);
    CHECK(a.find_first_not_of("0123456789abcdef") == std::string::npos);

    CHECK(crypto::constantTimeEquals("abc", "abc"));
    CHECK_FALSE(crypto::constantTimeEquals("abc", "abd"));
    CHECK_FALSE(crypto::constantTimeEquals("abc", "abcd"));
}
