#include <catch2/catch.hpp>
#include "utils/json_parser.hpp"

using namespace rendezvous;

TEST_CASE("parseObject keeps strings unescaped and other values raw", "[json]") {
    auto fields = JsonParser::parseObject(
        R"({"a":"x\"y","n":42,"o":{"k":[1, 2]},"z":null,"b":true,"u":"é"})");

    REQUIRE(fields.size() == 6);
    CHECK(fields["a"].is_string);
    CHECK(fields["a"].value == "x\"y");
    CHECK(fields["n"].value == "42");
    CHECK_FALSE(fields["n"].is_string);
    CHECK(fields["o"].isObject());
    CHECK(fields["o"].value == R"({"k":[1, 2]})");
    CHECK(fields["z"].isNull());
    CHECK(fields["b"].value == "true");
    CHECK(fields["u"].value == "\xC3\xA9");
}

TEST_CASE("parseObject rejects malformed input", "[json]") {
    CHECK_THROWS_AS(JsonParser::parseObject(R"({"a":})"), std::invalid_argument);
    CHECK_THROWS_AS(JsonParser::parseObject(R"({"a":1} x)"), std::invalid_argument);
    CHECK_THROWS_AS(JsonParser::parseObject("[1]"), std::invalid_argument);
    CHECK_THROWS_AS(JsonParser::parseObject(R"({"a":"unterminated)"), std::invalid_argument);
    CHECK_THROWS_AS(JsonParser::parseObject(""), std::invalid_argument);
    CHECK_FALSE(JsonParser::isObject("not json"));
    CHECK(JsonParser::isValid("[1,{\"a\":null}]"));
}

TEST_CASE("typed accessors", "[json]") {
    auto fields = JsonParser::parseObject(R"({"s":"text","i":123,"q":"77","bad":"abc","f":false,"nil":null})");

    SECTION("strings") {
        CHECK(JsonParser::getString(fields, "s") == "text");
        CHECK(JsonParser::getString(fields, "missing", "dflt") == "dflt");
        CHECK(JsonParser::getString(fields, "nil", "dflt") == "dflt");
        CHECK_THROWS_AS(JsonParser::getString(fields, "i"), std::invalid_argument);
    }

    SECTION("integers") {
        CHECK(JsonParser::getInt(fields, "i") == 123);
        CHECK(JsonParser::getInt(fields, "q") == 77);
        CHECK(JsonParser::getInt(fields, "missing", -1) == -1);
        CHECK_THROWS_AS(JsonParser::getInt(fields, "bad"), std::invalid_argument);
    }

    SECTION("booleans and raw") {
        CHECK_FALSE(JsonParser::getBool(fields, "f", true));
        CHECK_THROWS_AS(JsonParser::getBool(fields, "s"), std::invalid_argument);
        CHECK(JsonParser::getRaw(fields, "s") == "\"text\"");
        CHECK(JsonParser::getRaw(fields, "missing") == "null");
    }
}

TEST_CASE("string arrays", "[json]") {
    auto values = JsonParser::parseStringArray(R"(["a", "b\nc"])");
    REQUIRE(values.size() == 2);
    CHECK(values[1] == "b\nc");
    CHECK_THROWS_AS(JsonParser::parseStringArray("[1]"), std::invalid_argument);
    CHECK(JsonParser::parseArray("[]").empty());
}

TEST_CASE("response builders escape their input", "[json]") {
    CHECK(JsonParser::quote("a\"b\n") == "\"a\\\"b\\n\"");
    CHECK(JsonParser::createErrorResponse("room_full", "Room \"x\" is full") ==
          R"({"success":false,"error":{"code":"room_full","message":"Room \"x\" is full"}})");
    CHECK(JsonParser::stringify({{"k", "v"}}) == R"({"k":"v"})");
}
