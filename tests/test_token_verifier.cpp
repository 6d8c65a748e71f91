#include <catch2/catch.hpp>
#include "auth/token_verifier.hpp"
#include "crypto/digest.hpp"
#include "test_support.hpp"

using namespace rendezvous;
using rendezvous::test::ManualClock;
using rendezvous::test::errorCodeOf;

TEST_CASE("jwt tokens signed with the shared secret verify", "[auth]") {
    ManualClock clock;
    JwtTokenVerifier verifier("secret", clock.clock());
    const int64_t now_seconds = clock.now() / 1000;

    SECTION("subject and display name") {
        auto user = verifier.verify(verifier.sign("alice", now_seconds + 60, "Alice"));
        CHECK(user.user_id == "alice");
        CHECK(user.display_name == "Alice");
    }

    SECTION("display name defaults to the subject") {
        auto user = verifier.verify(verifier.sign("bob", now_seconds + 60));
        CHECK(user.display_name == "bob");
    }

    SECTION("expired") {
        const std::string token = verifier.sign("alice", now_seconds + 60);
        clock.advanceSeconds(120);
        CHECK(errorCodeOf([&] { verifier.verify(token); }) == "token_expired");
    }
}

TEST_CASE("jwt verification rejects forged or malformed tokens", "[auth]") {
    ManualClock clock;
    JwtTokenVerifier verifier("secret", clock.clock());
    JwtTokenVerifier other("another-secret", clock.clock());
    const int64_t exp = clock.now() / 1000 + 60;

    CHECK(errorCodeOf([&] { verifier.verify(""); }) == "unauthorized");
    CHECK(errorCodeOf([&] { verifier.verify("not-a-jwt"); }) == "invalid_token");
    CHECK(errorCodeOf([&] { verifier.verify("a.b.c.d"); }) == "invalid_token");
    CHECK(errorCodeOf([&] { verifier.verify(other.sign("alice", exp)); }) == "invalid_token");

    SECTION("payload swapped after signing") {
        const std::string token = verifier.sign("alice", exp);
        const size_t first = token.find('.');
        const size_t second = token.find('.', first + 1);
        const std::string forged_payload = crypto::base64UrlEncode(
            "{\"sub\":\"mallory\",\"exp\":" + std::to_string(exp) + "}");
        const std::string forged = token.substr(0, first + 1) + forged_payload + token.substr(second);
        CHECK(errorCodeOf([&] { verifier.verify(forged); }) == "invalid_token");
    }

    SECTION("unsigned algorithm") {
        const std::string header = crypto::base64UrlEncode("{\"alg\":\"none\"}");
        const std::string payload = crypto::base64UrlEncode("{\"sub\":\"alice\",\"exp\":" + std::to_string(exp) + "}");
        CHECK(errorCodeOf([&] { verifier.verify(header + "." + payload + "."); }) == "invalid_token");
    }

    SECTION("empty secret is a configuration error") {
        CHECK_THROWS_AS(JwtTokenVerifier(""), ValidationError);
    }
}

TEST_CASE("development verifier treats the token as the user id", "[auth]") {
    DevelopmentTokenVerifier verifier;
    CHECK(verifier.verify("carol").user_id == "carol");
    CHECK(errorCodeOf([&] { verifier.verify("bad id"); }) == "invalid_token");
    CHECK(errorCodeOf([&] { verifier.verify(""); }) == "unauthorized");
}

TEST_CASE("bearer token extraction", "[auth]") {
    CHECK(bearerToken("Bearer abc") == "abc");
    CHECK(bearerToken("bearer  abc ") == "abc");
    CHECK(bearerToken("Basic xyz") == "");
    CHECK(bearerToken("Bearer ") == "");
    CHECK(bearerToken("") == "");
}
