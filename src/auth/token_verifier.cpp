#include "../../include/auth/token_verifier.hpp"
#include "../../include/common/errors.hpp"
#include "../../include/crypto/digest.hpp"
#include "../../include/utils/json_parser.hpp"
#include <cctype>
#include <sstream>

namespace rendezvous {

namespace {

const size_t kMaxTokenLength = 8192;

std::map<std::string, JsonField> decodeSegment(const std::string& segment, const char* what) {
    try {
        return JsonParser::parseObject(crypto::base64UrlDecode(segment));
    } catch (const std::invalid_argument&) {
        throw AuthError(std::string("Malformed token ") + what);
    }
}

} // namespace

JwtTokenVerifier::JwtTokenVerifier(const std::string& secret, Clock clock)
    : secret_(secret)
    , clock_(std::move(clock)) {
    if (secret_.empty()) {
        throw ValidationError("JWT secret must not be empty");
    }
}

AuthenticatedUser JwtTokenVerifier::verify(const std::string& token) const {
    if (token.empty()) {
        throw AuthError("Missing bearer token", ErrorCode::UNAUTHORIZED);
    }
    if (token.size() > kMaxTokenLength) {
        throw AuthError("Token too long");
    }

    const size_t first_dot = token.find('.');
    const size_t second_dot = first_dot == std::string::npos ? std::string::npos : token.find('.', first_dot + 1);
    if (second_dot == std::string::npos || token.find('.', second_dot + 1) != std::string::npos) {
        throw AuthError("Token is not a JWT");
    }

    const std::string header_segment = token.substr(0, first_dot);
    const std::string payload_segment = token.substr(first_dot + 1, second_dot - first_dot - 1);
    const std::string signature_segment = token.substr(second_dot + 1);

    auto header = decodeSegment(header_segment, "header");
    if (JsonParser::getString(header, "alg") != "HS256") {
        throw AuthError("Unsupported token algorithm");
    }

    const std::string expected = crypto::base64UrlEncode(
        crypto::hmacSha256(secret_, header_segment + "." + payload_segment));
    if (!crypto::constantTimeEquals(expected, signature_segment)) {
        throw AuthError("Token signature is invalid");
    }

    auto claims = decodeSegment(payload_segment, "payload");
    AuthenticatedUser user;
    int64_t expires_at = 0;
    int64_t not_before = 0;
    try {
        user.user_id = JsonParser::getString(claims, "sub");
        user.display_name = JsonParser::getString(claims, "name");
        expires_at = JsonParser::getInt(claims, "exp", -1);
        not_before = JsonParser::getInt(claims, "nbf", 0);
    } catch (const std::invalid_argument& e) {
        throw AuthError(std::string("Malformed token claims: ") + e.what());
    }

    if (user.user_id.empty()) {
        throw AuthError("Token has no subject");
    }
    if (expires_at < 0) {
        throw AuthError("Token has no expiry");
    }

    const int64_t now_seconds = clock_() / 1000;
    if (now_seconds >= expires_at) {
        throw AuthError("Token has expired", ErrorCode::TOKEN_EXPIRED);
    }
    if (not_before > 0 && now_seconds < not_before) {
        throw AuthError("Token is not valid yet");
    }

    if (user.display_name.empty()) {
        user.display_name = user.user_id;
    }
    return user;
}

std::string JwtTokenVerifier::sign(const std::string& user_id, int64_t expires_at_seconds,
                                   const std::string& display_name) const {
    const std::string header = crypto::base64UrlEncode("{\"alg\":\"HS256\",\"typ\":\"JWT\"}");

    std::ostringstream claims;
    claims << "{\"sub\":" << JsonParser::quote(user_id) << ",\"exp\":" << expires_at_seconds;
    if (!display_name.empty()) {
        claims << ",\"name\":" << JsonParser::quote(display_name);
    }
    claims << "}";

    const std::string payload = crypto::base64UrlEncode(claims.str());
    const std::string signature = crypto::base64UrlEncode(crypto::hmacSha256(secret_, header + "." + payload));
    return header + "." + payload + "." + signature;
}

AuthenticatedUser DevelopmentTokenVerifier::verify(const std::string& token) const {
    if (token.empty()) {
        throw AuthError("Missing bearer token", ErrorCode::UNAUTHORIZED);
    }
    if (token.size() > 128) {
        throw AuthError("Token too long");
    }
    for (char c : token) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-' || c == '.';
        if (!ok) {
            throw AuthError("Development tokens are plain user ids");
        }
    }
    return AuthenticatedUser{token, token};
}

std::string bearerToken(const std::string& authorization_header) {
    const std::string prefix = "Bearer ";
    if (authorization_header.size() <= prefix.size()) {
        return "";
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(authorization_header[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return "";
        }
    }
    std::string token = authorization_header.substr(prefix.size());
    size_t start = token.find_first_not_of(' ');
    size_t end = token.find_last_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    return token.substr(start, end - start + 1);
}

} // namespace rendezvous
