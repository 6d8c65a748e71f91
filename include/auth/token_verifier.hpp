#ifndef TOKEN_VERIFIER_HPP
#define TOKEN_VERIFIER_HPP

#include "../utils/time_utils.hpp"
#include <string>

namespace rendezvous {

struct AuthenticatedUser {
    std::string user_id;
    std::string display_name;
};

/**
 * Verifies bearer tokens issued elsewhere. Identity issuance is not part
 * of this server.
 */
class TokenVerifier {
public:
    virtual ~TokenVerifier() = default;

    // Throws AuthError (unauthorized, invalid_token, token_expired)
    virtual AuthenticatedUser verify(const std::string& token) const = 0;
};

/**
 * HS256 JSON Web Tokens. Requires the "sub" and "exp" claims; "name"
 * becomes the display name when present.
 */
class JwtTokenVerifier : public TokenVerifier {
public:
    explicit JwtTokenVerifier(const std::string& secret, Clock clock = systemClock());

    AuthenticatedUser verify(const std::string& token) const override;

    // Issues a token with the same secret. Used by tests and local tooling.
    std::string sign(const std::string& user_id, int64_t expires_at_seconds,
                     const std::string& display_name = "") const;

private:
    std::string secret_;
    Clock clock_;
};

/**
 * Treats the token itself as the user id. Only for RENDEZVOUS_STORE=memory
 * without a configured secret.
 */
class DevelopmentTokenVerifier : public TokenVerifier {
public:
    AuthenticatedUser verify(const std::string& token) const override;
};

// Extracts the token from "Bearer <token>"; empty if the header has another scheme
std::string bearerToken(const std::string& authorization_header);

} // namespace rendezvous

#endif // TOKEN_VERIFIER_HPP
