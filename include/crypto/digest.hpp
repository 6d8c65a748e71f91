#ifndef DIGEST_HPP
#define DIGEST_HPP

#include <string>
#include <memory>
#include <openssl/evp.h>

namespace rendezvous {
namespace crypto {

std::string sha256Hex(const std::string& data);
std::string hmacSha256(const std::string& key, const std::string& data);

std::string base64Encode(const std::string& data);
// Throws std::invalid_argument on characters outside the alphabet or bad padding
std::string base64Decode(const std::string& encoded);
std::string base64UrlEncode(const std::string& data);
std::string base64UrlDecode(const std::string& encoded);

std::string toHex(const std::string& bytes);
// Hex string of `bytes` random bytes from the OpenSSL CSPRNG. Throws std::runtime_error on failure.
std::string randomHex(size_t bytes);
bool constantTimeEquals(const std::string& a, const std::string& b);

/**
 * Incremental SHA-256, used to hash assembled transfers without loading
 * them into memory.
 */
class Sha256Stream {
public:
    Sha256Stream();

    void update(const char* data, size_t size);
    void update(const std::string& data) { update(data.data(), data.size()); }
    std::string finalHex();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool finished_ = false;
};

} // namespace crypto
} // namespace rendezvous

#endif // DIGEST_HPP
