#include "../../include/crypto/digest.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <vector>
#include <cctype>

namespace rendezvous {
namespace crypto {

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH));
}

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(),
         reinterpret_cast<const unsigned char*>(key.data()),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         digest,
         &len);
    return std::string(reinterpret_cast<const char*>(digest), len);
}

std::string base64Encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);

    BUF_MEM* buf_mem = nullptr;
    BIO_get_mem_ptr(bio, &buf_mem);

    std::string result(buf_mem->data, buf_mem->length);
    BIO_free_all(bio);

    return result;
}

std::string base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return "";
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("Base64 input length must be a multiple of 4");
    }
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        const char c = encoded[i];
        if (c == '=') {
            if (i + 2 < encoded.size()) {
                throw std::invalid_argument("Base64 padding in the middle of input");
            }
            padding++;
            continue;
        }
        if (padding > 0 || !(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/')) {
            throw std::invalid_argument("Invalid base64 character");
        }
    }

    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::vector<char> result(encoded.size());
    int decoded_len = BIO_read(bio, result.data(), static_cast<int>(result.size()));

    BIO_free_all(bio);

    const size_t expected = encoded.size() / 4 * 3 - padding;
    if (decoded_len < 0 || static_cast<size_t>(decoded_len) != expected) {
        throw std::invalid_argument("Base64 decode failed");
    }

    return std::string(result.data(), static_cast<size_t>(decoded_len));
}

std::string base64UrlEncode(const std::string& data) {
    std::string out = base64Encode(data);
    for (char& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

std::string base64UrlDecode(const std::string& encoded) {
    std::string standard = encoded;
    for (char& c : standard) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') {
            throw std::invalid_argument("Invalid base64url character");
        }
    }
    if (standard.size() % 4 == 1) {
        throw std::invalid_argument("Invalid base64url length");
    }
    while (standard.size() % 4 != 0) {
        standard += '=';
    }
    return base64Decode(standard);
}

std::string toHex(const std::string& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : bytes) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

std::string randomHex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return toHex(std::string(buffer.begin(), buffer.end()));
}

bool constantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    }
    return diff == 0;
}

Sha256Stream::Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 context");
    }
}

void Sha256Stream::update(const char* data, size_t size) {
    if (finished_) {
        throw std::logic_error("Sha256Stream already finalised");
    }
    if (size > 0 && EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256Stream::finalHex() {
    if (finished_) {
        throw std::logic_error("Sha256Stream already finalised");
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &len) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    finished_ = true;
    return toHex(std::string(reinterpret_cast<const char*>(hash), len));
}

} // namespace crypto
} // namespace rendezvous
