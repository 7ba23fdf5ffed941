#include <gradelib/macros/throw.hh>
#include <gradelib/sha.hh>
#include <openssl/evp.h>

Sha1::Sha1()
: ctx_{EVP_MD_CTX_new()} {
    if (ctx_ == nullptr) {
        THROW("EVP_MD_CTX_new() failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        THROW("EVP_DigestInit_ex() failed");
    }
}

Sha1::~Sha1() { EVP_MD_CTX_free(ctx_); }

void Sha1::update(const void* data, size_t len) {
    if (EVP_DigestUpdate(ctx_, data, len) != 1) {
        THROW("EVP_DigestUpdate() failed");
    }
}

std::string Sha1::hex_digest() {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out, &len) != 1) {
        THROW("EVP_DigestFinal_ex() failed");
    }

    static constexpr char digits[] = "0123456789abcdef";
    std::string res(len * 2, '\0');
    for (unsigned i = 0; i < len; ++i) {
        res[2 * i] = digits[out[i] >> 4];
        res[2 * i + 1] = digits[out[i] & 15];
    }
    return res;
}

std::string sha1(std::string_view str) {
    Sha1 sha;
    sha.update(str);
    return sha.hex_digest();
}
