#pragma once

#include <cstddef>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

// Incremental SHA-1 (via OpenSSL's EVP interface)
class Sha1 {
    evp_md_ctx_st* ctx_;

public:
    Sha1();

    Sha1(const Sha1&) = delete;
    Sha1(Sha1&&) = delete;
    Sha1& operator=(const Sha1&) = delete;
    Sha1& operator=(Sha1&&) = delete;

    ~Sha1();

    void update(const void* data, size_t len);

    void update(std::string_view str) { update(str.data(), str.size()); }

    // Returns 40 bytes long hash ([a-f0-9]+), the object cannot be updated
    // afterwards
    std::string hex_digest();
};

// Returns 40 bytes long hash ([a-f0-9]+)
std::string sha1(std::string_view str);
