// COMMONIP - SHA256 Hash Function
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP interface. Used to fingerprint
// free-text fields (metadata URIs, license terms, proposal descriptions).

#ifndef COMMONIP_CRYPTO_SHA256_H
#define COMMONIP_CRYPTO_SHA256_H

#include "commonip/core/types.h"

#include <cstddef>
#include <string>

// OpenSSL context type, kept out of the public header
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace commonip {

/// SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Feed data into the hasher
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::string& text) {
        return Write(reinterpret_cast<const Byte*>(text.data()), text.size());
    }

    /// Write the digest to `hash` and reset
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Discard any buffered input
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

/// One-shot SHA-256 of a text field
Hash256 SHA256Hash(const std::string& text);

/// Deterministic address derived from a label (first 20 digest bytes)
Address AddressFromLabel(const std::string& label);

} // namespace commonip

#endif // COMMONIP_CRYPTO_SHA256_H
