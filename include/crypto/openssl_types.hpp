#pragma once

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <string>
#include <string_view>

namespace kafkasec {

// RAII deleters for OpenSSL handles
struct BioDeleter     { void operator()(BIO* p) const { if (p) BIO_free_all(p); } };
struct X509Deleter    { void operator()(X509* p) const { if (p) X509_free(p); } };
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { if (p) EVP_PKEY_free(p); } };
struct SslCtxDeleter  { void operator()(SSL_CTX* p) const { if (p) SSL_CTX_free(p); } };

using BioPtr     = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr    = std::unique_ptr<X509, X509Deleter>;
using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using SslCtxPtr  = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

/**
 * @brief Read-only memory BIO over caller-owned bytes.
 * The bytes must outlive the BIO.
 */
[[nodiscard]] inline BioPtr make_mem_bio(std::string_view data) {
    return BioPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
}

/**
 * @brief Drain the OpenSSL error queue into a single message.
 * @return Last queued error text, or `fallback` if the queue was empty.
 */
[[nodiscard]] inline std::string openssl_error_string(std::string_view fallback = "unknown OpenSSL error") {
    unsigned long last = 0;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        last = code;
    }
    if (last == 0) return std::string(fallback);

    char buf[256];
    ERR_error_string_n(last, buf, sizeof(buf));
    return std::string(buf);
}

} // namespace kafkasec
