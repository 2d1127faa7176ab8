// tests/common/test_support.h
//
// Shared helpers for the devhttps regression tests:
// - scratch directories under /tmp
// - small file writers
// - a self-signed certificate/key pair generated with OpenSSL, so no test
//   depends on ./generate-ssl.sh having been run
//
// Header-only; every test is its own executable.

#pragma once

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace devhttps_test {

inline int g_failures = 0;

// Print "[case] FAIL: msg" and count it. Returns cond so callers can bail.
inline bool expect(bool cond, const std::string& name, const std::string& msg) {
    if (!cond) {
        std::fprintf(stderr, "[%s] FAIL: %s\n", name.c_str(), msg.c_str());
        g_failures++;
    }
    return cond;
}

inline int finish(const char* suite) {
    if (g_failures) {
        std::fprintf(stderr, "[%s] FAILURES: %d\n", suite, g_failures);
        return 1;
    }
    std::printf("[%s] ALL OK\n", suite);
    return 0;
}

inline std::string make_temp_dir(const char* tag) {
    std::string tmpl = std::string("/tmp/devhttps_") + tag + "_XXXXXX";
    char* p = ::mkdtemp(tmpl.data());
    if (!p) {
        std::fprintf(stderr, "mkdtemp failed for %s\n", tmpl.c_str());
        std::exit(2);
    }
    return p;
}

inline void remove_tree(const std::string& dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

inline bool write_file(const std::filesystem::path& p, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << content;
    return f.good();
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return {};
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Write key as unencrypted PKCS#8 PEM.
inline bool write_key_pem(const std::string& path, EVP_PKEY* pkey) {
    FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) return false;
    const int ok = PEM_write_PrivateKey(f, pkey, nullptr, nullptr, 0, nullptr, nullptr);
    std::fclose(f);
    return ok == 1;
}

// Self-signed X.509 for CN=<cn>, valid from now-60s for `days` days.
// days < 0 produces an already-expired certificate.
inline bool write_cert_pem(const std::string& path, EVP_PKEY* pkey,
                           const char* cn, long days) {
    X509* x = X509_new();
    if (!x) return false;

    bool ok = X509_set_version(x, 2) == 1 &&
              ASN1_INTEGER_set(X509_get_serialNumber(x), 1) == 1;
    if (days >= 0) {
        ok = ok && X509_gmtime_adj(X509_getm_notBefore(x), -60) != nullptr &&
                   X509_gmtime_adj(X509_getm_notAfter(x), days * 86400L) != nullptr;
    } else {
        ok = ok && X509_gmtime_adj(X509_getm_notBefore(x), (days - 1) * 86400L) != nullptr &&
                   X509_gmtime_adj(X509_getm_notAfter(x), days * 86400L) != nullptr;
    }
    ok = ok && X509_set_pubkey(x, pkey) == 1;

    X509_NAME* name = X509_get_subject_name(x);
    ok = ok && X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                          reinterpret_cast<const unsigned char*>(cn),
                                          -1, -1, 0) == 1;
    ok = ok && X509_set_issuer_name(x, name) == 1;
    ok = ok && X509_sign(x, pkey, EVP_sha256()) > 0;

    if (ok) {
        FILE* f = std::fopen(path.c_str(), "wb");
        ok = f && PEM_write_X509(f, x) == 1;
        if (f) std::fclose(f);
    }

    X509_free(x);
    return ok;
}

// ssl/server.crt + ssl/server.key style pair in one call.
inline bool write_self_signed_pair(const std::string& cert_path,
                                   const std::string& key_path,
                                   const char* cn = "localhost",
                                   long days = 365) {
    EVP_PKEY* pkey = EVP_RSA_gen(2048);
    if (!pkey) return false;
    const bool ok = write_key_pem(key_path, pkey) &&
                    write_cert_pem(cert_path, pkey, cn, days);
    EVP_PKEY_free(pkey);
    return ok;
}

} // namespace devhttps_test
