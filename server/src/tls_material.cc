#include "tls_material.h"
#include "devhttps_util.h"

#include <ctime>
#include <filesystem>
#include <memory>
#include <system_error>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace devhttps {

const char* const kMissingCertificatesMessage =
    "SSL certificates not found!\n"
    "Please run ./generate-ssl.sh first to create SSL certificates.";

namespace {

using BioPtr  = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

void set_err(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

// Drain the OpenSSL error queue into one line (most recent last).
std::string openssl_errors() {
    std::string out;
    unsigned long code = 0;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "unknown OpenSSL error" : out;
}

std::string name_cn(const X509_NAME* name) {
    if (!name) return {};
    const int idx = X509_NAME_get_index_by_NID(const_cast<X509_NAME*>(name), NID_commonName, -1);
    if (idx < 0) return {};
    X509_NAME_ENTRY* e = X509_NAME_get_entry(name, idx);
    if (!e) return {};

    unsigned char* utf8 = nullptr;
    const int n = ASN1_STRING_to_UTF8(&utf8, X509_NAME_ENTRY_get_data(e));
    if (n < 0 || !utf8) return {};
    std::string cn(reinterpret_cast<char*>(utf8), (size_t)n);
    OPENSSL_free(utf8);
    return cn;
}

std::string key_type_name(int base_id) {
    switch (base_id) {
        case EVP_PKEY_RSA:     return "RSA";
        case EVP_PKEY_EC:      return "EC";
        case EVP_PKEY_ED25519: return "ED25519";
        case EVP_PKEY_ED448:   return "ED448";
        default: break;
    }
    const char* sn = OBJ_nid2sn(base_id);
    return sn ? sn : "unknown";
}

bool is_regular_file_or_link(const std::string& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(p, ec);   // follows symlinks
}

} // namespace

bool tls_material_present(const std::string& cert_path, const std::string& key_path) {
    return is_regular_file_or_link(cert_path) && is_regular_file_or_link(key_path);
}

bool inspect_tls_material(const std::string& cert_path,
                          const std::string& key_path,
                          TlsMaterialInfo* out,
                          std::string* err) {
    ERR_clear_error();

    BioPtr cert_bio(BIO_new_file(cert_path.c_str(), "r"), &BIO_free);
    if (!cert_bio) {
        set_err(err, "cannot open certificate " + cert_path + ": " + openssl_errors());
        return false;
    }
    X509Ptr cert(PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert) {
        set_err(err, "certificate " + cert_path + " is not a PEM X.509 certificate: " + openssl_errors());
        return false;
    }

    BioPtr key_bio(BIO_new_file(key_path.c_str(), "r"), &BIO_free);
    if (!key_bio) {
        set_err(err, "cannot open private key " + key_path + ": " + openssl_errors());
        return false;
    }
    // No passphrase callback: an encrypted key cannot be used unattended.
    PkeyPtr pkey(PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, const_cast<char*>("")),
                 &EVP_PKEY_free);
    if (!pkey) {
        set_err(err, "private key " + key_path + " is not an unencrypted PEM key: " + openssl_errors());
        return false;
    }

    if (X509_check_private_key(cert.get(), pkey.get()) != 1) {
        set_err(err, "private key " + key_path + " does not match certificate " + cert_path);
        ERR_clear_error();
        return false;
    }

    if (out) {
        TlsMaterialInfo info;
        info.subject_cn = name_cn(X509_get_subject_name(cert.get()));
        info.issuer_cn  = name_cn(X509_get_issuer_name(cert.get()));
        info.self_signed = (X509_check_issued(cert.get(), cert.get()) == X509_V_OK);

        const ASN1_TIME* na = X509_get0_notAfter(cert.get());
        std::tm tm{};
        if (na && ASN1_TIME_to_tm(na, &tm) == 1) {
            info.not_after_utc = iso_utc_from_epoch(timegm(&tm));
        }
        info.expired = (na && X509_cmp_current_time(na) < 0);

        info.key_type = key_type_name(EVP_PKEY_base_id(pkey.get()));
        info.key_bits = EVP_PKEY_bits(pkey.get());

        *out = info;
    }

    ERR_clear_error();
    return true;
}

} // namespace devhttps
