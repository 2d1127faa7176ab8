#pragma once
#include <string>

namespace devhttps {

/*
Certificate material
====================

The responder needs a PEM certificate and a PEM private key on disk before it
opens any socket. The pair is produced out of band (an openssl script), so the
only jobs here are:

- presence check (missing files are a fatal startup condition, exit 1)
- inspection with OpenSSL so a broken or mismatched pair is reported with a
  reason instead of a silent TLS context failure

The pair is read again by httplib::SSLServer when the TLS context is built;
nothing here keeps OpenSSL objects alive past the call.
*/

struct TlsMaterialInfo {
    std::string subject_cn;
    std::string issuer_cn;
    std::string not_after_utc;   // ISO-8601, "" if unreadable
    std::string key_type;        // "RSA", "EC", "ED25519", ...
    int key_bits = 0;
    bool self_signed = false;
    bool expired = false;
};

// Operator guidance printed when either file is missing.
extern const char* const kMissingCertificatesMessage;

// Both files exist (regular files or symlinks to them).
bool tls_material_present(const std::string& cert_path, const std::string& key_path);

// Parse both PEMs and check the key belongs to the certificate.
bool inspect_tls_material(const std::string& cert_path,
                          const std::string& key_path,
                          TlsMaterialInfo* out,
                          std::string* err);

} // namespace devhttps
