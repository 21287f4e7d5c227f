// tests/common/test_support.h
//
// Helpers shared by the test executables: scratch directories, file writing,
// and self-signed certificate generation (OpenSSL) for TLS tests.

#pragma once

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

namespace coiserve_test {

// Tally of failed checks; each test main() returns non-zero if it is > 0.
struct Checks {
    int failed = 0;

    void expect(bool ok, const std::string& what) {
        if (!ok) {
            failed++;
            std::cerr << "FAIL: " << what << "\n";
        }
    }
};

// Fresh empty directory under the system temp dir.
inline std::filesystem::path make_temp_dir(const std::string& tag) {
    std::random_device rd;
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::filesystem::path p = std::filesystem::temp_directory_path() /
        ("coiserve_" + tag + "_" + std::to_string(ticks) + "_" + std::to_string(rd()));
    std::filesystem::create_directories(p);
    return p;
}

inline bool write_file(const std::filesystem::path& p, const std::string& body) {
    std::ofstream f(p, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(body.data(), (std::streamsize)body.size());
    return f.good();
}

// Writes a 2048-bit RSA key and a self-signed X.509 certificate for CN=localhost.
inline bool write_self_signed_pair(const std::filesystem::path& cert_path,
                                   const std::filesystem::path& key_path) {
    EVP_PKEY* pkey = nullptr;
    EVP_PKEY_CTX* kctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (!kctx) return false;
    if (EVP_PKEY_keygen_init(kctx) != 1 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(kctx, 2048) != 1 ||
        EVP_PKEY_keygen(kctx, &pkey) != 1) {
        EVP_PKEY_CTX_free(kctx);
        return false;
    }
    EVP_PKEY_CTX_free(kctx);

    X509* x = X509_new();
    if (!x) {
        EVP_PKEY_free(pkey);
        return false;
    }

    X509_set_version(x, 2);
    ASN1_INTEGER_set(X509_get_serialNumber(x), 1);
    X509_gmtime_adj(X509_getm_notBefore(x), -3600L);
    X509_gmtime_adj(X509_getm_notAfter(x), 24L * 3600L);
    X509_set_pubkey(x, pkey);

    X509_NAME* name = X509_get_subject_name(x);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(x, name);

    bool ok = X509_sign(x, pkey, EVP_sha256()) > 0;

    if (ok) {
        FILE* fc = std::fopen(cert_path.c_str(), "wb");
        ok = fc && PEM_write_X509(fc, x) == 1;
        if (fc) std::fclose(fc);
    }
    if (ok) {
        FILE* fk = std::fopen(key_path.c_str(), "wb");
        ok = fk && PEM_write_PrivateKey(fk, pkey, nullptr, nullptr, 0, nullptr, nullptr) == 1;
        if (fk) std::fclose(fk);
    }

    X509_free(x);
    EVP_PKEY_free(pkey);
    return ok;
}

} // namespace coiserve_test
