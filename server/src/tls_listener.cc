#include "tls_listener.h"

#include "access_log.h"
#include "isolation_headers.h"
#include "static_files.h"

#include <filesystem>
#include <iostream>
#include <system_error>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <sys/socket.h>

namespace coiserve {

// Pops the oldest queued OpenSSL error (the root cause) and clears the rest.
static std::string openssl_error_string() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown error";

    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
}

bool check_tls_key_pair(const std::string& cert_path,
                        const std::string& key_path,
                        std::string* err) {
    if (err) err->clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(cert_path, ec)) {
        if (err) *err = "certificate file " + cert_path + " is missing or not a regular file";
        return false;
    }
    if (!std::filesystem::is_regular_file(key_path, ec)) {
        if (err) *err = "private key file " + key_path + " is missing or not a regular file";
        return false;
    }

    ERR_clear_error();
    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    if (!ctx) {
        if (err) *err = "SSL_CTX_new failed: " + openssl_error_string();
        return false;
    }

    if (SSL_CTX_use_certificate_chain_file(ctx, cert_path.c_str()) != 1) {
        if (err) *err = "cannot load certificate chain from " + cert_path + ": " + openssl_error_string();
        SSL_CTX_free(ctx);
        return false;
    }

    if (SSL_CTX_use_PrivateKey_file(ctx, key_path.c_str(), SSL_FILETYPE_PEM) != 1) {
        if (err) *err = "cannot load private key from " + key_path + ": " + openssl_error_string();
        SSL_CTX_free(ctx);
        return false;
    }

    if (SSL_CTX_check_private_key(ctx) != 1) {
        if (err) *err = "private key " + key_path + " does not match certificate " + cert_path
                      + ": " + openssl_error_string();
        SSL_CTX_free(ctx);
        return false;
    }

    SSL_CTX_free(ctx);
    return true;
}

bool check_served_root(const std::string& root_dir, std::string* err) {
    if (err) err->clear();

    std::error_code ec;
    if (!std::filesystem::is_directory(root_dir, ec)) {
        if (err) *err = "served root " + root_dir + " is not a directory";
        return false;
    }
    return true;
}

HttpsFileServer::HttpsFileServer(ServerConfig cfg)
    : cfg_(std::move(cfg)) {
    std::string err;

    // Checked up front: SSLServer only reports is_valid() == false, without
    // saying which file is wrong.
    if (!check_tls_key_pair(cfg_.cert_path, cfg_.key_path, &err)) {
        throw StartupError(StartupError::Kind::Tls, err);
    }
    if (!check_served_root(cfg_.root_dir, &err)) {
        throw StartupError(StartupError::Kind::Root, err);
    }

    srv_ = std::make_unique<httplib::SSLServer>(cfg_.cert_path.c_str(), cfg_.key_path.c_str());
    if (!srv_->is_valid()) {
        throw StartupError(StartupError::Kind::Tls,
                           "failed to set up TLS context from " + cfg_.cert_path + " / " + cfg_.key_path);
    }

    // SO_REUSEADDR only, never SO_REUSEPORT: a second instance on the same
    // port must fail to bind.
    srv_->set_socket_options([](socket_t sock) {
        int yes = 1;
        if (::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                         reinterpret_cast<const void*>(&yes), sizeof(yes)) != 0) {
            std::cerr << "[server] WARNING: setsockopt(SO_REUSEADDR) failed" << std::endl;
        }
    });

    if (!install_static_files(*srv_, cfg_, &err)) {
        throw StartupError(StartupError::Kind::Root, err);
    }
    install_isolation_headers(*srv_);
    if (cfg_.access_log) install_access_log(*srv_, std::cerr);
}

HttpsFileServer::~HttpsFileServer() {
    stop();
}

void HttpsFileServer::bind() {
    if (cfg_.port == 0) {
        const int p = srv_->bind_to_any_port(cfg_.host);
        if (p < 0) {
            throw StartupError(StartupError::Kind::Bind,
                               "cannot bind " + cfg_.host + " to an ephemeral port");
        }
        bound_port_ = p;
        return;
    }

    if (!srv_->bind_to_port(cfg_.host, cfg_.port)) {
        throw StartupError(StartupError::Kind::Bind,
                           "cannot bind " + cfg_.host + ":" + std::to_string(cfg_.port)
                           + " (address in use or permission denied)");
    }
    bound_port_ = cfg_.port;
}

bool HttpsFileServer::listen() {
    if (bound_port_ < 0) bind();
    return srv_->listen_after_bind();
}

void HttpsFileServer::start() {
    bind();
    worker_ = std::thread([this]() {
        if (!srv_->listen_after_bind()) {
            std::cerr << "[server] accept loop on port " << bound_port_ << " failed" << std::endl;
        }
    });
    srv_->wait_until_ready();
}

void HttpsFileServer::stop() {
    if (srv_) srv_->stop();
    if (worker_.joinable()) worker_.join();
}

} // namespace coiserve
