#pragma once
#include <memory>
#include <string>
#include <thread>

#include "httplib.h"
#include "server_config.h"
#include "startup_error.h"

namespace coiserve {

// Load cert_path (PEM chain) and key_path (PEM key) into a scratch OpenSSL
// context and check that they belong together.
// On failure err names the file and carries the OpenSSL reason.
bool check_tls_key_pair(const std::string& cert_path,
                        const std::string& key_path,
                        std::string* err);

// The served root must exist and be a directory.
bool check_served_root(const std::string& root_dir, std::string* err);

/*
HttpsFileServer
===============

TLS listener + static file handler for one ServerConfig.

Lifecycle:
  HttpsFileServer srv(cfg);   // validates cert/key/root, wires handlers
  srv.bind();                 // binds host:port (port 0 => ephemeral)
  srv.listen();               // blocks until stop()

or, for tests:
  srv.start();                // bind + accept loop on a background thread
  ... srv.port() ...
  srv.stop();

Every failure before the accept loop runs throws StartupError.
A failed TLS handshake only drops that connection; the accept loop goes on.
*/
class HttpsFileServer {
public:
    explicit HttpsFileServer(ServerConfig cfg);
    ~HttpsFileServer();

    HttpsFileServer(const HttpsFileServer&) = delete;
    HttpsFileServer& operator=(const HttpsFileServer&) = delete;

    void bind();
    bool listen();

    void start();
    void stop();

    // Bound port, or -1 before bind().
    int port() const { return bound_port_; }
    const ServerConfig& config() const { return cfg_; }

private:
    const ServerConfig cfg_;
    std::unique_ptr<httplib::SSLServer> srv_;
    int bound_port_ = -1;
    std::thread worker_;
};

} // namespace coiserve
