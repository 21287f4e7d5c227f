/*
coiserve: local HTTPS file server for cross-origin isolated pages
=================================================================

Serves the working directory over TLS and adds three headers to every
response so browsers grant cross-origin isolation (SharedArrayBuffer,
precise timers) to pages loaded from it:

  Access-Control-Allow-Origin: *
  Cross-Origin-Opener-Policy: same-origin
  Cross-Origin-Embedder-Policy: require-corp

Defaults: port 8080, cert.pem + key.pem from the working directory.
An optional coiserve.json in the working directory overrides them.

Exit codes
----------
  0  stopped cleanly
  1  accept loop failed / unexpected error
  2  bad coiserve.json
  3  certificate or key problem
  4  served root problem
  5  cannot bind the port

Generate a local certificate with e.g.
  openssl req -x509 -newkey rsa:2048 -nodes -days 365 \
      -keyout key.pem -out cert.pem -subj /CN=localhost
*/

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "server_config.h"
#include "startup_error.h"
#include "tls_listener.h"

static int exit_code_for(coiserve::StartupError::Kind kind) {
    switch (kind) {
        case coiserve::StartupError::Kind::Tls:  return 3;
        case coiserve::StartupError::Kind::Root: return 4;
        case coiserve::StartupError::Kind::Bind: return 5;
    }
    return 1;
}

static const char* log_tag_for(coiserve::StartupError::Kind kind) {
    switch (kind) {
        case coiserve::StartupError::Kind::Tls:  return "[tls]";
        case coiserve::StartupError::Kind::Root: return "[root]";
        case coiserve::StartupError::Kind::Bind: return "[bind]";
    }
    return "[server]";
}

int main()
{
    coiserve::ServerConfig cfg;

    std::vector<std::string> warnings;
    std::string err;
    if (!coiserve::load_server_config_if_present(coiserve::kConfigFileName, &cfg, &warnings, &err)) {
        std::cerr << "[config] FATAL: " << err << std::endl;
        return 2;
    }
    for (const auto& w : warnings) {
        std::cerr << "[config] WARNING: " << coiserve::kConfigFileName << ": " << w << std::endl;
    }

    try {
        coiserve::HttpsFileServer server(cfg);
        server.bind();

        std::cout << "HTTPS Server serving at https://localhost:" << server.port() << std::endl;
        if (!server.listen()) {
            std::cerr << "[server] FATAL: accept loop failed on port " << server.port() << std::endl;
            return 1;
        }
    } catch (const coiserve::StartupError& e) {
        std::cerr << log_tag_for(e.kind()) << " FATAL: " << e.what() << std::endl;
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "[server] FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
