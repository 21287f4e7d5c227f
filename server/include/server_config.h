#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace coiserve {

/*
ServerConfig
============

Process-wide settings, built once in main() and handed by const reference to the
listener and the request handlers. Nothing reads configuration from globals.

The defaults reproduce the plain invocation: serve the working directory on
port 8080 using cert.pem / key.pem from the working directory.
*/
struct ServerConfig {
    std::string host      = "0.0.0.0";  // all interfaces
    int         port      = 8080;       // 0 => ephemeral (tests)
    std::string cert_path = "cert.pem"; // PEM certificate chain
    std::string key_path  = "key.pem";  // PEM private key
    std::string root_dir  = ".";        // served root

    bool directory_listing = true;
    bool access_log        = true;
};

// Default config file name, looked up in the working directory.
inline constexpr const char* kConfigFileName = "coiserve.json";

// Apply recognized keys of a JSON object onto *cfg.
// Keys with the wrong type or out-of-range values are skipped and described in
// *warnings. Returns false (with err) only if j is not an object.
bool apply_server_config_json(const nlohmann::json& j,
                              ServerConfig* cfg,
                              std::vector<std::string>* warnings,
                              std::string* err);

// Read and apply a JSON config file. Missing file or parse error => false.
bool load_server_config(const std::string& path,
                        ServerConfig* cfg,
                        std::vector<std::string>* warnings,
                        std::string* err);

// Like load_server_config, but a missing file leaves *cfg untouched and succeeds.
bool load_server_config_if_present(const std::string& path,
                                   ServerConfig* cfg,
                                   std::vector<std::string>* warnings,
                                   std::string* err);

} // namespace coiserve
