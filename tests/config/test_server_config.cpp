// tests/config/test_server_config.cpp
//
// ServerConfig defaults and coiserve.json overrides.

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "server_config.h"
#include "../common/test_support.h"

using coiserve_test::Checks;
using json = nlohmann::json;

int main() {
    Checks c;

    // built-in defaults
    {
        coiserve::ServerConfig cfg;
        c.expect(cfg.host == "0.0.0.0", "defaults: all interfaces");
        c.expect(cfg.port == 8080, "defaults: port 8080");
        c.expect(cfg.cert_path == "cert.pem", "defaults: cert.pem");
        c.expect(cfg.key_path == "key.pem", "defaults: key.pem");
        c.expect(cfg.root_dir == ".", "defaults: working directory");
        c.expect(cfg.directory_listing, "defaults: listing on");
        c.expect(cfg.access_log, "defaults: access log on");
    }

    // overrides
    {
        coiserve::ServerConfig cfg;
        std::vector<std::string> warnings;
        std::string err;
        const json j = {
            {"host", "127.0.0.1"},
            {"port", 8443},
            {"cert_path", "/etc/coiserve/cert.pem"},
            {"key_path", "/etc/coiserve/key.pem"},
            {"root_dir", "/srv/www"},
            {"directory_listing", false},
            {"access_log", false},
            {"unknown_key", 1}
        };
        c.expect(coiserve::apply_server_config_json(j, &cfg, &warnings, &err), "overrides: accepted");
        c.expect(cfg.host == "127.0.0.1", "overrides: host");
        c.expect(cfg.port == 8443, "overrides: port");
        c.expect(cfg.cert_path == "/etc/coiserve/cert.pem", "overrides: cert_path");
        c.expect(cfg.key_path == "/etc/coiserve/key.pem", "overrides: key_path");
        c.expect(cfg.root_dir == "/srv/www", "overrides: root_dir");
        c.expect(!cfg.directory_listing, "overrides: directory_listing");
        c.expect(!cfg.access_log, "overrides: access_log");
        c.expect(warnings.empty(), "overrides: unknown keys are not warnings");
    }

    // wrong types are skipped with a warning, the rest still applies
    {
        coiserve::ServerConfig cfg;
        std::vector<std::string> warnings;
        std::string err;
        const json j = {
            {"port", "8081"},
            {"directory_listing", "no"},
            {"cert_path", ""},
            {"key_path", "k.pem"}
        };
        c.expect(coiserve::apply_server_config_json(j, &cfg, &warnings, &err), "types: accepted");
        c.expect(cfg.port == 8080, "types: port kept");
        c.expect(cfg.directory_listing, "types: listing kept");
        c.expect(cfg.cert_path == "cert.pem", "types: empty cert_path ignored");
        c.expect(cfg.key_path == "k.pem", "types: valid key still applied");
        c.expect(warnings.size() == 3, "types: one warning per bad key");
    }

    // out of range port
    {
        coiserve::ServerConfig cfg;
        std::vector<std::string> warnings;
        std::string err;
        c.expect(coiserve::apply_server_config_json(json{{"port", 70000}}, &cfg, &warnings, &err),
                 "range: accepted");
        c.expect(cfg.port == 8080 && warnings.size() == 1, "range: port ignored with warning");
    }

    // non-object root
    {
        coiserve::ServerConfig cfg;
        std::string err;
        c.expect(!coiserve::apply_server_config_json(json::array(), &cfg, nullptr, &err),
                 "root: array rejected");
        c.expect(!err.empty(), "root: error message");
    }

    // files
    {
        const std::filesystem::path dir = coiserve_test::make_temp_dir("config");
        coiserve::ServerConfig cfg;
        std::vector<std::string> warnings;
        std::string err;

        c.expect(coiserve::load_server_config_if_present((dir / "coiserve.json").string(), &cfg, &warnings, &err),
                 "file: missing optional file is fine");
        c.expect(cfg.port == 8080, "file: missing file keeps defaults");
        c.expect(!coiserve::load_server_config((dir / "coiserve.json").string(), &cfg, &warnings, &err),
                 "file: missing required file fails");

        coiserve_test::write_file(dir / "coiserve.json", "{ \"port\": 9443 }");
        c.expect(coiserve::load_server_config_if_present((dir / "coiserve.json").string(), &cfg, &warnings, &err),
                 "file: present file loads");
        c.expect(cfg.port == 9443, "file: port from file");

        coiserve_test::write_file(dir / "coiserve.json", "{ \"port\": ");
        c.expect(!coiserve::load_server_config_if_present((dir / "coiserve.json").string(), &cfg, &warnings, &err),
                 "file: bad JSON fails");
        c.expect(err.find("coiserve.json") != std::string::npos, "file: error names the file");

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    if (c.failed) {
        std::cerr << c.failed << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: server config\n";
    return 0;
}
