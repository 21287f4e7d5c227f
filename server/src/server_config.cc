#include "server_config.h"

#include <filesystem>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace coiserve {

static void warn_type(std::vector<std::string>* warnings, const char* key, const char* expected) {
    if (!warnings) return;
    warnings->push_back(std::string("ignoring '") + key + "' (expected " + expected + ")");
}

static void take_string(const json& j, const char* key, std::string* out,
                        std::vector<std::string>* warnings) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_string() || it->get<std::string>().empty()) {
        warn_type(warnings, key, "non-empty string");
        return;
    }
    *out = it->get<std::string>();
}

static void take_bool(const json& j, const char* key, bool* out,
                      std::vector<std::string>* warnings) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_boolean()) {
        warn_type(warnings, key, "boolean");
        return;
    }
    *out = it->get<bool>();
}

bool apply_server_config_json(const json& j,
                              ServerConfig* cfg,
                              std::vector<std::string>* warnings,
                              std::string* err) {
    if (err) err->clear();
    if (!cfg) {
        if (err) *err = "null cfg";
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "config root must be a JSON object";
        return false;
    }

    take_string(j, "host", &cfg->host, warnings);
    take_string(j, "cert_path", &cfg->cert_path, warnings);
    take_string(j, "key_path", &cfg->key_path, warnings);
    take_string(j, "root_dir", &cfg->root_dir, warnings);

    auto it = j.find("port");
    if (it != j.end()) {
        if (!it->is_number_integer()) {
            warn_type(warnings, "port", "integer");
        } else {
            const long long p = it->get<long long>();
            if (p < 0 || p > 65535) {
                warn_type(warnings, "port", "integer in 0..65535");
            } else {
                cfg->port = (int)p;
            }
        }
    }

    take_bool(j, "directory_listing", &cfg->directory_listing, warnings);
    take_bool(j, "access_log", &cfg->access_log, warnings);
    return true;
}

bool load_server_config(const std::string& path,
                        ServerConfig* cfg,
                        std::vector<std::string>* warnings,
                        std::string* err) {
    if (err) err->clear();

    std::ifstream f(path);
    if (!f.good()) {
        if (err) *err = "cannot open " + path;
        return false;
    }

    json j;
    try {
        j = json::parse(f, nullptr, true);
    } catch (const std::exception& e) {
        if (err) *err = "failed to parse " + path + ": " + e.what();
        return false;
    }

    std::string e2;
    if (!apply_server_config_json(j, cfg, warnings, &e2)) {
        if (err) *err = path + ": " + e2;
        return false;
    }
    return true;
}

bool load_server_config_if_present(const std::string& path,
                                   ServerConfig* cfg,
                                   std::vector<std::string>* warnings,
                                   std::string* err) {
    if (err) err->clear();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return true;

    return load_server_config(path, cfg, warnings, err);
}

} // namespace coiserve
