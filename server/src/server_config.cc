#include "server_config.h"
#include "devhttps_util.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

using json = nlohmann::json;

namespace devhttps {

static void set_err(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

static bool parse_port(const std::string& s, int& out) {
    const std::string v = trim_ws(s);
    if (v.empty()) return false;
    for (char c : v) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') return false;
    if (n < 0 || n > 65535) return false;
    out = (int)n;
    return true;
}

static bool take_string(const json& j, const char* key, std::string& out, std::string* err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        set_err(err, std::string("\"") + key + "\" must be a string");
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool apply_config_json(const json& j, ServerConfig& cfg, std::string* err) {
    if (!j.is_object()) {
        set_err(err, "settings must be a JSON object");
        return false;
    }

    // Build on a copy so a half-applied file never leaks into cfg.
    ServerConfig tmp = cfg;

    if (!take_string(j, "bind", tmp.bind_host, err)) return false;
    if (!take_string(j, "cert", tmp.cert_path, err)) return false;
    if (!take_string(j, "key",  tmp.key_path,  err)) return false;
    if (!take_string(j, "root", tmp.doc_root,  err)) return false;
    if (!take_string(j, "access_log", tmp.access_log_path, err)) return false;

    auto pit = j.find("port");
    if (pit != j.end()) {
        if (!pit->is_number_integer()) {
            set_err(err, "\"port\" must be an integer");
            return false;
        }
        const long long p = pit->get<long long>();
        if (p < 0 || p > 65535) {
            set_err(err, "\"port\" out of range: " + std::to_string(p));
            return false;
        }
        tmp.port = (int)p;
    }

    auto lit = j.find("log_requests");
    if (lit != j.end()) {
        if (!lit->is_boolean()) {
            set_err(err, "\"log_requests\" must be a boolean");
            return false;
        }
        tmp.log_requests = lit->get<bool>();
    }

    cfg = tmp;
    return true;
}

bool load_config_file(const std::string& path, ServerConfig& cfg, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) {
        set_err(err, "cannot open settings file: " + path);
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        set_err(err, "parse error in " + path + ": " + e.what());
        return false;
    }

    std::string why;
    if (!apply_config_json(j, cfg, &why)) {
        set_err(err, path + ": " + why);
        return false;
    }
    return true;
}

bool apply_config_env(ServerConfig& cfg, std::string* err) {
    ServerConfig tmp = cfg;

    if (const char* v = std::getenv("DEVHTTPS_BIND")) tmp.bind_host = v;
    if (const char* v = std::getenv("DEVHTTPS_CERT")) tmp.cert_path = v;
    if (const char* v = std::getenv("DEVHTTPS_KEY"))  tmp.key_path = v;
    if (const char* v = std::getenv("DEVHTTPS_ROOT")) tmp.doc_root = v;
    if (const char* v = std::getenv("DEVHTTPS_ACCESS_LOG")) tmp.access_log_path = v;

    if (const char* v = std::getenv("DEVHTTPS_PORT")) {
        if (!parse_port(v, tmp.port)) {
            set_err(err, std::string("DEVHTTPS_PORT is not a port number: ") + v);
            return false;
        }
    }

    if (const char* v = std::getenv("DEVHTTPS_LOG_REQUESTS")) {
        if (!parse_bool_flag(v, tmp.log_requests)) {
            set_err(err, std::string("DEVHTTPS_LOG_REQUESTS is not a boolean: ") + v);
            return false;
        }
    }

    cfg = tmp;
    return true;
}

bool validate_config(const ServerConfig& cfg, std::string* err) {
    if (cfg.port < 0 || cfg.port > 65535) {
        set_err(err, "port out of range: " + std::to_string(cfg.port));
        return false;
    }
    if (cfg.bind_host.empty()) {
        set_err(err, "bind address is empty");
        return false;
    }
    if (cfg.cert_path.empty() || cfg.key_path.empty()) {
        set_err(err, "certificate and key paths must not be empty");
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(cfg.doc_root, ec)) {
        set_err(err, "document root is not a directory: " + cfg.doc_root);
        return false;
    }
    return true;
}

bool load_server_config(ServerConfig& cfg, std::string* err) {
    if (const char* p = std::getenv("DEVHTTPS_CONFIG")) {
        if (!load_config_file(p, cfg, err)) return false;
        std::cerr << "[config] loaded settings from " << p << std::endl;
    }

    if (!apply_config_env(cfg, err)) return false;
    return validate_config(cfg, err);
}

} // namespace devhttps
