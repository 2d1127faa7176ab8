#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace devhttps {

/*
ServerConfig
============

Everything the responder needs to start. Values come from, in order of
increasing precedence:

  1. the defaults below
  2. a JSON settings file named by DEVHTTPS_CONFIG
  3. DEVHTTPS_* environment variables

JSON settings format (every key optional):
{
  "bind": "0.0.0.0",
  "port": 3000,
  "cert": "ssl/server.crt",
  "key":  "ssl/server.key",
  "root": ".",
  "access_log": "logs/access.jsonl",
  "log_requests": true
}
*/
struct ServerConfig {
    std::string bind_host = "0.0.0.0";
    int port = 3000;                       // 0 => any free port

    // relative paths resolve against the working directory
    std::string cert_path = "ssl/server.crt";
    std::string key_path  = "ssl/server.key";

    std::string doc_root = ".";

    // "" => JSONL access log disabled
    std::string access_log_path;

    // per-request Common Log Format line on stderr
    bool log_requests = true;
};

// Apply a parsed settings object on top of cfg. Unknown keys are ignored.
bool apply_config_json(const nlohmann::json& j, ServerConfig& cfg, std::string* err);

// Read and apply a JSON settings file.
bool load_config_file(const std::string& path, ServerConfig& cfg, std::string* err);

// Apply DEVHTTPS_* environment overrides.
bool apply_config_env(ServerConfig& cfg, std::string* err);

// Range and existence checks that do not need the network.
bool validate_config(const ServerConfig& cfg, std::string* err);

// defaults -> DEVHTTPS_CONFIG file -> environment -> validate
bool load_server_config(ServerConfig& cfg, std::string* err);

} // namespace devhttps
