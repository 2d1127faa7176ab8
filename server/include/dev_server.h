#pragma once
#include <atomic>
#include <memory>
#include <ostream>
#include <string>

#include "httplib.h"
#include "server_config.h"
#include "static_serve.h"
#include "access_log.h"

namespace devhttps {

/*
DevServer
=========

The static TLS responder as one explicitly constructed value:

  DevServer server(cfg);
  server.init(&err);     // document root, access log, TLS context, routes
  server.bind(&err);     // listener on cfg.bind_host:cfg.port
  server.run();          // blocking accept loop until stop()

Route table (composed, no handler subclassing):

  OPTIONS .*                 -> 200, empty body (cors.h)
  GET/HEAD .*                -> StaticSite::handle
  POST/PUT/DELETE/PATCH .*   -> 501
  post-routing hook          -> CORS headers on every response
  error handler              -> HTML error body for library-generated 4xx/5xx
  logger                     -> AccessLog

stop() may be called from any thread, before or during run().
*/
class DevServer {
public:
    explicit DevServer(ServerConfig cfg);
    ~DevServer();

    DevServer(const DevServer&) = delete;
    DevServer& operator=(const DevServer&) = delete;

    bool init(std::string* err);
    bool bind(std::string* err);

    // Blocks. Returns false if the listener failed rather than being stopped.
    bool run();
    void stop();

    bool is_running() const;
    int port() const { return bound_port_; }

    const ServerConfig& config() const { return cfg_; }
    httplib::Server& http() { return *srv_; }

private:
    ServerConfig cfg_;
    StaticSite site_;
    std::unique_ptr<AccessLog> access_log_;
    std::unique_ptr<httplib::SSLServer> srv_;
    int bound_port_ = -1;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> run_entered_{false};
    std::atomic<bool> run_exited_{false};
};

// Register the full route table on srv.
void install_routes(httplib::Server& srv, const StaticSite& site, AccessLog* access_log);

// "https://localhost:<port>/"
std::string serving_url(int port);

// URL line plus self-signed certificate guidance, newline terminated.
std::string startup_banner(int port);

extern const char* const kShutdownNotice;

// Presence check (prints guidance on out) and OpenSSL inspection.
// 0 => ok, 1 => certificate material missing or unusable.
int check_startup_preconditions(const ServerConfig& cfg, std::ostream& out);

// Run until SIGINT/SIGTERM, then print the shutdown notice on out.
// 0 => interrupted cleanly, 3 => listener failed.
int serve_until_interrupted(DevServer& server, std::ostream& out);

// Whole process lifecycle after configuration; returns the exit status.
int run_devhttps(const ServerConfig& cfg, std::ostream& out);

} // namespace devhttps
