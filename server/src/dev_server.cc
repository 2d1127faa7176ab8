#include "dev_server.h"
#include "cors.h"
#include "shutdown.h"
#include "tls_material.h"

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

namespace devhttps {

const char* const kShutdownNotice = "Server stopped";

DevServer::DevServer(ServerConfig cfg)
    : cfg_(std::move(cfg)), site_(cfg_.doc_root) {}

DevServer::~DevServer() {
    stop();
}

bool DevServer::init(std::string* err) {
    if (!site_.init(err)) return false;

    std::ostream* console = cfg_.log_requests ? &std::cerr : nullptr;
    if (console || !cfg_.access_log_path.empty()) {
        access_log_ = std::make_unique<AccessLog>(console, cfg_.access_log_path);
        // open() failure only drops the file sink and has already warned
        if (access_log_->open() && access_log_->file_enabled()) {
            std::cerr << "[access] JSONL access log: " << access_log_->jsonl_path() << std::endl;
        }
    }

    srv_ = std::make_unique<httplib::SSLServer>(cfg_.cert_path.c_str(), cfg_.key_path.c_str());
    if (!srv_->is_valid()) {
        if (err) *err = "cannot build TLS context from " + cfg_.cert_path + " and " + cfg_.key_path;
        srv_.reset();
        return false;
    }

    install_routes(*srv_, site_, access_log_.get());
    return true;
}

bool DevServer::bind(std::string* err) {
    if (!srv_) {
        if (err) *err = "server not initialized";
        return false;
    }

    if (cfg_.port == 0) {
        bound_port_ = srv_->bind_to_any_port(cfg_.bind_host);
    } else if (srv_->bind_to_port(cfg_.bind_host, cfg_.port)) {
        bound_port_ = cfg_.port;
    } else {
        bound_port_ = -1;
    }

    if (bound_port_ < 0) {
        if (err) *err = "cannot bind " + cfg_.bind_host + ":" + std::to_string(cfg_.port)
                        + " (address in use or not permitted)";
        return false;
    }
    return true;
}

bool DevServer::run() {
    if (!srv_ || bound_port_ < 0) return false;

    run_entered_.store(true);
    if (stop_requested_.load()) {
        run_exited_.store(true);
        return true;
    }

    const bool ok = srv_->listen_after_bind();
    run_exited_.store(true);
    return ok || stop_requested_.load();
}

void DevServer::stop() {
    stop_requested_.store(true);
    if (!srv_) return;

    // httplib::Server::stop() is a no-op until the accept loop is live, so a
    // stop that races run() waits for one side or the other.
    if (run_entered_.load()) {
        while (!run_exited_.load() && !srv_->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    srv_->stop();
}

bool DevServer::is_running() const {
    return srv_ && srv_->is_running();
}

void install_routes(httplib::Server& srv, const StaticSite& site, AccessLog* access_log) {
    install_cors(srv);

    srv.Get(R"(.*)", [&site](const httplib::Request& req, httplib::Response& res) {
        site.handle(req, res);
    });

    srv.Post(R"(.*)",   StaticSite::reply_unsupported_method);
    srv.Put(R"(.*)",    StaticSite::reply_unsupported_method);
    srv.Delete(R"(.*)", StaticSite::reply_unsupported_method);
    srv.Patch(R"(.*)",  StaticSite::reply_unsupported_method);

    // Library-generated errors (unmatched route, malformed request, ...)
    // arrive here with an empty body.
    srv.set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) reply_error_page(res, res.status, "");
    });

    if (access_log) {
        srv.set_logger([access_log](const httplib::Request& req, const httplib::Response& res) {
            access_log->record(make_access_event(req, res));
        });
    }
}

std::string serving_url(int port) {
    return "https://localhost:" + std::to_string(port) + "/";
}

std::string startup_banner(int port) {
    std::string s;
    s += "HTTPS server starting on " + serving_url(port) + "\n";
    s += "Note: Your browser will show a security warning for the self-signed certificate.\n";
    s += "Click 'Advanced' then 'Proceed to localhost (unsafe)' to continue.\n";
    s += "Press Ctrl+C to stop the server\n";
    return s;
}

int check_startup_preconditions(const ServerConfig& cfg, std::ostream& out) {
    if (!tls_material_present(cfg.cert_path, cfg.key_path)) {
        out << kMissingCertificatesMessage << std::endl;
        return 1;
    }

    TlsMaterialInfo info;
    std::string err;
    if (!inspect_tls_material(cfg.cert_path, cfg.key_path, &info, &err)) {
        std::cerr << "[tls] FATAL: " << err << std::endl;
        return 1;
    }

    std::cerr << "[tls] certificate CN=" << (info.subject_cn.empty() ? "?" : info.subject_cn)
              << (info.self_signed ? " (self-signed)" : "")
              << " key=" << info.key_type << "/" << info.key_bits
              << " not_after=" << (info.not_after_utc.empty() ? "?" : info.not_after_utc)
              << std::endl;
    if (info.expired) {
        std::cerr << "[tls] WARNING: certificate has expired; regenerate it with ./generate-ssl.sh"
                  << std::endl;
    }
    return 0;
}

int serve_until_interrupted(DevServer& server, std::ostream& out) {
    ShutdownWatcher watcher;
    watcher.start([&server]() { server.stop(); });

    const bool ok = server.run();
    watcher.stop();

    if (watcher.fired() || shutdown_requested()) {
        out << "\n" << kShutdownNotice << std::endl;
        return 0;
    }
    if (!ok) {
        std::cerr << "[server] FATAL: listener stopped unexpectedly" << std::endl;
        return 3;
    }
    return 0;
}

int run_devhttps(const ServerConfig& cfg, std::ostream& out) {
    const int pre = check_startup_preconditions(cfg, out);
    if (pre != 0) return pre;

    DevServer server(cfg);

    std::string err;
    if (!server.init(&err)) {
        std::cerr << "[server] FATAL: " << err << std::endl;
        return 1;
    }
    if (!server.bind(&err)) {
        std::cerr << "[server] FATAL: " << err << std::endl;
        return 3;
    }

    std::cerr << "[server] serving " << server.config().doc_root
              << " on " << cfg.bind_host << ":" << server.port() << std::endl;

    install_shutdown_signals();
    out << startup_banner(server.port()) << std::flush;

    return serve_until_interrupted(server, out);
}

} // namespace devhttps
