#include "cors.h"

namespace devhttps {

const HeaderList& cors_headers() {
    static const HeaderList kHeaders = {
        {"Access-Control-Allow-Origin",  "*"},
        {"Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
    };
    return kHeaders;
}

void apply_cors_headers(httplib::Response& res) {
    // httplib::Response::set_header appends to a multimap; erase first so a
    // second pass never produces duplicate header lines.
    for (const auto& h : cors_headers()) {
        res.headers.erase(h.first);
        res.set_header(h.first, h.second);
    }
}

void reply_preflight(const httplib::Request& /*req*/, httplib::Response& res) {
    res.status = 200;
    res.body.clear();
}

void install_cors(httplib::Server& srv) {
    // ".*" also matches the asterisk-form target "OPTIONS * HTTP/1.1".
    srv.Options(R"(.*)", reply_preflight);

    srv.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        apply_cors_headers(res);
    });
}

} // namespace devhttps
