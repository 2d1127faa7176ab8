// tests/cors/test_cors_headers.cpp
//
// Regression test: the CORS decorator must stay byte-exact and idempotent.
//
// What it tests:
// 1) The fixed header set (names, values, order)
// 2) apply_cors_headers() on an empty response and on a 404 response
// 3) A second application does not duplicate header lines
// 4) A pre-existing, different Access-Control-Allow-Origin is replaced
// 5) reply_preflight() answers 200 with an empty body and no content type

#include <iostream>
#include <string>

#include "httplib.h"
#include "cors.h"
#include "../common/test_support.h"

using devhttps_test::expect;

static bool has_exact_cors(const httplib::Response& res, const std::string& name) {
    bool ok = true;
    ok = expect(res.get_header_value_count("Access-Control-Allow-Origin") == 1,
                name, "Allow-Origin count != 1") && ok;
    ok = expect(res.get_header_value("Access-Control-Allow-Origin") == "*",
                name, "Allow-Origin value") && ok;
    ok = expect(res.get_header_value_count("Access-Control-Allow-Methods") == 1,
                name, "Allow-Methods count != 1") && ok;
    ok = expect(res.get_header_value("Access-Control-Allow-Methods") == "GET, POST, PUT, DELETE, OPTIONS",
                name, "Allow-Methods value") && ok;
    ok = expect(res.get_header_value_count("Access-Control-Allow-Headers") == 1,
                name, "Allow-Headers count != 1") && ok;
    ok = expect(res.get_header_value("Access-Control-Allow-Headers") == "Content-Type, Authorization",
                name, "Allow-Headers value") && ok;
    return ok;
}

int main() {
    {
        const std::string name = "header_set";
        const auto& hs = devhttps::cors_headers();
        if (expect(hs.size() == 3, name, "expected exactly three headers")) {
            expect(hs[0].first == "Access-Control-Allow-Origin", name, "first header name");
            expect(hs[1].first == "Access-Control-Allow-Methods", name, "second header name");
            expect(hs[2].first == "Access-Control-Allow-Headers", name, "third header name");
        }
    }

    {
        const std::string name = "apply_on_200";
        httplib::Response res;
        res.status = 200;
        res.set_content("hello", "text/plain");
        devhttps::apply_cors_headers(res);
        has_exact_cors(res, name);
        expect(res.body == "hello", name, "body must be untouched");
        expect(res.get_header_value("Content-Type") == "text/plain", name, "content type must be untouched");
    }

    {
        const std::string name = "apply_on_404";
        httplib::Response res;
        res.status = 404;
        res.set_content("nope", "text/html");
        devhttps::apply_cors_headers(res);
        has_exact_cors(res, name);
        expect(res.status == 404, name, "status must be untouched");
    }

    {
        const std::string name = "idempotent";
        httplib::Response res;
        devhttps::apply_cors_headers(res);
        devhttps::apply_cors_headers(res);
        devhttps::apply_cors_headers(res);
        has_exact_cors(res, name);
        expect(res.headers.size() == 3, name, "no extra headers expected");
    }

    {
        const std::string name = "replaces_existing";
        httplib::Response res;
        res.set_header("Access-Control-Allow-Origin", "https://example.com");
        res.set_header("access-control-allow-headers", "X-Custom");
        devhttps::apply_cors_headers(res);
        has_exact_cors(res, name);
    }

    {
        const std::string name = "preflight";
        httplib::Request req;
        req.method = "OPTIONS";
        req.path = "/does/not/exist/anywhere";
        httplib::Response res;
        res.body = "stale";
        devhttps::reply_preflight(req, res);
        expect(res.status == 200, name, "status " + std::to_string(res.status));
        expect(res.body.empty(), name, "body must be empty");
        expect(!res.has_header("Content-Type"), name, "no content type on preflight");

        devhttps::apply_cors_headers(res);
        has_exact_cors(res, name);
        expect(res.headers.size() == 3, name, "preflight carries only the CORS headers");
    }

    {
        // The installer must leave a server with an OPTIONS route and the
        // post-routing hook; exercised end to end in tests/e2e.
        const std::string name = "install_smoke";
        httplib::Server srv;
        devhttps::install_cors(srv);
        expect(srv.is_valid(), name, "server invalid after install_cors");
    }

    return devhttps_test::finish("cors");
}
