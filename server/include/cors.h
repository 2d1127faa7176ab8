#pragma once
#include <string>
#include <utility>
#include <vector>

#include "httplib.h"

namespace devhttps {

/*
CORS decoration
===============

Every response leaving the server carries the same three headers so that
browser code served from any origin can read it:

  Access-Control-Allow-Origin:  *
  Access-Control-Allow-Methods: GET, POST, PUT, DELETE, OPTIONS
  Access-Control-Allow-Headers: Content-Type, Authorization

The headers are attached on httplib's post-routing hook, which runs right
before the status line and headers are written for *every* response: routed
handlers, 404s for unmatched routes, and the library's own 400/414/501 error
replies. There is no per-status branch anywhere.

OPTIONS is answered here as well (200, empty body) without reaching the
static-file handler.
*/

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// The fixed header set, in emission order.
const HeaderList& cors_headers();

// Replace-or-add each CORS header on res. Safe to call more than once.
void apply_cors_headers(httplib::Response& res);

// Preflight short-circuit: 200, no body. Does not touch the file system.
void reply_preflight(const httplib::Request& req, httplib::Response& res);

// Register the OPTIONS catch-all route and the post-routing decorator.
void install_cors(httplib::Server& srv);

} // namespace devhttps
