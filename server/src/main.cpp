/*
devhttps: local development HTTPS static file server
====================================================

Serves the working directory over TLS with a self-signed certificate and adds
permissive CORS headers to every response so browser code running on another
origin (a dev server on :5173, a file:// page, ...) can fetch from it.

Startup
-------
1. configuration: defaults, DEVHTTPS_CONFIG json file, DEVHTTPS_* env
2. ssl/server.crt + ssl/server.key must exist (exit 1 otherwise, no socket)
3. TLS context, bind on 0.0.0.0:3000, banner
4. accept loop until Ctrl+C, then "Server stopped" and exit 0

Exit codes
----------
  0  interrupted cleanly
  1  certificate/key missing or unusable
  2  invalid configuration
  3  cannot bind / listener failed

Certificates are produced out of band (./generate-ssl.sh runs openssl).
*/

#include <iostream>
#include <string>

#include "dev_server.h"
#include "server_config.h"

int main()
{
    devhttps::ServerConfig cfg;
    std::string err;
    if (!devhttps::load_server_config(cfg, &err)) {
        std::cerr << "[config] FATAL: " << err << std::endl;
        return 2;
    }

    return devhttps::run_devhttps(cfg, std::cout);
}
