#pragma once
#include "httplib.h"

#include <filesystem>
#include <string>

namespace devhttps {

// Lowercase extension including the dot (".png"). Unknown => "application/octet-stream".
std::string mime_for_ext(std::string ext);
std::string mime_for_path(const std::filesystem::path& p);

// Map a decoded URL path onto root. "", "." and ".." segments are dropped so
// the result never climbs above root lexically. Symlinks are not resolved here.
std::filesystem::path translate_request_path(const std::filesystem::path& root,
                                             const std::string& url_path);

// Small HTML error body ("Error code: 404", "Message: ...").
void reply_error_page(httplib::Response& res, int status, const std::string& message);

// Whole-file response with Content-Type, Last-Modified and If-Modified-Since
// handling. Sets 403/500 on open failure.
bool serve_static_file(const httplib::Request& req,
                       httplib::Response& res,
                       const std::string& abs_path,
                       const std::string& content_type);

// Directory listing page; false + status set on iteration failure.
bool serve_directory_listing(const httplib::Request& req,
                             httplib::Response& res,
                             const std::filesystem::path& dir);

/*
StaticSite
==========

GET/HEAD handler rooted at a document root, with the usual static-server
behaviour:

- directory without trailing slash -> 301 to the slash form
- directory with trailing slash    -> index.html, index.htm, else a listing
- file                              -> bytes with a guessed content type
- missing                           -> 404
- symlink leaving the root          -> 403

The root is canonicalized once in init(); handle() is const and safe to call
from any number of request threads.
*/
class StaticSite {
public:
    explicit StaticSite(std::string doc_root);

    bool init(std::string* err = nullptr);

    void handle(const httplib::Request& req, httplib::Response& res) const;

    // 501 for methods a static site cannot honour (POST/PUT/DELETE/PATCH).
    static void reply_unsupported_method(const httplib::Request& req, httplib::Response& res);

    const std::filesystem::path& root() const { return root_; }

private:
    std::string doc_root_;
    std::filesystem::path root_;   // canonical after init()

    bool inside_root_(const std::filesystem::path& p) const;
};

} // namespace devhttps
