#include "static_serve.h"
#include "devhttps_util.h"

#include <algorithm>
#include <cerrno>
#include <ctime>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>

namespace fs = std::filesystem;

namespace devhttps {

std::string mime_for_ext(std::string ext) {
    // ext must be lowercase and include dot (".png")
    static const std::map<std::string, std::string> kMime = {
        {".html",  "text/html; charset=utf-8"},
        {".htm",   "text/html; charset=utf-8"},
        {".css",   "text/css; charset=utf-8"},
        {".js",    "application/javascript; charset=utf-8"},
        {".mjs",   "application/javascript; charset=utf-8"},
        {".json",  "application/json; charset=utf-8"},
        {".map",   "application/json; charset=utf-8"},
        {".xml",   "application/xml; charset=utf-8"},
        {".txt",   "text/plain; charset=utf-8"},
        {".md",    "text/markdown; charset=utf-8"},
        {".csv",   "text/csv; charset=utf-8"},
        {".svg",   "image/svg+xml; charset=utf-8"},
        {".png",   "image/png"},
        {".jpg",   "image/jpeg"},
        {".jpeg",  "image/jpeg"},
        {".gif",   "image/gif"},
        {".webp",  "image/webp"},
        {".avif",  "image/avif"},
        {".ico",   "image/x-icon"},
        {".woff",  "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf",   "font/ttf"},
        {".otf",   "font/otf"},
        {".wasm",  "application/wasm"},
        {".pdf",   "application/pdf"},
        {".zip",   "application/zip"},
        {".gz",    "application/gzip"},
        {".mp4",   "video/mp4"},
        {".webm",  "video/webm"},
        {".mp3",   "audio/mpeg"},
        {".ogg",   "audio/ogg"},
        {".wav",   "audio/wav"},
    };
    auto it = kMime.find(ext);
    if (it != kMime.end()) return it->second;
    return "application/octet-stream";
}

std::string mime_for_path(const fs::path& p) {
    return mime_for_ext(lower_ascii(p.extension().string()));
}

fs::path translate_request_path(const fs::path& root, const std::string& url_path) {
    fs::path out = root;
    std::string seg;
    std::istringstream in(url_path);
    while (std::getline(in, seg, '/')) {
        if (seg.empty() || seg == "." || seg == "..") continue;
        out /= seg;
    }
    return out;
}

static const char* reason_phrase(int status) {
    switch (status) {
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 414: return "URI Too Long";
        case 416: return "Range Not Satisfiable";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Error";
    }
}

void reply_error_page(httplib::Response& res, int status, const std::string& message) {
    const std::string msg = message.empty() ? reason_phrase(status) : message;

    std::ostringstream html;
    html << "<!DOCTYPE HTML>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<title>Error response</title>\n"
         << "</head>\n"
         << "<body>\n"
         << "<h1>Error response</h1>\n"
         << "<p>Error code: " << status << "</p>\n"
         << "<p>Message: " << html_escape(msg) << ".</p>\n"
         << "</body>\n"
         << "</html>\n";

    res.status = status;
    res.set_content(html.str(), "text/html; charset=utf-8");
}

static bool read_file_to_string(const std::string& path, std::string& out, int& err_no) {
    errno = 0;
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) {
        err_no = errno;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        err_no = EIO;
        return false;
    }
    out = ss.str();
    return true;
}

bool serve_static_file(const httplib::Request& req,
                       httplib::Response& res,
                       const std::string& abs_path,
                       const std::string& content_type) {
    struct stat st{};
    if (::stat(abs_path.c_str(), &st) != 0) {
        const int e = errno;
        if (e == ENOENT || e == ENOTDIR) reply_error_page(res, 404, "File not found");
        else if (e == EACCES)            reply_error_page(res, 403, "Permission denied");
        else                             reply_error_page(res, 500, "Cannot stat file");
        return false;
    }

    const std::time_t mtime = st.st_mtime;

    // If-None-Match takes precedence; we never emit ETags, so its presence
    // simply disables the date comparison.
    if (!req.has_header("If-None-Match") && req.has_header("If-Modified-Since")) {
        std::time_t ims = 0;
        if (parse_http_date(req.get_header_value("If-Modified-Since"), ims) && mtime <= ims) {
            res.status = 304;
            res.set_header("Last-Modified", http_date(mtime));
            return true;
        }
    }

    std::string body;
    int err_no = 0;
    if (!read_file_to_string(abs_path, body, err_no)) {
        if (err_no == EACCES || err_no == EPERM) reply_error_page(res, 403, "Permission denied");
        else if (err_no == ENOENT)               reply_error_page(res, 404, "File not found");
        else                                     reply_error_page(res, 500, "Cannot read file");
        return false;
    }

    res.set_header("Last-Modified", http_date(mtime));
    res.set_content(std::move(body), content_type);
    res.status = 200;
    return true;
}

struct ListingEntry {
    std::string name;
    bool is_dir = false;
    bool is_link = false;
};

bool serve_directory_listing(const httplib::Request& req,
                             httplib::Response& res,
                             const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) reply_error_page(res, 403, "No permission to list directory");
        else                                    reply_error_page(res, 500, "Cannot list directory");
        return false;
    }

    std::vector<ListingEntry> entries;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        ListingEntry e;
        e.name = it->path().filename().string();
        std::error_code sec;
        e.is_link = it->is_symlink(sec);
        e.is_dir = it->is_directory(sec);   // follows symlinks
        entries.push_back(std::move(e));
    }
    if (ec) {
        reply_error_page(res, 500, "Cannot list directory");
        return false;
    }

    std::sort(entries.begin(), entries.end(), [](const ListingEntry& a, const ListingEntry& b) {
        return lower_ascii(a.name) < lower_ascii(b.name);
    });

    const std::string title = "Directory listing for " + html_escape(req.path);

    std::ostringstream html;
    html << "<!DOCTYPE HTML>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<title>" << title << "</title>\n"
         << "</head>\n"
         << "<body>\n"
         << "<h1>" << title << "</h1>\n"
         << "<hr>\n"
         << "<ul>\n";

    for (const auto& e : entries) {
        std::string display = e.name;
        std::string link = e.name;
        if (e.is_dir) {
            display += "/";
            link += "/";
        }
        if (e.is_link) display = e.name + "@";

        html << "<li><a href=\"" << url_encode_path(link) << "\">"
             << html_escape(display) << "</a></li>\n";
    }

    html << "</ul>\n"
         << "<hr>\n"
         << "</body>\n"
         << "</html>\n";

    res.status = 200;
    res.set_content(html.str(), "text/html; charset=utf-8");
    return true;
}

StaticSite::StaticSite(std::string doc_root)
    : doc_root_(std::move(doc_root)) {}

bool StaticSite::init(std::string* err) {
    std::error_code ec;
    fs::path root = fs::canonical(doc_root_, ec);
    if (ec) {
        if (err) *err = "cannot resolve document root " + doc_root_ + ": " + ec.message();
        return false;
    }
    if (!fs::is_directory(root, ec)) {
        if (err) *err = "document root is not a directory: " + root.string();
        return false;
    }
    root_ = std::move(root);
    return true;
}

bool StaticSite::inside_root_(const fs::path& p) const {
    std::error_code ec;
    const fs::path real = fs::canonical(p, ec);
    if (ec) return false;

    auto r = root_.begin();
    auto q = real.begin();
    for (; r != root_.end(); ++r, ++q) {
        if (q == real.end() || *r != *q) return false;
    }
    return true;
}

void StaticSite::handle(const httplib::Request& req, httplib::Response& res) const {
    const std::string& url_path = req.path;

    if (url_path.find('\0') != std::string::npos) {
        reply_error_page(res, 400, "Bad request path");
        return;
    }

    const bool trailing_slash = !url_path.empty() && url_path.back() == '/';
    const fs::path full = translate_request_path(root_, url_path);

    std::error_code ec;
    const fs::file_status st = fs::status(full, ec);
    if (st.type() == fs::file_type::not_found) {
        reply_error_page(res, 404, "File not found");
        return;
    }
    if (ec) {
        if (ec == std::errc::permission_denied) reply_error_page(res, 403, "Permission denied");
        else                                    reply_error_page(res, 500, "Cannot stat path");
        return;
    }

    if (!inside_root_(full)) {
        reply_error_page(res, 403, "Path leaves the document root");
        return;
    }

    if (fs::is_directory(st)) {
        if (!trailing_slash) {
            std::string location = url_encode_path(url_path) + "/";
            const auto q = req.target.find('?');
            if (q != std::string::npos) location += req.target.substr(q);
            res.status = 301;
            res.set_header("Location", location);
            return;
        }

        for (const char* index : {"index.html", "index.htm"}) {
            const fs::path candidate = full / index;
            std::error_code iec;
            if (fs::is_regular_file(candidate, iec)) {
                serve_static_file(req, res, candidate.string(), mime_for_path(candidate));
                return;
            }
        }

        serve_directory_listing(req, res, full);
        return;
    }

    if (trailing_slash) {
        reply_error_page(res, 404, "File not found");
        return;
    }

    if (!fs::is_regular_file(st)) {
        reply_error_page(res, 403, "Not a regular file");
        return;
    }

    serve_static_file(req, res, full.string(), mime_for_path(full));
}

void StaticSite::reply_unsupported_method(const httplib::Request& req, httplib::Response& res) {
    reply_error_page(res, 501, "Unsupported method ('" + req.method + "')");
}

} // namespace devhttps
