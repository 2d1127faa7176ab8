#pragma once
#include <ctime>
#include <string>

namespace devhttps {

    std::string lower_ascii(std::string s);
    std::string trim_ws(std::string s);

    // 2026-01-19T12:34:56.123Z
    std::string now_iso_utc();
    std::string iso_utc_from_epoch(std::time_t t);

    // RFC 7231 IMF-fixdate: "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string http_date(std::time_t t);
    bool parse_http_date(const std::string& s, std::time_t& out);

    // Common Log Format timestamp: "18/Oct/2026:14:00:00 +0000"
    std::string clf_time_utc(std::time_t t);

    // percent-encode everything except unreserved chars and '/'
    std::string url_encode_path(const std::string& s);
    std::string html_escape(const std::string& s);

    // "1", "true", "yes", "on" (any case) -> true; "0", "false", "no", "off" -> false
    bool parse_bool_flag(const std::string& s, bool& out);

} // namespace devhttps
