#pragma once
#include <cstdint>
#include <ctime>
#include <mutex>
#include <ostream>
#include <string>

#include "httplib.h"

namespace devhttps {

/*
AccessEvent
===========

One served request, as recorded in the access log.

All fields are plain values copied out of the request/response pair so the
event can outlive them and be formatted on any thread.
*/
struct AccessEvent {
    // ISO-8601 UTC with milliseconds, e.g. 2026-10-18T14:00:00.123Z
    std::string ts_utc;

    std::string remote_addr;
    std::string method;
    std::string target;      // path plus query as sent by the client
    std::string version;     // "HTTP/1.1"
    int status = 0;
    std::uint64_t bytes = 0; // response body length, 0 for HEAD/304
    std::string user_agent;
};

// Copy the loggable fields out of a finished exchange.
AccessEvent make_access_event(const httplib::Request& req, const httplib::Response& res);

// Common Log Format line without trailing newline:
// 127.0.0.1 - - [18/Oct/2026:14:00:00 +0000] "GET / HTTP/1.1" 200 1234
std::string format_clf(const AccessEvent& e, std::time_t when);

// One compact JSON object without trailing newline.
std::string format_jsonl(const AccessEvent& e);

/*
AccessLog
=========

Request log sink installed with httplib::Server::set_logger.

- console: one CLF line per request on the given stream (stderr in the server)
- file:    optional JSONL file, one object per request

record() is called concurrently from httplib worker threads; both sinks are
written under mu_ so lines never interleave.
*/
class AccessLog {
public:
    // jsonl_path may be empty (file sink disabled).
    AccessLog(std::ostream* console, std::string jsonl_path);

    // Create the parent directory of the JSONL file. Failure disables the file
    // sink with a warning; it never stops the server.
    bool open(std::string* err = nullptr);

    void record(const AccessEvent& e);

    bool file_enabled() const { return !jsonl_path_.empty(); }
    const std::string& jsonl_path() const { return jsonl_path_; }

private:
    std::ostream* console_;
    std::string jsonl_path_;
    std::mutex mu_;
};

} // namespace devhttps
