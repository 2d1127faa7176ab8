#include "access_log.h"
#include "devhttps_util.h"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace devhttps {

AccessEvent make_access_event(const httplib::Request& req, const httplib::Response& res) {
    AccessEvent e;
    e.ts_utc = now_iso_utc();
    e.remote_addr = req.remote_addr.empty() ? "-" : req.remote_addr;
    e.method = req.method;
    e.target = req.target.empty() ? req.path : req.target;
    e.version = req.version.empty() ? "HTTP/1.1" : req.version;
    e.status = res.status;
    e.bytes = (req.method == "HEAD") ? 0 : (std::uint64_t)res.body.size();
    e.user_agent = req.get_header_value("User-Agent");
    return e;
}

std::string format_clf(const AccessEvent& e, std::time_t when) {
    std::ostringstream oss;
    oss << e.remote_addr << " - - [" << clf_time_utc(when) << "] \""
        << e.method << " " << e.target << " " << e.version << "\" "
        << e.status << " ";
    if (e.bytes == 0) oss << "-";
    else oss << e.bytes;
    return oss.str();
}

std::string format_jsonl(const AccessEvent& e) {
    nlohmann::json j;
    j["ts"] = e.ts_utc;
    j["remote_addr"] = e.remote_addr;
    j["method"] = e.method;
    j["path"] = e.target;
    j["status"] = e.status;
    j["bytes"] = e.bytes;
    j["user_agent"] = e.user_agent;
    // replace: request lines are client-controlled and may not be valid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

AccessLog::AccessLog(std::ostream* console, std::string jsonl_path)
    : console_(console), jsonl_path_(std::move(jsonl_path)) {}

bool AccessLog::open(std::string* err) {
    if (jsonl_path_.empty()) return true;

    const std::filesystem::path parent = std::filesystem::path(jsonl_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            if (err) *err = "cannot create " + parent.string() + ": " + ec.message();
            std::cerr << "[access] WARNING: create_directories failed: " << ec.message()
                      << " (JSONL access log disabled)" << std::endl;
            jsonl_path_.clear();
            return false;
        }
    }

    std::ofstream probe(jsonl_path_, std::ios::app);
    if (!probe.good()) {
        if (err) *err = "cannot open " + jsonl_path_ + " for append";
        std::cerr << "[access] WARNING: cannot open " << jsonl_path_
                  << " (JSONL access log disabled)" << std::endl;
        jsonl_path_.clear();
        return false;
    }
    return true;
}

void AccessLog::record(const AccessEvent& e) {
    const std::string clf = format_clf(e, std::time(nullptr));
    const std::string line = jsonl_path_.empty() ? std::string() : format_jsonl(e);

    std::lock_guard<std::mutex> lk(mu_);

    if (console_) {
        *console_ << clf << std::endl;
    }

    if (!line.empty()) {
        std::ofstream out(jsonl_path_, std::ios::app);
        out << line << "\n";
        out.flush();
    }
}

} // namespace devhttps
