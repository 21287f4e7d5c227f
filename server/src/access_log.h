#pragma once
#include <ctime>
#include <ostream>
#include <string>

#include "httplib.h"

namespace coiserve {

    // One line per request, common log format without user fields:
    //   127.0.0.1 - - [19/Oct/2026 12:00:00] "GET /index.html HTTP/1.1" 200 -
    std::string format_access_log_line(const httplib::Request& req,
                                       const httplib::Response& res,
                                       std::time_t now);

    // Route the library's per-request logger to out (std::cerr in main).
    void install_access_log(httplib::Server& srv, std::ostream& out);

} // namespace coiserve
