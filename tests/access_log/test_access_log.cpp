// tests/access_log/test_access_log.cpp
//
// Access log lines keep the common log layout operators grep for.

#include <ctime>
#include <iostream>
#include <sstream>
#include <string>

#include "httplib.h"
#include "access_log.h"
#include "coiserve_util.h"
#include "../common/test_support.h"

using coiserve_test::Checks;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int main() {
    Checks c;

    const std::time_t t = 1792400000; // fixed instant; rendered in local time

    {
        httplib::Request req;
        req.method = "GET";
        req.path = "/index.html";
        req.version = "HTTP/1.1";
        req.remote_addr = "127.0.0.1";
        httplib::Response res;
        res.status = 200;

        const std::string line = coiserve::format_access_log_line(req, res, t);
        c.expect(line == "127.0.0.1 - - [" + coiserve::log_date_time(t) + "] \"GET /index.html HTTP/1.1\" 200 -",
                 "200 line layout (got: " + line + ")");
    }

    {
        httplib::Request req;
        req.method = "HEAD";
        req.path = "/missing.txt";
        httplib::Response res;
        res.status = 404;

        const std::string line = coiserve::format_access_log_line(req, res, t);
        c.expect(line.rfind("- - - [", 0) == 0, "unknown peer shown as '-' (got: " + line + ")");
        c.expect(ends_with(line, "\"HEAD /missing.txt HTTP/1.1\" 404 -"), "404 line tail (got: " + line + ")");
    }

    {
        const std::string stamp = coiserve::log_date_time(t);
        // dd/Mon/yyyy hh:mm:ss
        c.expect(stamp.size() == 20 && stamp[2] == '/' && stamp[6] == '/' && stamp[11] == ' ',
                 "timestamp shape (got: " + stamp + ")");
    }

    if (c.failed) {
        std::cerr << c.failed << " check(s) failed\n";
        return 1;
    }
    std::cout << "OK: access log\n";
    return 0;
}
