#pragma once
#include <ctime>
#include <string>

namespace coiserve {

    std::string lower_ascii(std::string s);

    // HTML text escaping for &, <, > (and " when quote is true).
    std::string html_escape(const std::string& s, bool quote = false);

    // Percent-encode everything except unreserved chars and '/'.
    std::string url_encode_path(const std::string& s);

    // RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string http_date(std::time_t t);
    bool parse_http_date(const std::string& s, std::time_t* out);

    // Access log timestamp in local time: "19/Oct/2026 12:00:00"
    std::string log_date_time(std::time_t t);

} // namespace coiserve
