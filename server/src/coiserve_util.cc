#include "coiserve_util.h"

#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace coiserve {

static const char* const kMonths[12] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string html_escape(const std::string& s, bool quote) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (quote) out += "&quot;";
                else out.push_back(c);
                break;
            case '\'':
                if (quote) out += "&#x27;";
                else out.push_back(c);
                break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string url_encode_path(const std::string& s) {
    static const char *hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if ((c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back((char)c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 15]);
        }
    }
    return out;
}

std::string http_date(std::time_t t) {
    static const char* const kDays[7] = { "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat" };

    std::tm tm{};
    gmtime_r(&t, &tm);

    // Built by hand so the output does not depend on the process locale.
    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf),
                                "%s, %02d %s %04d %02d:%02d:%02d GMT",
                                kDays[tm.tm_wday], tm.tm_mday, kMonths[tm.tm_mon],
                                tm.tm_year + 1900, tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (n <= 0) return "";
    return std::string(buf, (size_t)n);
}

bool parse_http_date(const std::string& s, std::time_t* out) {
    if (!out) return false;

    // Only IMF-fixdate is accepted; obsolete RFC 850 / asctime forms are ignored.
    char wday[4] = {0};
    char mon[4] = {0};
    char zone[4] = {0};
    int day = 0, year = 0, hh = 0, mm = 0, ss = 0;
    if (std::sscanf(s.c_str(), "%3s, %d %3s %d %d:%d:%d %3s",
                    wday, &day, mon, &year, &hh, &mm, &ss, zone) != 8) {
        return false;
    }
    if (std::strcmp(zone, "GMT") != 0) return false;

    int month = -1;
    for (int i = 0; i < 12; i++) {
        if (std::strcmp(mon, kMonths[i]) == 0) { month = i; break; }
    }
    if (month < 0) return false;
    if (day < 1 || day > 31 || year < 1970 || hh > 23 || mm > 59 || ss > 60) return false;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_hour = hh;
    tm.tm_min = mm;
    tm.tm_sec = ss;

    *out = timegm(&tm);
    return true;
}

std::string log_date_time(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf), "%02d/%s/%04d %02d:%02d:%02d",
                                tm.tm_mday, kMonths[tm.tm_mon], tm.tm_year + 1900,
                                tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (n <= 0) return "";
    return std::string(buf, (size_t)n);
}

} // namespace coiserve
