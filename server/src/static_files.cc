#include "static_files.h"
#include "coiserve_util.h"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace coiserve {

/*
Static file serving
===================

Requests are answered in layers, all installed on one httplib::Server:

  1) pre-routing  : If-Modified-Since => 304 for unchanged regular files
  2) mount point  : the library serves readable regular files from root_dir
                    (content type from the mime table below, byte ranges,
                    index.html for "dir/", 301 for "dir" without slash)
  3) Get fallback : whatever the mount point declined: index.htm, directory
                    listings, and the 403 / 404 / 500 mapping
  4) error pages  : HTML body for any 4xx/5xx that has none yet

Headers that must appear on every response are added afterwards by the
post-routing hook in isolation_headers.cc, not here.

Path policy
-----------
The library rejects mount-point paths that climb above the mount with "..".
The fallback resolves with the same rule (resolve_request_path), so a request
can never reach a file outside root_dir through either layer. Symlinks inside
root_dir are followed.
*/

static const std::vector<std::pair<std::string, std::string>> kMimeTable = {
    {"html",  "text/html"},
    {"htm",   "text/html"},
    {"css",   "text/css"},
    {"js",    "text/javascript"},
    {"mjs",   "text/javascript"},
    {"json",  "application/json"},
    {"map",   "application/json"},
    {"wasm",  "application/wasm"},
    {"txt",   "text/plain"},
    {"xml",   "text/xml"},
    {"svg",   "image/svg+xml"},
    {"png",   "image/png"},
    {"jpg",   "image/jpeg"},
    {"jpeg",  "image/jpeg"},
    {"gif",   "image/gif"},
    {"webp",  "image/webp"},
    {"ico",   "image/x-icon"},
    {"woff",  "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf",   "font/ttf"},
    {"pdf",   "application/pdf"},
    {"mp3",   "audio/mpeg"},
    {"wav",   "audio/wav"},
    {"mp4",   "video/mp4"},
    {"webm",  "video/webm"},
};

const std::vector<std::pair<std::string, std::string>>& mime_table() {
    return kMimeTable;
}

std::string mime_for_ext(const std::string& ext_in) {
    const std::string ext = lower_ascii(ext_in);
    for (const auto& kv : kMimeTable) {
        if (kv.first == ext) return kv.second;
    }
    return "application/octet-stream";
}

bool resolve_request_path(const std::filesystem::path& root,
                          const std::string& url_path,
                          std::filesystem::path* out_abs,
                          std::string* err) {
    if (err) err->clear();
    if (!out_abs) {
        if (err) *err = "null out_abs";
        return false;
    }

    if (url_path.empty() || url_path[0] != '/') {
        if (err) *err = "path must start with '/'";
        return false;
    }
    if (url_path.find('\0') != std::string::npos ||
        url_path.find('\\') != std::string::npos) {
        if (err) *err = "invalid path";
        return false;
    }

    std::vector<std::string> parts;
    size_t pos = 1;
    while (pos <= url_path.size()) {
        size_t next = url_path.find('/', pos);
        if (next == std::string::npos) next = url_path.size();

        std::string seg = url_path.substr(pos, next - pos);
        pos = next + 1;

        if (seg.empty() || seg == ".") continue;
        if (seg == "..") {
            if (parts.empty()) {
                if (err) *err = "path escapes served root";
                return false;
            }
            parts.pop_back();
            continue;
        }
        parts.push_back(std::move(seg));
    }

    std::filesystem::path abs = root;
    for (const auto& p : parts) abs /= p;

    *out_abs = abs;
    return true;
}

bool list_directory(const std::filesystem::path& dir,
                    std::vector<ListingEntry>* out,
                    std::error_code* ec_out) {
    std::error_code ec;
    std::vector<ListingEntry> entries;

    for (auto it = std::filesystem::directory_iterator(dir, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        ListingEntry e;
        e.name = it->path().filename().string();

        std::error_code ec2;
        e.is_dir = it->is_directory(ec2);
        e.is_link = it->is_symlink(ec2);
        entries.push_back(std::move(e));
    }

    if (ec) {
        if (ec_out) *ec_out = ec;
        return false;
    }

    std::sort(entries.begin(), entries.end(), [](const ListingEntry& a, const ListingEntry& b) {
        const std::string la = lower_ascii(a.name);
        const std::string lb = lower_ascii(b.name);
        if (la != lb) return la < lb;
        return a.name < b.name;
    });

    if (out) *out = std::move(entries);
    return true;
}

std::string render_directory_listing(const std::string& url_path,
                                     const std::vector<ListingEntry>& entries) {
    const std::string title = "Directory listing for " + html_escape(url_path);

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
    return html.str();
}

std::string render_error_page(int status, const std::string& message) {
    std::ostringstream html;
    html << "<!DOCTYPE HTML>\n"
         << "<html lang=\"en\">\n"
         << "    <head>\n"
         << "        <meta charset=\"utf-8\">\n"
         << "        <title>Error response</title>\n"
         << "    </head>\n"
         << "    <body>\n"
         << "        <h1>Error response</h1>\n"
         << "        <p>Error code: " << status << "</p>\n"
         << "        <p>Message: " << html_escape(message) << ".</p>\n"
         << "        <p>Error code explanation: " << status << " - "
         << html_escape(error_explanation_for(status)) << ".</p>\n"
         << "    </body>\n"
         << "</html>\n";
    return html.str();
}

std::string error_explanation_for(int status) {
    switch (status) {
        case 400: return "Bad request syntax or unsupported method";
        case 403: return "Request forbidden -- authorization will not help";
        case 404: return "Nothing matches the given URI";
        case 405: return "Specified method is invalid for this resource";
        case 413: return "Entity is too large";
        case 414: return "URI is too long";
        case 416: return "Cannot satisfy request range";
        case 500: return "Server got itself in trouble";
        case 501: return "Server does not support this operation";
        case 503: return "The server cannot process the request due to a high load";
        default:  return httplib::status_message(status);
    }
}

std::string error_message_for(const httplib::Request& req, int status) {
    switch (status) {
        case 403: return "Forbidden";
        case 404: return "File not found";
        case 501: return "Unsupported method ('" + req.method + "')";
        default:  return httplib::status_message(status);
    }
}

static void fail(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(render_error_page(status, message), "text/html; charset=utf-8");
}

static void set_last_modified(const std::filesystem::path& p, httplib::Response& res) {
    struct stat st{};
    if (::stat(p.c_str(), &st) != 0) return;
    if (res.has_header("Last-Modified")) return;
    res.set_header("Last-Modified", http_date(st.st_mtime));
}

// Serve a regular file the mount point did not (or could not) open.
static void serve_file_direct(const std::filesystem::path& p, httplib::Response& res) {
    if (::access(p.c_str(), R_OK) != 0) {
        if (errno == EACCES) fail(res, 403, "Permission denied");
        else fail(res, 500, "Cannot open file");
        return;
    }

    std::ifstream f(p, std::ios::in | std::ios::binary);
    if (!f) {
        fail(res, 500, "Cannot open file");
        return;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        fail(res, 500, "Error reading file");
        return;
    }

    std::string ext = p.extension().string();
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);

    res.status = 200;
    res.set_content(ss.str(), mime_for_ext(ext));
    set_last_modified(p, res);
}

static void serve_directory(const ServerConfig& cfg,
                            const httplib::Request& req,
                            const std::filesystem::path& dir,
                            httplib::Response& res) {
    if (req.path.empty() || req.path.back() != '/') {
        res.set_redirect(url_encode_path(req.path) + "/", 301);
        return;
    }

    // index.html only lands here when the library failed to open it.
    for (const char* index : {"index.html", "index.htm"}) {
        const std::filesystem::path p = dir / index;
        std::error_code ec;
        if (std::filesystem::is_regular_file(p, ec)) {
            serve_file_direct(p, res);
            return;
        }
    }

    if (!cfg.directory_listing) {
        fail(res, 404, "File not found");
        return;
    }

    std::vector<ListingEntry> entries;
    std::error_code ec;
    if (!list_directory(dir, &entries, &ec)) {
        if (ec == std::errc::permission_denied) fail(res, 403, "No permission to list directory");
        else fail(res, 500, "Cannot list directory");
        return;
    }

    res.status = 200;
    res.set_content(render_directory_listing(req.path, entries), "text/html; charset=utf-8");
}

void serve_static_fallback(const ServerConfig& cfg,
                           const httplib::Request& req,
                           httplib::Response& res) {
    std::filesystem::path abs;
    std::string err;
    if (!resolve_request_path(cfg.root_dir, req.path, &abs, &err)) {
        fail(res, 403, "Forbidden");
        return;
    }

    std::error_code ec;
    const auto st = std::filesystem::status(abs, ec);
    if (ec) {
        if (ec == std::errc::permission_denied) fail(res, 403, "Permission denied");
        else fail(res, 404, "File not found");
        return;
    }

    if (std::filesystem::is_directory(st)) {
        serve_directory(cfg, req, abs, res);
        return;
    }
    if (std::filesystem::is_regular_file(st)) {
        // "/file.txt/" names a directory that is not there
        if (req.path.back() == '/') {
            fail(res, 404, "File not found");
            return;
        }
        serve_file_direct(abs, res);
        return;
    }

    // missing, or a fifo/socket/device
    fail(res, 404, "File not found");
}

void serve_not_implemented(const httplib::Request& req, httplib::Response& res) {
    fail(res, 501, error_message_for(req, 501));
}

bool handle_not_modified(const ServerConfig& cfg,
                         const httplib::Request& req,
                         httplib::Response& res) {
    if (req.method != "GET" && req.method != "HEAD") return false;
    if (!req.has_header("If-Modified-Since")) return false;
    if (req.has_header("If-None-Match")) return false;

    std::time_t since = 0;
    if (!parse_http_date(req.get_header_value("If-Modified-Since"), &since)) return false;

    std::filesystem::path abs;
    if (!resolve_request_path(cfg.root_dir, req.path, &abs, nullptr)) return false;
    if (req.path.back() == '/') abs /= "index.html";

    struct stat st{};
    if (::stat(abs.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
    if (st.st_mtime > since) return false;
    // unreadable files answer 403 from the normal path, not 304
    if (::access(abs.c_str(), R_OK) != 0) return false;

    res.status = 304;
    return true;
}

void annotate_static_file(const ServerConfig& cfg,
                          const httplib::Request& req,
                          httplib::Response& res) {
    std::filesystem::path abs;
    if (!resolve_request_path(cfg.root_dir, req.path, &abs, nullptr)) return;
    if (req.path.back() == '/') abs /= "index.html";
    set_last_modified(abs, res);
}

bool install_static_files(httplib::Server& srv, const ServerConfig& cfg, std::string* err) {
    if (err) err->clear();

    for (const auto& kv : mime_table()) {
        srv.set_file_extension_and_mimetype_mapping(kv.first, kv.second);
    }

    if (!srv.set_mount_point("/", cfg.root_dir)) {
        if (err) *err = "cannot mount served root " + cfg.root_dir;
        return false;
    }

    srv.set_pre_routing_handler([&cfg](const httplib::Request& req, httplib::Response& res) {
        return handle_not_modified(cfg, req, res)
            ? httplib::Server::HandlerResponse::Handled
            : httplib::Server::HandlerResponse::Unhandled;
    });

    srv.set_file_request_handler([&cfg](const httplib::Request& req, httplib::Response& res) {
        annotate_static_file(cfg, req, res);
    });

    srv.Get(R"(/.*)", [&cfg](const httplib::Request& req, httplib::Response& res) {
        serve_static_fallback(cfg, req, res);
    });

    auto not_implemented = [](const httplib::Request& req, httplib::Response& res) {
        serve_not_implemented(req, res);
    };
    srv.Post(R"(/.*)", not_implemented);
    srv.Put(R"(/.*)", not_implemented);
    srv.Delete(R"(/.*)", not_implemented);
    srv.Patch(R"(/.*)", not_implemented);
    srv.Options(R"(/.*)", not_implemented);

    srv.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;
        res.set_content(render_error_page(res.status, error_message_for(req, res.status)),
                        "text/html; charset=utf-8");
    });

    return true;
}

} // namespace coiserve
