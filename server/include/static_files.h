#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "httplib.h"
#include "server_config.h"

namespace coiserve {

struct ListingEntry {
    std::string name;     // file name as on disk
    bool is_dir = false;  // follows symlinks
    bool is_link = false;
};

// Resolve a decoded URL path ("/a/b.txt", "/", "/dir/") under root.
// "." and empty segments are dropped, ".." pops one segment; a ".." that would
// climb above root fails with err = "path escapes served root".
bool resolve_request_path(const std::filesystem::path& root,
                          const std::string& url_path,
                          std::filesystem::path* out_abs,
                          std::string* err);

// Content type for a file extension ("html", "wasm"; no dot, any case).
// Unknown extensions map to application/octet-stream.
std::string mime_for_ext(const std::string& ext);

// Extensions registered with the library's static file table.
const std::vector<std::pair<std::string, std::string>>& mime_table();

// Read directory entries sorted case-insensitively by name.
bool list_directory(const std::filesystem::path& dir,
                    std::vector<ListingEntry>* out,
                    std::error_code* ec);

// HTML page "Directory listing for <url_path>".
std::string render_directory_listing(const std::string& url_path,
                                     const std::vector<ListingEntry>& entries);

// HTML error page body for status codes >= 400.
std::string render_error_page(int status, const std::string& message);

// "Error code explanation" line of the error page.
std::string error_explanation_for(int status);

// Message used on the error page for a status.
std::string error_message_for(const httplib::Request& req, int status);

// GET/HEAD handler that runs after the library's mount point declined the
// request: directory index.htm, directory listings, and the 403/404/500 mapping.
void serve_static_fallback(const ServerConfig& cfg,
                           const httplib::Request& req,
                           httplib::Response& res);

// Handler for methods a static file server does not implement (501).
void serve_not_implemented(const httplib::Request& req, httplib::Response& res);

// Pre-routing check for If-Modified-Since. Sets 304 and returns true when the
// file under cfg.root_dir has not changed since the given date.
bool handle_not_modified(const ServerConfig& cfg,
                         const httplib::Request& req,
                         httplib::Response& res);

// Add Last-Modified to a response the library is serving from disk.
void annotate_static_file(const ServerConfig& cfg,
                          const httplib::Request& req,
                          httplib::Response& res);

// Wire all of the above plus the mount point and error pages into srv.
// Returns false with err if cfg.root_dir cannot be mounted.
// cfg is captured by reference and must outlive srv.
bool install_static_files(httplib::Server& srv, const ServerConfig& cfg, std::string* err);

} // namespace coiserve
