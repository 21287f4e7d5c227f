#pragma once
#include <array>
#include <utility>

#include "httplib.h"

namespace coiserve {

// Headers browsers require before enabling cross-origin isolation
// (SharedArrayBuffer, high resolution timers).
inline constexpr std::array<std::pair<const char*, const char*>, 3> kIsolationHeaders = {{
    {"Access-Control-Allow-Origin",  "*"},
    {"Cross-Origin-Opener-Policy",   "same-origin"},
    {"Cross-Origin-Embedder-Policy", "require-corp"},
}};

// Append the isolation headers to res. Any existing header of the same name is
// dropped first, so each one ends up present exactly once with our value.
void apply_isolation_headers(httplib::Response& res);

// Install apply_isolation_headers as the server's post-routing hook. The hook
// runs after status, content and error pages are final, for every response.
void install_isolation_headers(httplib::Server& srv);

} // namespace coiserve
