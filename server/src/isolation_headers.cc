#include "isolation_headers.h"

namespace coiserve {

void apply_isolation_headers(httplib::Response& res) {
    for (const auto& kv : kIsolationHeaders) {
        res.headers.erase(std::string(kv.first));
        res.set_header(kv.first, kv.second);
    }
}

void install_isolation_headers(httplib::Server& srv) {
    srv.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        apply_isolation_headers(res);
    });
}

} // namespace coiserve
