#include "access_log.h"
#include "coiserve_util.h"

#include <mutex>

namespace coiserve {

std::string format_access_log_line(const httplib::Request& req,
                                   const httplib::Response& res,
                                   std::time_t now) {
    const std::string host = req.remote_addr.empty() ? "-" : req.remote_addr;
    const std::string version = req.version.empty() ? "HTTP/1.1" : req.version;

    // Size is always "-": file bodies are streamed by the library and the
    // final byte count is not visible here.
    return host + " - - [" + log_date_time(now) + "] \""
         + req.method + " " + req.path + " " + version + "\" "
         + std::to_string(res.status) + " -";
}

void install_access_log(httplib::Server& srv, std::ostream& out) {
    // Logger runs on worker threads; keep lines whole.
    static std::mutex mu;

    srv.set_logger([&out](const httplib::Request& req, const httplib::Response& res) {
        const std::string line = format_access_log_line(req, res, std::time(nullptr));
        std::lock_guard<std::mutex> lk(mu);
        out << line << std::endl;
    });
}

} // namespace coiserve
