#pragma once
#include <stdexcept>
#include <string>

namespace coiserve {

// Fatal failure before the server starts accepting connections.
// what() names the offending file or address and the reason.
class StartupError : public std::runtime_error {
public:
    enum class Kind {
        Tls,   // certificate / key missing, unreadable, invalid or mismatched
        Root,  // served root missing or not a directory
        Bind   // port in use or not permitted
    };

    StartupError(Kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace coiserve
