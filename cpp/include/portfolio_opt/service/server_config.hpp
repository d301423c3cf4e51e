#pragma once

#include "governor.hpp"
#include "http_server.hpp"
#include <string>

namespace portfolio_opt {

// Settings for the optimization_server binary. Defaults come from the
// component Config structs, then PORTFOLIO_OPT_* environment variables,
// then command line flags (highest precedence).
struct ServerConfig {
    HttpServer::Config http;
    JobGovernor::Config governor;
    bool show_help{false};

    // Throws std::invalid_argument on unknown flags or malformed values
    [[nodiscard]] static ServerConfig from_args(int argc, const char* const* argv);

    void apply_environment();
    void apply_option(const std::string& name, const std::string& value);

    [[nodiscard]] static std::string usage(const std::string& program);
};

}  // namespace portfolio_opt
