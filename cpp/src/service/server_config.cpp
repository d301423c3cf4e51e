#include "portfolio_opt/service/server_config.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace portfolio_opt {

namespace {

int parse_int(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for --" + name + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid integer for --" + name + ": " + value);
    }
    return parsed;
}

int parse_non_negative(const std::string& name, const std::string& value) {
    const int parsed = parse_int(name, value);
    if (parsed < 0) {
        throw std::invalid_argument("--" + name + " must be non-negative");
    }
    return parsed;
}

bool parse_bool(const std::string& name, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::invalid_argument("Invalid boolean for --" + name + ": " + value);
}

// Flag name -> environment variable, e.g. max-timeout-ms -> PORTFOLIO_OPT_MAX_TIMEOUT_MS
std::string env_name(const std::string& flag) {
    std::string name = "PORTFOLIO_OPT_";
    for (char c : flag) {
        name += (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

const char* const kOptions[] = {
    "address", "port", "slots", "queue", "timeout-ms", "max-timeout-ms",
    "particles", "iterations", "stagnation", "starts", "max-body-bytes",
    "max-connections", "verbose",
};

}  // namespace

void ServerConfig::apply_option(const std::string& name, const std::string& value) {
    if (name == "address") {
        http.address = value;
    } else if (name == "port") {
        const int port = parse_non_negative(name, value);
        if (port > std::numeric_limits<uint16_t>::max()) {
            throw std::invalid_argument("--port out of range: " + value);
        }
        http.port = static_cast<uint16_t>(port);
    } else if (name == "slots") {
        governor.slots = parse_non_negative(name, value);
    } else if (name == "queue") {
        governor.queue_capacity = parse_non_negative(name, value);
    } else if (name == "timeout-ms") {
        governor.default_budget = std::chrono::milliseconds(parse_non_negative(name, value));
    } else if (name == "max-timeout-ms") {
        governor.max_budget = std::chrono::milliseconds(parse_non_negative(name, value));
    } else if (name == "particles") {
        governor.swarm.n_particles = parse_non_negative(name, value);
    } else if (name == "iterations") {
        governor.swarm.max_iterations = parse_non_negative(name, value);
    } else if (name == "stagnation") {
        governor.swarm.stagnation_window = parse_non_negative(name, value);
    } else if (name == "starts") {
        governor.n_starts = parse_non_negative(name, value);
    } else if (name == "max-body-bytes") {
        http.max_body_bytes = static_cast<size_t>(parse_non_negative(name, value));
    } else if (name == "max-connections") {
        http.max_connections = parse_non_negative(name, value);
    } else if (name == "verbose") {
        const bool verbose = parse_bool(name, value);
        http.verbose = verbose;
        governor.verbose = verbose;
    } else {
        throw std::invalid_argument("Unknown option --" + name);
    }
}

void ServerConfig::apply_environment() {
    for (const char* option : kOptions) {
        if (const char* value = std::getenv(env_name(option).c_str())) {
            apply_option(option, value);
        }
    }
}

ServerConfig ServerConfig::from_args(int argc, const char* const* argv) {
    ServerConfig config;
    config.apply_environment();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
        std::string name = arg.substr(2);

        // Accept both "--name value" and "--name=value"; --verbose may stand alone
        std::string value;
        const auto eq = name.find('=');
        if (eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
        } else if (name == "verbose") {
            value = "true";
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            throw std::invalid_argument("Missing value for --" + name);
        }
        config.apply_option(name, value);
    }
    return config;
}

std::string ServerConfig::usage(const std::string& program) {
    const ServerConfig defaults;
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n\n"
        << "  --address ADDR          Listen address (default " << defaults.http.address << ")\n"
        << "  --port N                Listen port (default " << defaults.http.port << ")\n"
        << "  --slots N               Concurrent optimization jobs, 0 = all cores\n"
        << "  --queue N               Jobs allowed to wait for a slot (default "
        << defaults.governor.queue_capacity << ")\n"
        << "  --timeout-ms N          Default per-job budget (default "
        << defaults.governor.default_budget.count() << ")\n"
        << "  --max-timeout-ms N      Ceiling on requested budgets (default "
        << defaults.governor.max_budget.count() << ")\n"
        << "  --particles N           Swarm size (default " << defaults.governor.swarm.n_particles << ")\n"
        << "  --iterations N          Iteration budget (default "
        << defaults.governor.swarm.max_iterations << ")\n"
        << "  --stagnation N          Flat iterations before stopping, 0 disables (default "
        << defaults.governor.swarm.stagnation_window << ")\n"
        << "  --starts N              Independent swarms per job (default "
        << defaults.governor.n_starts << ")\n"
        << "  --max-body-bytes N      Request body limit\n"
        << "  --max-connections N     Open connections before 503\n"
        << "  --verbose               Log requests and jobs\n\n"
        << "Every option can also be set as PORTFOLIO_OPT_<NAME>, e.g. PORTFOLIO_OPT_PORT=9000.\n";
    return out.str();
}

}  // namespace portfolio_opt
