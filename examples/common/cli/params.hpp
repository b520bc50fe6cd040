#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "wirepool/core/category.hpp"
#include "lcr/log/logger.hpp"


namespace wirepool::examples::cli {

// -------------------------------------------------------------
// Validators
// -------------------------------------------------------------
inline auto category_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        core::Category c;
        if (core::parse_category(value, c)) {
            return {};
        }
        return "Category must be one of: voice, chat, inventory, alerts, general";
    },
    "Category validator"
);

inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);

// -------------------------------------------------------------
// Demo parameters
// -------------------------------------------------------------
struct Params {
    std::string config_path;
    std::string category       = "chat";
    std::string tenant         = "main";
    std::string role           = "customer";
    std::uint32_t clients      = 12;
    std::uint32_t duration_s   = 5;
    double fail_rate           = 0.01;
    std::string log_level      = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Config    : " << (config_path.empty() ? "(defaults)" : config_path) << "\n"
           << "  Category  : " << category << "\n"
           << "  Tenant    : " << tenant << "\n"
           << "  Role      : " << role << "\n"
           << "  Clients   : " << clients << "\n"
           << "  Duration  : " << duration_s << " s\n"
           << "  Fail rate : " << fail_rate << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-c,--config", params.config_path, "JSON pool configuration file")->check(CLI::ExistingFile);
    app.add_option("--category", params.category, "Traffic category to exercise")->check(category_validator)->default_val(params.category);
    app.add_option("--tenant", params.tenant, "Tenant id used by every client")->default_val(params.tenant);
    app.add_option("--role", params.role, "Requester role used by every client")->default_val(params.role);
    app.add_option("-n,--clients", params.clients, "Concurrent clients")->check(CLI::Range(1u, 1024u))->default_val(params.clients);
    app.add_option("-d,--duration", params.duration_s, "Run time in seconds")->check(CLI::Range(1u, 3600u))->default_val(params.duration_s);
    app.add_option("--fail-rate", params.fail_rate, "Probability of a simulated transport failure")->check(CLI::Range(0.0, 1.0))->default_val(params.fail_rate);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Clients contend for the category's channels through one pool.\n"
        "Metrics and telemetry are printed at exit."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    lcr::log::Level lvl = lcr::log::Level::Info;
    (void)lcr::log::parse_level(params.log_level, lvl);
    lcr::log::Logger::instance().set_level(lvl);
    return params;
}

} // namespace wirepool::examples::cli
