#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace yieldvault::examples::cli::simulation {

    // -------------------------------------------------------------
    // Simulation parameters
    // -------------------------------------------------------------
    struct Params {
        std::string   config_path;                 // empty: built-in defaults
        std::uint32_t users        = 7;
        std::uint64_t deposit      = 1'000;        // whole asset units per user
        std::uint64_t yield_bps    = 250;          // yield accrued on each source
        std::uint32_t batch        = 5;
        std::string   journal_path;                // empty: no journal
        std::string   log_level    = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Config    : " << (config_path.empty() ? "<defaults>" : config_path) << "\n"
               << "  Users     : " << users << "\n"
               << "  Deposit   : " << deposit << "\n"
               << "  Yield     : " << yield_bps << " bps\n"
               << "  Batch     : " << batch << "\n"
               << "  Journal   : " << (journal_path.empty() ? "<off>" : journal_path) << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-c,--config", params.config_path, "Vault configuration (JSON)")->check(CLI::ExistingFile);
        app.add_option("-u,--users", params.users, "Number of depositors")->check(CLI::Range(1u, 1000u))->default_val(params.users);
        app.add_option("-d,--deposit", params.deposit, "Deposit per user, in whole asset units")->check(CLI::Range(1ull, 1'000'000'000ull))->default_val(params.deposit);
        app.add_option("-y,--yield-bps", params.yield_bps, "Yield accrued on each source, in bps")->check(CLI::Range(0ull, 10'000ull))->default_val(params.yield_bps);
        app.add_option("-b,--batch", params.batch, "Fulfillment batch size")->check(batch_size_validator)->default_val(params.batch);
        app.add_option("-j,--journal", params.journal_path, "Append events to this journal file");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | off")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Runs one deposit -> allocate -> yield -> redeem cycle against\n"
            "in-memory yield sources and prints the resulting vault state."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level);
        return params;
    }

} // namespace yieldvault::examples::cli::simulation
