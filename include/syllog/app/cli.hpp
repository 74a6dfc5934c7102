#pragma once

#include "syllog/logic/query.hpp"
#include "syllog/logic/saturation.hpp"
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace syllog::app {

    // Process exit statuses of the syllog command.
    enum ExitStatus : int {
        kExitOk = 0,
        kExitParseError = 1,
        kExitUsage = 2,
        kExitSweepLimit = 3,
    };

    struct Options {
        logic::Query query;
        std::size_t threads = 0;
        std::size_t max_sweeps = logic::kDefaultMaxSweeps;
        bool trace = false;
        bool timing = false;
        bool dot = false;
        bool help = false;
    };

    void usage(std::ostream &os);

    // Parses the arguments after the program name. Returns nullopt after
    // reporting the problem on err.
    std::optional<Options> parse_options(const std::vector<std::string> &args, std::ostream &err);

    // Loads statements from in, saturates and reports. The verdict (and DOT,
    // if asked for) goes to out; diagnostics, trace and timing go to err.
    int run(const Options &options, std::istream &in, std::ostream &out, std::ostream &err);

    // parse_options + run, with the usage and --help handling of the command.
    int run_cli(const std::vector<std::string> &args, std::istream &in, std::ostream &out, std::ostream &err);

} // namespace syllog::app
