#include "Options.hpp"
#include <getopt.h>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {

struct option command_line_options[] = {
    { "topology", required_argument, nullptr, 't' },
    { "scenario", required_argument, nullptr, 's' },
    { "loss", required_argument, nullptr, 'q' },
    { "neighbour_delay", required_argument, nullptr, 'n' },
    { "distant_delay", required_argument, nullptr, 'd' },
    { "seed", required_argument, nullptr, 'r' },
    { "max_ticks", required_argument, nullptr, 'm' },
    { "tick_rate", required_argument, nullptr, 'p' },
    { "verbose", no_argument, nullptr, 'v' },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 }
};

// digits only, no sign, at most max
unsigned long long unsignedValue(const char* name, const std::string& value, unsigned long long max)
{
    const auto bad = [&]() {
        return std::invalid_argument(std::string(name) + " must be an integer in [0, " + std::to_string(max)
                                     + "], got '" + value + "'");
    };
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) throw bad();

    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw bad();
    }
    if (v > max) throw bad();
    return v;
}

int nonNegative(const char* name, const std::string& value)
{
    return static_cast<int>(unsignedValue(name, value, std::numeric_limits<int>::max()));
}

double number(const char* name, const std::string& value)
{
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::out_of_range&) {
        used = 0;
    }
    if (used != value.size()) {
        throw std::invalid_argument(std::string(name) + " must be a number, got '" + value + "'");
    }
    return v;
}

} // namespace

void usage(std::ostream& os, const char* argv0, bool withViewer)
{
    os << "Usage: " << argv0
       << " [-t,--topology FILE] [-s,--scenario FILE] [-q,--loss Q]"
       << " [-n,--neighbour_delay N] [-d,--distant_delay N] [-r,--seed SEED]"
       << " [-m,--max_ticks N]";
    if (withViewer) os << " [-p,--tick_rate TICKS_PER_SEC]";
    os << " [-v,--verbose] [-h,--help]\n";
}

Options parseOptions(int argc, char** argv, bool withViewer)
{
    Options opts;
    optind = 0;  // reinitialise getopt between calls
    opterr = 0;

    while (true) {
        int option_index = 0;
        const int opt = getopt_long(argc, argv, withViewer ? ":t:s:q:n:d:r:m:p:vh" : ":t:s:q:n:d:r:m:vh",
                                    command_line_options, &option_index);
        if (opt == -1) break;

        switch (opt) {
        case 't': opts.topologyPath = optarg; break;
        case 's': opts.scenarioPath = optarg; break;
        case 'q': {
            const double q = number("loss", optarg);
            if (q < 0.0 || q > 1.0) {
                throw std::invalid_argument("loss must be in [0, 1], got '" + std::string(optarg) + "'");
            }
            opts.config.lossProbability = q;
            break;
        }
        case 'n': opts.config.delays.neighbour = nonNegative("neighbour_delay", optarg); break;
        case 'd': opts.config.delays.distant = nonNegative("distant_delay", optarg); break;
        case 'r':
            opts.config.seed = static_cast<std::uint32_t>(
                unsignedValue("seed", optarg, std::numeric_limits<std::uint32_t>::max()));
            break;
        case 'm': opts.config.maxTicks = nonNegative("max_ticks", optarg); break;
        case 'p':
            if (!withViewer) throw std::invalid_argument("unknown option --tick_rate");
            opts.tickRate = number("tick_rate", optarg);
            if (opts.tickRate <= 0.0) throw std::invalid_argument("tick_rate must be positive");
            break;
        case 'v': opts.config.verbose = true; break;
        case 'h': opts.help = true; break;
        case ':':
            throw std::invalid_argument(std::string("missing value for ") + argv[optind - 1]);
        default:
            throw std::invalid_argument(std::string("unknown option ") + argv[optind - 1]);
        }
    }

    if (optind < argc) {
        throw std::invalid_argument(std::string("unexpected argument ") + argv[optind]);
    }
    return opts;
}
