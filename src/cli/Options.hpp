#pragma once
#include "../sim/SimConfig.hpp"
#include <ostream>
#include <string>

struct Options
{
    std::string topologyPath = "topology.txt";
    std::string scenarioPath = "scenario.txt";
    SimConfig config;
    double tickRate = 4.0;  // viewer only, ticks per second
    bool help = false;
};

// Parses the shared command line. Unknown options and bad values throw
// std::invalid_argument. withViewer accepts -p/--tick_rate.
Options parseOptions(int argc, char** argv, bool withViewer = false);

void usage(std::ostream& os, const char* argv0, bool withViewer = false);
