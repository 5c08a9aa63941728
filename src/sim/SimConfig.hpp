#pragma once
#include <cstdint>
#include <optional>
#include <ostream>

struct LookupDelays
{
    int neighbour = 1;  // destination is a direct neighbour
    int distant   = 2;  // destination resolved through the route table
};

struct SimConfig
{
    LookupDelays delays;
    double lossProbability = 0.05;      // per tick, per in-transit packet
    std::optional<std::uint32_t> seed;  // random_device when unset
    int maxTicks = 0;                   // 0 = run until finished
    bool verbose = false;

    void summary(std::ostream& os) const
    {
        os << "neighbour_delay=" << delays.neighbour << " "
           << "distant_delay=" << delays.distant << " "
           << "loss=" << lossProbability << " "
           << "seed=";
        if (seed) os << *seed;
        else      os << "random";
        os << " "
           << "max_ticks=" << maxTicks << "\n";
    }
};
