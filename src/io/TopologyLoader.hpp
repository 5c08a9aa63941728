#pragma once
#include "../sim/Network.hpp"
#include <istream>
#include <string>

// Reads the router graph into net:
//
//   <router count>
//   <node> <neighbour> <delay> [<dest> <dest> ...] <neighbour> <delay> [...] ...
//
// Each link group adds the link in both directions; the bracketed
// destinations are routed from <node> through <neighbour>.
// Throws std::runtime_error naming the offending line.
void loadTopology(std::istream& in, Network& net);

void loadTopologyFile(const std::string& path, Network& net);
