#pragma once
#include "../sim/Network.hpp"
#include "../sim/Packet.hpp"
#include <istream>
#include <string>
#include <vector>

// One request per line: <connection> <source id> <destination id>.
// Router ids are resolved against net; throws std::runtime_error.
std::vector<Packet> loadScenario(std::istream& in, Network& net);

std::vector<Packet> loadScenarioFile(const std::string& path, Network& net);
