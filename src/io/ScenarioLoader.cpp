#include "ScenarioLoader.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::vector<Packet> loadScenario(std::istream& in, Network& net)
{
    std::vector<Packet> packets;
    std::string line;
    for (int number = 1; std::getline(in, line); ++number) {
        std::istringstream ls(line);
        std::string connection;
        if (!(ls >> connection)) continue;

        int src = 0;
        int dst = 0;
        std::string extra;
        if (!(ls >> src >> dst) || (ls >> extra)) {
            throw std::runtime_error("scenario line " + std::to_string(number)
                                     + ": expected '<connection> <source> <destination>'");
        }

        Router* source = net.getRouter(src);
        Router* destination = net.getRouter(dst);
        if (!source || !destination) {
            throw std::runtime_error("scenario line " + std::to_string(number) + ": unknown router "
                                     + std::to_string(source ? dst : src));
        }
        packets.emplace_back(connection, source, destination);
    }
    return packets;
}

std::vector<Packet> loadScenarioFile(const std::string& path, Network& net)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("couldn't read scenario file " + path);
    }
    return loadScenario(file, net);
}
