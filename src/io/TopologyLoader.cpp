#include "TopologyLoader.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <regex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

struct NumberedLine
{
    int number;
    std::string text;
};

[[noreturn]] void fail(int line, const std::string& what)
{
    throw std::runtime_error("topology line " + std::to_string(line) + ": " + what);
}

int toInt(const std::string& digits, int line)
{
    try {
        return std::stoi(digits);
    } catch (const std::out_of_range&) {
        fail(line, "number " + digits + " out of range");
    }
}

bool isBlank(const std::string& s)
{
    return s.find_first_not_of(" \t\r") == std::string::npos;
}

Router* lookup(Network& net, int id, int line)
{
    Router* router = net.getRouter(id);
    if (!router) fail(line, "unknown router " + std::to_string(id));
    return router;
}

void checkSymmetric(const Router* a, const Router* b, int delay, int line)
{
    if (a->isNeighbour(b) && a->linkDelay(b) != delay) {
        fail(line, "link " + std::to_string(a->id()) + "-" + std::to_string(b->id())
                   + " redeclared with delay " + std::to_string(delay)
                   + " (was " + std::to_string(a->linkDelay(b)) + ")");
    }
}

} // namespace

void loadTopology(std::istream& in, Network& net)
{
    static const std::regex nodeRe(R"(^\s*(\d+))");
    static const std::regex groupRe(R"(^\s*(\d+)\s+(\d+)\s*\[([\d\s]*)\])");
    static const std::regex numberRe(R"(\d+)");

    // a hop's countdown is the link delay plus a lookup delay
    const LookupDelays& delays = net.config().delays;
    const int maxDelay = std::numeric_limits<int>::max() - std::max(delays.neighbour, delays.distant);

    std::string text;
    if (!std::getline(in, text)) {
        throw std::runtime_error("topology: empty input");
    }
    // first line is the router count, informational only
    if (!std::regex_search(text, nodeRe)) fail(1, "expected router count");

    std::vector<NumberedLine> lines;
    for (int number = 2; std::getline(in, text); ++number) {
        if (!isBlank(text)) lines.push_back(NumberedLine{ number, text });
    }

    // routers first, in order of appearance
    for (const auto& line : lines) {
        std::smatch m;
        if (!std::regex_search(line.text, m, nodeRe)) fail(line.number, "expected router id");
        const int id = toInt(m[1].str(), line.number);
        if (!net.getRouter(id)) net.addRouter(id);
    }

    for (const auto& line : lines) {
        std::smatch m;
        std::regex_search(line.text, m, nodeRe);
        Router* node = net.getRouter(toInt(m[1].str(), line.number));

        std::string rest = m.suffix().str();
        while (std::regex_search(rest, m, groupRe)) {
            Router* neighbour = lookup(net, toInt(m[1].str(), line.number), line.number);
            const int delay = toInt(m[2].str(), line.number);

            if (neighbour == node) fail(line.number, "router " + std::to_string(node->id()) + " linked to itself");
            if (delay <= 0) fail(line.number, "link delay must be positive");
            if (delay > maxDelay) {
                fail(line.number, "link delay " + std::to_string(delay) + " exceeds " + std::to_string(maxDelay));
            }
            checkSymmetric(node, neighbour, delay, line.number);
            checkSymmetric(neighbour, node, delay, line.number);

            std::vector<Router*> routes;
            const std::string dests = m[3].str();
            for (std::sregex_iterator it(dests.begin(), dests.end(), numberRe), end; it != end; ++it) {
                Router* destination = lookup(net, toInt(it->str(), line.number), line.number);
                if (destination == node) {
                    fail(line.number, "router " + std::to_string(node->id()) + " routes to itself");
                }
                routes.push_back(destination);
            }

            node->addConnection(neighbour, delay, routes);
            neighbour->addConnection(node, delay);
            rest = m.suffix().str();
        }

        if (!isBlank(rest)) fail(line.number, "unexpected '" + rest + "'");
    }
}

void loadTopologyFile(const std::string& path, Network& net)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("couldn't read topology file " + path);
    }
    loadTopology(file, net);
}
