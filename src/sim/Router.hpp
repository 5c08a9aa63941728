#pragma once
#include "Event.hpp"
#include "Packet.hpp"
#include "SimConfig.hpp"
#include <deque>
#include <ostream>
#include <unordered_map>
#include <vector>

struct Link
{
    Router* neighbour;
    int     delay;
};

class Router
{
public:
    explicit Router(int id, LookupDelays delays = {})
        : id_(id), delays_(delays) {}

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    int id() const { return id_; }

    // verbose per-packet trace; null disables it
    void setTrace(std::ostream* os) { trace_ = os; }

    // Registers the link to neighbour and routes every destination in
    // routes through it. Called once per direction by the topology loader.
    void addConnection(Router* neighbour, int delay,
                       const std::vector<Router*>& routes = {});

    void addIncomingPacket(Packet pkt) { input_.push_back(std::move(pkt)); }

    // Route table entry first, then a direct neighbour, else nullptr.
    Router* getRouteFor(const Router* destination) const;

    bool isNeighbour(const Router* other) const { return findLink(other) != nullptr; }

    // throws std::out_of_range when other is not a neighbour
    int linkDelay(const Router* other) const;

    void processIncomingPackets(int tick, std::vector<Event>& events);

    // Hands the whole output queue to the caller.
    std::deque<Packet> takeOutgoingPackets();

    const std::deque<Packet>& input() const { return input_; }
    const std::deque<Packet>& output() const { return output_; }
    const std::vector<Link>& links() const { return links_; }
    const std::unordered_map<const Router*, Router*>& routes() const { return routes_; }

private:
    const Link* findLink(const Router* other) const;
    void reply(int tick, const Packet& request, std::vector<Event>& events);
    void forward(int tick, Packet pkt, std::vector<Event>& events);
    void reportUnroutable(int tick, const Packet& pkt, std::vector<Event>& events) const;

    int                 id_;
    LookupDelays        delays_;
    std::vector<Link>   links_;
    std::unordered_map<const Router*, Router*> routes_;  // destination -> next hop
    std::deque<Packet>  input_;
    std::deque<Packet>  output_;
    std::ostream*       trace_ = nullptr;
};

std::ostream& operator<<(std::ostream& os, const Router& router);
