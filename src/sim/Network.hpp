#pragma once
#include "Event.hpp"
#include "Packet.hpp"
#include "Router.hpp"
#include "SimConfig.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <random>
#include <vector>

class Network
{
public:
    explicit Network(const SimConfig& config);

    Network(const Network&) = delete;
    Network& operator=(const Network&) = delete;

    // Routers keep insertion order; it decides processing order each tick.
    Router* addRouter(int id);

    Router* getRouter(int id);
    const Router* getRouter(int id) const;

    const std::vector<std::unique_ptr<Router>>& routers() const { return routers_; }

    // Queues a request at its source router, ready for the first tick.
    void injectPacket(Packet pkt);

    void tick(int i);
    bool finished() const;
    std::size_t livePacketCount() const;

    const std::deque<Packet>& packetsInTransit() const { return transit_; }
    const std::vector<Event>& events() const { return events_; }

    void setListener(EventListener* listener) { listener_ = listener; }
    const SimConfig& config() const { return config_; }

private:
    void dropPackets(int i);
    void deliverPackets(int i);
    void processIncomingPackets(int i);
    void transmitPackets(int i);

    void publish(std::size_t from);
    void dumpTransit(const char* label) const;
    void dumpRouters(const char* label) const;

    SimConfig config_;
    std::vector<std::unique_ptr<Router>> routers_;
    std::deque<Packet> transit_;
    std::vector<Event> events_;
    EventListener* listener_ = nullptr;

    std::mt19937 rng_;
    std::bernoulli_distribution loss_;
};
