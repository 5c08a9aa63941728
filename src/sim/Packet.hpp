#pragma once
#include <ostream>
#include <string>
#include <utility>

class Router;

struct Packet
{
    std::string connection;
    Router* source      = nullptr;
    Router* destination = nullptr;
    Router* via         = nullptr;  // next hop; null while queued at a router
    int  delay    = 0;              // ticks left until arrival at via
    int  lifetime = 0;              // ticks spent in transit
    bool isReply  = false;

    // hop bookkeeping for the viewer and the trace
    const Router* lastHop = nullptr;
    int hopDelay = 0;

    Packet() = default;
    Packet(std::string conn, Router* src, Router* dst)
        : connection(std::move(conn)), source(src), destination(dst) {}

    int tick()
    {
        --delay;
        ++lifetime;
        return delay;
    }
};

std::ostream& operator<<(std::ostream& os, const Packet& pkt);
