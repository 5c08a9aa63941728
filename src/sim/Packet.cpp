#include "Packet.hpp"
#include "Router.hpp"

std::ostream& operator<<(std::ostream& os, const Packet& pkt)
{
    os << "Packet(conn=" << pkt.connection
       << " src=" << pkt.source->id()
       << " dest=" << pkt.destination->id()
       << " via=";
    if (pkt.via) os << pkt.via->id();
    else         os << "None";
    return os << " D=" << pkt.delay
              << " T=" << pkt.lifetime << ")";
}
