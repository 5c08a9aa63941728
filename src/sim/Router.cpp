#include "Router.hpp"
#include <stdexcept>
#include <string>

void Router::addConnection(Router* neighbour, int delay, const std::vector<Router*>& routes)
{
    if (neighbour == this) {
        throw std::invalid_argument("router " + std::to_string(id_) + " cannot link to itself");
    }

    bool known = false;
    for (auto& link : links_) {
        if (link.neighbour == neighbour) {
            link.delay = delay;
            known = true;
            break;
        }
    }
    if (!known) links_.push_back(Link{ neighbour, delay });

    for (Router* destination : routes) {
        if (destination == this) {
            throw std::invalid_argument("router " + std::to_string(id_) + " cannot route to itself");
        }
        routes_[destination] = neighbour;
    }
}

const Link* Router::findLink(const Router* other) const
{
    for (const auto& link : links_) {
        if (link.neighbour == other) return &link;
    }
    return nullptr;
}

int Router::linkDelay(const Router* other) const
{
    const Link* link = findLink(other);
    if (!link) {
        throw std::out_of_range("router " + std::to_string(id_) + " has no link to "
                                + (other ? std::to_string(other->id()) : std::string("null")));
    }
    return link->delay;
}

Router* Router::getRouteFor(const Router* destination) const
{
    auto it = routes_.find(destination);
    if (it != routes_.end()) return it->second;

    if (const Link* link = findLink(destination)) return link->neighbour;
    return nullptr;
}

void Router::processIncomingPackets(int tick, std::vector<Event>& events)
{
    // only what was queued before this call
    for (std::size_t n = input_.size(); n > 0; --n) {
        Packet pkt = std::move(input_.front());
        input_.pop_front();

        if (pkt.destination != this) {
            forward(tick, std::move(pkt), events);
            continue;
        }

        if (trace_) {
            *trace_ << "    delivered " << (pkt.isReply ? "REPLY " : "") << pkt
                    << " to " << *this << "\n";
        }

        if (pkt.isReply) {
            Event ev;
            ev.tick        = tick;
            ev.kind        = EventKind::Delivered;
            ev.connection  = pkt.connection;
            ev.node        = id_;
            ev.source      = pkt.source->id();
            ev.destination = pkt.destination->id();
            ev.lifetime    = pkt.lifetime;
            ev.isReply     = true;
            events.push_back(std::move(ev));
        } else {
            reply(tick, pkt, events);
        }
    }
}

void Router::reply(int tick, const Packet& request, std::vector<Event>& events)
{
    Packet pkt(request.connection, this, request.source);
    pkt.lifetime = request.lifetime;
    pkt.isReply  = true;
    pkt.via      = getRouteFor(request.source);

    if (!pkt.via) {
        reportUnroutable(tick, pkt, events);
        return;
    }

    const int lookup = isNeighbour(pkt.via) ? delays_.neighbour : delays_.distant;
    pkt.delay    = linkDelay(pkt.via) + lookup;
    pkt.lastHop  = this;
    pkt.hopDelay = pkt.delay;
    output_.push_back(std::move(pkt));
}

void Router::forward(int tick, Packet pkt, std::vector<Event>& events)
{
    if (const Link* link = findLink(pkt.destination)) {
        pkt.via   = link->neighbour;
        pkt.delay = link->delay + delays_.neighbour;
    } else {
        auto it = routes_.find(pkt.destination);
        if (it == routes_.end()) {
            reportUnroutable(tick, pkt, events);
            return;
        }
        pkt.via   = it->second;
        pkt.delay = linkDelay(pkt.via) + delays_.distant;
    }

    pkt.lastHop  = this;
    pkt.hopDelay = pkt.delay;
    output_.push_back(std::move(pkt));
}

void Router::reportUnroutable(int tick, const Packet& pkt, std::vector<Event>& events) const
{
    if (trace_) *trace_ << pkt << " lost at " << *this << "\n";

    Event ev;
    ev.tick        = tick;
    ev.kind        = EventKind::Unroutable;
    ev.connection  = pkt.connection;
    ev.node        = id_;
    ev.source      = pkt.source->id();
    ev.destination = pkt.destination->id();
    ev.lifetime    = pkt.lifetime;
    ev.isReply     = pkt.isReply;
    events.push_back(std::move(ev));
}

std::deque<Packet> Router::takeOutgoingPackets()
{
    std::deque<Packet> out;
    out.swap(output_);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Router& router)
{
    os << "Router(id=" << router.id() << " in=[";
    const char* sep = "";
    for (const auto& pkt : router.input()) {
        os << sep << pkt;
        sep = " ";
    }
    os << "] out=[";
    sep = "";
    for (const auto& pkt : router.output()) {
        os << sep << pkt;
        sep = " ";
    }
    return os << "])";
}
