#include "Network.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

double checkedLoss(double q)
{
    if (!(q >= 0.0 && q <= 1.0)) {
        throw std::invalid_argument("loss probability must be in [0, 1], got " + std::to_string(q));
    }
    return q;
}

} // namespace

Network::Network(const SimConfig& config)
    : config_(config),
      rng_(config.seed ? *config.seed : std::random_device{}()),
      loss_(checkedLoss(config.lossProbability))
{
}

Router* Network::addRouter(int id)
{
    if (getRouter(id)) {
        throw std::invalid_argument("duplicate router id " + std::to_string(id));
    }
    routers_.push_back(std::make_unique<Router>(id, config_.delays));
    Router* router = routers_.back().get();
    if (config_.verbose) router->setTrace(&std::cerr);
    return router;
}

Router* Network::getRouter(int id)
{
    for (auto& router : routers_) {
        if (router->id() == id) return router.get();
    }
    return nullptr;
}

const Router* Network::getRouter(int id) const
{
    for (const auto& router : routers_) {
        if (router->id() == id) return router.get();
    }
    return nullptr;
}

void Network::injectPacket(Packet pkt)
{
    if (!pkt.source || !pkt.destination) {
        throw std::invalid_argument("packet " + pkt.connection + " has no source or destination");
    }
    pkt.source->addIncomingPacket(std::move(pkt));
}

void Network::dropPackets(int i)
{
    const std::size_t first = events_.size();
    std::deque<Packet> kept;
    for (auto& pkt : transit_) {
        if (!loss_(rng_)) {
            kept.push_back(std::move(pkt));
            continue;
        }
        if (config_.verbose) std::cerr << "dropped " << pkt << "\n";

        Event ev;
        ev.tick        = i;
        ev.kind        = EventKind::Lost;
        ev.connection  = pkt.connection;
        ev.node        = pkt.via->id();
        ev.source      = pkt.source->id();
        ev.destination = pkt.destination->id();
        ev.lifetime    = pkt.lifetime;
        ev.isReply     = pkt.isReply;
        events_.push_back(std::move(ev));
    }
    transit_.swap(kept);
    publish(first);
}

void Network::deliverPackets(int /*i*/)
{
    for (std::size_t n = transit_.size(); n > 0; --n) {
        Packet pkt = std::move(transit_.front());
        transit_.pop_front();

        if (pkt.tick() <= 0) {
            Router* next = pkt.via;
            pkt.via = nullptr;
            next->addIncomingPacket(std::move(pkt));
        } else {
            transit_.push_back(std::move(pkt));
        }
    }
}

void Network::processIncomingPackets(int i)
{
    const std::size_t first = events_.size();
    for (auto& router : routers_) {
        router->processIncomingPackets(i, events_);  // input -> output
    }
    publish(first);
}

void Network::transmitPackets(int /*i*/)
{
    for (auto& router : routers_) {
        for (auto& pkt : router->takeOutgoingPackets()) {
            transit_.push_back(std::move(pkt));
        }
    }
}

void Network::tick(int i)
{
    if (config_.verbose) {
        std::cerr << "t = " << i << "\n";
        dumpTransit("pre-deliver");
    }
    dropPackets(i);
    deliverPackets(i);
    if (config_.verbose) dumpRouters("post-deliver");
    processIncomingPackets(i);
    if (config_.verbose) dumpRouters("pre-transmit");
    transmitPackets(i);
    if (config_.verbose) dumpTransit("post-transmit");
}

bool Network::finished() const
{
    if (!transit_.empty()) return false;
    for (const auto& router : routers_) {
        if (!router->input().empty() || !router->output().empty()) return false;
    }
    return true;
}

std::size_t Network::livePacketCount() const
{
    std::size_t count = transit_.size();
    for (const auto& router : routers_) {
        count += router->input().size() + router->output().size();
    }
    return count;
}

void Network::publish(std::size_t from)
{
    if (!listener_) return;
    for (std::size_t k = from; k < events_.size(); ++k) {
        listener_->onEvent(events_[k]);
    }
}

void Network::dumpTransit(const char* label) const
{
    std::cerr << "    " << label << ": transmit: [";
    const char* sep = "";
    for (const auto& pkt : transit_) {
        std::cerr << sep << pkt;
        sep = " ";
    }
    std::cerr << "]\n";
}

void Network::dumpRouters(const char* label) const
{
    std::cerr << "    " << label << ": routers:";
    for (const auto& router : routers_) {
        std::cerr << " " << *router;
    }
    std::cerr << "\n";
}
