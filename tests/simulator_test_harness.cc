#include "simulator_test_harness.hh"
#include "../src/io/TopologyLoader.hpp"

#include <sstream>

using namespace std;

SimConfig lossless_config()
{
    SimConfig config;
    config.lossProbability = 0.0;
    config.seed = 1;
    return config;
}

SimConfig lossy_config(double q, uint32_t seed)
{
    SimConfig config;
    config.lossProbability = q;
    config.seed = seed;
    return config;
}

SimulatorTestHarness::SimulatorTestHarness(string test_name, const string& topology, const SimConfig& config)
    : name_(move(test_name)),
      network_(make_unique<Network>(config)),
      simulation_(make_unique<Simulation>(*network_, config.maxTicks))
{
    istringstream in(topology);
    loadTopology(in, *network_);
}

void SimulatorTestHarness::fail(const SimulatorTestStep& step, const string& what) const
{
    ostringstream msg;
    msg << "The test \"" << name_ << "\" failed at tick " << simulation_->tick()
        << " while " << step.str() << ": " << what;
    throw ExpectationViolation(msg.str());
}

void SimulatorTestHarness::execute(const SimulatorAction& action)
{
    try {
        action.execute(*this);
    } catch (const ExpectationViolation&) {
        throw;
    } catch (const exception& e) {
        fail(action, e.what());
    }
}

void SimulatorTestHarness::execute(const SimulatorExpectation& expectation) const
{
    try {
        expectation.execute(*this);
    } catch (const exception& e) {
        fail(expectation, e.what());
    }
}

void SimulatorTestHarness::resetLiveBaseline()
{
    lastLive_ = network_->livePacketCount();
}

void SimulatorTestHarness::step()
{
    simulation_->step();

    const size_t live = network_->livePacketCount();
    if (live > lastLive_) {
        throw ExpectationViolation("The test \"" + name_ + "\" saw live packets grow from "
                                   + to_string(lastLive_) + " to " + to_string(live)
                                   + " at tick " + to_string(simulation_->tick()));
    }
    lastLive_ = live;
}

string SendRequest::str() const
{
    return "sending request " + connection + " from " + to_string(source) + " to " + to_string(destination);
}

void SendRequest::execute(SimulatorTestHarness& harness) const
{
    Network& net = harness.network();
    Router* src = net.getRouter(source);
    Router* dst = net.getRouter(destination);
    if (!src || !dst) throw runtime_error("unknown router");
    net.injectPacket(Packet(connection, src, dst));
    harness.resetLiveBaseline();
}

string RunTicks::str() const
{
    return "running " + to_string(ticks) + " ticks";
}

void RunTicks::execute(SimulatorTestHarness& harness) const
{
    for (int i = 0; i < ticks; ++i) harness.step();
}

string RunToCompletion::str() const
{
    return "running to completion (limit " + to_string(limit) + ")";
}

void RunToCompletion::execute(SimulatorTestHarness& harness) const
{
    for (int i = 0; i < limit; ++i) {
        harness.step();
        if (harness.network().finished()) return;
    }
    throw runtime_error("network still busy with " + to_string(harness.network().livePacketCount())
                        + " packets");
}

string ExpectTick::str() const
{
    return "expecting tick " + to_string(tick);
}

void ExpectTick::execute(const SimulatorTestHarness& harness) const
{
    if (harness.simulation().tick() != tick) {
        throw ExpectationViolation("tick is " + to_string(harness.simulation().tick()));
    }
}

string ExpectFinished::str() const
{
    return finished ? "expecting the network to be drained" : "expecting the network to be busy";
}

void ExpectFinished::execute(const SimulatorTestHarness& harness) const
{
    if (harness.network().finished() != finished) {
        throw ExpectationViolation(to_string(harness.network().livePacketCount()) + " packets live");
    }
}

string ExpectLivePackets::str() const
{
    return "expecting " + to_string(count) + " live packets";
}

void ExpectLivePackets::execute(const SimulatorTestHarness& harness) const
{
    const size_t live = harness.network().livePacketCount();
    if (live != count) throw ExpectationViolation("found " + to_string(live));
}

string ExpectInTransit::str() const
{
    return "expecting " + string(is_reply ? "reply " : "request ") + connection + " in transit to "
           + to_string(via) + " with delay " + to_string(delay);
}

void ExpectInTransit::execute(const SimulatorTestHarness& harness) const
{
    const Packet* found = nullptr;
    for (const auto& pkt : harness.network().packetsInTransit()) {
        if (pkt.connection != connection || pkt.isReply != is_reply) continue;
        if (found) throw ExpectationViolation("more than one matching packet in transit");
        found = &pkt;
    }
    if (!found) throw ExpectationViolation("no matching packet in transit");

    ostringstream actual;
    actual << *found;
    if (!found->via || found->via->id() != via) {
        throw ExpectationViolation("wrong next hop: " + actual.str());
    }
    if (found->delay != delay) {
        throw ExpectationViolation("wrong delay: " + actual.str());
    }
}

string ExpectQueued::str() const
{
    return "expecting router " + to_string(router) + " with " + to_string(input) + " in / "
           + to_string(output) + " out";
}

void ExpectQueued::execute(const SimulatorTestHarness& harness) const
{
    const Router* r = harness.network().getRouter(router);
    if (!r) throw ExpectationViolation("unknown router");
    if (r->input().size() != input || r->output().size() != output) {
        ostringstream actual;
        actual << *r;
        throw ExpectationViolation("found " + actual.str());
    }
}

string ExpectEvent::str() const
{
    Event ev;
    ev.tick = tick;
    ev.kind = kind;
    ev.connection = connection;
    ev.node = node;
    ev.source = source;
    ev.destination = destination;
    ostringstream line;
    line << ev;
    return "expecting \"" + line.str() + "\"";
}

void ExpectEvent::execute(const SimulatorTestHarness& harness) const
{
    for (const auto& ev : harness.network().events()) {
        if (ev.tick == tick && ev.kind == kind && ev.connection == connection && ev.node == node
            && ev.source == source && ev.destination == destination) {
            return;
        }
    }

    ostringstream seen;
    for (const auto& ev : harness.network().events()) seen << "\n    " << ev;
    throw ExpectationViolation("not reported; events so far:" + seen.str());
}

string ExpectEventCount::str() const
{
    return "expecting " + to_string(count) + " " + toString(kind) + " events";
}

void ExpectEventCount::execute(const SimulatorTestHarness& harness) const
{
    size_t n = 0;
    for (const auto& ev : harness.network().events()) {
        if (ev.kind == kind) ++n;
    }
    if (n != count) throw ExpectationViolation("found " + to_string(n));
}
