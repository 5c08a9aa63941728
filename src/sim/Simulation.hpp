#pragma once
#include "Network.hpp"

enum class RunStatus
{
    Finished,
    TickLimitReached
};

class Simulation
{
public:
    explicit Simulation(Network& net, int maxTicks = 0)
        : network_(net), maxTicks_(maxTicks) {}

    void step()
    {
        ++currentTick_;
        network_.tick(currentTick_);
    }

    // Ticks until the network drains; maxTicks_ > 0 caps the run.
    RunStatus run()
    {
        do {
            step();
            if (network_.finished()) return RunStatus::Finished;
        } while (maxTicks_ <= 0 || currentTick_ < maxTicks_);
        return RunStatus::TickLimitReached;
    }

    bool finished() const { return network_.finished(); }
    int tick() const { return currentTick_; }
    int maxTicks() const { return maxTicks_; }
private:
    Network& network_;
    int currentTick_ = 0;
    int maxTicks_;
};
