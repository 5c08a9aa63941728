#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "cli/Options.hpp"
#include "io/ScenarioLoader.hpp"
#include "io/TopologyLoader.hpp"
#include "sim/Network.hpp"
#include "sim/Simulation.hpp"

int main(int argc, char** argv)
{
    try {
        const Options opts = parseOptions(argc, argv);
        if (opts.help) {
            usage(std::cout, argv[0]);
            return EXIT_SUCCESS;
        }
        if (opts.config.verbose) opts.config.summary(std::cerr);

        Network network(opts.config);
        loadTopologyFile(opts.topologyPath, network);
        for (auto& pkt : loadScenarioFile(opts.scenarioPath, network)) {
            network.injectPacket(std::move(pkt));
        }

        StatusPrinter printer(std::cout);
        network.setListener(&printer);

        Simulation sim(network, opts.config.maxTicks);
        if (sim.run() == RunStatus::TickLimitReached) {
            std::cerr << "Error: not finished after " << sim.tick() << " ticks, "
                      << network.livePacketCount() << " packets still live\n";
            return EXIT_FAILURE;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
