#include <SFML/Graphics.hpp>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "cli/Options.hpp"
#include "gui/Renderer.hpp"
#include "io/ScenarioLoader.hpp"
#include "io/TopologyLoader.hpp"
#include "sim/Network.hpp"
#include "sim/Simulation.hpp"

namespace {

void runViewer(const Options& opts)
{
    const unsigned WIDTH  = 1280;
    const unsigned HEIGHT = 720;

    Network network(opts.config);
    loadTopologyFile(opts.topologyPath, network);
    for (auto& pkt : loadScenarioFile(opts.scenarioPath, network)) {
        network.injectPacket(std::move(pkt));
    }

    StatusPrinter printer(std::cout);
    network.setListener(&printer);
    Simulation sim(network, opts.config.maxTicks);

    sf::RenderWindow window(
        sf::VideoMode(WIDTH, HEIGHT),
        "routesim " + opts.topologyPath
    );
    window.setFramerateLimit(60);

    Renderer renderer(window, network);

    bool paused  = false;
    bool done    = false;
    double tickRate = opts.tickRate;
    double pending  = 0.0;  // real seconds not yet turned into ticks
    sf::Clock clock;

    std::cout << "Controls:\n"
              << "  Space: pause/resume\n"
              << "  Right: single tick while paused\n"
              << "  Up:    speed up (x2)\n"
              << "  Down:  slow down (/2)\n"
              << "  Click: show router or link\n"
              << "  Esc:   quit\n";

    auto advance = [&]() {
        if (done) return;
        sim.step();
        if (sim.finished()) {
            std::cout << "finished after " << sim.tick() << " ticks\n";
            done = true;
        } else if (sim.maxTicks() > 0 && sim.tick() >= sim.maxTicks()) {
            std::cout << "stopped at tick limit " << sim.tick() << ", "
                      << network.livePacketCount() << " packets still live\n";
            done = true;
        }
    };

    while (window.isOpen()) {
        sf::Event event{};
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window.close();
            }
            if (event.type == sf::Event::KeyPressed) {
                if (event.key.code == sf::Keyboard::Escape) {
                    window.close();
                } else if (event.key.code == sf::Keyboard::Space) {
                    paused = !paused;
                    std::cout << (paused ? "Paused\n" : "Resumed\n");
                } else if (event.key.code == sf::Keyboard::Right && paused) {
                    advance();
                } else if (event.key.code == sf::Keyboard::Up) {
                    if (tickRate < 256.0) tickRate *= 2.0;
                    std::cout << "Tick rate: " << tickRate << "/s\n";
                } else if (event.key.code == sf::Keyboard::Down) {
                    if (tickRate > 0.25) tickRate /= 2.0;
                    std::cout << "Tick rate: " << tickRate << "/s\n";
                }
            }
            if (event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                const sf::Vector2f p = window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                const int routerId = renderer.pickNode(p);
                if (routerId >= 0) {
                    std::cout << *network.getRouter(routerId) << "\n";
                } else {
                    const int linkIdx = renderer.pickLink(p);
                    if (linkIdx >= 0) {
                        const LinkVisual& link = renderer.links()[linkIdx];
                        std::cout << "Link(" << link.nodeA << " <-> " << link.nodeB
                                  << " delay=" << link.delay << ")\n";
                    }
                }
            }
        }

        double dtReal = clock.restart().asSeconds();
        if (dtReal > 0.1) dtReal = 0.1;

        if (!paused && !done) {
            pending += dtReal * tickRate;
            while (pending >= 1.0 && !done) {
                pending -= 1.0;
                advance();
            }
        }

        window.clear(sf::Color(30, 30, 30));
        renderer.draw();
        window.display();
    }
}

} // namespace

int main(int argc, char** argv)
{
    try {
        const Options opts = parseOptions(argc, argv, true);
        if (opts.help) {
            usage(std::cout, argv[0], true);
            return EXIT_SUCCESS;
        }
        if (opts.config.verbose) opts.config.summary(std::cerr);
        runViewer(opts);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(std::cerr, argv[0], true);
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
