#include "simulator_test_harness.hh"

#include <cstdlib>
#include <iostream>

using namespace std;

const string chain_topology = "4\n"
                              "1 2 2 [3 4]\n"
                              "2 3 3 [4] 1 2 []\n"
                              "3 4 4 [] 2 3 [1]\n"
                              "4 3 4 [2 1]\n";

// 2 knows nothing about 4
const string partial_topology = "4\n"
                                "1 2 2 [3 4]\n"
                                "2 3 2 []\n"
                                "3 4 2 []\n"
                                "4\n";

// 2 reaches 1 directly but its table sends 1 through 3
const string triangle_topology = "3\n"
                                 "1 2 1 [] 3 1 []\n"
                                 "2 3 1 [1]\n"
                                 "3\n";

// 1 and 2 each route 3 through the other
const string loop_topology = "3\n"
                             "1 2 1 [3]\n"
                             "2 1 1 [3]\n"
                             "3\n";

int main()
{
    try {
        {
            SimulatorTestHarness test { "all pairs terminate with one reply each", chain_topology };
            for (int src = 1; src <= 4; ++src) {
                for (int dst = 1; dst <= 4; ++dst) {
                    if (src != dst) test.execute(SendRequest { to_string(src) + "-" + to_string(dst), src, dst });
                }
            }
            test.execute(ExpectLivePackets { 12 });
            test.execute(RunToCompletion { 100 });
            // longest round trip, 1 <-> 4: 4 + 5 + 5 + 5 + 5 + 3 ticks in transit
            test.execute(ExpectTick { 28 });
            test.execute(ExpectEventCount { EventKind::Delivered, 12 });
            test.execute(ExpectEvent { 28, EventKind::Delivered, "1-4", 1, 4, 1 });
            test.execute(ExpectEvent { 28, EventKind::Delivered, "4-1", 4, 1, 4 });
            test.execute(ExpectEvent { 7, EventKind::Delivered, "1-2", 1, 2, 1 });
        }

        {
            SimulatorTestHarness test { "destination with no route or link", partial_topology };
            test.execute(SendRequest { "far", 1, 4 });
            test.execute(RunTicks { 1 });
            test.execute(ExpectInTransit { "far", 2, 4 });
            test.execute(RunTicks { 4 });
            test.execute(ExpectEvent { 5, EventKind::Unroutable, "far", 2, 1, 4 });
            test.execute(ExpectFinished {});
            test.execute(ExpectEventCount { EventKind::Delivered, 0 });
        }

        {
            SimulatorTestHarness test { "unroutable at the source", partial_topology };
            test.execute(SendRequest { "nowhere", 4, 1 });
            test.execute(RunTicks { 1 });
            test.execute(ExpectEvent { 1, EventKind::Unroutable, "nowhere", 4, 4, 1 });
            test.execute(ExpectFinished {});
        }

        {
            // 3 gets the request but has no way back to 1
            SimulatorTestHarness test { "reply without a route back", partial_topology };
            test.execute(SendRequest { "oneway", 1, 3 });
            test.execute(RunToCompletion { 50 });
            test.execute(ExpectTick { 8 });
            test.execute(ExpectEvent { 8, EventKind::Unroutable, "oneway", 3, 3, 1 });
            test.execute(ExpectEventCount { EventKind::Delivered, 0 });
        }

        {
            SimulatorTestHarness test { "route table wins over a direct link for replies", triangle_topology };
            test.execute(SendRequest { "tri", 1, 2 });
            test.execute(RunTicks { 1 });
            test.execute(ExpectInTransit { "tri", 2, 2 });
            test.execute(RunTicks { 2 });
            test.execute(ExpectInTransit { "tri", 3, 2, true });
            test.execute(RunTicks { 2 });
            test.execute(ExpectInTransit { "tri", 1, 2, true });
            test.execute(RunToCompletion {});
            test.execute(ExpectTick { 7 });
            test.execute(ExpectEvent { 7, EventKind::Delivered, "tri", 1, 2, 1 });
        }

        {
            SimConfig config = lossless_config();
            config.maxTicks = 50;
            SimulatorTestHarness test { "routing loop stops at the tick limit", loop_topology, config };
            test.execute(SendRequest { "loop", 1, 3 });
            if (test.simulation().run() != RunStatus::TickLimitReached) {
                throw ExpectationViolation("loop finished");
            }
            test.execute(ExpectTick { 50 });
            test.execute(ExpectLivePackets { 1 });
            test.execute(ExpectFinished { false });
            if (!test.network().events().empty()) {
                throw ExpectationViolation("a looping packet should not report anything");
            }
        }
    } catch (const exception& e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
