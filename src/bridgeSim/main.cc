/*
 * Copyright 2023-2026 Playlab/ACAL
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

/**
 * @file main.cc
 * @brief Random-traffic demonstration of the AXI4-Lite to APB bridge
 *
 * @details
 * One bridge connects a TrafficGenerator in the fast clock domain with an ApbRegisterFile in the
 * slow clock domain. The generator issues a seeded random mix of writes and reads, drops BREADY and
 * RREADY at random, and checks every read against the preloaded register pattern. At the end the
 * written words are compared with the last value sent to them.
 *
 * **Configuration sections:**
 * - `Bridge`: bus widths, queue depth, number of targets, clock periods and the watchdog.
 * - `Peripheral`: words per target, wait states and the word index that answers with PSLVERR.
 * - `Traffic`: number of writes and reads, seed and backpressure probability.
 *
 * @par Example Invocations:
 * @code
 * ./bridgeSim
 * ./bridgeSim --config src/bridgeSim/configs/bridgeSim.json
 * ./bridgeSim --queue_depth 8 --slow_clock_period 73 --slow_clock_phase 5 --num_targets 4
 * ./bridgeSim --wait_states 3 --error_addr 6 --backpressure 0.5
 * @endcode
 */

#include "BridgeSimTop.hh"

int main(int argc, char** argv) {
	top = std::make_shared<BridgeSimTop>();
	top->init(argc, argv);
	top->run();
	top->finish();
	return 0;
}
