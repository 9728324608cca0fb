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


#pragma once

#include <memory>
#include <string>
#include <vector>

#include "BridgeSim.hh"
using namespace bridgesim;

namespace testbridge {

/// Bits of GTest mask 0.
enum ScoreboardBit : size_t {
	ALL_COMPLETED = 0,  ///< every programmed transaction completed as expected
};

/// Bits of GTest mask 1, each one a protocol violation seen on the AXI4-Lite side.
enum ViolationBit : size_t {
	SPURIOUS_BVALID = 0,  ///< BVALID without an outstanding write
	SPURIOUS_RVALID = 1,  ///< RVALID without an outstanding read
	UNSTABLE_B      = 2,  ///< B response dropped or changed before its handshake
	UNSTABLE_R      = 3,  ///< R response dropped or changed before its handshake
};

class BridgeTestTop;

/**
 * @brief Fast-domain observer of the manager-facing bus.
 *
 * It samples committed signals only, so its position in the module list does not matter. The
 * outstanding counts it compares against are the ones of the previous edge, which are exactly the
 * ones the sampled signals were derived from.
 */
class Scoreboard : public SimModule {
public:
	Scoreboard(BridgeTestTop* _top, Bridge* _bridge, TrafficGenerator* _manager)
	    : SimModule("Scoreboard"), owner(_top), bridge(_bridge), manager(_manager) {}

	void step() override;

	bool isChecked() const { return this->checked; }

private:
	BridgeTestTop*    owner;
	Bridge*           bridge;
	TrafficGenerator* manager;

	bool                 checked      = false;
	bool                 havePrevious = false;
	AxiLiteSlaveSignals  prevSlave;
	AxiLiteMasterSignals prevMaster;
	size_t               prevWritesEnqueued = 0;
	size_t               prevBDelivered     = 0;
	size_t               prevReadsEnqueued  = 0;
	size_t               prevRDelivered     = 0;
};

/**
 * @brief Bridge between a TrafficGenerator and an ApbRegisterFile, programmed by each test.
 *
 * Tests call init(), program the manager and the peripheral through the accessors, then run().
 * The simulation ends once the manager has nothing left to do.
 */
class BridgeTestTop : public SimTop {
public:
	BridgeTestTop() : SimTop() {}

	void registerConfigs() override;
	void registerCLIArguments() override;
	void registerSimulators() override;
	bool isSimulationDone() const override;
	void reportStatistics() override;

	Bridge&           getBridge() { return *this->bridge; }
	ApbRegisterFile&  getPeripheral() { return *this->peripheral; }
	TrafficGenerator& getManager() { return *this->manager; }

	/// Address of word `_index` of target `_target`.
	Addr wordAddress(int _target, int _index) const;

private:
	std::unique_ptr<Bridge>           bridge;
	std::unique_ptr<ApbRegisterFile>  peripheral;
	std::unique_ptr<TrafficGenerator> manager;
	std::unique_ptr<Scoreboard>       scoreboard;
};

}  // namespace testbridge
