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

#include <string>
#include <vector>

#include "sim/RegisterManager.hh"
#include "utils/TypeDef.hh"

namespace bridgesim {

class SimModule;
class SimRegisterBase;

/**
 * @file ClockDomain.hh
 * @brief Periodic clock that owns a set of modules and the registers they update
 *
 * @details
 * A ClockDomain produces edges at `phase + k * period` global ticks. At each edge the simulation
 * top calls step() on every domain that has an edge at the current tick, and only afterwards calls
 * sync() on the same domains. Two domains whose edges coincide therefore both evaluate against the
 * state committed before the edge.
 *
 * ```
 * global tick   0    10   20   30   37   40   50   60   70   74
 * fast (10)     |    |    |    |         |    |    |    |
 * slow (37,0)   |                   |                        |
 * ```
 */
class ClockDomain {
public:
	ClockDomain(const std::string& _name, Tick _period, Tick _phase = 0);

	ClockDomain(const ClockDomain&)            = delete;
	ClockDomain& operator=(const ClockDomain&) = delete;

	const std::string& getName() const { return this->name; }
	Tick               getPeriod() const { return this->period; }
	Tick               getPhase() const { return this->phase; }

	/// @brief Global tick of the next edge that has not been committed yet.
	Tick getNextEdge() const { return this->nextEdge; }

	/// @brief Global tick of the edge being evaluated, or of the last committed edge.
	Tick getCurrentTick() const { return this->currentTick; }

	/// @brief Number of committed edges since reset.
	uint64_t getCycle() const { return this->cycle; }

	void addModule(SimModule* _module);
	void addRegister(SimRegisterBase* _reg) { this->registers.addRegister(_reg); }
	void removeRegister(SimRegisterBase* _reg) { this->registers.removeRegister(_reg); }

	const std::vector<SimModule*>& getModules() const { return this->modules; }
	RegisterManager&               getRegisterManager() { return this->registers; }

	/// @brief Phase 1: evaluate every module in registration order.
	void step();

	/// @brief Phase 2: commit every register and advance to the next edge.
	void sync();

	/// @brief Reset registers and modules and rewind to the first edge.
	void reset();

private:
	const std::string       name;
	const Tick              period;
	const Tick              phase;
	Tick                    nextEdge;
	Tick                    currentTick = 0;
	uint64_t                cycle       = 0;
	std::vector<SimModule*> modules;
	RegisterManager         registers;
};

}  // namespace bridgesim
