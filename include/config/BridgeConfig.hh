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

#include <cstdint>

#include "config/SimConfig.hh"
#include "utils/TypeDef.hh"

namespace bridgesim {

/**
 * @brief Structural parameters of a Bridge, fixed at construction.
 */
struct BridgeParams {
	int addressWidth = 32;
	int dataWidth    = 32;
	int queueDepth   = 4;
	int numTargets   = 1;

	/// @throws ConfigurationError when a parameter is out of range.
	void validate() const;

	Addr     getAddressMask() const;
	uint64_t getDataMask() const;
	uint8_t  getStrobeMask() const;
	int      getBytesPerWord() const { return this->dataWidth / 8; }
};

/**
 * @brief Clock set-up of the two domains around the bridge.
 */
struct ClockParams {
	Tick fastPeriod = 10;
	Tick slowPeriod = 37;
	Tick slowPhase  = 0;
	Tick maxTick    = 0;

	/// @throws ConfigurationError when a period is zero.
	void validate() const;
};

/**
 * @brief The `"Bridge"` configuration section.
 *
 * | key               | type | default | range                        |
 * |-------------------|------|---------|------------------------------|
 * | address_width     | int  | 32      | 1 .. 64                      |
 * | data_width        | int  | 32      | 8 .. 64, multiple of 8       |
 * | queue_depth       | int  | 4       | power of two, at least 2     |
 * | num_targets       | int  | 1       | 1 .. 32                      |
 * | fast_clock_period | tick | 10      | > 0                          |
 * | slow_clock_period | tick | 37      | > 0                          |
 * | slow_clock_phase  | tick | 0       |                              |
 * | max_tick          | tick | 0       | 0 disables the watchdog      |
 */
class BridgeConfig : public SimConfig {
public:
	BridgeConfig() : SimConfig("Bridge") {
		BridgeParams bridge;
		ClockParams  clock;
		this->addParameter<int>("address_width", bridge.addressWidth, ParamType::INT);
		this->addParameter<int>("data_width", bridge.dataWidth, ParamType::INT);
		this->addParameter<int>("queue_depth", bridge.queueDepth, ParamType::INT);
		this->addParameter<int>("num_targets", bridge.numTargets, ParamType::INT);
		this->addParameter<Tick>("fast_clock_period", clock.fastPeriod, ParamType::TICK);
		this->addParameter<Tick>("slow_clock_period", clock.slowPeriod, ParamType::TICK);
		this->addParameter<Tick>("slow_clock_phase", clock.slowPhase, ParamType::TICK);
		this->addParameter<Tick>("max_tick", clock.maxTick, ParamType::TICK);
	}

	BridgeParams getBridgeParams() const;
	ClockParams  getClockParams() const;

	/// @throws ConfigurationError when any parameter is out of range.
	void validate() const;
};

/**
 * @brief The `"Peripheral"` configuration section of the APB register file model.
 */
class PeripheralConfig : public SimConfig {
public:
	PeripheralConfig() : SimConfig("Peripheral") {
		this->addParameter<int>("regs_per_target", 64, ParamType::INT);
		this->addParameter<int>("wait_states", 0, ParamType::INT);
		// word index answering with PSLVERR in every target, -1 for none
		this->addParameter<int>("error_addr", -1, ParamType::INT);
	}
};

}  // namespace bridgesim
