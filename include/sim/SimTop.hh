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
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/BridgeConfig.hh"
#include "config/CLIManager.hh"
#include "sim/ClockDomain.hh"
#include "utils/Logging.hh"
#include "utils/TypeDef.hh"

namespace bridgesim {

/**
 * @file SimTop.hh
 * @brief Top-level simulation driver
 *
 * @details
 * SimTopBase owns the configuration, the clock domains and the global tick. A user top derives from
 * it, builds its modules in registerSimulators() and reports completion through
 * isSimulationDone().
 *
 * **Initialization (init):**
 * ```
 * initConfig()            defaults < constructor JSON files < --config files < CLI options
 *   |
 * validate "Bridge"       throws ConfigurationError
 *   |
 * create clock domains    "fast" (fast_clock_period, 0), "slow" (slow_clock_period, slow_clock_phase)
 *   |
 * registerSimulators()    user modules and their clock domains
 * ```
 *
 * **Main loop (run):**
 * ```
 * while (!isSimulationDone()):
 *     globalTick = earliest next edge over all domains
 *     [Phase #1] step() every domain with an edge at globalTick
 *     [Phase #2] sync() the same domains
 * ```
 *
 * Because every domain with an edge at the same tick evaluates before any of them commits, module
 * evaluation never observes a value produced in the current tick by another domain.
 *
 * A non-zero `max_tick` bounds run(): exceeding it is reported as an error.
 *
 * **GoogleTest support:** testbench modules set bits in a set of 64-bit masks with
 * setGTestBitMask(); tests compare them with checkGTestBitMask().
 */
class SimTopBase : public CLIManager {
public:
	explicit SimTopBase(const std::vector<std::string>& _configFilePaths = {});
	virtual ~SimTopBase();

	void init(int argc, char** argv);

	/// @brief Run until the user top reports completion.
	void run();

	/**
	 * @brief Advance edge by edge until `_cond` holds or `_limit` ticks have elapsed.
	 * @return the value of `_cond` when the call returns
	 */
	bool runUntil(const std::function<bool()>& _cond, Tick _limit);

	/// @brief Advance until the global tick reaches `getGlobalTick() + _duration`.
	void runFor(Tick _duration);

	void finish();

	Tick getGlobalTick() const { return this->globalTick; }

	ClockDomain* getClockDomain(const std::string& _name) const;
	ClockDomain* getFastDomain() const { return this->getClockDomain("fast"); }
	ClockDomain* getSlowDomain() const { return this->getClockDomain("slow"); }

	const BridgeParams& getBridgeParams() const { return this->bridgeParams; }
	const ClockParams&  getClockParams() const { return this->clockParams; }

	void     setGTestBitMask(int _which, size_t _bit);
	uint64_t getGTestBitMask(int _which) const;
	bool     checkGTestBitMask(int _which, uint64_t _value) const { return this->getGTestBitMask(_which) == _value; }

protected:
	void initConfig(int argc, char** argv);

	ClockDomain* addClockDomain(const std::string& _name, Tick _period, Tick _phase);

	virtual void registerSimulators() = 0;
	virtual bool isSimulationDone() const = 0;

	/// @brief Called by finish() to print module statistics.
	virtual void reportStatistics() {}

private:
	/// @brief One iteration of the main loop.
	void stepGlobalTick();

	Tick         globalTick = 0;
	BridgeParams bridgeParams;
	ClockParams  clockParams;

	std::vector<std::unique_ptr<ClockDomain>> domains;
	std::vector<uint64_t>                     gTestBitMasks;
};

/**
 * @brief SimTopBase with empty user hooks.
 */
class SimTop : public SimTopBase {
public:
	explicit SimTop(const std::vector<std::string>& _configFilePaths = {}) : SimTopBase(_configFilePaths) {}
	virtual ~SimTop() = default;

protected:
	void registerSimulators() override {}
	bool isSimulationDone() const override { return true; }
};

/// The active simulation top, used by the logger to stamp the current tick.
extern std::shared_ptr<SimTopBase> top;

}  // namespace bridgesim
