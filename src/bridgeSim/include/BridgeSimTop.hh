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

#include <map>
#include <memory>
#include <random>
#include <utility>

#include "BridgeSim.hh"
using namespace bridgesim;

#include "TrafficConfig.hh"

/**
 * @brief Demo top: one bridge between a random AXI4-Lite manager and an APB register file.
 *
 * Every register is preloaded with a known pattern. Writes target even words and reads target odd
 * words, so each read has a known expected value regardless of how the two channels interleave.
 * At the end, every written word is compared with the last value written to it.
 */
class BridgeSimTop : public SimTop {
public:
	BridgeSimTop(const std::vector<std::string>& _configFilePaths = {}) : SimTop(_configFilePaths) {}

	void registerConfigs() override;
	void registerCLIArguments() override;
	void registerSimulators() override;

	bool isSimulationDone() const override;
	void reportStatistics() override;

private:
	static uint64_t preloadPattern(int _target, int _index) {
		return 0xA5000000ull | (static_cast<uint64_t>(_target) << 16) | static_cast<uint64_t>(_index);
	}

	std::unique_ptr<Bridge>           bridge;
	std::unique_ptr<ApbRegisterFile>  peripheral;
	std::unique_ptr<TrafficGenerator> manager;

	std::map<std::pair<int, int>, uint64_t> expectedWords;
};
