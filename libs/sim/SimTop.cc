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

#include "sim/SimTop.hh"

#include <algorithm>
#include <exception>
#include <limits>

#include "config/BridgeConfig.hh"
#include "utils/Logging.hh"

namespace bridgesim {

// A global variable for others to access the common variable
std::shared_ptr<SimTopBase> top = nullptr;

SimTopBase::SimTopBase(const std::vector<std::string>& _configFilePaths) : CLIManager("BridgeSim", _configFilePaths) {
	// Ref: https://en.cppreference.com/w/cpp/error/set_terminate
	std::set_terminate(&LogOStream::handleTerminate);
}

SimTopBase::~SimTopBase() = default;

void SimTopBase::init(int argc, char** argv) {
	// Parse SimConfig and CLI Arguments.
	this->initConfig(argc, argv);

	auto bridgeConfig = dynamic_cast<BridgeConfig*>(this->getConfig("Bridge"));
	bridgeConfig->validate();
	this->bridgeParams = bridgeConfig->getBridgeParams();
	this->clockParams  = bridgeConfig->getClockParams();

	this->addClockDomain("fast", this->clockParams.fastPeriod, 0);
	this->addClockDomain("slow", this->clockParams.slowPeriod, this->clockParams.slowPhase);

	// Create & register user modules
	this->registerSimulators();

	LABELED_INFO("SimTopBase") << "Clock domains: fast period " << this->clockParams.fastPeriod << ", slow period "
	                           << this->clockParams.slowPeriod << " phase " << this->clockParams.slowPhase << ".";
}

void SimTopBase::initConfig(int argc, char** argv) {
	// Create and Register Framework Configuration
	this->addConfig("Bridge", new BridgeConfig());

	// [Priority #4 : SimConfig Default Value] Register user SimConfig. (virtual function)
	this->registerConfigs();

	// Register framework and user-defined CLI arguments
	this->registerBridgeSimCLIArguments();
	this->registerCLIArguments();

	// Parse the arguments and get the configuration file path(s)
	this->parseCLIArguments(argc, argv);

	// [Priority #3 : JSON Configuration File] from the SimTop constructor
	this->parseConfigFiles(this->configFilePaths);

	// [Priority #2 : JSON Configuration File] from --config
	this->parseConfigFiles(this->configFilePathsFromCLI);

	// [Priority #1 : CLI Arguments]
	this->setCLIParametersToSimConfig();

	VERBOSE_CLASS_INFO << "Google Test (1:Enabled / 0:Disabled): " << this->gTestMode;
}

ClockDomain* SimTopBase::addClockDomain(const std::string& _name, Tick _period, Tick _phase) {
	for (auto& domain : this->domains) {
		CLASS_ASSERT_MSG(domain->getName() != _name, "Clock domain `" << _name << "` already exists.");
	}
	this->domains.push_back(std::make_unique<ClockDomain>(_name, _period, _phase));
	return this->domains.back().get();
}

ClockDomain* SimTopBase::getClockDomain(const std::string& _name) const {
	for (auto& domain : this->domains) {
		if (domain->getName() == _name) return domain.get();
	}
	CLASS_ERROR << "The clock domain \'" << _name << "\' does not exist.";
	return nullptr;
}

void SimTopBase::stepGlobalTick() {
	CLASS_ASSERT_MSG(!this->domains.empty(), "No clock domain is registered. Call init() first.");

	Tick next = std::numeric_limits<Tick>::max();
	for (auto& domain : this->domains) { next = std::min(next, domain->getNextEdge()); }
	this->globalTick = next;

	std::vector<ClockDomain*> active;
	for (auto& domain : this->domains) {
		if (domain->getNextEdge() == next) active.push_back(domain.get());
	}

	// [Phase #1] : Step Phase.
	for (auto domain : active) { domain->step(); }

	// [Phase #2] : Sync Phase.
	for (auto domain : active) { domain->sync(); }
}

void SimTopBase::run() {
	while (!this->isSimulationDone()) {
		if (this->clockParams.maxTick != 0 && this->globalTick >= this->clockParams.maxTick) {
			LABELED_ERROR("SimTopBase") << "Watchdog: the simulation did not finish within max_tick "
			                            << this->clockParams.maxTick << ".";
		}
		this->stepGlobalTick();
	}
}

bool SimTopBase::runUntil(const std::function<bool()>& _cond, Tick _limit) {
	const Tick deadline = this->globalTick + _limit;
	while (!_cond()) {
		if (this->globalTick >= deadline) return false;
		this->stepGlobalTick();
	}
	return true;
}

void SimTopBase::runFor(Tick _duration) {
	const Tick deadline = this->globalTick + _duration;
	while (true) {
		Tick next = std::numeric_limits<Tick>::max();
		for (auto& domain : this->domains) { next = std::min(next, domain->getNextEdge()); }
		if (next > deadline) break;
		this->stepGlobalTick();
	}
}

void SimTopBase::finish() {
	this->reportStatistics();
	LABELED_INFO("SimTopBase") << "Simulation complete.";
}

void SimTopBase::setGTestBitMask(int _which, size_t _bit) {
	CLASS_ASSERT_MSG(_which >= 0 && _bit < 64, "Invalid GTest bit " << _which << ":" << _bit);
	if (this->gTestBitMasks.size() <= static_cast<size_t>(_which)) this->gTestBitMasks.resize(_which + 1, 0);
	this->gTestBitMasks[_which] |= uint64_t{1} << _bit;
}

uint64_t SimTopBase::getGTestBitMask(int _which) const {
	if (_which < 0 || this->gTestBitMasks.size() <= static_cast<size_t>(_which)) return 0;
	return this->gTestBitMasks[_which];
}

}  // namespace bridgesim
