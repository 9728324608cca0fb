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

#include "BridgeSimTop.hh"

#include <algorithm>

void BridgeSimTop::registerConfigs() {
	this->addConfig("Peripheral", new PeripheralConfig());
	this->addConfig("Traffic", new TrafficConfig());
}

void BridgeSimTop::registerCLIArguments() {
	this->addCLIOption<int>("--regs_per_target", "Words in each APB register file.", "Peripheral", "regs_per_target");
	this->addCLIOption<int>("--wait_states", "Extra ACCESS cycles before PREADY.", "Peripheral", "wait_states");
	this->addCLIOption<int>("--error_addr", "Word index answering with PSLVERR, -1 for none.", "Peripheral",
	                        "error_addr");
	this->addCLIOption<int>("--num_writes", "Number of random writes.", "Traffic", "num_writes");
	this->addCLIOption<int>("--num_reads", "Number of random reads.", "Traffic", "num_reads");
	this->addCLIOption<int>("--seed", "Seed of the random workload.", "Traffic", "seed");
	this->addCLIOption<float>("--backpressure", "Probability of BREADY/RREADY low per cycle.", "Traffic",
	                          "backpressure");
}

void BridgeSimTop::registerSimulators() {
	const auto& params        = this->getBridgeParams();
	const int   regsPerTarget = this->getParameter<int>("Peripheral", "regs_per_target");
	const int   errorIndex    = this->getParameter<int>("Peripheral", "error_addr");

	this->bridge = std::make_unique<Bridge>("bridge", params, this->getFastDomain(), this->getSlowDomain());

	this->peripheral = std::make_unique<ApbRegisterFile>("apb", this->getSlowDomain(), &this->bridge->getAddressMap(),
	                                                     params.numTargets, regsPerTarget, params.dataWidth);
	this->peripheral->setWaitStates(this->getParameter<int>("Peripheral", "wait_states"));
	this->peripheral->setErrorIndex(errorIndex);

	this->manager = std::make_unique<TrafficGenerator>("manager", this->getFastDomain());

	this->bridge->connectManager(this->manager.get());
	this->bridge->connectCompleter(this->peripheral.get());
	this->manager->connect(this->bridge.get());
	this->peripheral->connect(this->bridge.get());

	this->getFastDomain()->addModule(this->manager.get());
	this->getSlowDomain()->addModule(this->peripheral.get());

	for (int t = 0; t < params.numTargets; ++t) {
		for (int i = 0; i < regsPerTarget; ++i) {
			this->peripheral->poke(t, i, preloadPattern(t, i) & params.getDataMask());
		}
	}

	// Workload
	const auto   seed = static_cast<uint32_t>(this->getParameter<int>("Traffic", "seed"));
	std::mt19937 rng(seed);
	this->manager->setBackpressure(this->getParameter<float>("Traffic", "backpressure"), seed + 1);

	const int  numWrites  = this->getParameter<int>("Traffic", "num_writes");
	const int  numReads   = this->getParameter<int>("Traffic", "num_reads");
	const int  bytes      = params.getBytesPerWord();
	const int  pairs      = std::max(1, regsPerTarget / 2);
	const auto dataMask   = params.getDataMask();
	const auto strobeMask = params.getStrobeMask();

	std::uniform_int_distribution<int>      targetDist(0, params.numTargets - 1);
	std::uniform_int_distribution<int>      pairDist(0, pairs - 1);
	std::uniform_int_distribution<uint64_t> dataDist;

	auto addressOf = [&](int _target, int _index) {
		return this->bridge->getAddressMap().getRegion(_target).startAddr +
		       static_cast<Addr>(_index) * static_cast<Addr>(bytes);
	};

	for (int n = 0; n < numWrites; ++n) {
		int      target = targetDist(rng);
		int      index  = std::min(2 * pairDist(rng), regsPerTarget - 1);
		uint64_t data   = dataDist(rng) & dataMask;
		this->manager->write(addressOf(target, index), data, strobeMask);
		// a write answered with PSLVERR leaves the word untouched
		if (index != errorIndex) this->expectedWords[{target, index}] = data;
	}

	for (int n = 0; n < numReads; ++n) {
		int target = targetDist(rng);
		int index  = std::min(2 * pairDist(rng) + 1, regsPerTarget - 1);
		if (index % 2 == 0) {
			// a single-word register file has no odd words: read whatever the last write left
			this->manager->read(addressOf(target, index));
			continue;
		}
		if (index == errorIndex) {
			this->manager->read(addressOf(target, index), 0, AxiResp::SLVERR);
		} else {
			this->manager->read(addressOf(target, index), preloadPattern(target, index) & dataMask, AxiResp::OKAY);
		}
	}

	CLASS_INFO << "Workload: " << numWrites << " writes, " << numReads << " reads over " << params.numTargets
	           << " target(s).";
}

bool BridgeSimTop::isSimulationDone() const { return this->manager->isDone(); }

void BridgeSimTop::reportStatistics() {
	this->bridge->reportStatistics();
	this->manager->reportStatistics();

	size_t corrupted = 0;
	for (const auto& [word, value] : this->expectedWords) {
		if (this->peripheral->peek(word.first, word.second) != value) {
			corrupted++;
			CLASS_WARNING << "target " << word.first << " word " << word.second << " holds 0x" << std::hex
			              << this->peripheral->peek(word.first, word.second) << ", expected 0x" << value;
		}
	}

	LABELED_STATISTICS("BridgeSimTop") << "Words checked: " << this->expectedWords.size()
	                                   << ", corrupted: " << corrupted;
	if (corrupted != 0 || this->manager->getNumMismatches() != 0) {
		LABELED_ERROR("BridgeSimTop") << "Data integrity check failed.";
	}
}
