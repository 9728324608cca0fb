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


#include "BridgeTestTop.hh"

namespace testbridge {

void Scoreboard::step() {
	const auto slave  = this->bridge->getAxiLiteSlaveSignals();
	const auto master = this->manager->getAxiLiteMasterSignals();

	if (slave.bvalid && this->prevWritesEnqueued <= this->prevBDelivered) {
		this->owner->setGTestBitMask(1, ViolationBit::SPURIOUS_BVALID);
	}
	if (slave.rvalid && this->prevReadsEnqueued <= this->prevRDelivered) {
		this->owner->setGTestBitMask(1, ViolationBit::SPURIOUS_RVALID);
	}

	if (this->havePrevious) {
		if (this->prevSlave.bvalid && !this->prevMaster.bready &&
		    (!slave.bvalid || slave.bresp != this->prevSlave.bresp)) {
			this->owner->setGTestBitMask(1, ViolationBit::UNSTABLE_B);
		}
		if (this->prevSlave.rvalid && !this->prevMaster.rready &&
		    (!slave.rvalid || slave.rdata != this->prevSlave.rdata || slave.rresp != this->prevSlave.rresp)) {
			this->owner->setGTestBitMask(1, ViolationBit::UNSTABLE_R);
		}
	}

	const auto& frontEnd     = this->bridge->getFrontEnd();
	this->prevWritesEnqueued = frontEnd.getNumWritesEnqueued();
	this->prevBDelivered     = frontEnd.getNumBDelivered();
	this->prevReadsEnqueued  = frontEnd.getNumReadsEnqueued();
	this->prevRDelivered     = frontEnd.getNumRDelivered();
	this->prevSlave          = slave;
	this->prevMaster         = master;
	this->havePrevious       = true;

	if (!this->checked && this->manager->isDone()) {
		this->checked = true;
		if (this->manager->getNumMismatches() == 0) this->owner->setGTestBitMask(0, ScoreboardBit::ALL_COMPLETED);
	}
}

void BridgeTestTop::registerConfigs() { this->addConfig("Peripheral", new PeripheralConfig()); }

void BridgeTestTop::registerCLIArguments() {
	this->addCLIOption<int>("--regs_per_target", "Words in each APB register file.", "Peripheral", "regs_per_target");
	this->addCLIOption<int>("--wait_states", "Extra ACCESS cycles before PREADY.", "Peripheral", "wait_states");
	this->addCLIOption<int>("--error_addr", "Word index answering with PSLVERR.", "Peripheral", "error_addr");
}

void BridgeTestTop::registerSimulators() {
	const auto& params = this->getBridgeParams();

	this->bridge     = std::make_unique<Bridge>("bridge", params, this->getFastDomain(), this->getSlowDomain());
	this->peripheral = std::make_unique<ApbRegisterFile>(
	    "apb", this->getSlowDomain(), &this->bridge->getAddressMap(), params.numTargets,
	    this->getParameter<int>("Peripheral", "regs_per_target"), params.dataWidth);
	this->peripheral->setWaitStates(this->getParameter<int>("Peripheral", "wait_states"));
	this->peripheral->setErrorIndex(this->getParameter<int>("Peripheral", "error_addr"));

	this->manager    = std::make_unique<TrafficGenerator>("manager", this->getFastDomain());
	this->scoreboard = std::make_unique<Scoreboard>(this, this->bridge.get(), this->manager.get());

	this->bridge->connectManager(this->manager.get());
	this->bridge->connectCompleter(this->peripheral.get());
	this->manager->connect(this->bridge.get());
	this->peripheral->connect(this->bridge.get());

	this->getFastDomain()->addModule(this->manager.get());
	this->getFastDomain()->addModule(this->scoreboard.get());
	this->getSlowDomain()->addModule(this->peripheral.get());
}

bool BridgeTestTop::isSimulationDone() const { return this->scoreboard->isChecked(); }

void BridgeTestTop::reportStatistics() {
	this->bridge->reportStatistics();
	this->manager->reportStatistics();
}

Addr BridgeTestTop::wordAddress(int _target, int _index) const {
	return this->bridge->getAddressMap().getRegion(_target).startAddr +
	       static_cast<Addr>(_index) * static_cast<Addr>(this->getBridgeParams().getBytesPerWord());
}

}  // namespace testbridge
