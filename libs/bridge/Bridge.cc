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

#include "bridge/Bridge.hh"

#include "sim/ClockDomain.hh"
#include "utils/Logging.hh"

namespace bridgesim {

const BridgeParams& Bridge::checkParams(const BridgeParams& _params) {
	_params.validate();
	return _params;
}

Bridge::Bridge(const std::string& _name, const BridgeParams& _params, ClockDomain* _fastDomain,
               ClockDomain* _slowDomain)
    : name(_name), params(checkParams(_params)), addressMap(_name + ".addrMap") {
	this->addressMap.registerEvenSplit(this->params.addressWidth, this->params.numTargets);

	const size_t depth = static_cast<size_t>(this->params.queueDepth);

	this->wcmd = std::make_unique<AsyncFifo<WriteCommand>>(_name + ".wcmd", depth, _fastDomain, _slowDomain);
	this->rcmd = std::make_unique<AsyncFifo<ReadCommand>>(_name + ".rcmd", depth, _fastDomain, _slowDomain);
	this->wrsp = std::make_unique<AsyncFifo<BridgeResponse>>(_name + ".wrsp", depth, _slowDomain, _fastDomain);
	this->rrsp = std::make_unique<AsyncFifo<BridgeResponse>>(_name + ".rrsp", depth, _slowDomain, _fastDomain);

	this->arbiter  = std::make_unique<CommandArbiter>(this->wcmd.get(), this->rcmd.get());
	this->frontEnd = std::make_unique<FrontEnd>(_name + ".frontEnd", _fastDomain, this->params, this->wcmd.get(),
	                                            this->rcmd.get(), this->wrsp.get(), this->rrsp.get());
	this->backEnd  = std::make_unique<BackEnd>(_name + ".backEnd", _slowDomain, this->params, this->arbiter.get(),
	                                           &this->addressMap, this->wrsp.get(), this->rrsp.get());

	_fastDomain->addModule(this->frontEnd.get());
	_fastDomain->addModule(this->wcmd->getWritePort());
	_fastDomain->addModule(this->rcmd->getWritePort());
	_fastDomain->addModule(this->wrsp->getReadPort());
	_fastDomain->addModule(this->rrsp->getReadPort());

	_slowDomain->addModule(this->backEnd.get());
	_slowDomain->addModule(this->wcmd->getReadPort());
	_slowDomain->addModule(this->rcmd->getReadPort());
	_slowDomain->addModule(this->wrsp->getWritePort());
	_slowDomain->addModule(this->rrsp->getWritePort());

	CLASS_INFO << "`" << _name << "`: " << this->params.addressWidth << "-bit address, " << this->params.dataWidth
	           << "-bit data, queue depth " << this->params.queueDepth << ", " << this->params.numTargets
	           << " target(s).";
}

void Bridge::reportStatistics() const {
	LABELED_STATISTICS(this->name) << "Writes enqueued: " << this->frontEnd->getNumWritesEnqueued();
	LABELED_STATISTICS(this->name) << "Reads enqueued: " << this->frontEnd->getNumReadsEnqueued();
	LABELED_STATISTICS(this->name) << "APB transfers: " << this->backEnd->getNumTransfers();
	LABELED_STATISTICS(this->name) << "Completer errors: " << this->backEnd->getNumErrors();
	LABELED_STATISTICS(this->name) << "Response-queue stalls: " << this->backEnd->getNumRspWaits();
	LABELED_STATISTICS(this->name) << "B responses delivered: " << this->frontEnd->getNumBDelivered();
	LABELED_STATISTICS(this->name) << "R responses delivered: " << this->frontEnd->getNumRDelivered();
}

}  // namespace bridgesim
