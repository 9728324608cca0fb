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

#include "bridge/BackEnd.hh"
#include "bridge/BridgeTypes.hh"
#include "bridge/CommandArbiter.hh"
#include "bridge/FrontEnd.hh"
#include "common/AsyncFifo.hh"
#include "config/BridgeConfig.hh"
#include "sim/SimAddressMap.hh"

namespace bridgesim {

class ClockDomain;

/**
 * @file Bridge.hh
 * @brief AXI4-Lite to APB4 bridge across two clock domains
 *
 * @details
 * The Bridge assembles the front end (fast domain), the back end (slow domain) and the four
 * clock-crossing queues between them:
 *
 * ```
 *            fast domain            |             slow domain
 *                                   |
 *  AXI4-Lite <--> FrontEnd --wcmd-->|--+
 *                          --rcmd-->|--+--> CommandArbiter --> BackEnd <--> APB4
 *                          <--wrsp--|<---------------------------+
 *                          <--rrsp--|<---------------------------+
 * ```
 *
 * The constructor adds every module to its domain in data-flow order: the front end and the back
 * end precede the queue ports they drive.
 *
 * @throws ConfigurationError from the constructor when `_params` is invalid.
 */
class Bridge : public AxiLiteSlaveIf, public ApbRequesterIf {
public:
	Bridge(const std::string& _name, const BridgeParams& _params, ClockDomain* _fastDomain, ClockDomain* _slowDomain);

	void connectManager(const AxiLiteMasterIf* _master) { this->frontEnd->connect(_master); }
	void connectCompleter(const ApbCompleterIf* _completer) { this->backEnd->connect(_completer); }

	AxiLiteSlaveSignals getAxiLiteSlaveSignals() const override { return this->frontEnd->getSignals(); }
	ApbRequest          getApbRequest() const override { return this->backEnd->getApbRequest(); }

	const std::string&   getName() const { return this->name; }
	const BridgeParams&  getParams() const { return this->params; }
	const SimAddressMap& getAddressMap() const { return this->addressMap; }

	FrontEnd& getFrontEnd() { return *this->frontEnd; }
	BackEnd&  getBackEnd() { return *this->backEnd; }

	AsyncFifo<WriteCommand>&   getWriteCommandQueue() { return *this->wcmd; }
	AsyncFifo<ReadCommand>&    getReadCommandQueue() { return *this->rcmd; }
	AsyncFifo<BridgeResponse>& getWriteResponseQueue() { return *this->wrsp; }
	AsyncFifo<BridgeResponse>& getReadResponseQueue() { return *this->rrsp; }

	void reportStatistics() const;

private:
	static const BridgeParams& checkParams(const BridgeParams& _params);

	const std::string  name;
	const BridgeParams params;
	SimAddressMap      addressMap;

	std::unique_ptr<AsyncFifo<WriteCommand>>   wcmd;
	std::unique_ptr<AsyncFifo<ReadCommand>>    rcmd;
	std::unique_ptr<AsyncFifo<BridgeResponse>> wrsp;
	std::unique_ptr<AsyncFifo<BridgeResponse>> rrsp;

	std::unique_ptr<CommandArbiter> arbiter;
	std::unique_ptr<FrontEnd>       frontEnd;
	std::unique_ptr<BackEnd>        backEnd;
};

}  // namespace bridgesim
