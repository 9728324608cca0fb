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

#include "bridge/BridgeTypes.hh"
#include "hw/SimRegister.hh"
#include "sim/SimAddressMap.hh"
#include "sim/SimModule.hh"

namespace bridgesim {

/// One completed APB transfer as seen by the completer.
struct ApbTransfer {
	Tick     setupTick = 0;  // edge of the SETUP phase
	Tick     tick      = 0;  // edge on which PREADY completed the transfer
	int      target    = 0;
	Addr     addr      = 0;
	bool     isWrite   = false;
	uint64_t data      = 0;  // write data after strobing, or read data
	uint8_t  strb      = 0;
	bool     error     = false;
};

/**
 * @brief APB4 completer model: one word-addressed register file per target.
 *
 * @details
 * Target i owns the address region i of the shared SimAddressMap; its word index is the offset into
 * that region divided by the bus width in bytes. The model answers in the ACCESS phase after
 * `waitStates` extra cycles. Writes honor PSTRB byte lanes. Words beyond the register file and the
 * word index configured with setErrorIndex() answer with PSLVERR, and an erroneous write leaves the
 * registers untouched.
 *
 * setStall(true) withholds PREADY until setStall(false); it is meant to be toggled between
 * simulation steps.
 *
 * The model checks the requester side of the protocol: PENABLE only with PSEL, at most one PSEL bit,
 * and stable control and data signals from SETUP through the end of ACCESS.
 */
class ApbRegisterFile : public SimModule, public ApbCompleterIf {
public:
	ApbRegisterFile(const std::string& _name, ClockDomain* _domain, const SimAddressMap* _addressMap, int _numTargets,
	                int _regsPerTarget, int _dataWidth);

	void connect(const ApbRequesterIf* _requester) { this->requester = _requester; }

	ApbResponse respond(const ApbRequest& _req) const override;

	void step() override;
	void reset() override;

	void setWaitStates(int _waitStates) { this->waitStates = _waitStates; }
	void setErrorIndex(int _index) { this->errorIndex = _index; }
	void setStall(bool _stall) { this->stalled = _stall; }
	bool isStalled() const { return this->stalled; }

	uint64_t peek(int _target, int _index) const;
	void     poke(int _target, int _index, uint64_t _value);

	const std::vector<ApbTransfer>& getTransfers() const { return this->transfers; }

private:
	int  decodeTarget(uint32_t _psel) const;
	bool isErrorIndex(int _target, Addr _addr, int& _index) const;

	SimRegister<uint64_t>& word(int _target, int _index) const {
		return *this->regs[static_cast<size_t>(_target * this->regsPerTarget + _index)];
	}

	const ApbRequesterIf* requester = nullptr;
	const SimAddressMap*  addressMap;
	const int             numTargets;
	const int             regsPerTarget;
	const int             bytesPerWord;
	const uint64_t        dataMask;

	int  waitStates = 0;
	int  errorIndex = -1;
	bool stalled    = false;

	std::vector<std::unique_ptr<SimRegister<uint64_t>>> regs;

	SimRegister<int>        waitCount;
	SimRegister<ApbRequest> lastRequest;
	SimRegister<Tick>       setupTick;

	std::vector<ApbTransfer> transfers;
};

}  // namespace bridgesim
