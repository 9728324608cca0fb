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

#include <ostream>
#include <string>

#include "bridge/BridgeTypes.hh"
#include "bridge/CommandArbiter.hh"
#include "common/AsyncFifo.hh"
#include "config/BridgeConfig.hh"
#include "hw/SimRegister.hh"
#include "profiling/Statistics.hh"
#include "sim/SimAddressMap.hh"
#include "sim/SimModule.hh"

namespace bridgesim {

enum class BackEndState : uint8_t { IDLE, SETUP, ACCESS, RSP_WAIT };

std::ostream& operator<<(std::ostream& _os, BackEndState _state);

/// Transaction latched by the back end in IDLE.
struct LatchedTransaction {
	bool     isWrite = false;
	Addr     addr    = 0;
	uint64_t data    = 0;
	uint8_t  strb    = 0;
	int      target  = 0;
};

/// Result waiting to enter a response queue.
struct ResultSlot {
	bool           valid   = false;
	bool           isWrite = false;
	BridgeResponse response;
};

/**
 * @brief APB requester of the bridge, clocked by the slow domain.
 *
 * @details
 * One transaction at a time walks through the APB phases:
 *
 * ```
 *          +---------------------------------------------+
 *          v                                             |
 *        IDLE --accept--> SETUP ---> ACCESS --PREADY, queue has room--+
 *                                      |
 *                                      +--PREADY, queue full--> RSP_WAIT --room--> IDLE
 * ```
 *
 * - IDLE takes the arbiter's grant only when both the output and the pending result slots are
 *   empty, so a completed transaction is never overtaken.
 * - SETUP drives PSEL for the decoded target with PENABLE low.
 * - ACCESS drives PSEL and PENABLE and waits for PREADY with no time-out.
 * - RSP_WAIT drives nothing and holds the result until its response queue has room.
 *
 * The output slot is pushed into its response queue on the next edge and cleared once accepted.
 * APB outputs are a function of the committed state only.
 */
class BackEnd : public SimModule {
public:
	BackEnd(const std::string& _name, ClockDomain* _domain, const BridgeParams& _params, CommandArbiter* _arbiter,
	        const SimAddressMap* _addressMap, AsyncFifo<BridgeResponse>* _wrsp, AsyncFifo<BridgeResponse>* _rrsp);

	void connect(const ApbCompleterIf* _completer) { this->completer = _completer; }

	ApbRequest getApbRequest() const;

	void step() override;
	void reset() override;

	BackEndState              getState() const { return this->state.get(); }
	const LatchedTransaction& getLatched() const { return this->latched.get(); }
	const ResultSlot&         getOutputSlot() const { return this->output.get(); }
	const ResultSlot&         getPendingSlot() const { return this->pending.get(); }

	size_t getNumTransfers() const { return this->transfers.sum(); }
	size_t getNumErrors() const { return this->errors.sum(); }
	size_t getNumRspWaits() const { return this->rspWaits.sum(); }

private:
	AsyncFifo<BridgeResponse>* getResponseQueue(bool _isWrite) const {
		return _isWrite ? this->wrsp : this->rrsp;
	}

	const BridgeParams params;

	CommandArbiter*            arbiter;
	const SimAddressMap*       addressMap;
	AsyncFifo<BridgeResponse>* wrsp;
	AsyncFifo<BridgeResponse>* rrsp;
	const ApbCompleterIf*      completer = nullptr;

	SimRegister<BackEndState>       state;
	SimRegister<LatchedTransaction> latched;
	SimRegister<ResultSlot>         output;
	SimRegister<ResultSlot>         pending;

	Statistics<size_t, StatisticsMode::Accumulator> transfers;
	Statistics<size_t, StatisticsMode::Accumulator> errors;
	Statistics<size_t, StatisticsMode::Accumulator> rspWaits;
};

}  // namespace bridgesim
