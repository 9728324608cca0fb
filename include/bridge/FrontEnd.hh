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

#include <string>

#include "bridge/BridgeTypes.hh"
#include "common/AsyncFifo.hh"
#include "config/BridgeConfig.hh"
#include "hw/SimRegister.hh"
#include "profiling/Statistics.hh"
#include "sim/SimModule.hh"

namespace bridgesim {

/**
 * @brief AXI4-Lite subordinate of the bridge, clocked by the fast domain.
 *
 * @details
 * Each request channel (AW, W, AR) owns one capture register; the channel is ready exactly when its
 * register is empty. A complete write (AW and W captured) is pushed into the write command queue,
 * a captured AR into the read command queue; the capture registers clear on the edge the queue
 * accepts the command, and stay occupied with the channel not ready while the queue is full.
 *
 * On the response side BVALID/RVALID mirror the non-empty state of the response queues and the
 * head is presented on the bus. A response leaves its queue only on a completed handshake.
 *
 * ```
 *  AW --> [aw] --+
 *                +--> wcmd queue ==> back end
 *  W  --> [w ] --+
 *  AR --> [ar] -----> rcmd queue ==> back end
 *  B  <-------------- wrsp queue <== back end
 *  R  <-------------- rrsp queue <== back end
 * ```
 */
class FrontEnd : public SimModule {
public:
	FrontEnd(const std::string& _name, ClockDomain* _domain, const BridgeParams& _params,
	         AsyncFifo<WriteCommand>* _wcmd, AsyncFifo<ReadCommand>* _rcmd, AsyncFifo<BridgeResponse>* _wrsp,
	         AsyncFifo<BridgeResponse>* _rrsp);

	void connect(const AxiLiteMasterIf* _master) { this->master = _master; }

	/// @brief Subordinate-side AXI4-Lite signals, derived from committed state.
	AxiLiteSlaveSignals getSignals() const;

	void step() override;
	void reset() override;

	const AddrBeat& getAwCapture() const { return this->awReg.get(); }
	const DataBeat& getWCapture() const { return this->wReg.get(); }
	const AddrBeat& getArCapture() const { return this->arReg.get(); }

	size_t getNumWritesEnqueued() const { return this->writesEnqueued.sum(); }
	size_t getNumReadsEnqueued() const { return this->readsEnqueued.sum(); }
	size_t getNumBDelivered() const { return this->bDelivered.sum(); }
	size_t getNumRDelivered() const { return this->rDelivered.sum(); }

private:
	void checkAddress(Addr _addr, const char* _channel) const;

	const BridgeParams params;

	const AxiLiteMasterIf*     master = nullptr;
	AsyncFifo<WriteCommand>*   wcmd;
	AsyncFifo<ReadCommand>*    rcmd;
	AsyncFifo<BridgeResponse>* wrsp;
	AsyncFifo<BridgeResponse>* rrsp;

	SimRegister<AddrBeat> awReg;
	SimRegister<DataBeat> wReg;
	SimRegister<AddrBeat> arReg;

	Statistics<size_t, StatisticsMode::Accumulator> writesEnqueued;
	Statistics<size_t, StatisticsMode::Accumulator> readsEnqueued;
	Statistics<size_t, StatisticsMode::Accumulator> bDelivered;
	Statistics<size_t, StatisticsMode::Accumulator> rDelivered;
};

}  // namespace bridgesim
