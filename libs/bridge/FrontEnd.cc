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

#include "bridge/FrontEnd.hh"

#include "utils/Logging.hh"

namespace bridgesim {

FrontEnd::FrontEnd(const std::string& _name, ClockDomain* _domain, const BridgeParams& _params,
                   AsyncFifo<WriteCommand>* _wcmd, AsyncFifo<ReadCommand>* _rcmd, AsyncFifo<BridgeResponse>* _wrsp,
                   AsyncFifo<BridgeResponse>* _rrsp)
    : SimModule(_name),
      params(_params),
      wcmd(_wcmd),
      rcmd(_rcmd),
      wrsp(_wrsp),
      rrsp(_rrsp),
      awReg(_domain, _name + ".aw"),
      wReg(_domain, _name + ".w"),
      arReg(_domain, _name + ".ar") {}

AxiLiteSlaveSignals FrontEnd::getSignals() const {
	AxiLiteSlaveSignals signals;

	signals.awready = !this->awReg.get().valid;
	signals.wready  = !this->wReg.get().valid;
	signals.arready = !this->arReg.get().valid;

	signals.bvalid = !this->wrsp->isEmpty();
	if (signals.bvalid) { signals.bresp = this->wrsp->front().error ? AxiResp::SLVERR : AxiResp::OKAY; }

	signals.rvalid = !this->rrsp->isEmpty();
	if (signals.rvalid) {
		const auto& head = this->rrsp->front();
		signals.rdata    = head.data;
		signals.rresp    = head.error ? AxiResp::SLVERR : AxiResp::OKAY;
	}

	return signals;
}

void FrontEnd::checkAddress(Addr _addr, const char* _channel) const {
	CLASS_ASSERT_MSG((_addr & ~this->params.getAddressMask()) == 0,
	                 _channel << " address 0x" << std::hex << _addr << " is wider than " << std::dec
	                          << this->params.addressWidth << " bits.");
}

void FrontEnd::step() {
	CLASS_ASSERT_MSG(this->master, "`" << this->getName() << "` has no AXI4-Lite manager connected.");

	const auto bus   = this->master->getAxiLiteMasterSignals();
	const auto ready = this->getSignals();

	AddrBeat aw = this->awReg.get();
	DataBeat w  = this->wReg.get();
	AddrBeat ar = this->arReg.get();

	// Hand complete commands to the queues.
	if (aw.valid && w.valid && this->wcmd->tryPush(WriteCommand{aw.addr, w.data, w.strb})) {
		VERBOSE_CLASS_INFO << "write 0x" << std::hex << aw.addr << " enqueued";
		aw.valid = false;
		w.valid  = false;
		this->writesEnqueued.push(1);
	}
	if (ar.valid && this->rcmd->tryPush(ReadCommand{ar.addr})) {
		VERBOSE_CLASS_INFO << "read 0x" << std::hex << ar.addr << " enqueued";
		ar.valid = false;
		this->readsEnqueued.push(1);
	}

	// Request channel handshakes.
	if (bus.awvalid && ready.awready) {
		this->checkAddress(bus.awaddr, "AW");
		aw = AddrBeat{true, bus.awaddr};
	}
	if (bus.wvalid && ready.wready) {
		CLASS_ASSERT_MSG((bus.wdata & ~this->params.getDataMask()) == 0,
		                 "W data 0x" << std::hex << bus.wdata << " is wider than " << std::dec << this->params.dataWidth
		                             << " bits.");
		CLASS_ASSERT_MSG((bus.wstrb & ~this->params.getStrobeMask()) == 0,
		                 "W strobe 0x" << std::hex << static_cast<int>(bus.wstrb) << " selects bytes beyond the "
		                               << std::dec << this->params.dataWidth << "-bit data bus.");
		w = DataBeat{true, bus.wdata, bus.wstrb};
	}
	if (bus.arvalid && ready.arready) {
		this->checkAddress(bus.araddr, "AR");
		ar = AddrBeat{true, bus.araddr};
	}

	this->awReg.set(aw);
	this->wReg.set(w);
	this->arReg.set(ar);

	// Response channel handshakes.
	if (ready.bvalid && bus.bready && this->wrsp->tryPop()) { this->bDelivered.push(1); }
	if (ready.rvalid && bus.rready && this->rrsp->tryPop()) { this->rDelivered.push(1); }
}

void FrontEnd::reset() {
	this->writesEnqueued.clear();
	this->readsEnqueued.clear();
	this->bDelivered.clear();
	this->rDelivered.clear();
}

}  // namespace bridgesim
