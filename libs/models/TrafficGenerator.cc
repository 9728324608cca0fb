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

#include "models/TrafficGenerator.hh"

#include "sim/ClockDomain.hh"
#include "utils/Logging.hh"

namespace bridgesim {

TrafficGenerator::TrafficGenerator(const std::string& _name, ClockDomain* _domain)
    : SimModule(_name),
      awReg(_domain, _name + ".aw"),
      wReg(_domain, _name + ".w"),
      arReg(_domain, _name + ".ar"),
      bAllowReg(_domain, _name + ".bAllow", true),
      rAllowReg(_domain, _name + ".rAllow", true) {}

void TrafficGenerator::setBackpressure(double _rate, uint32_t _seed) {
	CLASS_ASSERT_MSG(_rate >= 0.0 && _rate < 1.0, "backpressure rate " << _rate << " is outside [0, 1).");
	this->backpressureRate = _rate;
	this->rng.seed(_seed);
}

void TrafficGenerator::write(Addr _addr, uint64_t _data, uint8_t _strb) {
	Op op;
	op.kind = Op::Kind::WRITE;
	op.addr = _addr;
	op.data = _data;
	op.strb = _strb;
	this->writeProgram.push_back(op);
}

void TrafficGenerator::read(Addr _addr, std::optional<uint64_t> _expected, std::optional<AxiResp> _expectedResp) {
	Op op;
	op.kind         = Op::Kind::READ;
	op.addr         = _addr;
	op.expected     = _expected;
	op.expectedResp = _expectedResp;
	this->readProgram.push_back(op);
}

void TrafficGenerator::idleWrites(int _cycles) {
	Op op;
	op.cycles = _cycles;
	this->writeProgram.push_back(op);
}

void TrafficGenerator::idleReads(int _cycles) {
	Op op;
	op.cycles = _cycles;
	this->readProgram.push_back(op);
}

AxiLiteMasterSignals TrafficGenerator::getAxiLiteMasterSignals() const {
	AxiLiteMasterSignals signals;
	signals.awvalid = this->awReg.get().valid;
	signals.awaddr  = this->awReg.get().addr;
	signals.wvalid  = this->wReg.get().valid;
	signals.wdata   = this->wReg.get().data;
	signals.wstrb   = this->wReg.get().strb;
	signals.arvalid = this->arReg.get().valid;
	signals.araddr  = this->arReg.get().addr;
	signals.bready  = this->isBReady();
	signals.rready  = this->isRReady();
	return signals;
}

void TrafficGenerator::complete(std::deque<Outstanding>& _queue, bool _isWrite, uint64_t _data, AxiResp _resp) {
	CLASS_ASSERT_MSG(!_queue.empty(), (_isWrite ? "B" : "R") << " response without an outstanding transaction.");

	auto done = _queue.front();
	_queue.pop_front();

	AxiLiteCompletion completion;
	completion.isWrite      = _isWrite;
	completion.addr         = done.op.addr;
	completion.data         = _isWrite ? done.op.data : _data;
	completion.resp         = _resp;
	completion.issueTick    = done.issueTick;
	completion.completeTick = this->getClockDomain()->getCurrentTick();
	this->completions.push_back(completion);

	(_isWrite ? this->writeLatency : this->readLatency).push(completion.completeTick - completion.issueTick);

	if (done.op.expected && *done.op.expected != _data) {
		this->mismatches++;
		CLASS_WARNING << "read 0x" << std::hex << done.op.addr << " returned 0x" << _data << ", expected 0x"
		              << *done.op.expected;
	}
	if (done.op.expectedResp && *done.op.expectedResp != _resp) {
		this->mismatches++;
		CLASS_WARNING << (_isWrite ? "write" : "read") << " 0x" << std::hex << done.op.addr << " answered " << _resp
		              << ", expected " << *done.op.expectedResp;
	}
}

void TrafficGenerator::step() {
	CLASS_ASSERT_MSG(this->slave, "`" << this->getName() << "` has no AXI4-Lite subordinate connected.");

	const auto bus  = this->slave->getAxiLiteSlaveSignals();
	const Tick now  = this->getClockDomain()->getCurrentTick();
	AddrBeat   aw   = this->awReg.get();
	DataBeat   w    = this->wReg.get();
	AddrBeat   ar   = this->arReg.get();

	if (aw.valid && bus.awready) {
		aw.valid = false;
		this->awHandshakes++;
	}
	if (w.valid && bus.wready) {
		w.valid = false;
		this->wHandshakes++;
	}
	if (ar.valid && bus.arready) {
		ar.valid = false;
		this->arHandshakes++;
	}

	if (bus.bvalid && this->isBReady()) {
		this->bHandshakes++;
		this->complete(this->outstandingWrites, true, 0, bus.bresp);
	}
	if (bus.rvalid && this->isRReady()) {
		this->rHandshakes++;
		this->complete(this->outstandingReads, false, bus.rdata, bus.rresp);
	}

	// Next write once both AW and W of the previous one were accepted.
	if (this->writeIdle > 0) {
		this->writeIdle--;
	} else if (!aw.valid && !w.valid && !this->writeProgram.empty()) {
		auto op = this->writeProgram.front();
		this->writeProgram.pop_front();
		if (op.kind == Op::Kind::IDLE) {
			this->writeIdle = op.cycles;
		} else {
			aw = AddrBeat{true, op.addr};
			w  = DataBeat{true, op.data, op.strb};
			this->outstandingWrites.push_back(Outstanding{op, now});
		}
	}

	if (this->readIdle > 0) {
		this->readIdle--;
	} else if (!ar.valid && !this->readProgram.empty()) {
		auto op = this->readProgram.front();
		this->readProgram.pop_front();
		if (op.kind == Op::Kind::IDLE) {
			this->readIdle = op.cycles;
		} else {
			ar = AddrBeat{true, op.addr};
			this->outstandingReads.push_back(Outstanding{op, now});
		}
	}

	this->awReg.set(aw);
	this->wReg.set(w);
	this->arReg.set(ar);

	if (this->backpressureRate > 0.0) {
		std::bernoulli_distribution refuse(this->backpressureRate);
		this->bAllowReg.set(!refuse(this->rng));
		this->rAllowReg.set(!refuse(this->rng));
	}
}

bool TrafficGenerator::isDone() const {
	return this->writeProgram.empty() && this->readProgram.empty() && this->outstandingWrites.empty() &&
	       this->outstandingReads.empty() && this->writeIdle == 0 && this->readIdle == 0;
}

void TrafficGenerator::reset() {
	this->writeProgram.clear();
	this->readProgram.clear();
	this->outstandingWrites.clear();
	this->outstandingReads.clear();
	this->writeIdle = 0;
	this->readIdle  = 0;
	this->completions.clear();
	this->awHandshakes = this->wHandshakes = this->arHandshakes = 0;
	this->bHandshakes = this->rHandshakes = 0;
	this->mismatches                      = 0;
	this->writeLatency.clear();
	this->readLatency.clear();
	this->bready = true;
	this->rready = true;
}

void TrafficGenerator::reportStatistics() const {
	LABELED_STATISTICS(this->getName()) << "Writes completed: " << this->writeLatency.size()
	                                    << ", latency avg " << this->writeLatency.avg() << " max "
	                                    << this->writeLatency.max() << " ticks";
	LABELED_STATISTICS(this->getName()) << "Reads completed: " << this->readLatency.size() << ", latency avg "
	                                    << this->readLatency.avg() << " max " << this->readLatency.max()
	                                    << " ticks";
	LABELED_STATISTICS(this->getName()) << "Read mismatches: " << this->mismatches;
}

}  // namespace bridgesim
