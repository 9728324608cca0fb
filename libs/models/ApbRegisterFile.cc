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

#include "models/ApbRegisterFile.hh"

#include <bit>

#include "sim/ClockDomain.hh"
#include "utils/Logging.hh"

namespace bridgesim {

ApbRegisterFile::ApbRegisterFile(const std::string& _name, ClockDomain* _domain, const SimAddressMap* _addressMap,
                                 int _numTargets, int _regsPerTarget, int _dataWidth)
    : SimModule(_name),
      addressMap(_addressMap),
      numTargets(_numTargets),
      regsPerTarget(_regsPerTarget),
      bytesPerWord(_dataWidth / 8),
      dataMask(_dataWidth >= 64 ? ~uint64_t{0} : ((uint64_t{1} << _dataWidth) - 1)),
      waitCount(_domain, _name + ".waitCount", 0),
      lastRequest(_domain, _name + ".lastRequest"),
      setupTick(_domain, _name + ".setupTick", 0) {
	CLASS_ASSERT_MSG(_numTargets >= 1 && _regsPerTarget >= 1, "An APB register file needs at least one word.");

	this->regs.reserve(static_cast<size_t>(_numTargets * _regsPerTarget));
	for (int t = 0; t < _numTargets; ++t) {
		for (int i = 0; i < _regsPerTarget; ++i) {
			this->regs.push_back(std::make_unique<SimRegister<uint64_t>>(
			    _domain, _name + ".t" + std::to_string(t) + ".r" + std::to_string(i), 0));
		}
	}
}

int ApbRegisterFile::decodeTarget(uint32_t _psel) const {
	CLASS_ASSERT_MSG(std::popcount(_psel) == 1, "PSEL 0x" << std::hex << _psel << " is not one-hot.");
	int target = std::countr_zero(_psel);
	CLASS_ASSERT_MSG(target < this->numTargets, "PSEL selects target " << target << " of " << this->numTargets);
	return target;
}

bool ApbRegisterFile::isErrorIndex(int _target, Addr _addr, int& _index) const {
	const auto& region = this->addressMap->getRegion(_target);
	Addr        offset = (_addr - region.startAddr) / static_cast<Addr>(this->bytesPerWord);

	if (offset >= static_cast<Addr>(this->regsPerTarget)) return true;

	_index = static_cast<int>(offset);
	return _index == this->errorIndex;
}

ApbResponse ApbRegisterFile::respond(const ApbRequest& _req) const {
	ApbResponse rsp;

	if (_req.psel == 0 || !_req.penable) return rsp;
	if (this->stalled || this->waitCount.get() < this->waitStates) return rsp;

	int target = this->decodeTarget(_req.psel);
	int index  = -1;

	rsp.pready  = true;
	rsp.pslverr = this->isErrorIndex(target, _req.paddr, index);
	if (!rsp.pslverr && !_req.pwrite) { rsp.prdata = this->word(target, index).get(); }

	return rsp;
}

void ApbRegisterFile::step() {
	CLASS_ASSERT_MSG(this->requester, "`" << this->getName() << "` has no APB requester connected.");

	const auto req  = this->requester->getApbRequest();
	const auto prev = this->lastRequest.get();

	CLASS_ASSERT_MSG(!req.penable || req.psel, "PENABLE asserted without PSEL.");
	if (req.psel) this->decodeTarget(req.psel);
	if (req.psel && !req.penable) this->setupTick.set(this->getClockDomain()->getCurrentTick());

	if (req.penable) {
		// ACCESS follows SETUP or a wait cycle of the same transfer with identical signals
		ApbRequest expected = req;
		expected.penable    = prev.penable;
		CLASS_ASSERT_MSG(prev.psel && prev == expected, "APB request changed between SETUP and ACCESS.");
	}

	const auto rsp = this->respond(req);

	if (req.psel && req.penable && rsp.pready) {
		ApbTransfer xfer;
		xfer.setupTick = this->setupTick.get();
		xfer.tick      = this->getClockDomain()->getCurrentTick();
		xfer.target    = this->decodeTarget(req.psel);
		xfer.addr      = req.paddr;
		xfer.isWrite   = req.pwrite;
		xfer.strb      = req.pstrb;
		xfer.error     = rsp.pslverr;
		xfer.data      = rsp.prdata;

		int index = -1;
		if (req.pwrite && !this->isErrorIndex(xfer.target, req.paddr, index)) {
			auto&    reg    = this->word(xfer.target, index);
			uint64_t merged = reg.get();
			for (int lane = 0; lane < this->bytesPerWord; ++lane) {
				if (!(req.pstrb & (1u << lane))) continue;
				uint64_t laneMask = uint64_t{0xff} << (8 * lane);
				merged            = (merged & ~laneMask) | (req.pwdata & laneMask);
			}
			reg.set(merged & this->dataMask);
			xfer.data = merged & this->dataMask;
		}

		VERBOSE_CLASS_INFO << (xfer.isWrite ? "write" : "read") << " target " << xfer.target << " addr 0x" << std::hex
		                   << xfer.addr << " data 0x" << xfer.data << (xfer.error ? " SLVERR" : "");
		this->transfers.push_back(xfer);
		this->waitCount.set(0);
	} else if (req.psel && req.penable) {
		this->waitCount.set(this->waitCount.get() + 1);
	} else {
		this->waitCount.set(0);
	}

	// a completed transfer does not carry over into the next SETUP
	this->lastRequest.set(rsp.pready ? ApbRequest{} : req);
}

void ApbRegisterFile::reset() {
	this->transfers.clear();
	this->stalled = false;
}

uint64_t ApbRegisterFile::peek(int _target, int _index) const {
	CLASS_ASSERT_MSG(_target < this->numTargets && _index < this->regsPerTarget, "No word " << _index
	                                                                                        << " in target "
	                                                                                        << _target);
	return this->word(_target, _index).get();
}

void ApbRegisterFile::poke(int _target, int _index, uint64_t _value) {
	CLASS_ASSERT_MSG(_target < this->numTargets && _index < this->regsPerTarget, "No word " << _index
	                                                                                        << " in target "
	                                                                                        << _target);
	auto& reg = this->word(_target, _index);
	reg.set(_value & this->dataMask);
	reg.sync();
}

}  // namespace bridgesim
