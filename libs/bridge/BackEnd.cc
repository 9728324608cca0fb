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

#include "bridge/BackEnd.hh"

#include "utils/Logging.hh"

namespace bridgesim {

std::ostream& operator<<(std::ostream& _os, BackEndState _state) {
	switch (_state) {
		case BackEndState::IDLE: return _os << "IDLE";
		case BackEndState::SETUP: return _os << "SETUP";
		case BackEndState::ACCESS: return _os << "ACCESS";
		case BackEndState::RSP_WAIT: return _os << "RSP_WAIT";
	}
	return _os << "UNKNOWN";
}

BackEnd::BackEnd(const std::string& _name, ClockDomain* _domain, const BridgeParams& _params,
                 CommandArbiter* _arbiter, const SimAddressMap* _addressMap, AsyncFifo<BridgeResponse>* _wrsp,
                 AsyncFifo<BridgeResponse>* _rrsp)
    : SimModule(_name),
      params(_params),
      arbiter(_arbiter),
      addressMap(_addressMap),
      wrsp(_wrsp),
      rrsp(_rrsp),
      state(_domain, _name + ".state", BackEndState::IDLE),
      latched(_domain, _name + ".latched"),
      output(_domain, _name + ".output"),
      pending(_domain, _name + ".pending") {}

ApbRequest BackEnd::getApbRequest() const {
	ApbRequest req;
	auto       s = this->state.get();

	if (s == BackEndState::SETUP || s == BackEndState::ACCESS) {
		const auto& txn = this->latched.get();
		req.psel        = uint32_t{1} << txn.target;
		req.penable     = (s == BackEndState::ACCESS);
		req.paddr       = txn.addr;
		req.pwrite      = txn.isWrite;
		req.pwdata      = txn.isWrite ? txn.data : 0;
		req.pstrb       = txn.isWrite ? txn.strb : 0;
	}

	return req;
}

void BackEnd::step() {
	CLASS_ASSERT_MSG(this->completer, "`" << this->getName() << "` has no APB completer connected.");

	const auto req = this->getApbRequest();
	const auto rsp = this->completer->respond(req);

	CLASS_ASSERT_MSG(!rsp.pready || req.psel, "PREADY asserted while no completer is selected.");

	ResultSlot out = this->output.get();

	// Drain the output slot into its response queue.
	if (out.valid && this->getResponseQueue(out.isWrite)->tryPush(out.response)) { out.valid = false; }

	switch (this->state.get()) {
		case BackEndState::IDLE: {
			if (this->output.get().valid || this->pending.get().valid) break;

			auto grant = this->arbiter->peek();
			if (!grant) break;

			LatchedTransaction txn;
			txn.isWrite = grant->isWrite;
			txn.addr    = grant->addr;
			txn.data    = grant->data;
			txn.strb    = grant->strb;
			txn.target  = this->addressMap->getDeviceID(grant->addr);

			this->arbiter->accept();
			this->latched.set(txn);
			this->state.set(BackEndState::SETUP);
			VERBOSE_CLASS_INFO << (txn.isWrite ? "write" : "read") << " 0x" << std::hex << txn.addr << std::dec
			                   << " latched for target " << txn.target;
			break;
		}
		case BackEndState::SETUP: this->state.set(BackEndState::ACCESS); break;
		case BackEndState::ACCESS: {
			if (!rsp.pready) break;

			const auto& txn = this->latched.get();
			ResultSlot  result;
			result.valid          = true;
			result.isWrite        = txn.isWrite;
			result.response.data  = txn.isWrite ? 0 : (rsp.prdata & this->params.getDataMask());
			result.response.error = rsp.pslverr;

			this->transfers.push(1);
			if (rsp.pslverr) this->errors.push(1);

			if (!this->getResponseQueue(txn.isWrite)->isFull()) {
				out = result;
				this->state.set(BackEndState::IDLE);
			} else {
				this->pending.set(result);
				this->rspWaits.push(1);
				this->state.set(BackEndState::RSP_WAIT);
				VERBOSE_CLASS_INFO << "response queue full, holding the result";
			}
			break;
		}
		case BackEndState::RSP_WAIT: {
			const auto& held = this->pending.get();
			if (this->getResponseQueue(held.isWrite)->isFull()) break;

			out = held;
			this->pending.set(ResultSlot{});
			this->state.set(BackEndState::IDLE);
			break;
		}
	}

	this->output.set(out);
}

void BackEnd::reset() {
	this->transfers.clear();
	this->errors.clear();
	this->rspWaits.clear();
}

}  // namespace bridgesim
