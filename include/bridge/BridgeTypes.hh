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

#include <cstdint>
#include <ostream>

#include "utils/TypeDef.hh"

namespace bridgesim {

/*----------------------- queue payloads -----------------------*/

struct WriteCommand {
	Addr     addr = 0;
	uint64_t data = 0;
	uint8_t  strb = 0;
};

struct ReadCommand {
	Addr addr = 0;
};

struct BridgeResponse {
	uint64_t data  = 0;  // read data, 0 for writes
	bool     error = false;
};

/*----------------------- AXI4-Lite ----------------------------*/

/// Payload held by an address channel register.
struct AddrBeat {
	bool valid = false;
	Addr addr  = 0;
};

/// Payload held by a write data channel register.
struct DataBeat {
	bool     valid = false;
	uint64_t data  = 0;
	uint8_t  strb  = 0;
};

enum class AxiResp : uint8_t { OKAY = 0, SLVERR = 2 };

inline std::ostream& operator<<(std::ostream& _os, AxiResp _resp) {
	return _os << (_resp == AxiResp::OKAY ? "OKAY" : "SLVERR");
}

/// Signals driven by an AXI4-Lite manager.
struct AxiLiteMasterSignals {
	bool     awvalid = false;
	Addr     awaddr  = 0;
	bool     wvalid  = false;
	uint64_t wdata   = 0;
	uint8_t  wstrb   = 0;
	bool     bready  = false;
	bool     arvalid = false;
	Addr     araddr  = 0;
	bool     rready  = false;
};

/// Signals driven by an AXI4-Lite subordinate.
struct AxiLiteSlaveSignals {
	bool     awready = false;
	bool     wready  = false;
	bool     bvalid  = false;
	AxiResp  bresp   = AxiResp::OKAY;
	bool     arready = false;
	bool     rvalid  = false;
	uint64_t rdata   = 0;
	AxiResp  rresp   = AxiResp::OKAY;
};

/*----------------------- APB4 ---------------------------------*/

/// Signals driven by the APB requester. `psel` is one-hot, bit i selecting target i.
struct ApbRequest {
	uint32_t psel    = 0;
	bool     penable = false;
	Addr     paddr   = 0;
	bool     pwrite  = false;
	uint64_t pwdata  = 0;
	uint8_t  pstrb   = 0;

	bool operator==(const ApbRequest&) const = default;
};

/// Signals driven by the selected APB completer.
struct ApbResponse {
	bool     pready  = false;
	uint64_t prdata  = 0;
	bool     pslverr = false;
};

/*----------------------- port interfaces ----------------------*/

// Every getter returns a function of committed state only, so the peer may sample it at any point
// of phase 1 regardless of module order.

class AxiLiteMasterIf {
public:
	virtual ~AxiLiteMasterIf()                                       = default;
	virtual AxiLiteMasterSignals getAxiLiteMasterSignals() const = 0;
};

class AxiLiteSlaveIf {
public:
	virtual ~AxiLiteSlaveIf()                                      = default;
	virtual AxiLiteSlaveSignals getAxiLiteSlaveSignals() const = 0;
};

class ApbRequesterIf {
public:
	virtual ~ApbRequesterIf()                  = default;
	virtual ApbRequest getApbRequest() const = 0;
};

/**
 * @brief APB completer. respond() is the combinational response to `_req` given the completer's
 * committed state; it must not modify anything.
 */
class ApbCompleterIf {
public:
	virtual ~ApbCompleterIf()                                    = default;
	virtual ApbResponse respond(const ApbRequest& _req) const = 0;
};

}  // namespace bridgesim
