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

#include <deque>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "bridge/BridgeTypes.hh"
#include "hw/SimRegister.hh"
#include "profiling/Statistics.hh"
#include "sim/SimModule.hh"

namespace bridgesim {

/// A finished AXI4-Lite transaction as observed by the manager.
struct AxiLiteCompletion {
	bool     isWrite      = false;
	Addr     addr         = 0;
	uint64_t data         = 0;  // write data, or read data returned
	AxiResp  resp         = AxiResp::OKAY;
	Tick     issueTick    = 0;
	Tick     completeTick = 0;
};

/**
 * @brief AXI4-Lite manager model driving a program of writes and reads.
 *
 * @details
 * Writes and reads are issued from two independent in-order programs, as the AW/W and AR channels
 * of AXI4-Lite are independent. A write presents AW and W together and the next write starts once
 * both have been accepted; a read presents AR and the next read starts once AR has been accepted.
 * idle() inserts gap cycles into the program it follows.
 *
 * BREADY and RREADY are controlled with setBReady()/setRReady() and default high. On top of that,
 * setBackpressure() drops each of them for a cycle with the given probability; the random choice is
 * made in step() and registered, so the subordinate and the manager agree on it within an edge.
 * Responses are matched in order with the issued transactions of the same direction.
 *
 * A read may carry an expected value. isDone() turns true once every programmed transaction has
 * completed; mismatches against expectations are counted and reported.
 */
class TrafficGenerator : public SimModule, public AxiLiteMasterIf {
public:
	TrafficGenerator(const std::string& _name, ClockDomain* _domain);

	void connect(const AxiLiteSlaveIf* _slave) { this->slave = _slave; }

	void write(Addr _addr, uint64_t _data, uint8_t _strb = 0xff);
	void read(Addr _addr, std::optional<uint64_t> _expected = std::nullopt,
	          std::optional<AxiResp> _expectedResp = std::nullopt);
	void idleWrites(int _cycles);
	void idleReads(int _cycles);

	void setBReady(bool _ready) { this->bready = _ready; }
	void setRReady(bool _ready) { this->rready = _ready; }
	void setBackpressure(double _rate, uint32_t _seed);

	AxiLiteMasterSignals getAxiLiteMasterSignals() const override;

	void step() override;
	void reset() override;

	bool isDone() const;

	const std::vector<AxiLiteCompletion>& getCompletions() const { return this->completions; }

	size_t getNumAwHandshakes() const { return this->awHandshakes; }
	size_t getNumWHandshakes() const { return this->wHandshakes; }
	size_t getNumArHandshakes() const { return this->arHandshakes; }
	size_t getNumBHandshakes() const { return this->bHandshakes; }
	size_t getNumRHandshakes() const { return this->rHandshakes; }
	size_t getNumMismatches() const { return this->mismatches; }

	void reportStatistics() const;

private:
	struct Op {
		enum class Kind { WRITE, READ, IDLE } kind = Kind::IDLE;
		Addr                    addr               = 0;
		uint64_t                data               = 0;
		uint8_t                 strb               = 0;
		int                     cycles             = 0;
		std::optional<uint64_t> expected;
		std::optional<AxiResp>  expectedResp;
	};

	struct Outstanding {
		Op   op;
		Tick issueTick = 0;
	};

	bool isBReady() const { return this->bready && this->bAllowReg.get(); }
	bool isRReady() const { return this->rready && this->rAllowReg.get(); }

	void complete(std::deque<Outstanding>& _queue, bool _isWrite, uint64_t _data, AxiResp _resp);

	const AxiLiteSlaveIf* slave = nullptr;

	SimRegister<AddrBeat> awReg;
	SimRegister<DataBeat> wReg;
	SimRegister<AddrBeat> arReg;

	SimRegister<bool> bAllowReg;
	SimRegister<bool> rAllowReg;

	bool bready = true;
	bool rready = true;

	double       backpressureRate = 0.0;
	std::mt19937 rng;

	std::deque<Op>          writeProgram;
	std::deque<Op>          readProgram;
	std::deque<Outstanding> outstandingWrites;
	std::deque<Outstanding> outstandingReads;
	int                     writeIdle = 0;
	int                     readIdle  = 0;

	std::vector<AxiLiteCompletion> completions;

	size_t awHandshakes = 0;
	size_t wHandshakes  = 0;
	size_t arHandshakes = 0;
	size_t bHandshakes  = 0;
	size_t rHandshakes  = 0;
	size_t mismatches   = 0;

	Statistics<Tick> writeLatency;
	Statistics<Tick> readLatency;
};

}  // namespace bridgesim
