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


/**
 * @file TestBackEnd.cc
 * @brief APB side of the bridge: SETUP/ACCESS sequencing, arbitration, decode and response hold
 */

#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <vector>

#include "TestHarness.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

class StubCompleter : public ApbCompleterIf {
public:
	ApbResponse respond(const ApbRequest& _req) const override {
		ApbResponse rsp;
		if (!(_req.psel && _req.penable)) {
			rsp.pready = this->readyWhenIdle;
			return rsp;
		}
		rsp.pready  = this->ready;
		rsp.prdata  = this->readData;
		rsp.pslverr = this->error;
		return rsp;
	}

	bool     ready         = true;
	bool     error         = false;
	bool     readyWhenIdle = false;
	uint64_t readData      = 0;
};

class CommandSource : public SimModule {
public:
	CommandSource(AsyncFifo<WriteCommand>* _wcmd, AsyncFifo<ReadCommand>* _rcmd)
	    : SimModule("CommandSource"), wcmd(_wcmd), rcmd(_rcmd) {}

	void step() override {
		if (!this->writes.empty() && this->wcmd->tryPush(this->writes.front())) this->writes.pop_front();
		if (!this->reads.empty() && this->rcmd->tryPush(this->reads.front())) this->reads.pop_front();
	}

	std::deque<WriteCommand> writes;
	std::deque<ReadCommand>  reads;

private:
	AsyncFifo<WriteCommand>* wcmd;
	AsyncFifo<ReadCommand>*  rcmd;
};

class ResponseSink : public SimModule {
public:
	explicit ResponseSink(AsyncFifo<BridgeResponse>* _queue) : SimModule("ResponseSink"), queue(_queue) {}

	void step() override {
		if (!this->enabled || this->queue->isEmpty()) return;
		this->received.push_back(this->queue->front());
		EXPECT_TRUE(this->queue->tryPop());
	}

	bool                        enabled = true;
	std::vector<BridgeResponse> received;

private:
	AsyncFifo<BridgeResponse>* queue;
};

struct BackEndBench {
	explicit BackEndBench(const BridgeParams& _params = BridgeParams{})
	    : fast("fast", 10),
	      slow("slow", 37),
	      addressMap("map"),
	      wcmd("wcmd", _params.queueDepth, &fast, &slow),
	      rcmd("rcmd", _params.queueDepth, &fast, &slow),
	      wrsp("wrsp", _params.queueDepth, &slow, &fast),
	      rrsp("rrsp", _params.queueDepth, &slow, &fast),
	      arbiter(&wcmd, &rcmd),
	      backEnd("backEnd", &slow, _params, &arbiter, &addressMap, &wrsp, &rrsp),
	      source(&wcmd, &rcmd),
	      writeSink(&wrsp),
	      readSink(&rrsp),
	      domains{&fast, &slow} {
		this->addressMap.registerEvenSplit(_params.addressWidth, _params.numTargets);
		this->backEnd.connect(&this->completer);

		this->fast.addModule(&this->source);
		this->fast.addModule(&this->writeSink);
		this->fast.addModule(&this->readSink);
		this->fast.addModule(this->wcmd.getWritePort());
		this->fast.addModule(this->rcmd.getWritePort());
		this->fast.addModule(this->wrsp.getReadPort());
		this->fast.addModule(this->rrsp.getReadPort());

		this->slow.addModule(&this->backEnd);
		this->slow.addModule(this->wcmd.getReadPort());
		this->slow.addModule(this->rcmd.getReadPort());
		this->slow.addModule(this->wrsp.getWritePort());
		this->slow.addModule(this->rrsp.getWritePort());
	}

	// Run slow edges and record the APB request driven after each of them.
	void slowEdges(uint64_t _n) {
		for (uint64_t i = 0; i < _n; ++i) {
			runEdges(this->domains, &this->slow, 1);
			this->trace.push_back(this->backEnd.getApbRequest());
			this->states.push_back(this->backEnd.getState());
		}
	}

	template <typename Cond>
	bool slowEdgesUntil(Cond _cond, uint64_t _limit = 500) {
		for (uint64_t i = 0; i < _limit && !_cond(); ++i) this->slowEdges(1);
		return _cond();
	}

	size_t countStates(BackEndState _state) const {
		size_t n = 0;
		for (auto s : this->states) n += (s == _state);
		return n;
	}

	ClockDomain               fast;
	ClockDomain               slow;
	SimAddressMap             addressMap;
	AsyncFifo<WriteCommand>   wcmd;
	AsyncFifo<ReadCommand>    rcmd;
	AsyncFifo<BridgeResponse> wrsp;
	AsyncFifo<BridgeResponse> rrsp;
	CommandArbiter            arbiter;
	StubCompleter             completer;
	BackEnd                   backEnd;
	CommandSource             source;
	ResponseSink              writeSink;
	ResponseSink              readSink;
	std::vector<ClockDomain*> domains;

	std::vector<ApbRequest>   trace;
	std::vector<BackEndState> states;
};

}  // namespace

TEST(BackEndTest, WriteTakesOneSetupAndOneAccessCycle) {
	BridgeParams params;
	params.numTargets = 2;
	BackEndBench bench(params);
	bench.source.writes.push_back(WriteCommand{0x80000010, 0xdeadbeef, 0xf});

	ASSERT_TRUE(bench.slowEdgesUntil([&] { return bench.writeSink.received.size() == 1; }));

	EXPECT_EQ(bench.countStates(BackEndState::SETUP), 1u);
	EXPECT_EQ(bench.countStates(BackEndState::ACCESS), 1u) << "A ready completer ends ACCESS after one cycle.";

	size_t setup = 0;
	while (bench.states[setup] != BackEndState::SETUP) setup++;
	ASSERT_LT(setup + 2, bench.states.size());

	const auto& s = bench.trace[setup];
	EXPECT_EQ(s.psel, 0b10u) << "0x80000010 belongs to the upper half of the address space.";
	EXPECT_FALSE(s.penable);
	EXPECT_EQ(s.paddr, 0x80000010u);
	EXPECT_TRUE(s.pwrite);
	EXPECT_EQ(s.pwdata, 0xdeadbeefu);
	EXPECT_EQ(s.pstrb, 0xf);

	auto access    = bench.trace[setup + 1];
	EXPECT_TRUE(access.penable);
	access.penable = false;
	EXPECT_EQ(access, s) << "Every signal but PENABLE is stable from SETUP to ACCESS.";

	EXPECT_EQ(bench.states[setup + 2], BackEndState::IDLE);
	EXPECT_EQ(bench.trace[setup + 2].psel, 0u);

	EXPECT_FALSE(bench.writeSink.received[0].error);
	EXPECT_EQ(bench.backEnd.getNumTransfers(), 1u);
}

TEST(BackEndTest, AccessIsExtendedUntilPready) {
	BackEndBench bench;
	bench.completer.ready = false;
	bench.source.reads.push_back(ReadCommand{0x20});

	ASSERT_TRUE(bench.slowEdgesUntil([&] { return bench.backEnd.getState() == BackEndState::ACCESS; }));
	const auto held = bench.backEnd.getApbRequest();

	bench.slowEdges(5);
	for (size_t i = bench.states.size() - 5; i < bench.states.size(); ++i) {
		EXPECT_EQ(bench.states[i], BackEndState::ACCESS);
		EXPECT_EQ(bench.trace[i], held);
	}
	EXPECT_EQ(bench.backEnd.getNumTransfers(), 0u);

	bench.completer.ready    = true;
	bench.completer.readData = 0x1'2345'6789ull;
	bench.slowEdges(1);
	EXPECT_EQ(bench.backEnd.getState(), BackEndState::IDLE);

	ASSERT_TRUE(bench.slowEdgesUntil([&] { return bench.readSink.received.size() == 1; }));
	EXPECT_EQ(bench.readSink.received[0].data, 0x2345'6789u) << "Read data is truncated to the data width.";
	EXPECT_FALSE(bench.readSink.received[0].error);
}

TEST(BackEndTest, SlaveErrorIsForwarded) {
	BackEndBench bench;
	bench.completer.error = true;
	bench.source.writes.push_back(WriteCommand{0x4, 0x1, 0xf});

	ASSERT_TRUE(bench.slowEdgesUntil([&] { return bench.writeSink.received.size() == 1; }));
	EXPECT_TRUE(bench.writeSink.received[0].error);
	EXPECT_EQ(bench.backEnd.getNumErrors(), 1u);
}

TEST(BackEndTest, WaitingWritesWinOverWaitingReads) {
	BackEndBench bench;
	for (Addr i = 0; i < 3; ++i) {
		bench.source.writes.push_back(WriteCommand{0x100 + 4 * i, i, 0xf});
		bench.source.reads.push_back(ReadCommand{0x200 + 4 * i});
	}

	ASSERT_TRUE(bench.slowEdgesUntil(
	    [&] { return bench.writeSink.received.size() == 3 && bench.readSink.received.size() == 3; }));

	std::vector<bool> order;
	for (size_t i = 0; i < bench.states.size(); ++i) {
		if (bench.states[i] == BackEndState::SETUP) order.push_back(bench.trace[i].pwrite);
	}
	EXPECT_EQ(order, (std::vector<bool>{true, true, true, false, false, false}));
}

TEST(BackEndTest, TargetIsSelectedByAddressRegion) {
	BridgeParams params;
	params.numTargets = 4;
	BackEndBench bench(params);
	for (Addr addr : {Addr{0x0}, Addr{0x40000004}, Addr{0x80000008}, Addr{0xfffffffc}}) {
		bench.source.reads.push_back(ReadCommand{addr});
	}

	ASSERT_TRUE(bench.slowEdgesUntil([&] { return bench.readSink.received.size() == 4; }));

	std::vector<uint32_t> selects;
	for (size_t i = 0; i < bench.states.size(); ++i) {
		if (bench.states[i] == BackEndState::SETUP) selects.push_back(bench.trace[i].psel);
	}
	EXPECT_EQ(selects, (std::vector<uint32_t>{0b0001, 0b0010, 0b0100, 0b1000}));
}

TEST(BackEndTest, FullResponseQueueHoldsTheResult) {
	BridgeParams params;
	params.queueDepth = 2;
	BackEndBench bench(params);
	bench.writeSink.enabled = false;
	for (Addr i = 0; i < 4; ++i) bench.source.writes.push_back(WriteCommand{4 * i, i, 0xf});

	bench.slowEdges(60);

	EXPECT_EQ(bench.wrsp.getNumPushed(), 2u);
	EXPECT_EQ(bench.backEnd.getNumTransfers(), 3u);
	EXPECT_EQ(bench.backEnd.getState(), BackEndState::RSP_WAIT);
	EXPECT_TRUE(bench.backEnd.getPendingSlot().valid);
	EXPECT_EQ(bench.backEnd.getNumRspWaits(), 1u);
	EXPECT_EQ(bench.wcmd.getNumPopped(), 3u) << "No new command is accepted while a result is held.";
	EXPECT_EQ(bench.trace.back().psel, 0u) << "The bus is idle while the result waits.";

	bench.writeSink.enabled = true;
	ASSERT_TRUE(bench.slowEdgesUntil([&] { return bench.writeSink.received.size() == 4; }));
	EXPECT_EQ(bench.backEnd.getNumTransfers(), 4u);
	bench.slowEdges(2);
	EXPECT_EQ(bench.backEnd.getState(), BackEndState::IDLE);
}

TEST(BackEndTest, PreadyWithoutSelectIsAProtocolError) {
	BackEndBench bench;
	bench.completer.readyWhenIdle = true;
	EXPECT_THROW(bench.slowEdges(1), std::runtime_error);
}

}  // namespace unit_test
