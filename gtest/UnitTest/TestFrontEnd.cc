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
 * @file TestFrontEnd.cc
 * @brief AXI4-Lite side of the bridge: capture registers, ready derivation and response delivery
 */

#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <vector>

#include "TestHarness.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

// Manager whose signals are set by the test between edges.
class StubManager : public AxiLiteMasterIf {
public:
	AxiLiteMasterSignals getAxiLiteMasterSignals() const override { return this->signals; }

	AxiLiteMasterSignals signals;
};

// Feeds scripted responses into a response queue from the APB side.
class ResponseSource : public SimModule {
public:
	explicit ResponseSource(AsyncFifo<BridgeResponse>* _queue) : SimModule("ResponseSource"), queue(_queue) {}

	void step() override {
		if (!this->pending.empty() && this->queue->tryPush(this->pending.front())) this->pending.pop_front();
	}

	std::deque<BridgeResponse> pending;

private:
	AsyncFifo<BridgeResponse>* queue;
};

struct FrontEndBench {
	explicit FrontEndBench(const BridgeParams& _params = BridgeParams{})
	    : fast("fast", 10),
	      slow("slow", 37),
	      wcmd("wcmd", _params.queueDepth, &fast, &slow),
	      rcmd("rcmd", _params.queueDepth, &fast, &slow),
	      wrsp("wrsp", _params.queueDepth, &slow, &fast),
	      rrsp("rrsp", _params.queueDepth, &slow, &fast),
	      frontEnd("frontEnd", &fast, _params, &wcmd, &rcmd, &wrsp, &rrsp),
	      writeResponses(&wrsp),
	      readResponses(&rrsp),
	      domains{&fast, &slow} {
		this->frontEnd.connect(&this->manager);

		this->fast.addModule(&this->frontEnd);
		this->fast.addModule(this->wcmd.getWritePort());
		this->fast.addModule(this->rcmd.getWritePort());
		this->fast.addModule(this->wrsp.getReadPort());
		this->fast.addModule(this->rrsp.getReadPort());

		this->slow.addModule(&this->writeResponses);
		this->slow.addModule(&this->readResponses);
		this->slow.addModule(this->wcmd.getReadPort());
		this->slow.addModule(this->rcmd.getReadPort());
		this->slow.addModule(this->wrsp.getWritePort());
		this->slow.addModule(this->rrsp.getWritePort());
	}

	void fastEdges(uint64_t _n) { runEdges(this->domains, &this->fast, _n); }

	AxiLiteSlaveSignals bus() const { return this->frontEnd.getSignals(); }

	ClockDomain               fast;
	ClockDomain               slow;
	AsyncFifo<WriteCommand>   wcmd;
	AsyncFifo<ReadCommand>    rcmd;
	AsyncFifo<BridgeResponse> wrsp;
	AsyncFifo<BridgeResponse> rrsp;
	StubManager               manager;
	FrontEnd                  frontEnd;
	ResponseSource            writeResponses;
	ResponseSource            readResponses;
	std::vector<ClockDomain*> domains;
};

}  // namespace

TEST(FrontEndTest, IdleBusIsReadyAndSilent) {
	FrontEndBench bench;
	bench.fastEdges(3);

	EXPECT_TRUE(bench.bus().awready);
	EXPECT_TRUE(bench.bus().wready);
	EXPECT_TRUE(bench.bus().arready);
	EXPECT_FALSE(bench.bus().bvalid);
	EXPECT_FALSE(bench.bus().rvalid);
}

TEST(FrontEndTest, WriteIsEnqueuedOnceAddressAndDataArrived) {
	FrontEndBench bench;

	bench.manager.signals.awvalid = true;
	bench.manager.signals.awaddr  = 0x100;
	bench.fastEdges(1);
	bench.manager.signals.awvalid = false;

	EXPECT_TRUE(bench.frontEnd.getAwCapture().valid);
	EXPECT_EQ(bench.frontEnd.getAwCapture().addr, 0x100u);
	EXPECT_FALSE(bench.bus().awready) << "A full capture register deasserts its ready.";
	EXPECT_TRUE(bench.bus().wready);

	bench.fastEdges(3);
	EXPECT_EQ(bench.wcmd.getNumPushed(), 0u) << "An address without data must not be enqueued.";

	bench.manager.signals.wvalid = true;
	bench.manager.signals.wdata  = 0xAAAA0001;
	bench.manager.signals.wstrb  = 0xf;
	bench.fastEdges(1);
	bench.manager.signals.wvalid = false;
	EXPECT_TRUE(bench.frontEnd.getWCapture().valid);
	EXPECT_FALSE(bench.bus().wready);

	bench.fastEdges(1);
	EXPECT_EQ(bench.wcmd.getNumPushed(), 1u);
	EXPECT_EQ(bench.frontEnd.getNumWritesEnqueued(), 1u);
	EXPECT_TRUE(bench.bus().awready);
	EXPECT_TRUE(bench.bus().wready);
}

TEST(FrontEndTest, ReadIsEnqueuedOnTheEdgeAfterCapture) {
	FrontEndBench bench;

	bench.manager.signals.arvalid = true;
	bench.manager.signals.araddr  = 0x40;
	bench.fastEdges(1);
	bench.manager.signals.arvalid = false;

	EXPECT_TRUE(bench.frontEnd.getArCapture().valid);
	EXPECT_FALSE(bench.bus().arready);
	EXPECT_EQ(bench.rcmd.getNumPushed(), 0u);

	bench.fastEdges(1);
	EXPECT_EQ(bench.rcmd.getNumPushed(), 1u);
	EXPECT_TRUE(bench.bus().arready);
}

TEST(FrontEndTest, FullCommandQueueBackpressuresTheManager) {
	BridgeParams params;
	params.queueDepth = 2;
	FrontEndBench bench(params);

	// Every accepted AR is a new read; nothing drains the read command queue.
	bench.manager.signals.arvalid = true;
	bench.manager.signals.araddr  = 0x8;
	bench.fastEdges(40);

	EXPECT_EQ(bench.rcmd.getNumPushed(), 2u);
	EXPECT_EQ(bench.frontEnd.getNumReadsEnqueued(), 2u);
	EXPECT_TRUE(bench.frontEnd.getArCapture().valid) << "A third read waits in the capture register.";
	EXPECT_FALSE(bench.bus().arready);
}

TEST(FrontEndTest, ResponseIsHeldUntilTheManagerIsReady) {
	FrontEndBench bench;
	bench.manager.signals.rready = false;
	bench.readResponses.pending.push_back(BridgeResponse{0x1234, false});

	for (int guard = 0; !bench.bus().rvalid && guard < 100; ++guard) bench.fastEdges(1);
	ASSERT_TRUE(bench.bus().rvalid);
	EXPECT_EQ(bench.bus().rdata, 0x1234u);
	EXPECT_EQ(bench.bus().rresp, AxiResp::OKAY);

	bench.fastEdges(10);
	EXPECT_TRUE(bench.bus().rvalid) << "RVALID must stay asserted until RREADY.";
	EXPECT_EQ(bench.bus().rdata, 0x1234u);
	EXPECT_EQ(bench.frontEnd.getNumRDelivered(), 0u);

	bench.manager.signals.rready = true;
	bench.fastEdges(1);
	EXPECT_EQ(bench.frontEnd.getNumRDelivered(), 1u);
	EXPECT_FALSE(bench.bus().rvalid);

	bench.fastEdges(5);
	EXPECT_EQ(bench.frontEnd.getNumRDelivered(), 1u) << "A response is delivered exactly once.";
}

TEST(FrontEndTest, WriteErrorIsReportedAsSlverr) {
	FrontEndBench bench;
	bench.manager.signals.bready = true;
	bench.writeResponses.pending.push_back(BridgeResponse{0, true});

	for (int guard = 0; !bench.bus().bvalid && guard < 100; ++guard) bench.fastEdges(1);
	ASSERT_TRUE(bench.bus().bvalid);
	EXPECT_EQ(bench.bus().bresp, AxiResp::SLVERR);

	bench.fastEdges(1);
	EXPECT_EQ(bench.frontEnd.getNumBDelivered(), 1u);
}

TEST(FrontEndTest, OutOfWidthRequestsAreRejected) {
	BridgeParams params;
	params.addressWidth = 16;
	params.dataWidth    = 16;

	{
		FrontEndBench bench(params);
		bench.manager.signals.awvalid = true;
		bench.manager.signals.awaddr  = 0x10000;
		EXPECT_THROW(bench.fastEdges(1), std::runtime_error);
	}
	{
		FrontEndBench bench(params);
		bench.manager.signals.wvalid = true;
		bench.manager.signals.wdata  = 0x1ffff;
		bench.manager.signals.wstrb  = 0x3;
		EXPECT_THROW(bench.fastEdges(1), std::runtime_error);
	}
	{
		FrontEndBench bench(params);
		bench.manager.signals.wvalid = true;
		bench.manager.signals.wdata  = 0xffff;
		bench.manager.signals.wstrb  = 0x4;
		EXPECT_THROW(bench.fastEdges(1), std::runtime_error);
	}
}

}  // namespace unit_test
