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
 * @file main.cc
 * @brief End-to-end GoogleTest suite of the AXI4-Lite to APB bridge
 *
 * @details
 * Every test builds a fresh BridgeTestTop, selects its configuration with command-line options and
 * programs the TrafficGenerator and the ApbRegisterFile before running:
 *
 * @code
 *   TrafficGenerator --AXI4-Lite--> [ FrontEnd | 4 async queues | BackEnd ] --APB--> ApbRegisterFile
 *        (fast)                                                                        (slow)
 * @endcode
 *
 * The Scoreboard of the top reports through two GTest masks:
 * - mask 0, bit ALL_COMPLETED: the manager finished its program with every expectation met.
 * - mask 1: one bit per AXI4-Lite protocol violation, expected to stay 0 in every test.
 *
 * Options given to the executable are forwarded to every test, next to the ones the test adds:
 * @code{.sh}
 * ./testBridge --gtest_filter=BridgeTest.ClockRatioSweep
 * @endcode
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "BridgeSim.hh"
#include "BridgeTestTop.hh"

using namespace testbridge;

class BridgeTest : public testing::Test {
public:
	static int    argc;
	static char** argv;

	static void init(int _argc, char** _argv) {
		BridgeTest::argc = _argc;
		BridgeTest::argv = _argv;
	}

	void TearDown() override {
		if (this->simTop) {
			EXPECT_EQ(this->simTop->getGTestBitMask(1), 0u) << "AXI4-Lite protocol violation bits were set.";
		}
	}

protected:
	/// Build a top with the executable's own options plus `_extraArgs`.
	BridgeTestTop& start(const std::vector<std::string>& _extraArgs = {}) {
		this->simTop = std::make_shared<BridgeTestTop>();
		top          = this->simTop;

		this->args.clear();
		for (char* arg : getBridgeSimArguments(argc, argv)) this->args.emplace_back(arg);
		this->args.insert(this->args.end(), _extraArgs.begin(), _extraArgs.end());

		std::vector<char*> cargs;
		for (auto& arg : this->args) cargs.push_back(arg.data());
		this->simTop->init(static_cast<int>(cargs.size()), cargs.data());
		return *this->simTop;
	}

	std::shared_ptr<BridgeTestTop> simTop;
	std::vector<std::string>       args;
};

// Definition of static members
int    BridgeTest::argc = 0;
char** BridgeTest::argv = nullptr;

TEST_F(BridgeTest, WriteThenReadRoundTrip) {
	auto& sim = this->start({"--regs_per_target", "256"});

	sim.getManager().write(0x100, 0xAAAA0001, 0xf);
	sim.getManager().idleReads(40);
	sim.getManager().read(0x100, 0xAAAA0001, AxiResp::OKAY);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	EXPECT_EQ(sim.getPeripheral().peek(0, 0x40), 0xAAAA0001u);

	const auto& completions = sim.getManager().getCompletions();
	ASSERT_EQ(completions.size(), 2u);
	EXPECT_TRUE(completions[0].isWrite);
	EXPECT_EQ(completions[0].resp, AxiResp::OKAY);
	EXPECT_FALSE(completions[1].isWrite);
	EXPECT_EQ(completions[1].data, 0xAAAA0001u);

	const auto& transfers = sim.getPeripheral().getTransfers();
	ASSERT_EQ(transfers.size(), 2u);
	EXPECT_TRUE(transfers[0].isWrite);
	EXPECT_EQ(transfers[0].addr, 0x100u);
	EXPECT_EQ(transfers[0].strb, 0xf);
	EXPECT_FALSE(transfers[1].isWrite);
}

TEST_F(BridgeTest, WaitingWritesAreServedBeforeWaitingReads) {
	auto& sim = this->start();

	for (int i = 0; i < 4; ++i) sim.getPeripheral().poke(0, 8 + i, 0x5000 + i);
	sim.getPeripheral().setStall(true);
	for (int i = 0; i < 3; ++i) {
		sim.getManager().write(sim.wordAddress(0, i), 0x100 + i, 0xf);
		sim.getManager().read(sim.wordAddress(0, 8 + i), 0x5000 + i);
	}

	// Let every command reach the bridge while the first transfer is stuck in ACCESS.
	sim.runFor(3000);
	EXPECT_EQ(sim.getBridge().getBackEnd().getState(), BackEndState::ACCESS);
	sim.getPeripheral().setStall(false);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));

	std::vector<bool> apbOrder;
	for (const auto& xfer : sim.getPeripheral().getTransfers()) apbOrder.push_back(xfer.isWrite);
	EXPECT_EQ(apbOrder, (std::vector<bool>{true, true, true, false, false, false}));

	const auto& transfers = sim.getPeripheral().getTransfers();
	ASSERT_EQ(transfers.size(), 6u);
	Tick lastWriteEnd   = transfers[2].tick;
	Tick firstReadSetup = transfers[3].setupTick;
	EXPECT_LT(transfers[2].setupTick, lastWriteEnd);
	EXPECT_GT(firstReadSetup, lastWriteEnd) << "The first read enters SETUP only after the last write completed.";

	Tick lastB = 0, firstR = ~Tick{0};
	for (const auto& c : sim.getManager().getCompletions()) {
		if (c.isWrite) lastB = std::max(lastB, c.completeTick);
		else firstR = std::min(firstR, c.completeTick);
	}
	EXPECT_LT(lastB, firstR) << "Every B response arrives before the first R response.";
}

TEST_F(BridgeTest, HoldsQueueDepthPlusOneCommands) {
	auto& sim = this->start({"--queue_depth", "4"});

	sim.getPeripheral().setStall(true);
	for (int i = 0; i < 10; ++i) sim.getManager().write(sim.wordAddress(0, i), 0xC0DE0000 + i, 0xf);
	sim.runFor(5000);

	// One command in the APB sequencer, four in the write command queue, one in the capture registers.
	EXPECT_EQ(sim.getBridge().getBackEnd().getState(), BackEndState::ACCESS);
	EXPECT_EQ(sim.getBridge().getWriteCommandQueue().getNumPushed(), 5u);
	EXPECT_EQ(sim.getBridge().getWriteCommandQueue().getNumPopped(), 1u);
	EXPECT_EQ(sim.getManager().getNumAwHandshakes(), 6u);
	EXPECT_EQ(sim.getManager().getNumWHandshakes(), 6u);
	EXPECT_FALSE(sim.getBridge().getAxiLiteSlaveSignals().awready);
	EXPECT_FALSE(sim.getBridge().getAxiLiteSlaveSignals().wready);

	sim.getPeripheral().setStall(false);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	ASSERT_EQ(sim.getPeripheral().getTransfers().size(), 10u);
	for (int i = 0; i < 10; ++i) {
		EXPECT_EQ(sim.getPeripheral().getTransfers()[i].addr, sim.wordAddress(0, i));
		EXPECT_EQ(sim.getPeripheral().peek(0, i), 0xC0DE0000u + i);
	}
}

TEST_F(BridgeTest, ResultIsHeldWhileResponsesBackUp) {
	auto& sim = this->start({"--queue_depth", "4"});

	for (int i = 0; i < 6; ++i) {
		sim.getPeripheral().poke(0, i, 0xBEEF00 + i);
		sim.getManager().read(sim.wordAddress(0, i), 0xBEEF00 + i, AxiResp::OKAY);
	}
	sim.getManager().setRReady(false);
	sim.runFor(6000);

	auto& bridge = sim.getBridge();
	EXPECT_EQ(bridge.getReadResponseQueue().getNumPushed(), 4u);
	EXPECT_TRUE(bridge.getReadResponseQueue().isFull());
	EXPECT_EQ(bridge.getBackEnd().getState(), BackEndState::RSP_WAIT);
	EXPECT_EQ(bridge.getBackEnd().getNumTransfers(), 5u);
	EXPECT_EQ(bridge.getReadCommandQueue().getNumPopped(), 5u) << "The sixth read waits for the held result.";
	EXPECT_EQ(sim.getManager().getNumRHandshakes(), 0u);

	const auto bus = bridge.getAxiLiteSlaveSignals();
	EXPECT_TRUE(bus.rvalid);
	EXPECT_EQ(bus.rdata, 0xBEEF00u) << "The oldest result is presented first.";

	sim.getManager().setRReady(true);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	EXPECT_EQ(sim.getManager().getNumRHandshakes(), 6u);
	EXPECT_EQ(sim.getPeripheral().getTransfers().size(), 6u) << "No read is repeated or dropped.";
}

TEST_F(BridgeTest, WaitStatesAndStallsOnlyAddLatency) {
	std::vector<Tick> latencies;

	for (const char* waitStates : {"0", "5"}) {
		auto& sim = this->start({"--wait_states", waitStates});

		for (int i = 0; i < 8; ++i) {
			sim.getPeripheral().poke(0, 32 + i, 0x7700 + i);
			sim.getManager().write(sim.wordAddress(0, i), 0x1100 + i, 0xf);
			sim.getManager().read(sim.wordAddress(0, 32 + i), 0x7700 + i, AxiResp::OKAY);
		}
		sim.runFor(500);
		sim.getPeripheral().setStall(true);
		sim.runFor(2000);
		sim.getPeripheral().setStall(false);
		sim.run();

		EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED)) << "wait states " << waitStates;
		for (int i = 0; i < 8; ++i) EXPECT_EQ(sim.getPeripheral().peek(0, i), 0x1100u + i);
		latencies.push_back(sim.getGlobalTick());
	}
	EXPECT_GT(latencies[1], latencies[0]);
}

TEST_F(BridgeTest, IdleBridgeNeverDrivesEitherBus) {
	auto& sim = this->start();

	sim.getManager().idleWrites(2000);
	sim.run();

	EXPECT_TRUE(sim.getPeripheral().getTransfers().empty());
	EXPECT_EQ(sim.getManager().getNumBHandshakes(), 0u);
	EXPECT_EQ(sim.getManager().getNumRHandshakes(), 0u);
	EXPECT_EQ(sim.getBridge().getApbRequest().psel, 0u);
	EXPECT_EQ(sim.getBridge().getBackEnd().getState(), BackEndState::IDLE);
}

TEST_F(BridgeTest, PeripheralErrorBecomesSlverr) {
	auto& sim = this->start({"--error_addr", "5"});

	sim.getPeripheral().poke(0, 5, 0x55);
	sim.getManager().write(sim.wordAddress(0, 5), 0x66, 0xf);
	sim.getManager().write(sim.wordAddress(0, 4), 0x44, 0xf);
	sim.getManager().idleReads(60);
	sim.getManager().read(sim.wordAddress(0, 5), std::nullopt, AxiResp::SLVERR);
	sim.getManager().read(sim.wordAddress(0, 4), 0x44, AxiResp::OKAY);
	// beyond the 64 words of the register file
	sim.getManager().read(sim.wordAddress(0, 64), std::nullopt, AxiResp::SLVERR);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	EXPECT_EQ(sim.getPeripheral().peek(0, 5), 0x55u) << "A write answered with PSLVERR leaves the word untouched.";

	std::map<Addr, AxiResp> writeResps;
	for (const auto& c : sim.getManager().getCompletions()) {
		if (c.isWrite) writeResps[c.addr] = c.resp;
	}
	EXPECT_EQ(sim.getManager().getCompletions().size(), 5u);
	EXPECT_EQ(writeResps[sim.wordAddress(0, 5)], AxiResp::SLVERR);
	EXPECT_EQ(writeResps[sim.wordAddress(0, 4)], AxiResp::OKAY);
	EXPECT_EQ(sim.getBridge().getBackEnd().getNumErrors(), 3u);
}

TEST_F(BridgeTest, AddressSelectsTheTarget) {
	auto& sim = this->start({"--num_targets", "4"});

	for (int t = 0; t < 4; ++t) sim.getManager().write(sim.wordAddress(t, 1), 0xA0 + t, 0xf);
	sim.getManager().idleReads(80);
	for (int t = 3; t >= 0; --t) sim.getManager().read(sim.wordAddress(t, 1), 0xA0 + t, AxiResp::OKAY);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	EXPECT_EQ(sim.wordAddress(2, 1), 0x80000004u);
	for (int t = 0; t < 4; ++t) EXPECT_EQ(sim.getPeripheral().peek(t, 1), 0xA0u + t);
	for (int t = 0; t < 4; ++t) EXPECT_EQ(sim.getPeripheral().peek(t, 0), 0u);

	const auto& transfers = sim.getPeripheral().getTransfers();
	ASSERT_EQ(transfers.size(), 8u);
	for (int t = 0; t < 4; ++t) EXPECT_EQ(transfers[t].target, t);
	for (int t = 0; t < 4; ++t) EXPECT_EQ(transfers[4 + t].target, 3 - t);
}

TEST_F(BridgeTest, ByteStrobesMergeIntoTheWord) {
	auto& sim = this->start();

	sim.getPeripheral().poke(0, 2, 0x11223344);
	sim.getManager().write(sim.wordAddress(0, 2), 0xAABBCCDD, 0b0101);
	sim.getManager().write(sim.wordAddress(0, 3), 0xAABBCCDD, 0b0000);
	sim.getManager().idleReads(60);
	sim.getManager().read(sim.wordAddress(0, 2), 0x11BB33DD, AxiResp::OKAY);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	EXPECT_EQ(sim.getPeripheral().peek(0, 2), 0x11BB33DDu);
	EXPECT_EQ(sim.getPeripheral().peek(0, 3), 0u) << "A write without strobes changes nothing.";
}

TEST_F(BridgeTest, ClockRatioSweep) {
	// fast period, slow period, slow phase, queue depth, data width
	const std::vector<std::tuple<int, int, int, int, int>> setups = {
	    {10, 37, 0, 4, 32}, {10, 37, 5, 2, 32}, {37, 10, 0, 4, 32}, {10, 10, 0, 2, 32},
	    {10, 10, 5, 8, 64}, {7, 100, 3, 4, 16}, {100, 7, 50, 2, 8},
	};

	for (const auto& [fast, slow, phase, depth, width] : setups) {
		auto& sim = this->start({"--fast_clock_period", std::to_string(fast), "--slow_clock_period",
		                         std::to_string(slow), "--slow_clock_phase", std::to_string(phase), "--queue_depth",
		                         std::to_string(depth), "--data_width", std::to_string(width), "--num_targets", "2",
		                         "--regs_per_target", "16", "--max_tick", "50000000"});
		const auto& params = sim.getBridgeParams();

		std::mt19937                            rng(fast * 1000 + slow);
		std::uniform_int_distribution<uint64_t> dataDist;
		std::bernoulli_distribution             coin(0.5);

		// Writes go to words 0..7 and reads to the preloaded words 8..15.
		std::map<std::pair<int, int>, uint64_t> written;
		for (int t = 0; t < 2; ++t) {
			for (int i = 8; i < 16; ++i) sim.getPeripheral().poke(t, i, (0x9000 + 16 * t + i) & params.getDataMask());
		}
		for (int n = 0; n < 40; ++n) {
			int      t    = coin(rng) ? 1 : 0;
			int      i    = n % 8;
			uint64_t data = dataDist(rng) & params.getDataMask();
			sim.getManager().write(sim.wordAddress(t, i), data, params.getStrobeMask());
			written[{t, i}] = data;

			int r = 8 + n % 8;
			sim.getManager().read(sim.wordAddress(t, r), (0x9000 + 16 * t + r) & params.getDataMask(), AxiResp::OKAY);
		}
		sim.getManager().setBackpressure(0.3, static_cast<uint32_t>(fast + slow + phase));
		sim.run();

		EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED))
		    << "fast " << fast << ", slow " << slow << ", phase " << phase;
		EXPECT_EQ(sim.getManager().getCompletions().size(), 80u);
		for (const auto& [word, value] : written) {
			EXPECT_EQ(sim.getPeripheral().peek(word.first, word.second), value)
			    << "target " << word.first << " word " << word.second;
		}
		EXPECT_EQ(sim.getGTestBitMask(1), 0u) << "fast " << fast << ", slow " << slow << ", phase " << phase;
	}
}

TEST_F(BridgeTest, StalledReadStaysSilentUntilReleased) {
	auto& sim = this->start();

	sim.getPeripheral().poke(0, 7, 0x77);
	sim.getPeripheral().setStall(true);
	sim.getManager().read(sim.wordAddress(0, 7), 0x77, AxiResp::OKAY);

	bool sawRvalid = false;
	sim.runUntil(
	    [&]() {
		    sawRvalid = sawRvalid || sim.getBridge().getAxiLiteSlaveSignals().rvalid;
		    return false;
	    },
	    50000);
	EXPECT_FALSE(sawRvalid);
	EXPECT_EQ(sim.getBridge().getBackEnd().getState(), BackEndState::ACCESS);
	EXPECT_EQ(sim.getBridge().getReadResponseQueue().getNumPushed(), 0u);

	sim.getPeripheral().setStall(false);
	sim.run();

	EXPECT_TRUE(sim.checkGTestBitMask(0, 1 << ScoreboardBit::ALL_COMPLETED));
	EXPECT_EQ(sim.getManager().getNumRHandshakes(), 1u);
	EXPECT_EQ(sim.getPeripheral().getTransfers().size(), 1u);
}

TEST_F(BridgeTest, InvalidQueueDepthIsRejected) {
	EXPECT_THROW(this->start({"--queue_depth", "3"}), ConfigurationError);
	this->simTop.reset();
}

TEST_F(BridgeTest, WatchdogStopsAHungSimulation) {
	auto& sim = this->start({"--max_tick", "20000"});

	sim.getPeripheral().setStall(true);
	sim.getManager().write(0x0, 0x1, 0xf);
	EXPECT_THROW(sim.run(), std::runtime_error);
	EXPECT_GE(sim.getGlobalTick(), 20000u);
}

int main(int argc, char** argv) {
	BridgeTest::init(argc, argv);

	std::vector<char*> gtest_args = getGoogleTestArguments(argc, argv);
	int                gtest_argc = gtest_args.size();
	testing::InitGoogleTest(&gtest_argc, gtest_args.data());

	return RUN_ALL_TESTS();
}
