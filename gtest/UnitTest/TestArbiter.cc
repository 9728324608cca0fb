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

#include <gtest/gtest.h>

#include <deque>
#include <stdexcept>
#include <vector>

#include "TestHarness.hh"

namespace unit_test {

using namespace bridgesim;

TEST(FixedPriorityTest, LowestRequestingIndexWins) {
	FixedPriority arbiter(3);

	EXPECT_EQ(arbiter.getCurIndex(), Arbiter::NONE) << "No grant before the first arbitration.";

	EXPECT_EQ(arbiter.select({false, false, false}), Arbiter::NONE);
	EXPECT_EQ(arbiter.select({false, true, true}), 1u);
	EXPECT_EQ(arbiter.select({true, true, true}), 0u);
	EXPECT_EQ(arbiter.select({false, false, true}), 2u);
	EXPECT_EQ(arbiter.getCurIndex(), 2u);

	// The same requests are always granted the same way.
	for (int i = 0; i < 4; ++i) { EXPECT_EQ(arbiter.select({true, true, false}), 0u); }

	arbiter.reset();
	EXPECT_EQ(arbiter.getCurIndex(), Arbiter::NONE);
}

TEST(FixedPriorityTest, RequestsBeyondComponentCountAreIgnored) {
	FixedPriority arbiter(2);
	EXPECT_EQ(arbiter.select({false, false, true}), Arbiter::NONE);
	EXPECT_EQ(arbiter.select({false}), Arbiter::NONE);
}

namespace {

class CommandFeeder : public SimModule {
public:
	CommandFeeder(AsyncFifo<WriteCommand>* _wcmd, AsyncFifo<ReadCommand>* _rcmd)
	    : SimModule("CommandFeeder"), wcmd(_wcmd), rcmd(_rcmd) {}

	void step() override {
		if (!this->writes.empty() && !this->wcmd->isFull() && this->wcmd->tryPush(this->writes.front())) {
			this->writes.pop_front();
		}
		if (!this->reads.empty() && !this->rcmd->isFull() && this->rcmd->tryPush(this->reads.front())) {
			this->reads.pop_front();
		}
	}

	std::deque<WriteCommand> writes;
	std::deque<ReadCommand>  reads;

private:
	AsyncFifo<WriteCommand>* wcmd;
	AsyncFifo<ReadCommand>*  rcmd;
};

// Takes one grant per edge once enabled, as the back end does in IDLE.
class GrantTaker : public SimModule {
public:
	explicit GrantTaker(CommandArbiter* _arbiter) : SimModule("GrantTaker"), arbiter(_arbiter) {}

	void step() override {
		if (!this->enabled) return;
		if (auto grant = this->arbiter->peek()) {
			this->granted.push_back(*grant);
			this->arbiter->accept();
			if (this->acceptTwice) this->arbiter->accept();
		}
	}

	bool                        enabled     = false;
	bool                        acceptTwice = false;
	std::vector<GrantedCommand> granted;

private:
	CommandArbiter* arbiter;
};

struct ArbiterBench {
	ArbiterBench()
	    : fast("fast", 10),
	      slow("slow", 37, 3),
	      wcmd("wcmd", 4, &fast, &slow),
	      rcmd("rcmd", 4, &fast, &slow),
	      arbiter(&wcmd, &rcmd),
	      feeder(&wcmd, &rcmd),
	      taker(&arbiter),
	      domains{&fast, &slow} {
		this->fast.addModule(&this->feeder);
		this->fast.addModule(this->wcmd.getWritePort());
		this->fast.addModule(this->rcmd.getWritePort());
		this->slow.addModule(&this->taker);
		this->slow.addModule(this->wcmd.getReadPort());
		this->slow.addModule(this->rcmd.getReadPort());
	}

	ClockDomain               fast;
	ClockDomain               slow;
	AsyncFifo<WriteCommand>   wcmd;
	AsyncFifo<ReadCommand>    rcmd;
	CommandArbiter            arbiter;
	CommandFeeder             feeder;
	GrantTaker                taker;
	std::vector<ClockDomain*> domains;
};

}  // namespace

TEST(CommandArbiterTest, WaitingWritesAreGrantedBeforeWaitingReads) {
	ArbiterBench bench;
	bench.feeder.reads  = {{0x40}, {0x44}};
	bench.feeder.writes = {{0x10, 1, 0xf}, {0x14, 2, 0xf}};

	// both queues settle before the first grant is taken
	runEdges(bench.domains, &bench.slow, 8);
	EXPECT_FALSE(bench.wcmd.isEmpty());
	EXPECT_FALSE(bench.rcmd.isEmpty());

	bench.taker.enabled = true;
	runEdges(bench.domains, &bench.slow, 8);

	ASSERT_EQ(bench.taker.granted.size(), 4u);
	EXPECT_TRUE(bench.taker.granted[0].isWrite);
	EXPECT_EQ(bench.taker.granted[0].addr, 0x10u);
	EXPECT_TRUE(bench.taker.granted[1].isWrite);
	EXPECT_EQ(bench.taker.granted[1].data, 2u);
	EXPECT_FALSE(bench.taker.granted[2].isWrite);
	EXPECT_EQ(bench.taker.granted[3].addr, 0x44u);
	EXPECT_EQ(bench.wcmd.getNumPopped(), 2u);
	EXPECT_EQ(bench.rcmd.getNumPopped(), 2u);
}

TEST(CommandArbiterTest, GrantIsUsedUpByAccept) {
	ArbiterBench bench;
	bench.feeder.writes = {{0x10, 1, 0xf}};
	runEdges(bench.domains, &bench.slow, 8);

	bench.taker.enabled     = true;
	bench.taker.acceptTwice = true;
	EXPECT_THROW(runEdges(bench.domains, &bench.slow, 1), std::runtime_error);
	EXPECT_EQ(bench.wcmd.getNumPopped(), 1u);
}

}  // namespace unit_test
