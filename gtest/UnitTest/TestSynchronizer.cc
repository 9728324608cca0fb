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
 * @file TestSynchronizer.cc
 * @brief Two-flop synchronizer latency
 */

#include <gtest/gtest.h>

#include "TestHarness.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

class Counter : public SimModule {
public:
	explicit Counter(SimRegister<uint32_t>* _reg) : SimModule("Counter"), reg(_reg) {}
	void step() override { this->reg->set(this->reg->get() + 1); }

private:
	SimRegister<uint32_t>* reg;
};

}  // namespace

TEST(SynchronizerTest, ValueAppearsAfterTwoDestinationEdges) {
	ClockDomain            src("src", 10), dst("dst", 7);
	SimRegister<uint32_t>  value(&src, "value", 0);
	Synchronizer<uint32_t> sync("sync", &dst, &value);
	dst.addModule(&sync);

	value.set(0x5a);
	value.sync();

	dst.step();
	dst.sync();
	EXPECT_EQ(sync.get(), 0u) << "The first stage must not be visible at the output.";

	dst.step();
	dst.sync();
	EXPECT_EQ(sync.get(), 0x5au);
}

TEST(SynchronizerTest, ResetClearsBothStages) {
	ClockDomain            src("src", 10), dst("dst", 7);
	SimRegister<uint32_t>  value(&src, "value", 0);
	Synchronizer<uint32_t> sync("sync", &dst, &value);
	dst.addModule(&sync);

	value.set(9);
	value.sync();
	for (int i = 0; i < 3; ++i) {
		dst.step();
		dst.sync();
	}
	ASSERT_EQ(sync.get(), 9u);

	dst.reset();
	EXPECT_EQ(sync.get(), 0u);
}

TEST(SynchronizerTest, CoincidentEdgesSampleTheCommittedValue) {
	// The source counts up on every edge. On a shared edge the synchronizer samples the value
	// committed before the edge, whichever domain is stepped first.
	for (bool srcFirst : {true, false}) {
		ClockDomain            src("src", 10), dst("dst", 10);
		SimRegister<uint32_t>  value(&src, "value", 0);
		Counter                counter(&value);
		Synchronizer<uint32_t> sync("sync", &dst, &value);
		src.addModule(&counter);
		dst.addModule(&sync);

		std::vector<ClockDomain*> domains{&src, &dst};
		if (!srcFirst) std::swap(domains[0], domains[1]);

		for (uint32_t k = 0; k < 8; ++k) {
			stepGlobalTick(domains);
			EXPECT_EQ(value.get(), k + 1);
			EXPECT_EQ(sync.get(), k >= 1 ? k - 1 : 0u) << "edge " << k << (srcFirst ? " (src first)" : " (dst first)");
		}
	}
}

}  // namespace unit_test
