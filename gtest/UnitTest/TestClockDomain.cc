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
 * @file TestClockDomain.cc
 * @brief Two-phase register semantics and clock edge bookkeeping
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "TestHarness.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

// Copies another register into its own on every edge.
class Follower : public SimModule {
public:
	Follower(const std::string& _name, SimRegister<int>* _dst, const SimRegister<int>* _src)
	    : SimModule(_name), dst(_dst), src(_src) {}

	void step() override { this->dst->set(this->src->get()); }

private:
	SimRegister<int>*       dst;
	const SimRegister<int>* src;
};

class Idle : public SimModule {
public:
	Idle() : SimModule("Idle") {}
	void step() override {}
};

}  // namespace

TEST(SimRegisterTest, StagedValueIsCommittedBySync) {
	ClockDomain      domain("clk", 10);
	SimRegister<int> reg(&domain, "reg", 7);

	EXPECT_EQ(reg.get(), 7) << "A register starts at its reset value.";

	reg.set(3);
	EXPECT_EQ(reg.get(), 7) << "A staged value must not be visible before the commit.";
	EXPECT_EQ(reg.getNext(), 3);

	domain.sync();
	EXPECT_EQ(reg.get(), 3);

	domain.sync();
	EXPECT_EQ(reg.get(), 3) << "Without a new set() the register holds its value.";

	domain.reset();
	EXPECT_EQ(reg.get(), 7);
	EXPECT_EQ(reg.getNext(), 7);
}

TEST(SimRegisterTest, NamesAreUniquePerDomain) {
	ClockDomain      a("a", 10), b("b", 10);
	SimRegister<int> first(&a, "reg");

	EXPECT_THROW(SimRegister<int>(&a, "reg"), std::runtime_error);
	EXPECT_NO_THROW({ SimRegister<int> other(&b, "reg"); });
}

TEST(ClockDomainTest, EdgesFollowPeriodAndPhase) {
	ClockDomain domain("slow", 37, 5);

	EXPECT_EQ(domain.getNextEdge(), 5u);
	EXPECT_EQ(domain.getCycle(), 0u);

	domain.step();
	domain.sync();
	EXPECT_EQ(domain.getCurrentTick(), 5u);
	EXPECT_EQ(domain.getNextEdge(), 42u);
	EXPECT_EQ(domain.getCycle(), 1u);

	domain.step();
	domain.sync();
	EXPECT_EQ(domain.getCurrentTick(), 42u);
	EXPECT_EQ(domain.getNextEdge(), 79u);

	domain.reset();
	EXPECT_EQ(domain.getNextEdge(), 5u);
	EXPECT_EQ(domain.getCycle(), 0u);
}

TEST(ClockDomainTest, ModuleBelongsToOneDomain) {
	ClockDomain a("a", 10), b("b", 20);
	Idle        idle;

	a.addModule(&idle);
	EXPECT_EQ(idle.getClockDomain(), &a);
	EXPECT_THROW(b.addModule(&idle), std::runtime_error);
}

TEST(ClockDomainTest, CoincidentEdgesEvaluateBeforeCommit) {
	// Two domains swap register values on a shared edge. The result must not depend on which domain
	// is stepped first.
	for (bool aFirst : {true, false}) {
		ClockDomain      a("a", 10), b("b", 10);
		SimRegister<int> regA(&a, "regA", 1);
		SimRegister<int> regB(&b, "regB", 2);
		Follower         followA("followA", &regA, &regB);
		Follower         followB("followB", &regB, &regA);
		a.addModule(&followA);
		b.addModule(&followB);

		std::vector<ClockDomain*> domains{&a, &b};
		if (!aFirst) std::swap(domains[0], domains[1]);

		stepGlobalTick(domains);
		EXPECT_EQ(regA.get(), 2) << "domain order " << (aFirst ? "a,b" : "b,a");
		EXPECT_EQ(regB.get(), 1) << "domain order " << (aFirst ? "a,b" : "b,a");

		stepGlobalTick(domains);
		EXPECT_EQ(regA.get(), 1);
		EXPECT_EQ(regB.get(), 2);
	}
}

TEST(ClockDomainTest, OnlyDomainsWithAnEdgeAdvance) {
	ClockDomain               fast("fast", 10), slow("slow", 25, 3);
	std::vector<ClockDomain*> domains{&fast, &slow};

	EXPECT_EQ(stepGlobalTick(domains), 0u);
	EXPECT_EQ(fast.getCycle(), 1u);
	EXPECT_EQ(slow.getCycle(), 0u);

	EXPECT_EQ(stepGlobalTick(domains), 3u);
	EXPECT_EQ(fast.getCycle(), 1u);
	EXPECT_EQ(slow.getCycle(), 1u);

	EXPECT_EQ(stepGlobalTick(domains), 10u);
	EXPECT_EQ(stepGlobalTick(domains), 20u);
	EXPECT_EQ(stepGlobalTick(domains), 28u);
	EXPECT_EQ(fast.getCycle(), 3u);
	EXPECT_EQ(slow.getCycle(), 2u);
}

}  // namespace unit_test
