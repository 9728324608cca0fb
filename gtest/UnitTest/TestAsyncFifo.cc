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
 * @file TestAsyncFifo.cc
 * @brief Clock-domain-crossing queue: ordering, capacity, latency and occupancy bounds
 *
 * @details
 * A Producer in the write domain pushes an increasing sequence as fast as the queue accepts it. A
 * Consumer in the read domain pops every `interval`-th read edge. Both are added before the queue
 * port of their domain, which is how the bridge wires its queues.
 */

#include <gtest/gtest.h>

#include <memory>
#include <tuple>
#include <vector>

#include "TestHarness.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

class Producer : public SimModule {
public:
	Producer(AsyncFifo<uint32_t>* _fifo, uint32_t _count) : SimModule("Producer"), fifo(_fifo), count(_count) {}

	void step() override {
		if (this->next < this->count && this->fifo->tryPush(this->next)) {
			this->pushTicks.push_back(this->getClockDomain()->getCurrentTick());
			this->next++;
		}
	}

	uint32_t          next = 0;
	std::vector<Tick> pushTicks;

private:
	AsyncFifo<uint32_t>* fifo;
	const uint32_t       count;
};

class Consumer : public SimModule {
public:
	explicit Consumer(AsyncFifo<uint32_t>* _fifo) : SimModule("Consumer"), fifo(_fifo) {}

	void step() override {
		this->edges++;
		if (!this->enabled || this->edges % this->interval != 0 || this->fifo->isEmpty()) return;

		this->received.push_back(this->fifo->front());
		this->receiveTicks.push_back(this->getClockDomain()->getCurrentTick());
		EXPECT_TRUE(this->fifo->tryPop()) << "A non-empty queue must accept a pop.";
	}

	bool                  enabled  = true;
	uint64_t              interval = 1;
	uint64_t              edges    = 0;
	std::vector<uint32_t> received;
	std::vector<Tick>     receiveTicks;

private:
	AsyncFifo<uint32_t>* fifo;
};

struct FifoBench {
	FifoBench(size_t _depth, Tick _writePeriod, Tick _readPeriod, Tick _readPhase, uint32_t _count)
	    : writeDomain("wclk", _writePeriod),
	      readDomain("rclk", _readPeriod, _readPhase),
	      fifo("fifo", _depth, &writeDomain, &readDomain),
	      producer(&fifo, _count),
	      consumer(&fifo),
	      domains{&writeDomain, &readDomain} {
		this->writeDomain.addModule(&this->producer);
		this->writeDomain.addModule(this->fifo.getWritePort());
		this->readDomain.addModule(&this->consumer);
		this->readDomain.addModule(this->fifo.getReadPort());
	}

	size_t trueOccupancy() const { return this->fifo.getNumPushed() - this->fifo.getNumPopped(); }

	ClockDomain               writeDomain;
	ClockDomain               readDomain;
	AsyncFifo<uint32_t>       fifo;
	Producer                  producer;
	Consumer                  consumer;
	std::vector<ClockDomain*> domains;
};

}  // namespace

TEST(AsyncFifoTest, DepthMustBeAPowerOfTwo) {
	ClockDomain w("w", 10), r("r", 37);

	for (size_t depth : {0, 1, 3, 6, 12}) {
		EXPECT_THROW(AsyncFifo<uint32_t>("bad", depth, &w, &r), ConfigurationError) << "depth " << depth;
	}
	for (size_t depth : {2, 4, 64}) {
		EXPECT_NO_THROW({ AsyncFifo<uint32_t> fifo("good", depth, &w, &r); }) << "depth " << depth;
	}
}

TEST(AsyncFifoTest, StartsEmptyAndNotFull) {
	FifoBench bench(4, 10, 37, 0, 0);

	EXPECT_TRUE(bench.fifo.isEmpty());
	EXPECT_FALSE(bench.fifo.isFull());
	EXPECT_EQ(bench.fifo.getWriterOccupancy(), 0u);
	EXPECT_EQ(bench.fifo.getReaderOccupancy(), 0u);
	EXPECT_EQ(bench.fifo.getDepth(), 4u);
}

TEST(AsyncFifoTest, PreservesOrder) {
	FifoBench bench(4, 10, 37, 0, 200);

	for (int guard = 0; bench.consumer.received.size() < 200 && guard < 100000; ++guard) {
		stepGlobalTick(bench.domains);
	}

	ASSERT_EQ(bench.consumer.received.size(), 200u);
	for (uint32_t i = 0; i < 200; ++i) { EXPECT_EQ(bench.consumer.received[i], i); }
	EXPECT_EQ(bench.fifo.getNumPushed(), 200u);
	EXPECT_EQ(bench.fifo.getNumPopped(), 200u);
}

TEST(AsyncFifoTest, FillsToDepthWhileTheReaderIsStalled) {
	FifoBench bench(4, 10, 37, 0, 100);
	bench.consumer.enabled = false;

	runEdges(bench.domains, &bench.writeDomain, 50);

	EXPECT_EQ(bench.fifo.getNumPushed(), 4u) << "No more than the depth may enter a stalled queue.";
	EXPECT_TRUE(bench.fifo.isFull());
	EXPECT_EQ(bench.fifo.getWriterOccupancy(), 4u);

	runEdges(bench.domains, &bench.readDomain, 4);
	EXPECT_FALSE(bench.fifo.isEmpty());
	EXPECT_EQ(bench.fifo.getReaderOccupancy(), 4u);

	// Releasing the reader drains the queue and lets the producer continue.
	bench.consumer.enabled = true;
	for (int guard = 0; bench.consumer.received.size() < 100 && guard < 100000; ++guard) {
		stepGlobalTick(bench.domains);
	}
	EXPECT_EQ(bench.consumer.received.size(), 100u);
}

TEST(AsyncFifoTest, HeadIsVisibleNoEarlierThanTwoReadEdgesAfterThePush) {
	const std::vector<std::tuple<Tick, Tick, Tick>> clocks = {
	    {10, 37, 0}, {37, 10, 0}, {10, 10, 0}, {10, 10, 5}, {7, 13, 2}};

	for (const auto& [wPeriod, rPeriod, rPhase] : clocks) {
		FifoBench bench(4, wPeriod, rPeriod, rPhase, 16);
		for (int guard = 0; bench.consumer.received.size() < 16 && guard < 100000; ++guard) {
			stepGlobalTick(bench.domains);
		}
		ASSERT_EQ(bench.consumer.received.size(), 16u);

		for (size_t i = 0; i < 16; ++i) {
			EXPECT_GE(bench.consumer.receiveTicks[i] - bench.producer.pushTicks[i], 2 * rPeriod)
			    << "entry " << i << ", write period " << wPeriod << ", read period " << rPeriod << ", phase "
			    << rPhase;
		}
	}
}

TEST(AsyncFifoTest, OccupancyStaysWithinBoundsAcrossClockRatios) {
	const std::vector<std::tuple<Tick, Tick, Tick>> clocks = {
	    {10, 37, 0}, {10, 37, 19}, {37, 10, 5}, {10, 10, 0}, {10, 10, 5}, {7, 13, 2}, {13, 7, 0}, {10, 100, 1}};

	for (size_t depth : {2, 4, 8}) {
		for (const auto& [wPeriod, rPeriod, rPhase] : clocks) {
			for (uint64_t interval : {1, 3}) {
				FifoBench bench(depth, wPeriod, rPeriod, rPhase, 120);
				bench.consumer.interval = interval;

				for (int guard = 0; bench.consumer.received.size() < 120 && guard < 200000; ++guard) {
					stepGlobalTick(bench.domains);

					const size_t occupancy = bench.trueOccupancy();
					ASSERT_LE(occupancy, depth);
					ASSERT_LE(bench.fifo.getWriterOccupancy(), depth);
					ASSERT_LE(bench.fifo.getReaderOccupancy(), depth);
					// The writer overestimates and the reader underestimates the true occupancy.
					ASSERT_GE(bench.fifo.getWriterOccupancy(), occupancy);
					ASSERT_LE(bench.fifo.getReaderOccupancy(), occupancy);
				}
				ASSERT_EQ(bench.consumer.received.size(), 120u)
				    << "depth " << depth << ", write period " << wPeriod << ", read period " << rPeriod;

				// Once both sides have seen the last pointer updates the flags agree with the content.
				runEdges(bench.domains, &bench.writeDomain, 4);
				runEdges(bench.domains, &bench.readDomain, 4);
				EXPECT_TRUE(bench.fifo.isEmpty());
				EXPECT_FALSE(bench.fifo.isFull());
				EXPECT_EQ(bench.fifo.getWriterOccupancy(), 0u);
				EXPECT_EQ(bench.fifo.getReaderOccupancy(), 0u);
			}
		}
	}
}

TEST(AsyncFifoTest, ResetReturnsToEmpty) {
	FifoBench bench(2, 10, 37, 0, 10);
	bench.consumer.enabled = false;
	runEdges(bench.domains, &bench.writeDomain, 20);
	runEdges(bench.domains, &bench.readDomain, 4);
	ASSERT_TRUE(bench.fifo.isFull());

	bench.writeDomain.reset();
	bench.readDomain.reset();

	EXPECT_TRUE(bench.fifo.isEmpty());
	EXPECT_FALSE(bench.fifo.isFull());
	EXPECT_EQ(bench.fifo.getNumPushed(), 0u);
	EXPECT_EQ(bench.fifo.getWriterOccupancy(), 0u);
}

}  // namespace unit_test
