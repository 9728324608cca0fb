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

#include <stdexcept>
#include <utility>
#include <vector>

#include "sim/SimAddressMap.hh"

namespace unit_test {

using namespace bridgesim;

namespace {

// Every region is non-empty, regions are contiguous from 0 and the last one ends at the top of the space.
void expectCoversSpace(const SimAddressMap& _map, int _addressWidth, int _numDevices) {
	const Addr last = _addressWidth >= 64 ? ~Addr{0} : ((Addr{1} << _addressWidth) - 1);

	Addr next = 0;
	for (int id = 0; id < _numDevices; ++id) {
		const auto& region = _map.getRegion(id);
		EXPECT_EQ(region.startAddr, next) << _addressWidth << " bits, region " << id;
		EXPECT_LE(region.startAddr, region.lastAddr) << _addressWidth << " bits, region " << id;
		next = region.lastAddr + 1;
	}
	EXPECT_EQ(_map.getRegion(_numDevices - 1).lastAddr, last) << _addressWidth << " bits";
}

}  // namespace

TEST(SimAddressMapTest, EvenSplitOfALargeSpace) {
	SimAddressMap map("map");
	map.registerEvenSplit(32, 4);

	EXPECT_EQ(map.getRegion(1).startAddr, 0x40000000u);
	EXPECT_EQ(map.getRegion(2).startAddr, 0x80000000u);
	EXPECT_EQ(map.getRegion(3).lastAddr, 0xFFFFFFFFu);
	EXPECT_EQ(map.getDeviceID(0x7FFFFFFF), 1);
	EXPECT_EQ(map.getDeviceID(0x80000000), 2);
}

TEST(SimAddressMapTest, SmallSpacesSplitIntoNonEmptyRegions) {
	const std::vector<std::pair<int, int>> cases = {{1, 2}, {2, 3}, {2, 4}, {4, 5}, {4, 16}, {5, 32}, {8, 17}, {32, 3}};

	for (const auto& [width, count] : cases) {
		SimAddressMap map("map");
		ASSERT_NO_THROW(map.registerEvenSplit(width, count)) << width << " bits, " << count << " regions";
		expectCoversSpace(map, width, count);
	}

	// 16 addresses over 5 targets: sizes differ by at most one.
	SimAddressMap map("map");
	map.registerEvenSplit(4, 5);
	EXPECT_EQ(map.getRegion(0).lastAddr, 2u);
	EXPECT_EQ(map.getRegion(1).startAddr, 3u);
	EXPECT_EQ(map.getRegion(4).startAddr, 12u);
	EXPECT_EQ(map.getDeviceID(15), 4);
}

TEST(SimAddressMapTest, FullWidthSpace) {
	for (int count : {1, 3, 32}) {
		SimAddressMap map("map");
		ASSERT_NO_THROW(map.registerEvenSplit(64, count)) << count << " regions";
		expectCoversSpace(map, 64, count);
	}
}

TEST(SimAddressMapTest, MoreRegionsThanAddressesIsRejected) {
	SimAddressMap map("map");
	EXPECT_THROW(map.registerEvenSplit(1, 3), std::runtime_error);
}

}  // namespace unit_test
