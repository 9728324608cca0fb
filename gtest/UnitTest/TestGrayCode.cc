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

#include <cstdint>

#include "common/GrayCode.hh"

namespace unit_test {

using namespace bridgesim;

TEST(GrayCodeTest, AdjacentCodesDifferInOneBit) {
	for (uint32_t i = 0; i < 1024; ++i) {
		uint32_t diff = binToGray(i) ^ binToGray(i + 1);
		EXPECT_EQ(diff & (diff - 1), 0u) << "codes of " << i << " and " << i + 1;
		EXPECT_EQ(grayToBin(binToGray(i)), i);
	}
	// Wrap-around of a pointer modulo 2D also changes one bit.
	for (uint32_t depth : {2u, 4u, 16u}) {
		uint32_t diff = binToGray(2 * depth - 1) ^ binToGray(0);
		EXPECT_EQ(diff & (diff - 1), 0u) << "depth " << depth;
	}
}

TEST(GrayCodeTest, PowerOfTwo) {
	EXPECT_FALSE(isPowerOfTwo(0));
	EXPECT_TRUE(isPowerOfTwo(1));
	EXPECT_TRUE(isPowerOfTwo(64));
	EXPECT_FALSE(isPowerOfTwo(96));
}

}  // namespace unit_test
