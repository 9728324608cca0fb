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

#include <cstdint>

namespace bridgesim {

/// @brief Reflected binary Gray code of `_bin`.
inline uint32_t binToGray(uint32_t _bin) { return _bin ^ (_bin >> 1); }

/// @brief Inverse of binToGray().
inline uint32_t grayToBin(uint32_t _gray) {
	uint32_t bin = _gray;
	for (uint32_t shift = 1; shift < 32; shift <<= 1) { bin ^= bin >> shift; }
	return bin;
}

inline bool isPowerOfTwo(uint64_t _value) { return _value != 0 && (_value & (_value - 1)) == 0; }

}  // namespace bridgesim
