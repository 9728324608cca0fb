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

#include <cstddef>
#include <limits>
#include <vector>

namespace bridgesim {

/**
 * @brief Base class of arbitration policies.
 *
 * @details
 * An arbiter chooses one requester out of `componentNum` candidates. select() receives one
 * request bit per candidate and returns the index of the winner, or Arbiter::NONE when nobody
 * requests. Arbiters hold no state that influences the grant unless the policy requires it, so
 * select() may be evaluated any number of times within a tick.
 *
 * @code{.cpp}
 * FixedPriority arbiter(2);
 * size_t winner = arbiter.select({writePending, readPending});
 * if (winner != Arbiter::NONE) serve(winner);
 * @endcode
 */
class Arbiter {
public:
	static constexpr size_t NONE = std::numeric_limits<size_t>::max();

	explicit Arbiter(size_t _num = 0) : curIndex(NONE), componentNum(_num) {}
	virtual ~Arbiter() = default;

	/**
	 * @brief Index returned by the most recent select(), NONE before the first grant.
	 */
	size_t getCurIndex() const { return this->curIndex; }

	/**
	 * @brief Perform arbitration.
	 *
	 * @param _requests one bit per candidate, entries beyond the candidate count are ignored
	 * @return index of the selected candidate or NONE
	 */
	virtual size_t select(const std::vector<bool>& _requests) = 0;

	/// Forget the last grant.
	void reset() { this->curIndex = NONE; }

protected:
	size_t curIndex;
	size_t componentNum;
};

/**
 * @brief Lowest requesting index always wins.
 */
class FixedPriority : public Arbiter {
public:
	explicit FixedPriority(size_t _num) : Arbiter(_num) {}

	size_t select(const std::vector<bool>& _requests) override {
		this->curIndex = NONE;
		for (size_t i = 0; i < this->componentNum && i < _requests.size(); ++i) {
			if (_requests[i]) {
				this->curIndex = i;
				break;
			}
		}
		return this->curIndex;
	}
};

}  // namespace bridgesim
