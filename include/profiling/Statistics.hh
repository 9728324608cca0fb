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
#include <vector>

namespace bridgesim {

/**
 * @brief Storage policy of a Statistics object.
 */
enum class StatisticsMode {
	Default,     ///< keep every sample: sum, avg, max, min, size
	Accumulator  ///< keep the running sum only
};

/**
 * @brief Sample collector used by the bridge and the testbench models.
 *
 * @code{.cpp}
 * Statistics<Tick> latency;
 * latency.push(120);
 * latency.push(80);
 * LABELED_STATISTICS("Master") << "avg " << latency.avg() << " max " << latency.max();
 *
 * Statistics<size_t, StatisticsMode::Accumulator> transfers;
 * transfers.push(1);
 * @endcode
 *
 * @note Not thread-safe. Every model is stepped from the simulation thread.
 */
template <typename TValue, StatisticsMode Mode = StatisticsMode::Default>
class Statistics {
public:
	Statistics() = default;

	void push(const TValue& _val);

	TValue sum() const;
	TValue avg() const;
	TValue max() const;
	TValue min() const;
	size_t size() const;

	void clear() { this->container_.clear(); }

private:
	std::vector<TValue> container_;
};

template <typename TValue>
class Statistics<TValue, StatisticsMode::Accumulator> {
public:
	Statistics() = default;

	void   push(const TValue& _val);
	TValue sum() const;

	void clear() { this->value_ = TValue{}; }

private:
	TValue value_{};
};

}  // namespace bridgesim

#include "profiling/Statistics.inl"
