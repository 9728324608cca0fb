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

#include <algorithm>
#include <numeric>

#include "profiling/Statistics.hh"

namespace bridgesim {

template <typename TValue, StatisticsMode Mode>
void Statistics<TValue, Mode>::push(const TValue& _val) {
	this->container_.push_back(_val);
}

template <typename TValue, StatisticsMode Mode>
TValue Statistics<TValue, Mode>::sum() const {
	return std::accumulate(this->container_.begin(), this->container_.end(), TValue{});
}

template <typename TValue, StatisticsMode Mode>
TValue Statistics<TValue, Mode>::avg() const {
	return (this->container_.size() != 0) ? this->sum() / static_cast<TValue>(this->container_.size()) : TValue{};
}

template <typename TValue, StatisticsMode Mode>
TValue Statistics<TValue, Mode>::max() const {
	return (this->container_.size() > 0) ? *std::max_element(this->container_.begin(), this->container_.end())
	                                     : TValue{};
}

template <typename TValue, StatisticsMode Mode>
TValue Statistics<TValue, Mode>::min() const {
	return (this->container_.size() > 0) ? *std::min_element(this->container_.begin(), this->container_.end())
	                                     : TValue{};
}

template <typename TValue, StatisticsMode Mode>
size_t Statistics<TValue, Mode>::size() const {
	return this->container_.size();
}

template <typename TValue>
void Statistics<TValue, StatisticsMode::Accumulator>::push(const TValue& _val) {
	this->value_ += _val;
}

template <typename TValue>
TValue Statistics<TValue, StatisticsMode::Accumulator>::sum() const {
	return this->value_;
}

}  // namespace bridgesim
