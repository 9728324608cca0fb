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
#include <limits>
#include <vector>

#include "BridgeSim.hh"

namespace unit_test {

using namespace bridgesim;

/**
 * @brief Advance the earliest pending tick of a set of domains without a SimTop.
 *
 * Every domain with an edge at that tick is stepped before any of them is synced, as SimTopBase
 * does. Returns the tick that was evaluated.
 */
inline Tick stepGlobalTick(const std::vector<ClockDomain*>& _domains) {
	Tick next = std::numeric_limits<Tick>::max();
	for (auto domain : _domains) { next = std::min(next, domain->getNextEdge()); }

	std::vector<ClockDomain*> active;
	for (auto domain : _domains) {
		if (domain->getNextEdge() == next) active.push_back(domain);
	}

	for (auto domain : active) { domain->step(); }
	for (auto domain : active) { domain->sync(); }
	return next;
}

/// Run global ticks until `_domain` has completed `_edges` more edges.
inline void runEdges(const std::vector<ClockDomain*>& _domains, ClockDomain* _domain, uint64_t _edges) {
	const uint64_t target = _domain->getCycle() + _edges;
	while (_domain->getCycle() < target) { stepGlobalTick(_domains); }
}

}  // namespace unit_test
