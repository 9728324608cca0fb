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

#include <string>

namespace bridgesim {

class ClockDomain;

/**
 * @file SimModule.hh
 * @brief Base class of every clocked component
 *
 * @details
 * A SimModule is evaluated once per edge of the ClockDomain it is added to. step() runs in phase 1
 * of the tick: it may read any committed register, in its own domain or another one, and stages
 * next values into registers of its own domain. It must not commit anything itself.
 *
 * Modules of one domain are stepped in the order they were added. Combinational paths between
 * modules of the same domain, such as the producer side of a queue feeding the queue's write port,
 * rely on that order.
 *
 * **Lifecycle:**
 * ```
 * construct --> ClockDomain::addModule() --> reset() --> step() per edge ...
 * ```
 */
class SimModule {
public:
	explicit SimModule(const std::string& _name) : name(_name) {}
	virtual ~SimModule() = default;

	const std::string& getName() const { return this->name; }

	ClockDomain* getClockDomain() const { return this->domain; }
	void         setClockDomain(ClockDomain* _domain) { this->domain = _domain; }

	/// @brief Phase-1 evaluation for one edge of the owning domain.
	virtual void step() = 0;

	/// @brief Restore state that is not held in a SimRegister. Registers are reset by the domain.
	virtual void reset() {}

private:
	const std::string name;
	ClockDomain*      domain = nullptr;
};

}  // namespace bridgesim
